#include <iostream>
#include <string>
#include <vector>

#include "decoy_router.h"
#include "guard_config.h"
#include "guard_types.h"
#include "secure_eraser.h"

namespace {

#define FAIL()                                                     \
  do {                                                             \
    std::cerr << "secure_eraser_test failed at " << __FILE__       \
              << ":" << __LINE__ << "\n";                          \
    return 1;                                                      \
  } while (false)

using dz::guard::DecoyConfig;
using dz::guard::DecoyPreset;
using dz::guard::DecoyRouter;
using dz::guard::Flavor;
using dz::guard::kAllFlavors;
using dz::guard::Message;
using dz::guard::Role;
using dz::guard::SecureEraser;
using dz::guard::SecurityState;

bool AllPrintable(const std::string& text) {
  for (const char ch : text) {
    const int v = static_cast<unsigned char>(ch);
    if (v < 33 || v > 126) {
      return false;
    }
  }
  return true;
}

void SetDecoy(SecurityState& state, DecoyRouter& router, bool on) {
  state.is_decoy_mode = on;
  router.OnDecoyModeChanged(on);
}

}  // namespace

int main() {
  const std::uint64_t now = 5'000'000;

  // Overwrite keeps the byte length and changes the content.
  {
    const std::vector<std::string> inputs = {
        "meet at the north gate at nine",
        "x",
        "!!!!!!!!",
        "caf\xC3\xA9 au lait",
        std::string(300, 'a'),
    };
    for (const auto& original : inputs) {
      std::string text = original;
      SecureEraser::OverwriteText(text);
      if (text.size() != original.size() || text == original ||
          !AllPrintable(text)) {
        FAIL();
      }
    }
    std::string empty;
    SecureEraser::OverwriteText(empty);
    if (!empty.empty()) {
      FAIL();
    }

    std::vector<Message> batch(3);
    batch[0].text = "one";
    batch[1].text = "two";
    batch[2].text = "three";
    SecureEraser::Wipe(batch);
    if (!batch.empty()) {
      FAIL();
    }
  }

  // Burned decoy flavor shows nothing until the next append.
  {
    SecurityState state;
    DecoyConfig cfg;
    cfg.hush_preset = DecoyPreset::kGeneralAssistant;
    DecoyRouter router(cfg, state);
    SecureEraser eraser(router);
    std::string err;
    if (!router.Append(Flavor::kHush, Role::kUser, "real hush", now, err) ||
        !router.Append(Flavor::kClassified, Role::kUser, "real classified",
                       now, err)) {
      FAIL();
    }
    SetDecoy(state, router, true);
    if (!router.Append(Flavor::kHush, Role::kUser, "decoy hush", now, err)) {
      FAIL();
    }
    eraser.WipeFlavor(Flavor::kHush);
    if (!state.is_decoy_mode) {
      FAIL();
    }
    if (!router.decoy_set(Flavor::kHush).burned ||
        !router.decoy_set(Flavor::kHush).custom_messages.empty()) {
      FAIL();
    }
    if (!router.VisibleMessages(Flavor::kHush, now).empty()) {
      FAIL();
    }
    // Real content of every flavor survives a decoy-mode wipe.
    if (router.real_message_count() != 2) {
      FAIL();
    }
    // Other flavors keep their preset view.
    if (router.VisibleMessages(Flavor::kClassified, now).empty()) {
      FAIL();
    }
    // Re-entering decoy mode without leaving keeps the burn.
    SetDecoy(state, router, true);
    if (!router.VisibleMessages(Flavor::kHush, now).empty()) {
      FAIL();
    }
    if (!router.Append(Flavor::kHush, Role::kUser, "fresh", now, err)) {
      FAIL();
    }
    const auto visible = router.VisibleMessages(Flavor::kHush, now);
    if (visible.size() != 1 || visible[0].text != "fresh" ||
        router.decoy_set(Flavor::kHush).burned) {
      FAIL();
    }
    eraser.WipeFlavor(Flavor::kHush);
    SetDecoy(state, router, false);
    if (router.decoy_set(Flavor::kHush).burned) {
      FAIL();
    }
    SetDecoy(state, router, true);
    if (router.VisibleMessages(Flavor::kHush, now).size() != 4) {
      FAIL();
    }
    SetDecoy(state, router, false);
    const auto real_hush = router.VisibleMessages(Flavor::kHush, now);
    if (real_hush.size() != 1 || real_hush[0].text != "real hush") {
      FAIL();
    }
  }

  // Outside decoy mode only real content of the flavor goes.
  {
    SecurityState state;
    DecoyRouter router(DecoyConfig{}, state);
    SecureEraser eraser(router);
    std::string err;
    SetDecoy(state, router, true);
    if (!router.Append(Flavor::kClassified, Role::kUser, "cover", now, err)) {
      FAIL();
    }
    SetDecoy(state, router, false);
    if (!router.Append(Flavor::kClassified, Role::kUser, "secret", now, err)) {
      FAIL();
    }
    eraser.WipeFlavor(Flavor::kClassified);
    if (router.real_message_count() != 0 ||
        router.decoy_set(Flavor::kClassified).burned ||
        router.decoy_set(Flavor::kClassified).custom_messages.size() != 1) {
      FAIL();
    }
  }

  // Wipe everything.
  {
    SecurityState state;
    DecoyRouter router(DecoyConfig{}, state);
    SecureEraser eraser(router);
    std::string err;
    if (!router.Append(Flavor::kHush, Role::kUser, "a", now, err) ||
        !router.Append(Flavor::kClassified, Role::kUser, "b", now, err)) {
      FAIL();
    }
    SetDecoy(state, router, true);
    if (!router.Append(Flavor::kHush, Role::kUser, "c", now, err)) {
      FAIL();
    }
    eraser.WipeAll();
    if (router.real_message_count() != 0) {
      FAIL();
    }
    for (const Flavor f : kAllFlavors) {
      if (!router.decoy_set(f).custom_messages.empty() ||
          !router.decoy_set(f).burned) {
        FAIL();
      }
    }
  }

  return 0;
}
