#include <iostream>
#include <string>
#include <vector>

#include "decoy_presets.h"
#include "decoy_router.h"
#include "guard_config.h"
#include "guard_types.h"

namespace {

#define FAIL()                                                     \
  do {                                                             \
    std::cerr << "decoy_router_test failed at " << __FILE__        \
              << ":" << __LINE__ << "\n";                          \
    return 1;                                                      \
  } while (false)

using dz::guard::DecoyConfig;
using dz::guard::DecoyPreset;
using dz::guard::DecoyRouter;
using dz::guard::Flavor;
using dz::guard::Message;
using dz::guard::Role;
using dz::guard::SecurityState;

bool Contains(const std::vector<Message>& messages, const std::string& text) {
  for (const auto& msg : messages) {
    if (msg.text == text) {
      return true;
    }
  }
  return false;
}

void SetDecoy(SecurityState& state, DecoyRouter& router, bool on) {
  state.is_decoy_mode = on;
  router.OnDecoyModeChanged(on);
}

}  // namespace

int main() {
  const std::uint64_t now = 10'000'000;

  // Real and decoy writes never cross.
  {
    SecurityState state;
    DecoyRouter router(DecoyConfig{}, state);
    std::string err;
    if (!router.Append(Flavor::kHush, Role::kUser, "real question", now, err) ||
        !router.Append(Flavor::kHush, Role::kAssistant, "real answer", now,
                       err) ||
        !router.Append(Flavor::kClassified, Role::kUser, "other flavor", now,
                       err)) {
      FAIL();
    }
    const auto hush = router.VisibleMessages(Flavor::kHush, now);
    if (hush.size() != 2 || Contains(hush, "other flavor")) {
      FAIL();
    }

    SetDecoy(state, router, true);
    if (!router.Append(Flavor::kHush, Role::kUser, "decoy question", now,
                       err)) {
      FAIL();
    }
    auto decoy = router.VisibleMessages(Flavor::kHush, now);
    if (decoy.size() != 1 || decoy[0].text != "decoy question" ||
        Contains(decoy, "real question")) {
      FAIL();
    }
    if (router.real_message_count() != 3) {
      FAIL();
    }

    SetDecoy(state, router, false);
    const auto back = router.VisibleMessages(Flavor::kHush, now);
    if (back.size() != 2 || Contains(back, "decoy question")) {
      FAIL();
    }
  }

  // Empty decoy set falls back to the configured preset.
  {
    SecurityState state;
    DecoyConfig cfg;
    cfg.hush_preset = DecoyPreset::kMealPlanning;
    cfg.classified_preset = DecoyPreset::kAuto;
    DecoyRouter router(cfg, state);
    SetDecoy(state, router, true);
    const auto hush = router.VisibleMessages(Flavor::kHush, now);
    if (hush.size() != 4 || hush[0].id != "d1" ||
        hush[0].text != "What should I make for dinner tonight?" ||
        hush[1].role != Role::kAssistant ||
        hush[0].created_at_ms != now - 3600000 ||
        hush[1].created_at_ms != now - 3500000) {
      FAIL();
    }
    const auto classified = router.VisibleMessages(Flavor::kClassified, now);
    if (classified.size() != 2 || classified[0].id != "c1" ||
        classified[0].text != "STATUS REPORT" ||
        classified[0].context != Flavor::kClassified) {
      FAIL();
    }
    if (!router.VisibleMessages(Flavor::kDiscretion, now).empty()) {
      FAIL();
    }
    std::string err;
    if (router.SetDecoyPreset(Flavor::kDiscretion, DecoyPreset::kAuto, err)) {
      FAIL();
    }
    if (!router.SetDecoyPreset(Flavor::kHush, DecoyPreset::kNone, err)) {
      FAIL();
    }
    if (!router.VisibleMessages(Flavor::kHush, now).empty()) {
      FAIL();
    }
    // Discretion keeps its own decoy writes.
    if (!router.Append(Flavor::kDiscretion, Role::kUser, "hello", now, err)) {
      FAIL();
    }
    if (router.VisibleMessages(Flavor::kDiscretion, now).size() != 1 ||
        router.real_message_count() != 0) {
      FAIL();
    }
  }

  // System notices bypass decoy routing.
  {
    SecurityState state;
    DecoyRouter router(DecoyConfig{}, state);
    SetDecoy(state, router, true);
    std::string err;
    if (!router.Append(Flavor::kClassified, Role::kSystem, "mode switched",
                       now, err)) {
      FAIL();
    }
    if (Contains(router.VisibleMessages(Flavor::kClassified, now),
                 "mode switched")) {
      FAIL();
    }
    if (!router.decoy_set(Flavor::kClassified).custom_messages.empty()) {
      FAIL();
    }
    SetDecoy(state, router, false);
    const auto real = router.VisibleMessages(Flavor::kClassified, now);
    if (real.size() != 1 || real[0].role != Role::kSystem ||
        real[0].context != Flavor::kClassified) {
      FAIL();
    }
    if (router.Append(Flavor::kHush, Role::kUser, "", now, err)) {
      FAIL();
    }
  }

  // Preset table.
  {
    if (!dz::guard::BuildDecoyPreset(Flavor::kDiscretion,
                                     DecoyPreset::kGeneralAssistant, now)
             .empty() ||
        !dz::guard::BuildDecoyPreset(Flavor::kHush, DecoyPreset::kNone, now)
             .empty()) {
      FAIL();
    }
    const auto general = dz::guard::BuildDecoyPreset(
        Flavor::kClassified, DecoyPreset::kGeneralAssistant, now);
    if (general.size() != 4 || general[3].id != "c4" ||
        general[2].text != "RUN DIAGNOSTICS") {
      FAIL();
    }
  }

  return 0;
}
