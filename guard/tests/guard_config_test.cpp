#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "guard_config.h"

namespace {

#define FAIL()                                                     \
  do {                                                             \
    std::cerr << "guard_config_test failed at " << __FILE__        \
              << ":" << __LINE__ << "\n";                          \
    return 1;                                                      \
  } while (false)

using dz::guard::DecoyPreset;
using dz::guard::GuardConfig;
using dz::guard::LoadGuardConfig;
using dz::guard::PanicVariant;

std::string WriteFile(const std::string& name, const std::string& content) {
  std::error_code ec;
  auto dir = std::filesystem::temp_directory_path(ec);
  if (dir.empty()) {
    dir = std::filesystem::path{"."};
  }
  const auto path = dir / name;
  std::ofstream f(path, std::ios::binary);
  f << content;
  return path.string();
}

}  // namespace

int main() {
  {
    const auto path = WriteFile(
        "dz_guard_config_full.ini",
        "# duress subsystem\n"
        "[security]\n"
        "passcode_length=4  ; short codes\n"
        "argon2_blocks=64\n"
        "argon2_passes=2\n"
        "reject_weak_passcodes=off\n"
        "unlock_grace_ms=3000\n"
        "lockout_short_ms=1000\n"
        "lockout_long_ms=9000\n"
        "[motion]\n"
        "enabled=0\n"
        "interval_ms=50\n"
        "[panic]\n"
        "enabled=true\n"
        "variant=shake  # accelerometer\n"
        "cooldown_ms=4000\n"
        "required_count=4\n"
        "shake_threshold_g=1.75\n"
        "shake_interval_ms=20\n"
        "[decoy]\n"
        "hush_preset=meal_planning\n"
        "classified_preset=none\n"
        "[future]\n"
        "whatever=1\n");
    GuardConfig cfg;
    std::string err;
    if (!LoadGuardConfig(path, cfg, err)) {
      FAIL();
    }
    if (cfg.security.passcode_length != 4 || cfg.security.argon2_blocks != 64 ||
        cfg.security.argon2_passes != 2 || cfg.security.reject_weak_passcodes ||
        cfg.security.unlock_grace_ms != 3000 ||
        cfg.security.lockout_short_ms != 1000 ||
        cfg.security.lockout_long_ms != 9000) {
      FAIL();
    }
    if (cfg.motion.enabled || cfg.motion.interval_ms != 50) {
      FAIL();
    }
    if (!cfg.panic.enabled || cfg.panic.variant != PanicVariant::kShake ||
        cfg.panic.cooldown_ms != 4000 || cfg.panic.required_count != 4 ||
        cfg.panic.shake_threshold_g != 1.75 ||
        cfg.panic.shake_interval_ms != 20 ||
        cfg.panic.press_window_ms != 400) {
      FAIL();
    }
    if (cfg.decoy.hush_preset != DecoyPreset::kMealPlanning ||
        cfg.decoy.classified_preset != DecoyPreset::kNone) {
      FAIL();
    }
  }

  // Defaults.
  {
    const auto path = WriteFile("dz_guard_config_empty.ini", "\n");
    GuardConfig cfg;
    std::string err;
    if (!LoadGuardConfig(path, cfg, err)) {
      FAIL();
    }
    if (cfg.security.passcode_length != 6 ||
        cfg.security.unlock_grace_ms != 5000 || !cfg.motion.enabled ||
        cfg.panic.enabled || cfg.panic.variant != PanicVariant::kPress ||
        cfg.panic.required_count != 3 || cfg.panic.press_debounce_ms != 50 ||
        cfg.panic.shake_window_ms != 2000 ||
        cfg.decoy.hush_preset != DecoyPreset::kGeneralAssistant ||
        cfg.decoy.classified_preset != DecoyPreset::kStudyHelper) {
      FAIL();
    }
  }

  // Errors carry the line number.
  {
    GuardConfig cfg;
    std::string err;
    auto path = WriteFile("dz_guard_config_bad_line.ini",
                          "[security]\npasscode_length=6\nnot a pair\n");
    if (LoadGuardConfig(path, cfg, err) ||
        err.find("line 3") == std::string::npos) {
      FAIL();
    }
    err.clear();
    path = WriteFile("dz_guard_config_bad_enum.ini",
                     "[panic]\nvariant=wave\n");
    if (LoadGuardConfig(path, cfg, err) ||
        err.find("line 2") == std::string::npos) {
      FAIL();
    }
    err.clear();
    path = WriteFile("dz_guard_config_bad_number.ini",
                     "[security]\nargon2_blocks=-5\n");
    if (LoadGuardConfig(path, cfg, err) || err.empty()) {
      FAIL();
    }
    err.clear();
    path = WriteFile("dz_guard_config_range.ini",
                     "[security]\nargon2_blocks=4\n");
    if (LoadGuardConfig(path, cfg, err) || err.empty()) {
      FAIL();
    }
    err.clear();
    if (LoadGuardConfig("/nonexistent/dz_guard.ini", cfg, err) ||
        err.empty()) {
      FAIL();
    }
  }

  return 0;
}
