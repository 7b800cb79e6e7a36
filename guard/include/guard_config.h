#ifndef DZ_GUARD_GUARD_CONFIG_H
#define DZ_GUARD_GUARD_CONFIG_H

#include <cstdint>
#include <string>

#include "guard_types.h"

namespace dz::guard {

enum class PanicVariant : std::uint8_t { kPress = 0, kShake = 1 };

struct SecurityConfig {
  std::uint32_t passcode_length{6};
  // Argon2id cost; blocks are KiB of work area.
  std::uint32_t argon2_blocks{1024};
  std::uint32_t argon2_passes{3};
  bool reject_weak_passcodes{true};
  std::uint64_t unlock_grace_ms{5000};
  std::uint64_t lockout_short_ms{30000};
  std::uint64_t lockout_long_ms{300000};
};

struct MotionConfig {
  bool enabled{true};
  std::uint32_t interval_ms{100};
};

struct PanicConfig {
  bool enabled{false};
  PanicVariant variant{PanicVariant::kPress};
  std::uint64_t cooldown_ms{2000};
  std::uint32_t required_count{3};
  std::uint64_t press_window_ms{400};
  std::uint64_t press_debounce_ms{50};
  std::uint64_t shake_window_ms{2000};
  std::uint64_t shake_debounce_ms{200};
  double shake_threshold_g{2.5};
  std::uint32_t shake_interval_ms{50};
};

struct DecoyConfig {
  DecoyPreset hush_preset{DecoyPreset::kGeneralAssistant};
  DecoyPreset classified_preset{DecoyPreset::kStudyHelper};
};

struct GuardConfig {
  SecurityConfig security;
  MotionConfig motion;
  PanicConfig panic;
  DecoyConfig decoy;
};

bool LoadGuardConfig(const std::string& path, GuardConfig& out_cfg,
                     std::string& error);

}  // namespace dz::guard

#endif  // DZ_GUARD_GUARD_CONFIG_H
