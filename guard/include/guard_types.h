#ifndef DZ_GUARD_GUARD_TYPES_H
#define DZ_GUARD_GUARD_TYPES_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace dz::guard {

// Conversation contexts. kDiscretion is the low-friction flavor that is never
// passcode- or motion-locked.
enum class Flavor : std::uint8_t {
  kHush = 0,
  kClassified = 1,
  kDiscretion = 2,
};

inline constexpr std::size_t kFlavorCount = 3;

inline constexpr std::array<Flavor, kFlavorCount> kAllFlavors{
    {Flavor::kHush, Flavor::kClassified, Flavor::kDiscretion}};

enum class Role : std::uint8_t {
  kUser = 0,
  kAssistant = 1,
  kSystem = 2,
};

enum class DecoyPreset : std::uint8_t {
  kNone = 0,
  kAuto = 1,
  kStudyHelper = 2,
  kMealPlanning = 3,
  kGeneralAssistant = 4,
};

struct Message {
  std::string id;
  Role role{Role::kUser};
  // Only ever rewritten by SecureEraser.
  std::string text;
  std::uint64_t created_at_ms{0};
  Flavor context{Flavor::kHush};
};

struct DecoySet {
  DecoyPreset preset{DecoyPreset::kNone};
  std::vector<Message> custom_messages;
  bool burned{false};
};

struct PasscodeAttempts {
  std::uint32_t failed_attempts{0};
  std::optional<std::uint64_t> lockout_until_ms;
};

struct SecurityState {
  bool is_locked{false};
  bool is_passcode_set{false};
  bool is_duress_set{false};
  bool is_decoy_mode{false};
  Flavor active_flavor{Flavor::kHush};
  Flavor last_active_flavor{Flavor::kHush};
  PasscodeAttempts attempts;
};

inline constexpr std::size_t FlavorIndex(Flavor flavor) {
  return static_cast<std::size_t>(flavor);
}

inline constexpr bool IsLockExempt(Flavor flavor) {
  return flavor == Flavor::kDiscretion;
}

inline constexpr bool SupportsDecoyPreset(Flavor flavor) {
  return flavor == Flavor::kHush || flavor == Flavor::kClassified;
}

const char* FlavorName(Flavor flavor);
const char* RoleName(Role role);
const char* DecoyPresetName(DecoyPreset preset);

bool ParseFlavor(const std::string& text, Flavor& out);
bool ParseRole(const std::string& text, Role& out);
bool ParseDecoyPreset(const std::string& text, DecoyPreset& out);

}  // namespace dz::guard

#endif  // DZ_GUARD_GUARD_TYPES_H
