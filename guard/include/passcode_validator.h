#ifndef DZ_GUARD_PASSCODE_VALIDATOR_H
#define DZ_GUARD_PASSCODE_VALIDATOR_H

#include <cstdint>
#include <optional>
#include <string>

#include "credential_store.h"
#include "guard_config.h"
#include "guard_types.h"

namespace dz::guard {

enum class ValidationResult : std::uint8_t {
  kReal = 0,
  kDuress = 1,
  kInvalid = 2,
  kLockedOut = 3,
};

enum class PasscodeFormat : std::uint8_t {
  kOk = 0,
  kEmpty = 1,
  kWrongLength = 2,
  kNonDigit = 3,
};

const char* ValidationResultName(ValidationResult result);

PasscodeFormat CheckPasscodeFormat(const std::string& code,
                                   std::uint32_t required_length);
// Repeated digits, straight runs and a short list of well-known codes.
bool IsWeakPasscode(const std::string& code);

struct ConfiguredCodes {
  bool passcode_set{false};
  bool duress_set{false};
};

class PasscodeValidator {
 public:
  PasscodeValidator(CredentialStore& store, const SecurityConfig& cfg);

  // Duress is checked before the real passcode. While a lockout is active
  // the store is not consulted and |attempts| is left unchanged.
  ValidationResult Validate(const std::string& code,
                            std::uint64_t now_ms,
                            PasscodeAttempts& attempts);

  bool SetPasscode(const std::string& code, std::string& error);
  // nullopt removes the duress code.
  bool SetDuressCode(const std::optional<std::string>& code,
                     std::string& error);
  bool ClearPasscodes(std::string& error);
  bool LoadConfigured(ConfiguredCodes& out, std::string& error);

  std::uint64_t LockoutRemainingMs(const PasscodeAttempts& attempts,
                                   std::uint64_t now_ms) const;

 private:
  bool MatchesStored(const char* key, const std::string& code);
  bool CheckNewCode(const std::string& code, std::string& error) const;
  void RecordFailure(std::uint64_t now_ms, PasscodeAttempts& attempts) const;

  CredentialStore& store_;
  SecurityConfig cfg_;
};

}  // namespace dz::guard

#endif  // DZ_GUARD_PASSCODE_VALIDATOR_H
