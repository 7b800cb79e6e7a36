#include "passcode_validator.h"

#include <array>

#include "passcode_hash.h"
#include "platform_log.h"
#include "secure_buffer.h"

namespace dz::guard {

namespace {

constexpr char kLogTag[] = "passcode";
constexpr std::uint32_t kShortLockoutAttempts = 3;
constexpr std::uint32_t kLongLockoutAttempts = 6;

constexpr std::array<const char*, 17> kCommonCodes{{
    "123456", "654321", "111111", "000000", "222222", "333333",
    "444444", "555555", "666666", "777777", "888888", "999999",
    "121212", "101010", "000001", "123123", "696969",
}};

}  // namespace

const char* ValidationResultName(ValidationResult result) {
  switch (result) {
    case ValidationResult::kReal:
      return "real";
    case ValidationResult::kDuress:
      return "duress";
    case ValidationResult::kInvalid:
      return "invalid";
    case ValidationResult::kLockedOut:
      return "locked_out";
  }
  return "unknown";
}

PasscodeFormat CheckPasscodeFormat(const std::string& code,
                                   std::uint32_t required_length) {
  if (code.empty()) {
    return PasscodeFormat::kEmpty;
  }
  for (const char ch : code) {
    if (ch < '0' || ch > '9') {
      return PasscodeFormat::kNonDigit;
    }
  }
  if (code.size() != required_length) {
    return PasscodeFormat::kWrongLength;
  }
  return PasscodeFormat::kOk;
}

bool IsWeakPasscode(const std::string& code) {
  for (const char* common : kCommonCodes) {
    if (code == common) {
      return true;
    }
  }
  if (code.size() < 2) {
    return false;
  }
  bool same = true;
  bool ascending = true;
  bool descending = true;
  for (std::size_t i = 1; i < code.size(); ++i) {
    const int d = code[i] - code[i - 1];
    same = same && d == 0;
    ascending = ascending && d == 1;
    descending = descending && d == -1;
  }
  return same || ascending || descending;
}

PasscodeValidator::PasscodeValidator(CredentialStore& store,
                                     const SecurityConfig& cfg)
    : store_(store), cfg_(cfg) {}

bool PasscodeValidator::MatchesStored(const char* key,
                                      const std::string& code) {
  std::optional<std::string> record;
  std::string error;
  if (!store_.Get(key, record, error)) {
    platform::log::Log(platform::log::Level::kWarn, kLogTag,
                       "credential read failed",
                       {{"store_key", key}, {"error", error}});
    return false;
  }
  if (!record.has_value()) {
    return false;
  }
  bool match = false;
  const bool ok = VerifyPasscode(code, *record, match, error);
  common::SecureWipe(*record);
  if (!ok) {
    platform::log::Log(platform::log::Level::kWarn, kLogTag,
                       "credential record unusable",
                       {{"store_key", key}, {"error", error}});
    return false;
  }
  return match;
}

void PasscodeValidator::RecordFailure(std::uint64_t now_ms,
                                      PasscodeAttempts& attempts) const {
  attempts.failed_attempts++;
  if (attempts.failed_attempts >= kLongLockoutAttempts) {
    attempts.lockout_until_ms = now_ms + cfg_.lockout_long_ms;
  } else if (attempts.failed_attempts >= kShortLockoutAttempts) {
    attempts.lockout_until_ms = now_ms + cfg_.lockout_short_ms;
  }
}

ValidationResult PasscodeValidator::Validate(const std::string& code,
                                             std::uint64_t now_ms,
                                             PasscodeAttempts& attempts) {
  if (attempts.lockout_until_ms.has_value() &&
      now_ms < *attempts.lockout_until_ms) {
    return ValidationResult::kLockedOut;
  }
  if (MatchesStored(kDuressKey, code)) {
    attempts = PasscodeAttempts{};
    return ValidationResult::kDuress;
  }
  if (MatchesStored(kPasscodeKey, code)) {
    attempts = PasscodeAttempts{};
    return ValidationResult::kReal;
  }
  RecordFailure(now_ms, attempts);
  platform::log::Log(platform::log::Level::kInfo, kLogTag,
                     "passcode rejected",
                     {{"failed_attempts",
                       std::to_string(attempts.failed_attempts)}});
  return ValidationResult::kInvalid;
}

std::uint64_t PasscodeValidator::LockoutRemainingMs(
    const PasscodeAttempts& attempts, std::uint64_t now_ms) const {
  if (!attempts.lockout_until_ms.has_value() ||
      now_ms >= *attempts.lockout_until_ms) {
    return 0;
  }
  return *attempts.lockout_until_ms - now_ms;
}

bool PasscodeValidator::CheckNewCode(const std::string& code,
                                     std::string& error) const {
  switch (CheckPasscodeFormat(code, cfg_.passcode_length)) {
    case PasscodeFormat::kOk:
      break;
    case PasscodeFormat::kEmpty:
      error = "passcode empty";
      return false;
    case PasscodeFormat::kWrongLength:
      error = "passcode must be " + std::to_string(cfg_.passcode_length) +
              " digits";
      return false;
    case PasscodeFormat::kNonDigit:
      error = "passcode must contain digits only";
      return false;
  }
  if (cfg_.reject_weak_passcodes && IsWeakPasscode(code)) {
    error = "passcode too common";
    return false;
  }
  return true;
}

bool PasscodeValidator::SetPasscode(const std::string& code,
                                    std::string& error) {
  if (!CheckNewCode(code, error)) {
    return false;
  }
  if (MatchesStored(kDuressKey, code)) {
    error = "passcode must differ from duress code";
    return false;
  }
  std::string record;
  if (!HashPasscode(code, cfg_.argon2_blocks, cfg_.argon2_passes, record,
                    error)) {
    return false;
  }
  const bool ok = store_.Set(kPasscodeKey, record, error);
  common::SecureWipe(record);
  if (ok) {
    platform::log::Log(platform::log::Level::kInfo, kLogTag, "passcode set");
  }
  return ok;
}

bool PasscodeValidator::SetDuressCode(const std::optional<std::string>& code,
                                      std::string& error) {
  if (!code.has_value()) {
    if (!store_.Delete(kDuressKey, error)) {
      return false;
    }
    platform::log::Log(platform::log::Level::kInfo, kLogTag,
                       "duress code cleared");
    return true;
  }
  std::optional<std::string> existing;
  if (!store_.Get(kPasscodeKey, existing, error)) {
    return false;
  }
  if (!existing.has_value()) {
    error = "set a passcode before a duress code";
    return false;
  }
  common::SecureWipe(*existing);
  if (!CheckNewCode(*code, error)) {
    return false;
  }
  if (MatchesStored(kPasscodeKey, *code)) {
    error = "duress code must differ from passcode";
    return false;
  }
  std::string record;
  if (!HashPasscode(*code, cfg_.argon2_blocks, cfg_.argon2_passes, record,
                    error)) {
    return false;
  }
  const bool ok = store_.Set(kDuressKey, record, error);
  common::SecureWipe(record);
  if (ok) {
    platform::log::Log(platform::log::Level::kInfo, kLogTag,
                       "duress code set");
  }
  return ok;
}

bool PasscodeValidator::ClearPasscodes(std::string& error) {
  if (!store_.Delete(kDuressKey, error)) {
    return false;
  }
  return store_.Delete(kPasscodeKey, error);
}

bool PasscodeValidator::LoadConfigured(ConfiguredCodes& out,
                                       std::string& error) {
  out = ConfiguredCodes{};
  std::optional<std::string> record;
  if (!store_.Get(kPasscodeKey, record, error)) {
    return false;
  }
  out.passcode_set = record.has_value();
  if (record.has_value()) common::SecureWipe(*record);
  if (!store_.Get(kDuressKey, record, error)) {
    return false;
  }
  out.duress_set = record.has_value();
  if (record.has_value()) common::SecureWipe(*record);
  return true;
}

}  // namespace dz::guard
