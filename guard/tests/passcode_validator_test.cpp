#include <cstddef>
#include <iostream>
#include <optional>
#include <string>

#include "credential_store.h"
#include "guard_config.h"
#include "passcode_hash.h"
#include "passcode_validator.h"

namespace {

#define FAIL()                                                        \
  do {                                                                \
    std::cerr << "passcode_validator_test failed at " << __FILE__     \
              << ":" << __LINE__ << "\n";                             \
    return 1;                                                         \
  } while (false)

using dz::guard::MemoryCredentialStore;
using dz::guard::PasscodeAttempts;
using dz::guard::PasscodeFormat;
using dz::guard::PasscodeValidator;
using dz::guard::SecurityConfig;
using dz::guard::ValidationResult;

SecurityConfig FastConfig(std::uint32_t length) {
  SecurityConfig cfg;
  cfg.passcode_length = length;
  cfg.argon2_blocks = 8;
  cfg.argon2_passes = 1;
  cfg.reject_weak_passcodes = false;
  return cfg;
}

bool Store(MemoryCredentialStore& store,
           const char* key,
           const std::string& code) {
  std::string record;
  std::string err;
  if (!dz::guard::HashPasscode(code, 8, 1, record, err)) {
    return false;
  }
  return store.Set(key, record, err);
}

}  // namespace

int main() {
  // Duress and real both validate back to back; attempts reset each time.
  {
    MemoryCredentialStore store;
    if (!Store(store, dz::guard::kPasscodeKey, "1234") ||
        !Store(store, dz::guard::kDuressKey, "0000")) {
      FAIL();
    }
    PasscodeValidator validator(store, FastConfig(4));
    PasscodeAttempts attempts;
    attempts.failed_attempts = 2;
    if (validator.Validate("0000", 1000, attempts) !=
        ValidationResult::kDuress) {
      FAIL();
    }
    if (attempts.failed_attempts != 0 || attempts.lockout_until_ms) {
      FAIL();
    }
    attempts.failed_attempts = 1;
    if (validator.Validate("1234", 1001, attempts) != ValidationResult::kReal) {
      FAIL();
    }
    if (attempts.failed_attempts != 0 || attempts.lockout_until_ms) {
      FAIL();
    }
  }

  // Third failure starts a lockout; the next try inside it is refused.
  {
    MemoryCredentialStore store;
    if (!Store(store, dz::guard::kPasscodeKey, "1234")) {
      FAIL();
    }
    PasscodeValidator validator(store, FastConfig(4));
    PasscodeAttempts attempts;
    const std::uint64_t t0 = 50000;
    for (std::uint64_t i = 0; i < 3; ++i) {
      if (validator.Validate("9999", t0 + i * 3000, attempts) !=
          ValidationResult::kInvalid) {
        FAIL();
      }
      if (i < 2 && attempts.lockout_until_ms) {
        FAIL();
      }
    }
    const std::uint64_t third = t0 + 6000;
    if (!attempts.lockout_until_ms ||
        *attempts.lockout_until_ms != third + 30000) {
      FAIL();
    }
    if (validator.Validate("9999", third + 1000, attempts) !=
        ValidationResult::kLockedOut) {
      FAIL();
    }
    // Even the right code is refused, and nothing is counted.
    if (validator.Validate("1234", third + 1000, attempts) !=
        ValidationResult::kLockedOut) {
      FAIL();
    }
    if (attempts.failed_attempts != 3) {
      FAIL();
    }
    if (validator.LockoutRemainingMs(attempts, third + 1000) != 29000) {
      FAIL();
    }
  }

  // Schedule: failures 3..5 give 30s, 6 and later give 5 minutes.
  {
    MemoryCredentialStore store;
    if (!Store(store, dz::guard::kPasscodeKey, "1234")) {
      FAIL();
    }
    PasscodeValidator validator(store, FastConfig(4));
    PasscodeAttempts attempts;
    std::uint64_t now = 0;
    for (std::uint32_t n = 1; n <= 8; ++n) {
      if (attempts.lockout_until_ms) {
        now = *attempts.lockout_until_ms;
      }
      if (validator.Validate("4321", now, attempts) !=
          ValidationResult::kInvalid) {
        FAIL();
      }
      if (attempts.failed_attempts != n) {
        FAIL();
      }
      if (n < 3) {
        if (attempts.lockout_until_ms) {
          FAIL();
        }
      } else if (n < 6) {
        if (*attempts.lockout_until_ms != now + 30000) {
          FAIL();
        }
      } else if (*attempts.lockout_until_ms != now + 300000) {
        FAIL();
      }
    }
    now = *attempts.lockout_until_ms;
    if (validator.Validate("1234", now, attempts) != ValidationResult::kReal) {
      FAIL();
    }
    if (attempts.failed_attempts != 0 || attempts.lockout_until_ms) {
      FAIL();
    }
  }

  // A code matching both records resolves to duress.
  {
    MemoryCredentialStore store;
    if (!Store(store, dz::guard::kPasscodeKey, "2580") ||
        !Store(store, dz::guard::kDuressKey, "2580")) {
      FAIL();
    }
    PasscodeValidator validator(store, FastConfig(4));
    PasscodeAttempts attempts;
    if (validator.Validate("2580", 10, attempts) !=
        ValidationResult::kDuress) {
      FAIL();
    }
  }

  // Store failures and corrupt records fail toward Invalid.
  {
    MemoryCredentialStore store;
    if (!Store(store, dz::guard::kPasscodeKey, "1234")) {
      FAIL();
    }
    PasscodeValidator validator(store, FastConfig(4));
    PasscodeAttempts attempts;
    store.SetFailure(std::string("keystore locked"));
    if (validator.Validate("1234", 10, attempts) !=
        ValidationResult::kInvalid) {
      FAIL();
    }
    if (attempts.failed_attempts != 1) {
      FAIL();
    }
    store.SetFailure(std::nullopt);
    std::string err;
    if (!store.Set(dz::guard::kPasscodeKey, "argon2id$8$1$zz$00", err)) {
      FAIL();
    }
    if (validator.Validate("1234", 20, attempts) !=
        ValidationResult::kInvalid) {
      FAIL();
    }
  }

  // Format and weak-code checks.
  {
    if (dz::guard::CheckPasscodeFormat("", 6) != PasscodeFormat::kEmpty ||
        dz::guard::CheckPasscodeFormat("12345", 6) !=
            PasscodeFormat::kWrongLength ||
        dz::guard::CheckPasscodeFormat("12a456", 6) !=
            PasscodeFormat::kNonDigit ||
        dz::guard::CheckPasscodeFormat("804271", 6) != PasscodeFormat::kOk) {
      FAIL();
    }
    if (!dz::guard::IsWeakPasscode("123456") ||
        !dz::guard::IsWeakPasscode("777777") ||
        !dz::guard::IsWeakPasscode("696969") ||
        !dz::guard::IsWeakPasscode("987654") ||
        dz::guard::IsWeakPasscode("804271")) {
      FAIL();
    }
  }

  // Setting codes.
  {
    MemoryCredentialStore store;
    SecurityConfig cfg = FastConfig(6);
    cfg.reject_weak_passcodes = true;
    PasscodeValidator validator(store, cfg);
    std::string err;
    if (validator.SetDuressCode(std::string("913377"), err)) {
      FAIL();
    }
    if (validator.SetPasscode("123456", err)) {
      FAIL();
    }
    if (validator.SetPasscode("80427", err)) {
      FAIL();
    }
    if (!validator.SetPasscode("804271", err)) {
      FAIL();
    }
    std::optional<std::string> raw;
    if (!store.Get(dz::guard::kPasscodeKey, raw, err) || !raw ||
        raw->find("804271") != std::string::npos ||
        raw->rfind("argon2id$8$1$", 0) != 0) {
      FAIL();
    }
    if (validator.SetDuressCode(std::string("804271"), err)) {
      FAIL();
    }
    if (!validator.SetDuressCode(std::string("913377"), err)) {
      FAIL();
    }
    dz::guard::ConfiguredCodes codes;
    if (!validator.LoadConfigured(codes, err) || !codes.passcode_set ||
        !codes.duress_set) {
      FAIL();
    }
    PasscodeAttempts attempts;
    if (validator.Validate("913377", 5, attempts) !=
        ValidationResult::kDuress) {
      FAIL();
    }
    if (!validator.SetDuressCode(std::nullopt, err)) {
      FAIL();
    }
    if (validator.Validate("913377", 6, attempts) !=
        ValidationResult::kInvalid) {
      FAIL();
    }
    if (!validator.ClearPasscodes(err) || !validator.LoadConfigured(codes, err) ||
        codes.passcode_set || codes.duress_set) {
      FAIL();
    }
  }

  // Record fields must decode to the exact salt and hash sizes.
  {
    std::string record;
    std::string err;
    bool match = false;
    if (!dz::guard::HashPasscode("804271", 8, 1, record, err) ||
        !dz::guard::VerifyPasscode("804271", record, match, err) || !match) {
      FAIL();
    }
    std::string upper = record;
    for (std::size_t i = upper.find('$', 13); i < upper.size(); ++i) {
      if (upper[i] >= 'a' && upper[i] <= 'f') {
        upper[i] = static_cast<char>(upper[i] - 'a' + 'A');
      }
    }
    if (!dz::guard::VerifyPasscode("804271", upper, match, err) || !match) {
      FAIL();
    }
    const std::string short_hash = record.substr(0, record.size() - 2);
    if (dz::guard::VerifyPasscode("804271", short_hash, match, err) || match) {
      FAIL();
    }
  }

  return 0;
}
