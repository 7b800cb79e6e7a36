#ifndef DZ_GUARD_PASSCODE_HASH_H
#define DZ_GUARD_PASSCODE_HASH_H

#include <cstddef>
#include <cstdint>
#include <string>

namespace dz::guard {

inline constexpr std::size_t kPasscodeSaltBytes = 16;
inline constexpr std::size_t kPasscodeHashBytes = 32;

// Record format: argon2id$<blocks>$<passes>$<salt-hex>$<hash-hex>
bool HashPasscode(const std::string& passcode,
                  std::uint32_t argon2_blocks,
                  std::uint32_t argon2_passes,
                  std::string& out_record,
                  std::string& error);

// Cost parameters are taken from the record, so records survive a config
// change. A malformed record is an error, not a mismatch.
bool VerifyPasscode(const std::string& passcode,
                    const std::string& record,
                    bool& out_match,
                    std::string& error);

}  // namespace dz::guard

#endif  // DZ_GUARD_PASSCODE_HASH_H
