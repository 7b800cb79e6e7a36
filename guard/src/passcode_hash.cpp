#include "passcode_hash.h"

#include <array>
#include <cstdlib>
#include <vector>

#include "hex_utils.h"
#include "monocypher.h"
#include "platform_random.h"
#include "secure_buffer.h"

namespace dz::guard {

namespace {

constexpr char kScheme[] = "argon2id";
constexpr std::uint32_t kMaxBlocks = 65536;
constexpr std::uint32_t kMaxPasses = 16;

bool ParseField(const std::string& text, std::uint32_t& out) {
  if (text.empty() || text.size() > 10) return false;
  for (const char ch : text) {
    if (ch < '0' || ch > '9') return false;
  }
  const unsigned long long v = std::strtoull(text.c_str(), nullptr, 10);
  if (v > 0xFFFFFFFFull) return false;
  out = static_cast<std::uint32_t>(v);
  return true;
}

bool SplitRecord(const std::string& record, std::array<std::string, 5>& out) {
  std::size_t start = 0;
  for (std::size_t i = 0; i < out.size(); ++i) {
    const auto pos = record.find('$', start);
    if (i + 1 == out.size()) {
      if (pos != std::string::npos) return false;
      out[i] = record.substr(start);
    } else {
      if (pos == std::string::npos) return false;
      out[i] = record.substr(start, pos - start);
      start = pos + 1;
    }
  }
  return true;
}

bool DeriveHash(const std::string& passcode,
                const std::uint8_t* salt,
                std::uint32_t blocks,
                std::uint32_t passes,
                std::array<std::uint8_t, kPasscodeHashBytes>& out,
                std::string& error) {
  if (blocks < 8 || blocks > kMaxBlocks || passes == 0 ||
      passes > kMaxPasses) {
    error = "argon2id params invalid";
    return false;
  }
  std::vector<std::uint8_t> work_area;
  work_area.resize(static_cast<std::size_t>(blocks) * 1024);

  crypto_argon2_config cfg;
  cfg.algorithm = CRYPTO_ARGON2_ID;
  cfg.nb_blocks = blocks;
  cfg.nb_passes = passes;
  cfg.nb_lanes = 1;

  crypto_argon2_inputs in;
  in.pass = reinterpret_cast<const std::uint8_t*>(passcode.data());
  in.pass_size = static_cast<std::uint32_t>(passcode.size());
  in.salt = salt;
  in.salt_size = static_cast<std::uint32_t>(kPasscodeSaltBytes);

  crypto_argon2(out.data(), static_cast<std::uint32_t>(out.size()),
                work_area.data(), cfg, in, crypto_argon2_no_extras);
  crypto_wipe(work_area.data(), work_area.size());
  return true;
}

}  // namespace

bool HashPasscode(const std::string& passcode,
                  std::uint32_t argon2_blocks,
                  std::uint32_t argon2_passes,
                  std::string& out_record,
                  std::string& error) {
  out_record.clear();
  std::array<std::uint8_t, kPasscodeSaltBytes> salt{};
  if (!platform::RandomBytes(salt.data(), salt.size())) {
    error = "rng failed";
    return false;
  }
  std::array<std::uint8_t, kPasscodeHashBytes> hash{};
  common::ScopedWipe hash_wipe(hash);
  if (!DeriveHash(passcode, salt.data(), argon2_blocks, argon2_passes, hash,
                  error)) {
    return false;
  }
  out_record = std::string(kScheme) + "$" + std::to_string(argon2_blocks) +
               "$" + std::to_string(argon2_passes) + "$" +
               common::BytesToHexLower(salt.data(), salt.size()) + "$" +
               common::BytesToHexLower(hash.data(), hash.size());
  return true;
}

bool VerifyPasscode(const std::string& passcode,
                    const std::string& record,
                    bool& out_match,
                    std::string& error) {
  out_match = false;
  std::array<std::string, 5> parts;
  if (!SplitRecord(record, parts) || parts[0] != kScheme) {
    error = "passcode record malformed";
    return false;
  }
  std::uint32_t blocks = 0;
  std::uint32_t passes = 0;
  if (!ParseField(parts[1], blocks) || !ParseField(parts[2], passes)) {
    error = "passcode record params invalid";
    return false;
  }
  std::vector<std::uint8_t> salt;
  std::vector<std::uint8_t> expected;
  if (!common::DecodeHexField(parts[3], kPasscodeSaltBytes, salt) ||
      !common::DecodeHexField(parts[4], kPasscodeHashBytes, expected)) {
    error = "passcode record encoding invalid";
    return false;
  }
  std::array<std::uint8_t, kPasscodeHashBytes> actual{};
  common::ScopedWipe actual_wipe(actual);
  if (!DeriveHash(passcode, salt.data(), blocks, passes, actual, error)) {
    return false;
  }
  out_match = crypto_verify32(actual.data(), expected.data()) == 0;
  return true;
}

}  // namespace dz::guard
