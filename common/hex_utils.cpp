#include "hex_utils.h"

namespace dz::common {

namespace {

int HexNibble(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return 10 + (c - 'a');
  }
  if (c >= 'A' && c <= 'F') {
    return 10 + (c - 'A');
  }
  return -1;
}

}  // namespace

std::string BytesToHexLower(const std::uint8_t* data, std::size_t len) {
  if (!data || len == 0) {
    return {};
  }
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out;
  out.resize(len * 2);
  for (std::size_t i = 0; i < len; ++i) {
    out[i * 2] = kHex[data[i] >> 4];
    out[i * 2 + 1] = kHex[data[i] & 0x0F];
  }
  return out;
}

bool DecodeHexField(std::string_view hex,
                    std::size_t byte_len,
                    std::vector<std::uint8_t>& out) {
  out.clear();
  if (byte_len == 0 || hex.size() != byte_len * 2) {
    return false;
  }
  out.resize(byte_len);
  for (std::size_t i = 0; i < byte_len; ++i) {
    const int hi = HexNibble(hex[2 * i]);
    const int lo = HexNibble(hex[2 * i + 1]);
    if (hi < 0 || lo < 0) {
      out.clear();
      return false;
    }
    out[i] = static_cast<std::uint8_t>((hi << 4) | lo);
  }
  return true;
}

}  // namespace dz::common
