#ifndef DZ_GUARD_HEX_UTILS_H
#define DZ_GUARD_HEX_UTILS_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace dz::common {

std::string BytesToHexLower(const std::uint8_t* data, std::size_t len);

// Decodes |hex| only when it holds exactly |byte_len| bytes. Either case is
// accepted. On failure |out| is left empty.
bool DecodeHexField(std::string_view hex,
                    std::size_t byte_len,
                    std::vector<std::uint8_t>& out);

}  // namespace dz::common

#endif  // DZ_GUARD_HEX_UTILS_H
