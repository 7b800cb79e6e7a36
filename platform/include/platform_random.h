#ifndef DZ_GUARD_PLATFORM_RANDOM_H
#define DZ_GUARD_PLATFORM_RANDOM_H

#include <cstddef>
#include <cstdint>

namespace dz::platform {

// Fills |out| from the OS CSPRNG. False when no source is available.
bool RandomBytes(std::uint8_t* out, std::size_t len);
// Uniform draw in [0, bound). bound must be non-zero.
bool RandomBelow(std::uint32_t bound, std::uint32_t& out);

}  // namespace dz::platform

#endif  // DZ_GUARD_PLATFORM_RANDOM_H
