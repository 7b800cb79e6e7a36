#ifndef DZ_GUARD_PLATFORM_FS_H
#define DZ_GUARD_PLATFORM_FS_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <system_error>

namespace dz::platform::fs {

bool Exists(const std::filesystem::path& path, std::error_code& ec);
bool CreateDirectories(const std::filesystem::path& path,
                       std::error_code& ec);
// Writes to a sibling temp file (mode 0600), fsyncs it and renames it over
// |path|.
bool AtomicWrite(const std::filesystem::path& path,
                 const std::uint8_t* data,
                 std::size_t len,
                 std::error_code& ec);

}  // namespace dz::platform::fs

#endif  // DZ_GUARD_PLATFORM_FS_H
