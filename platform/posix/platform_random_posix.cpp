#include "platform_random.h"

#include <cerrno>

#include <fcntl.h>
#include <unistd.h>

#if defined(__linux__)
#include <sys/random.h>
#endif

namespace dz::platform {

namespace {

#if defined(__linux__)
bool FillFromGetrandom(std::uint8_t* out, std::size_t len) {
  std::size_t filled = 0;
  while (filled < len) {
    const ssize_t n = ::getrandom(out + filled, len - filled, 0);
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n <= 0) {
      return false;
    }
    filled += static_cast<std::size_t>(n);
  }
  return true;
}
#endif

bool FillFromUrandom(std::uint8_t* out, std::size_t len) {
  const int fd = ::open("/dev/urandom", O_RDONLY | O_CLOEXEC);
  if (fd < 0) {
    return false;
  }
  std::size_t filled = 0;
  bool ok = true;
  while (filled < len) {
    const ssize_t n = ::read(fd, out + filled, len - filled);
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n <= 0) {
      ok = false;
      break;
    }
    filled += static_cast<std::size_t>(n);
  }
  ::close(fd);
  return ok;
}

bool FillFromOs(std::uint8_t* out, std::size_t len) {
#if defined(__linux__)
  if (FillFromGetrandom(out, len)) {
    return true;
  }
#endif
  return FillFromUrandom(out, len);
}

bool RandomUint32(std::uint32_t& out) {
  std::uint8_t raw[4] = {};
  if (!FillFromOs(raw, sizeof(raw))) {
    return false;
  }
  out = static_cast<std::uint32_t>(raw[0]) |
        (static_cast<std::uint32_t>(raw[1]) << 8) |
        (static_cast<std::uint32_t>(raw[2]) << 16) |
        (static_cast<std::uint32_t>(raw[3]) << 24);
  return true;
}

}  // namespace

bool RandomBytes(std::uint8_t* out, std::size_t len) {
  if (out == nullptr || len == 0) {
    return false;
  }
  return FillFromOs(out, len);
}

bool RandomBelow(std::uint32_t bound, std::uint32_t& out) {
  if (bound == 0) {
    return false;
  }
  // Rejection sampling; draws at or above limit would bias the modulo.
  const std::uint32_t limit = 0xFFFFFFFFu - (0xFFFFFFFFu % bound);
  for (int draw = 0; draw < 64; ++draw) {
    std::uint32_t v = 0;
    if (!RandomUint32(v)) {
      return false;
    }
    if (v < limit) {
      out = v % bound;
      return true;
    }
  }
  return false;
}

}  // namespace dz::platform
