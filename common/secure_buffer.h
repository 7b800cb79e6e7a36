#ifndef DZ_GUARD_SECURE_BUFFER_H
#define DZ_GUARD_SECURE_BUFFER_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace dz::common {

// Volatile stores so the compiler cannot drop the zeroing of a buffer that
// is about to die.
inline void SecureWipe(void* data, std::size_t len) {
  if (data == nullptr) {
    return;
  }
  auto* p = static_cast<volatile unsigned char*>(data);
  for (std::size_t i = 0; i < len; ++i) {
    p[i] = 0;
  }
}

template <std::size_t N>
inline void SecureWipe(std::array<std::uint8_t, N>& buf) {
  SecureWipe(buf.data(), N);
}

// Zeroes the characters in place and then empties the string. Capacity
// beyond size() is not touched.
inline void SecureWipe(std::string& text) {
  if (!text.empty()) {
    SecureWipe(&text[0], text.size());
  }
  text.clear();
}

// Zeroes a fixed-size key or digest buffer when the scope ends.
template <std::size_t N>
class ScopedWipe {
 public:
  explicit ScopedWipe(std::array<std::uint8_t, N>& buf) : buf_(buf) {}
  ~ScopedWipe() { SecureWipe(buf_); }

  ScopedWipe(const ScopedWipe&) = delete;
  ScopedWipe& operator=(const ScopedWipe&) = delete;

 private:
  std::array<std::uint8_t, N>& buf_;
};

}  // namespace dz::common

#endif  // DZ_GUARD_SECURE_BUFFER_H
