#include "platform_fs.h"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <string>

#include "platform_random.h"

namespace dz::platform::fs {

namespace {

class UniqueFd {
 public:
  explicit UniqueFd(int fd) : fd_(fd) {}
  ~UniqueFd() { Close(); }

  UniqueFd(const UniqueFd&) = delete;
  UniqueFd& operator=(const UniqueFd&) = delete;

  int get() const { return fd_; }
  bool valid() const { return fd_ >= 0; }

  // Returns false and sets errno if close itself fails.
  bool Close() {
    if (fd_ < 0) {
      return true;
    }
    const int rc = ::close(fd_);
    fd_ = -1;
    return rc == 0;
  }

 private:
  int fd_;
};

std::error_code LastError() {
  return std::error_code(errno, std::generic_category());
}

bool WriteFully(int fd, const std::uint8_t* data, std::size_t len) {
  while (len > 0) {
    const ssize_t rc = ::write(fd, data, len);
    if (rc < 0) {
      if (errno == EINTR) {
        continue;
      }
      return false;
    }
    data += rc;
    len -= static_cast<std::size_t>(rc);
  }
  return true;
}

std::filesystem::path TempSibling(const std::filesystem::path& target) {
  std::array<std::uint8_t, 6> raw{};
  std::string suffix;
  if (RandomBytes(raw.data(), raw.size())) {
    static constexpr char kAlphabet[] = "0123456789abcdefghijklmnopqrstuv";
    for (const std::uint8_t b : raw) {
      suffix.push_back(kAlphabet[b & 0x1F]);
    }
  } else {
    suffix = std::to_string(static_cast<long>(::getpid()));
  }
  std::filesystem::path tmp = target;
  tmp += ".tmp-" + suffix;
  return tmp;
}

void SyncDirectory(const std::filesystem::path& file) {
  const std::filesystem::path dir =
      file.has_parent_path() ? file.parent_path() : std::filesystem::path(".");
  UniqueFd dfd(::open(dir.c_str(), O_RDONLY | O_DIRECTORY));
  if (dfd.valid()) {
    (void)::fsync(dfd.get());
  }
}

}  // namespace

bool Exists(const std::filesystem::path& path, std::error_code& ec) {
  return std::filesystem::exists(path, ec);
}

bool CreateDirectories(const std::filesystem::path& path,
                       std::error_code& ec) {
  std::filesystem::create_directories(path, ec);
  if (ec) {
    return false;
  }
  std::filesystem::permissions(path, std::filesystem::perms::owner_all,
                               std::filesystem::perm_options::replace, ec);
  return !ec;
}

bool AtomicWrite(const std::filesystem::path& path,
                 const std::uint8_t* data,
                 std::size_t len,
                 std::error_code& ec) {
  ec.clear();
  if (path.empty() || (len > 0 && !data)) {
    ec = std::make_error_code(std::errc::invalid_argument);
    return false;
  }
  constexpr int kMaxAttempts = 8;
  for (int attempt = 0; attempt < kMaxAttempts; ++attempt) {
    const std::filesystem::path tmp = TempSibling(path);
    UniqueFd fd(::open(tmp.c_str(),
                       O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC,
                       S_IRUSR | S_IWUSR));
    if (!fd.valid()) {
      if (errno == EEXIST) {
        continue;
      }
      ec = LastError();
      return false;
    }
    const bool written = WriteFully(fd.get(), data, len) &&
                         ::fsync(fd.get()) == 0 && fd.Close();
    if (!written || ::rename(tmp.c_str(), path.c_str()) != 0) {
      ec = LastError();
      std::error_code ignored;
      std::filesystem::remove(tmp, ignored);
      return false;
    }
    SyncDirectory(path);
    return true;
  }
  ec = std::make_error_code(std::errc::file_exists);
  return false;
}

}  // namespace dz::platform::fs
