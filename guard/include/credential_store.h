#ifndef DZ_GUARD_CREDENTIAL_STORE_H
#define DZ_GUARD_CREDENTIAL_STORE_H

#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace dz::guard {

inline constexpr char kPasscodeKey[] = "dz_passcode";
inline constexpr char kDuressKey[] = "dz_duress";

// Synchronous key/value store for credential records. Values are opaque to
// the store; callers only ever put hash records here.
class CredentialStore {
 public:
  virtual ~CredentialStore() = default;

  // Missing keys succeed with |out| reset.
  virtual bool Get(const std::string& key,
                   std::optional<std::string>& out,
                   std::string& error) = 0;
  virtual bool Set(const std::string& key,
                   const std::string& value,
                   std::string& error) = 0;
  // Deleting a missing key is not an error.
  virtual bool Delete(const std::string& key, std::string& error) = 0;
};

class MemoryCredentialStore final : public CredentialStore {
 public:
  MemoryCredentialStore() = default;
  ~MemoryCredentialStore() override;

  MemoryCredentialStore(const MemoryCredentialStore&) = delete;
  MemoryCredentialStore& operator=(const MemoryCredentialStore&) = delete;

  bool Get(const std::string& key,
           std::optional<std::string>& out,
           std::string& error) override;
  bool Set(const std::string& key,
           const std::string& value,
           std::string& error) override;
  bool Delete(const std::string& key, std::string& error) override;

  // Test hook: every later call fails with |error|.
  void SetFailure(std::optional<std::string> error);

 private:
  std::mutex mutex_;
  std::map<std::string, std::string> values_;
  std::optional<std::string> failure_;
};

// One "key=value" line per entry; rewritten atomically with mode 0600.
class FileCredentialStore final : public CredentialStore {
 public:
  explicit FileCredentialStore(std::filesystem::path path);

  bool Get(const std::string& key,
           std::optional<std::string>& out,
           std::string& error) override;
  bool Set(const std::string& key,
           const std::string& value,
           std::string& error) override;
  bool Delete(const std::string& key, std::string& error) override;

  const std::filesystem::path& path() const { return path_; }

 private:
  bool LoadLocked(std::map<std::string, std::string>& out,
                  std::string& error) const;
  bool SaveLocked(const std::map<std::string, std::string>& values,
                  std::string& error) const;

  std::filesystem::path path_;
  std::mutex mutex_;
};

}  // namespace dz::guard

#endif  // DZ_GUARD_CREDENTIAL_STORE_H
