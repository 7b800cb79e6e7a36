#include "credential_store.h"

#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

#include "platform_fs.h"
#include "secure_buffer.h"

namespace dz::guard {

namespace {

bool IsValidKey(const std::string& key) {
  if (key.empty()) return false;
  for (const char ch : key) {
    const bool ok = (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') ||
                    (ch >= '0' && ch <= '9') || ch == '_' || ch == '.' ||
                    ch == '-';
    if (!ok) return false;
  }
  return true;
}

bool IsValidValue(const std::string& value) {
  return value.find('\n') == std::string::npos &&
         value.find('\r') == std::string::npos;
}

}  // namespace

MemoryCredentialStore::~MemoryCredentialStore() {
  for (auto& kv : values_) {
    common::SecureWipe(kv.second);
  }
}

bool MemoryCredentialStore::Get(const std::string& key,
                                std::optional<std::string>& out,
                                std::string& error) {
  out.reset();
  std::lock_guard<std::mutex> lock(mutex_);
  if (failure_.has_value()) {
    error = *failure_;
    return false;
  }
  const auto it = values_.find(key);
  if (it != values_.end()) {
    out = it->second;
  }
  return true;
}

bool MemoryCredentialStore::Set(const std::string& key,
                                const std::string& value,
                                std::string& error) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (failure_.has_value()) {
    error = *failure_;
    return false;
  }
  if (!IsValidKey(key) || !IsValidValue(value)) {
    error = "credential entry invalid";
    return false;
  }
  auto& slot = values_[key];
  common::SecureWipe(slot);
  slot = value;
  return true;
}

bool MemoryCredentialStore::Delete(const std::string& key,
                                   std::string& error) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (failure_.has_value()) {
    error = *failure_;
    return false;
  }
  const auto it = values_.find(key);
  if (it != values_.end()) {
    common::SecureWipe(it->second);
    values_.erase(it);
  }
  return true;
}

void MemoryCredentialStore::SetFailure(std::optional<std::string> error) {
  std::lock_guard<std::mutex> lock(mutex_);
  failure_ = std::move(error);
}

FileCredentialStore::FileCredentialStore(std::filesystem::path path)
    : path_(std::move(path)) {}

bool FileCredentialStore::LoadLocked(std::map<std::string, std::string>& out,
                                     std::string& error) const {
  out.clear();
  std::error_code ec;
  if (!platform::fs::Exists(path_, ec)) {
    if (ec) {
      error = "credential store stat failed";
      return false;
    }
    return true;
  }
  std::ifstream f(path_, std::ios::binary);
  if (!f.is_open()) {
    error = "credential store open failed";
    return false;
  }
  std::string line;
  std::size_t line_no = 0;
  while (std::getline(f, line)) {
    ++line_no;
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (line.empty() || line.front() == '#') continue;
    const auto pos = line.find('=');
    if (pos == std::string::npos || pos == 0) {
      error = "credential store corrupt at line " + std::to_string(line_no);
      common::SecureWipe(line);
      return false;
    }
    out[line.substr(0, pos)] = line.substr(pos + 1);
    common::SecureWipe(line);
  }
  return true;
}

bool FileCredentialStore::SaveLocked(
    const std::map<std::string, std::string>& values,
    std::string& error) const {
  std::string blob;
  for (const auto& kv : values) {
    blob.append(kv.first);
    blob.push_back('=');
    blob.append(kv.second);
    blob.push_back('\n');
  }
  std::error_code ec;
  const auto parent = path_.parent_path();
  if (!parent.empty() && !platform::fs::Exists(parent, ec)) {
    if (!platform::fs::CreateDirectories(parent, ec)) {
      common::SecureWipe(blob);
      error = "credential store mkdir failed";
      return false;
    }
  }
  const bool ok = platform::fs::AtomicWrite(
      path_, reinterpret_cast<const std::uint8_t*>(blob.data()), blob.size(),
      ec);
  common::SecureWipe(blob);
  if (!ok) {
    error = "credential store write failed";
    if (ec) {
      error += ": " + ec.message();
    }
    return false;
  }
  return true;
}

bool FileCredentialStore::Get(const std::string& key,
                              std::optional<std::string>& out,
                              std::string& error) {
  out.reset();
  std::lock_guard<std::mutex> lock(mutex_);
  std::map<std::string, std::string> values;
  if (!LoadLocked(values, error)) {
    return false;
  }
  const auto it = values.find(key);
  if (it != values.end()) {
    out = it->second;
  }
  for (auto& kv : values) {
    common::SecureWipe(kv.second);
  }
  return true;
}

bool FileCredentialStore::Set(const std::string& key,
                              const std::string& value,
                              std::string& error) {
  if (!IsValidKey(key) || !IsValidValue(value)) {
    error = "credential entry invalid";
    return false;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  std::map<std::string, std::string> values;
  if (!LoadLocked(values, error)) {
    return false;
  }
  values[key] = value;
  const bool ok = SaveLocked(values, error);
  for (auto& kv : values) {
    common::SecureWipe(kv.second);
  }
  return ok;
}

bool FileCredentialStore::Delete(const std::string& key, std::string& error) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::map<std::string, std::string> values;
  if (!LoadLocked(values, error)) {
    return false;
  }
  const bool ok = values.erase(key) == 0 || SaveLocked(values, error);
  for (auto& kv : values) {
    common::SecureWipe(kv.second);
  }
  return ok;
}

}  // namespace dz::guard
