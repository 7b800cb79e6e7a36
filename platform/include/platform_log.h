#ifndef DZ_GUARD_PLATFORM_LOG_H
#define DZ_GUARD_PLATFORM_LOG_H

#include <cstdint>
#include <functional>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace dz::platform::log {

enum class Level : std::uint8_t { kDebug, kInfo, kWarn, kError };

struct Field {
  std::string_view key;
  std::string_view value;
};

// One line after redaction. Sinks never see raw field values.
struct Record {
  Level level{Level::kInfo};
  std::string tag;
  std::string message;
  std::vector<std::pair<std::string, std::string>> fields;
};

using Sink = std::function<void(const Record&)>;

// Replaces the stdout/stderr writer. An empty sink restores it.
void SetSink(Sink sink);
// Records below |level| are dropped before redaction. Default is kInfo.
void SetMinLevel(Level level);

void Log(Level level, std::string_view tag, std::string_view message);
void Log(Level level,
         std::string_view tag,
         std::string_view message,
         std::initializer_list<Field> fields);

bool IsSensitiveKey(std::string_view key);
// Masks |value| when |key| is sensitive.
std::string RedactValue(std::string_view key, std::string_view value);
// Masks the value of inline "word=value" tokens with a sensitive word.
std::string RedactMessage(std::string_view message);

}  // namespace dz::platform::log

#endif  // DZ_GUARD_PLATFORM_LOG_H
