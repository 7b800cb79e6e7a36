#include "platform_log.h"

#include <atomic>
#include <cctype>
#include <cstdio>
#include <mutex>
#include <string>
#include <utility>

namespace dz::platform::log {

namespace {

struct SinkSlot {
  std::mutex mutex;
  Sink sink;
};

SinkSlot& GlobalSink() {
  static SinkSlot slot;
  return slot;
}

std::atomic<int> g_min_level{static_cast<int>(Level::kInfo)};

const char* LevelName(Level level) {
  switch (level) {
    case Level::kDebug:
      return "DEBUG";
    case Level::kInfo:
      return "INFO";
    case Level::kWarn:
      return "WARN";
    case Level::kError:
      return "ERROR";
  }
  return "INFO";
}

bool IsSeparator(char ch) {
  return std::isspace(static_cast<unsigned char>(ch)) != 0 || ch == ',' ||
         ch == ';' || ch == '&';
}

std::string Lower(std::string_view value) {
  std::string out;
  out.reserve(value.size());
  for (const char ch : value) {
    out.push_back(
        static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
  }
  return out;
}

void WriteLine(const Record& rec) {
  std::string line = "[dz_guard] ";
  line += LevelName(rec.level);
  if (!rec.tag.empty()) {
    line += ' ';
    line += rec.tag;
  }
  line += ": ";
  line += rec.message;
  for (const auto& field : rec.fields) {
    line += ' ';
    line += field.first;
    line += '=';
    line += field.second;
  }
  line += '\n';
  std::FILE* out = rec.level >= Level::kWarn ? stderr : stdout;
  std::fputs(line.c_str(), out);
  std::fflush(out);
}

}  // namespace

void SetSink(Sink sink) {
  SinkSlot& slot = GlobalSink();
  std::lock_guard<std::mutex> lock(slot.mutex);
  slot.sink = std::move(sink);
}

void SetMinLevel(Level level) {
  g_min_level.store(static_cast<int>(level));
}

void Log(Level level, std::string_view tag, std::string_view message) {
  Log(level, tag, message, {});
}

void Log(Level level,
         std::string_view tag,
         std::string_view message,
         std::initializer_list<Field> fields) {
  if (static_cast<int>(level) < g_min_level.load()) {
    return;
  }
  Record rec;
  rec.level = level;
  rec.tag = std::string(tag);
  rec.message = RedactMessage(message);
  rec.fields.reserve(fields.size());
  for (const auto& field : fields) {
    if (field.key.empty()) {
      continue;
    }
    rec.fields.emplace_back(std::string(field.key),
                            RedactValue(field.key, field.value));
  }

  Sink sink;
  {
    SinkSlot& slot = GlobalSink();
    std::lock_guard<std::mutex> lock(slot.mutex);
    sink = slot.sink;
  }
  if (sink) {
    sink(rec);
    return;
  }
  WriteLine(rec);
}

bool IsSensitiveKey(std::string_view key) {
  if (key.empty()) {
    return false;
  }
  const std::string k = Lower(key);
  if (k == "code" || k == "text") {
    return true;
  }
  static constexpr const char* kMarkers[] = {
      "token", "password", "passcode", "secret", "pin", "duress_code"};
  for (const char* marker : kMarkers) {
    if (k.find(marker) != std::string::npos) {
      return true;
    }
  }
  if (k.find("key") == std::string::npos) {
    return false;
  }
  return k.find("key_id") == std::string::npos &&
         k.find("keyid") == std::string::npos &&
         k.find("store_key") == std::string::npos;
}

std::string RedactValue(std::string_view key, std::string_view value) {
  if (IsSensitiveKey(key)) {
    return "***";
  }
  return std::string(value);
}

// Matches on the word's suffix, so "entered code=1234" and "passcode=1234"
// both redact.
std::string RedactMessage(std::string_view message) {
  static constexpr const char* kInlineKeys[] = {
      "token", "password", "passcode", "secret", "key", "pin", "code", "text"};
  std::string out;
  out.reserve(message.size());
  std::size_t pos = 0;
  while (pos < message.size()) {
    const std::size_t eq = message.find('=', pos);
    if (eq == std::string_view::npos) {
      out.append(message.substr(pos));
      break;
    }
    std::size_t word_start = eq;
    while (word_start > pos && !IsSeparator(message[word_start - 1])) {
      --word_start;
    }
    const std::string word =
        Lower(message.substr(word_start, eq - word_start));
    bool sensitive = false;
    for (const char* key : kInlineKeys) {
      const std::string_view k(key);
      if (word.size() >= k.size() &&
          word.compare(word.size() - k.size(), k.size(), k) == 0) {
        sensitive = true;
        break;
      }
    }
    out.append(message.substr(pos, eq + 1 - pos));
    std::size_t value_end = eq + 1;
    while (value_end < message.size() && !IsSeparator(message[value_end])) {
      ++value_end;
    }
    if (sensitive && value_end > eq + 1) {
      out.append("***");
    } else {
      out.append(message.substr(eq + 1, value_end - eq - 1));
    }
    pos = value_end;
  }
  return out;
}

}  // namespace dz::platform::log
