#include "guard_config.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <string>

namespace dz::guard {

namespace {

std::string Trim(const std::string& s) {
  const auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
  auto b = std::find_if_not(s.begin(), s.end(), is_space);
  auto e = std::find_if_not(s.rbegin(), s.rend(), is_space).base();
  if (b >= e) return {};
  return std::string(b, e);
}

std::string StripInlineComment(const std::string& input) {
  for (std::size_t i = 0; i < input.size(); ++i) {
    const char ch = input[i];
    if ((ch == '#' || ch == ';') &&
        (i == 0 ||
         std::isspace(static_cast<unsigned char>(input[i - 1])) != 0)) {
      return Trim(input.substr(0, i));
    }
  }
  return input;
}

std::string ToLower(std::string s) {
  for (auto& ch : s) {
    ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  }
  return s;
}

bool ParseUint32(const std::string& text, std::uint32_t& out) {
  if (text.empty() || text.front() == '-') return false;
  char* end_ptr = nullptr;
  const unsigned long long v = std::strtoull(text.c_str(), &end_ptr, 10);
  if (end_ptr == text.c_str() || *end_ptr != '\0' || v > 0xFFFFFFFFull) {
    return false;
  }
  out = static_cast<std::uint32_t>(v);
  return true;
}

bool ParseUint64(const std::string& text, std::uint64_t& out) {
  if (text.empty() || text.front() == '-') return false;
  char* end_ptr = nullptr;
  const unsigned long long v = std::strtoull(text.c_str(), &end_ptr, 10);
  if (end_ptr == text.c_str() || *end_ptr != '\0') return false;
  out = static_cast<std::uint64_t>(v);
  return true;
}

bool ParseDouble(const std::string& text, double& out) {
  if (text.empty()) return false;
  char* end_ptr = nullptr;
  const double v = std::strtod(text.c_str(), &end_ptr);
  if (end_ptr == text.c_str() || *end_ptr != '\0') return false;
  out = v;
  return true;
}

bool ParseBool(const std::string& text, bool& out) {
  const std::string t = ToLower(text);
  if (t == "1" || t == "true" || t == "on") {
    out = true;
    return true;
  }
  if (t == "0" || t == "false" || t == "off") {
    out = false;
    return true;
  }
  return false;
}

bool ParsePanicVariant(const std::string& text, PanicVariant& out) {
  const std::string t = ToLower(Trim(text));
  if (t.empty() || t == "press" || t == "button" || t == "0") {
    out = PanicVariant::kPress;
    return true;
  }
  if (t == "shake" || t == "1") {
    out = PanicVariant::kShake;
    return true;
  }
  return false;
}

bool ValidateConfig(const GuardConfig& cfg, std::string& error) {
  if (cfg.security.passcode_length < 4 || cfg.security.passcode_length > 16) {
    error = "passcode_length out of range";
    return false;
  }
  if (cfg.security.argon2_blocks < 8 || cfg.security.argon2_blocks > 65536) {
    error = "argon2_blocks out of range";
    return false;
  }
  if (cfg.security.argon2_passes == 0 || cfg.security.argon2_passes > 16) {
    error = "argon2_passes out of range";
    return false;
  }
  if (cfg.motion.interval_ms == 0) {
    error = "motion interval_ms must be non-zero";
    return false;
  }
  if (cfg.panic.required_count < 2) {
    error = "panic required_count must be at least 2";
    return false;
  }
  if (cfg.panic.press_window_ms == 0 || cfg.panic.shake_window_ms == 0) {
    error = "panic window must be non-zero";
    return false;
  }
  if (!(cfg.panic.shake_threshold_g > 0.0)) {
    error = "shake_threshold_g must be positive";
    return false;
  }
  return true;
}

}  // namespace

bool LoadGuardConfig(const std::string& path, GuardConfig& out_cfg,
                     std::string& error) {
  out_cfg = GuardConfig{};
  std::ifstream f(path);
  if (!f.is_open()) {
    error = "guard config not found: " + path;
    return false;
  }
  std::string section;
  std::string line;
  std::size_t line_no = 0;
  const auto bad_value = [&](const std::string& key) {
    error = "invalid " + key + " at line " + std::to_string(line_no);
    return false;
  };
  while (std::getline(f, line)) {
    ++line_no;
    std::string t = StripInlineComment(Trim(line));
    if (t.empty()) continue;
    if (t.front() == '[' && t.back() == ']') {
      section = ToLower(Trim(t.substr(1, t.size() - 2)));
      continue;
    }
    const auto pos = t.find('=');
    if (pos == std::string::npos) {
      error = "invalid line " + std::to_string(line_no);
      return false;
    }
    const std::string key = ToLower(Trim(t.substr(0, pos)));
    const std::string val = StripInlineComment(Trim(t.substr(pos + 1)));
    if (section == "security") {
      auto& sec = out_cfg.security;
      if (key == "passcode_length") {
        if (!ParseUint32(val, sec.passcode_length)) return bad_value(key);
      } else if (key == "argon2_blocks") {
        if (!ParseUint32(val, sec.argon2_blocks)) return bad_value(key);
      } else if (key == "argon2_passes") {
        if (!ParseUint32(val, sec.argon2_passes)) return bad_value(key);
      } else if (key == "reject_weak_passcodes") {
        if (!ParseBool(val, sec.reject_weak_passcodes)) return bad_value(key);
      } else if (key == "unlock_grace_ms") {
        if (!ParseUint64(val, sec.unlock_grace_ms)) return bad_value(key);
      } else if (key == "lockout_short_ms") {
        if (!ParseUint64(val, sec.lockout_short_ms)) return bad_value(key);
      } else if (key == "lockout_long_ms") {
        if (!ParseUint64(val, sec.lockout_long_ms)) return bad_value(key);
      }
    } else if (section == "motion") {
      if (key == "enabled") {
        if (!ParseBool(val, out_cfg.motion.enabled)) return bad_value(key);
      } else if (key == "interval_ms") {
        if (!ParseUint32(val, out_cfg.motion.interval_ms)) return bad_value(key);
      }
    } else if (section == "panic") {
      auto& panic = out_cfg.panic;
      if (key == "enabled") {
        if (!ParseBool(val, panic.enabled)) return bad_value(key);
      } else if (key == "variant") {
        if (!ParsePanicVariant(val, panic.variant)) return bad_value(key);
      } else if (key == "cooldown_ms") {
        if (!ParseUint64(val, panic.cooldown_ms)) return bad_value(key);
      } else if (key == "required_count") {
        if (!ParseUint32(val, panic.required_count)) return bad_value(key);
      } else if (key == "press_window_ms") {
        if (!ParseUint64(val, panic.press_window_ms)) return bad_value(key);
      } else if (key == "press_debounce_ms") {
        if (!ParseUint64(val, panic.press_debounce_ms)) return bad_value(key);
      } else if (key == "shake_window_ms") {
        if (!ParseUint64(val, panic.shake_window_ms)) return bad_value(key);
      } else if (key == "shake_debounce_ms") {
        if (!ParseUint64(val, panic.shake_debounce_ms)) return bad_value(key);
      } else if (key == "shake_threshold_g") {
        if (!ParseDouble(val, panic.shake_threshold_g)) return bad_value(key);
      } else if (key == "shake_interval_ms") {
        if (!ParseUint32(val, panic.shake_interval_ms)) return bad_value(key);
      }
    } else if (section == "decoy") {
      if (key == "hush_preset") {
        if (!ParseDecoyPreset(val, out_cfg.decoy.hush_preset)) {
          return bad_value(key);
        }
      } else if (key == "classified_preset") {
        if (!ParseDecoyPreset(val, out_cfg.decoy.classified_preset)) {
          return bad_value(key);
        }
      }
    }
  }
  return ValidateConfig(out_cfg, error);
}

}  // namespace dz::guard
