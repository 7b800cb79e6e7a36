#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "credential_store.h"
#include "guard_config.h"
#include "lock_coordinator.h"
#include "platform_log.h"

namespace {

using dz::guard::ButtonDirection;
using dz::guard::ButtonEvent;
using dz::guard::Flavor;
using dz::guard::LockCoordinator;
using dz::guard::MotionSample;
using dz::guard::PanicOutcome;
using dz::guard::Role;

struct Options {
  std::string config_path;
  std::string trace_path;
  bool verbose{false};
};

void PrintUsage() {
  std::cout << "usage: dz_guard_replay [--verbose] <config.ini> <trace.csv>\n";
  std::cout << "trace line: <t_ms>,<kind>[,args...]\n";
}

bool ParseArgs(int argc, char** argv, Options& out) {
  std::vector<std::string> positional;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--verbose" || arg == "-v") {
      out.verbose = true;
      continue;
    }
    if (!arg.empty() && arg.front() == '-') {
      return false;
    }
    positional.push_back(arg);
  }
  if (positional.size() != 2) {
    return false;
  }
  out.config_path = positional[0];
  out.trace_path = positional[1];
  return true;
}

std::vector<std::string> SplitFields(const std::string& line,
                                     std::size_t max_fields) {
  std::vector<std::string> out;
  std::size_t start = 0;
  while (out.size() + 1 < max_fields) {
    const auto pos = line.find(',', start);
    if (pos == std::string::npos) {
      break;
    }
    out.push_back(line.substr(start, pos - start));
    start = pos + 1;
  }
  out.push_back(line.substr(start));
  return out;
}

bool ParseU64(const std::string& text, std::uint64_t& out) {
  if (text.empty()) return false;
  char* end_ptr = nullptr;
  const unsigned long long v = std::strtoull(text.c_str(), &end_ptr, 10);
  if (end_ptr == text.c_str() || *end_ptr != '\0') return false;
  out = static_cast<std::uint64_t>(v);
  return true;
}

bool ParseDoubleField(const std::string& text, double& out) {
  if (text.empty()) return false;
  char* end_ptr = nullptr;
  out = std::strtod(text.c_str(), &end_ptr);
  return end_ptr != text.c_str() && *end_ptr == '\0';
}

bool ParseSample(const std::vector<std::string>& f,
                 std::uint64_t t,
                 MotionSample& out) {
  if (f.size() != 5) return false;
  out.timestamp_ms = t;
  return ParseDoubleField(f[2], out.x) && ParseDoubleField(f[3], out.y) &&
         ParseDoubleField(f[4], out.z);
}

void Report(std::uint64_t t, const std::string& what) {
  std::cout << "t=" << t << " " << what << "\n";
}

void ReportPanic(std::uint64_t t, PanicOutcome outcome) {
  if (outcome != PanicOutcome::kNone) {
    Report(t, std::string("panic ") + dz::guard::PanicOutcomeName(outcome));
  }
}

class Replayer {
 public:
  Replayer(const dz::guard::GuardConfig& cfg,
           dz::guard::CredentialStore& store)
      : coord_(cfg, store, MakeHooks()) {}

  bool Start(std::string& error) { return coord_.Start(0, error); }

  bool Apply(const std::string& line, std::string& error);

 private:
  dz::guard::CoordinatorHooks MakeHooks() {
    dz::guard::CoordinatorHooks hooks;
    hooks.on_lock_changed = [this](bool locked) {
      Report(now_, locked ? "locked" : "unlocked");
    };
    hooks.on_panic_wipe = [this]() { Report(now_, "panic wipe complete"); };
    hooks.on_daily_reset_check = [this]() {
      Report(now_, "daily reset check");
    };
    return hooks;
  }

  LockCoordinator coord_;
  std::uint64_t now_{0};
};

bool Replayer::Apply(const std::string& line, std::string& error) {
  const auto head = SplitFields(line, 3);
  if (head.size() < 2) {
    error = "expected <t_ms>,<kind>";
    return false;
  }
  std::uint64_t t = 0;
  if (!ParseU64(head[0], t)) {
    error = "bad timestamp";
    return false;
  }
  now_ = t;
  const std::string& kind = head[1];
  const std::string arg = head.size() > 2 ? head[2] : std::string();

  if (kind == "motion" || kind == "shake") {
    MotionSample sample;
    if (!ParseSample(SplitFields(line, 5), t, sample)) {
      error = "expected x,y,z";
      return false;
    }
    if (kind == "motion") {
      if (coord_.ProcessMotionSample(sample)) {
        Report(t, "face-down lock requested");
      }
    } else {
      ReportPanic(t, coord_.ProcessShakeSample(sample));
    }
    return true;
  }
  if (kind == "press") {
    ButtonEvent ev;
    ev.direction = arg == "up" ? ButtonDirection::kUp : ButtonDirection::kDown;
    ev.timestamp_ms = t;
    ReportPanic(t, coord_.ProcessPress(ev));
    return true;
  }
  if (kind == "background") {
    coord_.OnBackground(t);
    return true;
  }
  if (kind == "foreground") {
    coord_.OnForeground(t);
    return true;
  }
  if (kind == "code") {
    const auto result = coord_.Validate(arg, t);
    Report(t, std::string("validate ") +
                  dz::guard::ValidationResultName(result));
    if (result == dz::guard::ValidationResult::kLockedOut) {
      Report(t, "lockout remaining_ms=" +
                    std::to_string(coord_.LockoutRemainingMs(t)));
    }
    return true;
  }
  if (kind == "passcode") {
    if (!coord_.SetPasscode(arg, error)) return false;
    Report(t, "passcode configured");
    return true;
  }
  if (kind == "duress") {
    std::optional<std::string> code;
    if (arg != "none") code = arg;
    if (!coord_.SetDuressCode(code, error)) return false;
    Report(t, code ? "duress configured" : "duress cleared");
    return true;
  }
  if (kind == "flavor" || kind == "wipe" || kind == "show") {
    Flavor flavor = Flavor::kHush;
    if (!dz::guard::ParseFlavor(arg, flavor)) {
      error = "unknown flavor";
      return false;
    }
    if (kind == "flavor") {
      coord_.SetFlavor(flavor);
    } else if (kind == "wipe") {
      coord_.WipeFlavor(flavor);
      Report(t, std::string("wiped ") + dz::guard::FlavorName(flavor));
    } else {
      const auto messages = coord_.VisibleMessages(flavor, t);
      Report(t, std::string("visible ") + dz::guard::FlavorName(flavor) +
                    " count=" + std::to_string(messages.size()));
      for (const auto& msg : messages) {
        std::cout << "  [" << dz::guard::RoleName(msg.role) << "] " << msg.text
                  << "\n";
      }
    }
    return true;
  }
  if (kind == "append") {
    const auto f = SplitFields(line, 5);
    Flavor flavor = Flavor::kHush;
    Role role = Role::kUser;
    if (f.size() != 5 || !dz::guard::ParseFlavor(f[2], flavor) ||
        !dz::guard::ParseRole(f[3], role)) {
      error = "expected <flavor>,<role>,<text>";
      return false;
    }
    return coord_.Append(flavor, role, f[4], t, error);
  }
  if (kind == "panic") {
    if (arg != "on" && arg != "off") {
      error = "expected on|off";
      return false;
    }
    coord_.SetPanicEnabled(arg == "on");
    return true;
  }
  if (kind == "wipe_all") {
    coord_.WipeAll();
    Report(t, "wiped all");
    return true;
  }
  if (kind == "lock") {
    if (!coord_.Lock()) {
      Report(t, "lock ignored");
    }
    return true;
  }
  error = "unknown kind: " + kind;
  return false;
}

}  // namespace

int main(int argc, char** argv) {
  Options opt;
  if (!ParseArgs(argc, argv, opt)) {
    PrintUsage();
    return 2;
  }
  dz::platform::log::SetMinLevel(opt.verbose ? dz::platform::log::Level::kDebug
                                             : dz::platform::log::Level::kWarn);

  dz::guard::GuardConfig cfg;
  std::string error;
  if (!dz::guard::LoadGuardConfig(opt.config_path, cfg, error)) {
    std::cerr << "config: " << error << "\n";
    return 2;
  }
  std::ifstream trace(opt.trace_path);
  if (!trace.is_open()) {
    std::cerr << "trace not found: " << opt.trace_path << "\n";
    return 2;
  }

  dz::guard::MemoryCredentialStore store;
  Replayer replayer(cfg, store);
  if (!replayer.Start(error)) {
    std::cerr << "start: " << error << "\n";
    return 1;
  }

  std::string line;
  std::size_t line_no = 0;
  while (std::getline(trace, line)) {
    ++line_no;
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (line.empty() || line.front() == '#') continue;
    error.clear();
    if (!replayer.Apply(line, error)) {
      std::cerr << "line " << line_no << ": " << error << "\n";
      return 1;
    }
  }
  return 0;
}
