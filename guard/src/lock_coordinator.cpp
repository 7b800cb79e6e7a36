#include "lock_coordinator.h"

#include <utility>

#include "platform_log.h"

namespace dz::guard {

namespace {

constexpr char kLogTag[] = "lock";

using platform::log::Level;

}  // namespace

LockCoordinator::LockCoordinator(const GuardConfig& cfg,
                                 CredentialStore& store,
                                 CoordinatorHooks hooks)
    : cfg_(cfg),
      hooks_(std::move(hooks)),
      validator_(store, cfg.security),
      router_(cfg.decoy, state_),
      eraser_(router_),
      motion_(cfg.security.unlock_grace_ms),
      panic_(cfg.panic) {}

LockCoordinator::~LockCoordinator() {
  DropMotionSubscription();
  DropPanicSubscription();
}

bool LockCoordinator::RefreshConfigured(std::string& error) {
  ConfiguredCodes codes;
  const bool ok = validator_.LoadConfigured(codes, error);
  if (!ok) {
    platform::log::Log(Level::kError, kLogTag, "credential store unavailable",
                       {{"error", error}});
    codes = ConfiguredCodes{};
  }
  state_.is_passcode_set = codes.passcode_set;
  state_.is_duress_set = codes.duress_set;
  return ok;
}

bool LockCoordinator::Start(std::uint64_t now_ms, std::string& error) {
  started_ = true;
  foreground_ = true;
  panic_.SetForeground(true);
  const bool ok = RefreshConfigured(error);
  state_.is_locked = state_.is_passcode_set;
  platform::log::Log(Level::kInfo, kLogTag, "started",
                     {{"locked", state_.is_locked ? "1" : "0"},
                      {"at_ms", std::to_string(now_ms)}});
  RefreshMotionSubscription();
  RefreshPanicSubscription();
  return ok;
}

void LockCoordinator::AttachMotionSensor(MotionSensor* sensor) {
  DropMotionSubscription();
  motion_sensor_ = sensor;
  RefreshMotionSubscription();
}

void LockCoordinator::AttachButtonSource(ButtonSource* source) {
  if (cfg_.panic.variant == PanicVariant::kPress) {
    DropPanicSubscription();
  }
  button_source_ = source;
  RefreshPanicSubscription();
}

void LockCoordinator::AttachShakeSensor(MotionSensor* sensor) {
  if (cfg_.panic.variant == PanicVariant::kShake) {
    DropPanicSubscription();
  }
  shake_sensor_ = sensor;
  RefreshPanicSubscription();
}

bool LockCoordinator::CanLock() const {
  return state_.is_passcode_set && !IsLockExempt(state_.active_flavor);
}

void LockCoordinator::SetLocked(bool locked, const char* reason) {
  if (state_.is_locked == locked) {
    return;
  }
  state_.is_locked = locked;
  platform::log::Log(Level::kInfo, kLogTag, locked ? "locked" : "unlocked",
                     {{"reason", reason},
                      {"flavor", FlavorName(state_.active_flavor)}});
  if (hooks_.on_lock_changed) {
    hooks_.on_lock_changed(locked);
  }
}

void LockCoordinator::SetDecoyModeInternal(bool on, bool clear_burn) {
  if (state_.is_decoy_mode == on) {
    return;
  }
  state_.is_decoy_mode = on;
  if (on || clear_burn) {
    router_.OnDecoyModeChanged(on);
  }
  platform::log::Log(Level::kInfo, kLogTag, on ? "decoy on" : "decoy off");
}

void LockCoordinator::OnBackground(std::uint64_t now_ms) {
  foreground_ = false;
  panic_.SetForeground(false);
  state_.last_active_flavor = state_.active_flavor;
  if (CanLock()) {
    SetLocked(true, "background");
  }
  DropMotionSubscription();
  motion_.Reset();
  platform::log::Log(Level::kDebug, kLogTag, "background",
                     {{"at_ms", std::to_string(now_ms)}});
}

void LockCoordinator::OnForeground(std::uint64_t now_ms) {
  foreground_ = true;
  panic_.SetForeground(true);
  RefreshMotionSubscription();
  if (hooks_.on_daily_reset_check) {
    hooks_.on_daily_reset_check();
  }
  platform::log::Log(Level::kDebug, kLogTag, "foreground",
                     {{"at_ms", std::to_string(now_ms)}});
}

ValidationResult LockCoordinator::Validate(const std::string& code,
                                           std::uint64_t now_ms) {
  const std::uint64_t lockout_ms =
      validator_.LockoutRemainingMs(state_.attempts, now_ms);
  if (lockout_ms > 0) {
    platform::log::Log(Level::kInfo, kLogTag, "locked out",
                       {{"remaining_ms", std::to_string(lockout_ms)}});
    return ValidationResult::kLockedOut;
  }
  const PasscodeFormat format =
      CheckPasscodeFormat(code, cfg_.security.passcode_length);
  if (format != PasscodeFormat::kOk) {
    platform::log::Log(Level::kInfo, kLogTag, "passcode format rejected");
    return ValidationResult::kInvalid;
  }
  const ValidationResult result =
      validator_.Validate(code, now_ms, state_.attempts);
  switch (result) {
    case ValidationResult::kReal:
      SetDecoyModeInternal(false, true);
      Unlock(now_ms);
      break;
    case ValidationResult::kDuress:
      SetDecoyModeInternal(true, false);
      Unlock(now_ms);
      break;
    case ValidationResult::kLockedOut:
      break;
    case ValidationResult::kInvalid:
      if (state_.attempts.lockout_until_ms.has_value() &&
          *state_.attempts.lockout_until_ms > now_ms) {
        platform::log::Log(
            Level::kWarn, kLogTag, "lockout started",
            {{"failed_attempts",
              std::to_string(state_.attempts.failed_attempts)}});
      }
      break;
  }
  return result;
}

bool LockCoordinator::Lock() {
  if (!CanLock()) {
    return false;
  }
  SetLocked(true, "manual");
  return true;
}

void LockCoordinator::Unlock(std::uint64_t now_ms) {
  motion_.NoteUnlock(now_ms);
  SetLocked(false, "unlock");
}

void LockCoordinator::SetDecoyMode(bool on) {
  SetDecoyModeInternal(on, true);
}

std::vector<Message> LockCoordinator::VisibleMessages(
    Flavor flavor, std::uint64_t now_ms) const {
  if (state_.is_locked && !IsLockExempt(flavor)) {
    return {};
  }
  return router_.VisibleMessages(flavor, now_ms);
}

bool LockCoordinator::Append(Flavor flavor,
                             Role role,
                             const std::string& text,
                             std::uint64_t now_ms,
                             std::string& error) {
  return router_.Append(flavor, role, text, now_ms, error);
}

void LockCoordinator::WipeFlavor(Flavor flavor) {
  eraser_.WipeFlavor(flavor);
}

void LockCoordinator::WipeAll() {
  eraser_.WipeAll();
  // Burn flags survive; only an explicit exit from decoy mode clears them.
  SetDecoyModeInternal(false, false);
}

bool LockCoordinator::SetDecoyPreset(Flavor flavor,
                                     DecoyPreset preset,
                                     std::string& error) {
  return router_.SetDecoyPreset(flavor, preset, error);
}

void LockCoordinator::SetFlavor(Flavor flavor) {
  if (state_.active_flavor == flavor) {
    return;
  }
  state_.active_flavor = flavor;
  DropMotionSubscription();
  motion_.Reset();
  RefreshMotionSubscription();
  platform::log::Log(Level::kInfo, kLogTag, "flavor changed",
                     {{"flavor", FlavorName(flavor)}});
}

void LockCoordinator::SetPanicEnabled(bool enabled) {
  cfg_.panic.enabled = enabled;
  panic_.SetEnabled(enabled);
  if (!enabled) {
    DropPanicSubscription();
  }
  RefreshPanicSubscription();
  platform::log::Log(Level::kInfo, kLogTag,
                     enabled ? "panic enabled" : "panic disabled");
}

void LockCoordinator::ApplyPanicWipe() {
  WipeAll();
  if (hooks_.on_panic_wipe) {
    hooks_.on_panic_wipe();
  }
}

PanicOutcome LockCoordinator::TriggerPanic(std::uint64_t now_ms) {
  const PanicOutcome outcome = panic_.Trigger(now_ms);
  if (outcome == PanicOutcome::kTriggered) {
    ApplyPanicWipe();
  }
  return outcome;
}

bool LockCoordinator::ProcessMotionSample(const MotionSample& sample) {
  if (!motion_.OnSample(sample)) {
    return false;
  }
  if (state_.is_locked || !CanLock()) {
    return false;
  }
  SetLocked(true, "face_down");
  return true;
}

PanicOutcome LockCoordinator::ProcessPress(const ButtonEvent& event) {
  const PanicOutcome outcome = panic_.OnButton(event);
  if (outcome == PanicOutcome::kTriggered) {
    ApplyPanicWipe();
  }
  return outcome;
}

PanicOutcome LockCoordinator::ProcessShakeSample(const MotionSample& sample) {
  const PanicOutcome outcome = panic_.OnShake(sample);
  if (outcome == PanicOutcome::kTriggered) {
    ApplyPanicWipe();
  }
  return outcome;
}

bool LockCoordinator::RejectInDecoyMode(std::string& error) const {
  if (!state_.is_decoy_mode) {
    return false;
  }
  error = "not available";
  platform::log::Log(Level::kWarn, kLogTag,
                     "credential change refused in decoy mode");
  return true;
}

bool LockCoordinator::SetPasscode(const std::string& code,
                                  std::string& error) {
  if (RejectInDecoyMode(error)) {
    return false;
  }
  if (!validator_.SetPasscode(code, error)) {
    return false;
  }
  std::string refresh_error;
  RefreshConfigured(refresh_error);
  RefreshMotionSubscription();
  return true;
}

bool LockCoordinator::SetDuressCode(const std::optional<std::string>& code,
                                    std::string& error) {
  if (RejectInDecoyMode(error)) {
    return false;
  }
  if (!validator_.SetDuressCode(code, error)) {
    return false;
  }
  std::string refresh_error;
  RefreshConfigured(refresh_error);
  return true;
}

bool LockCoordinator::ClearPasscodes(std::string& error) {
  if (RejectInDecoyMode(error)) {
    return false;
  }
  const bool ok = validator_.ClearPasscodes(error);
  std::string refresh_error;
  RefreshConfigured(refresh_error);
  if (!state_.is_passcode_set) {
    SetLocked(false, "passcode cleared");
    state_.attempts = PasscodeAttempts{};
    DropMotionSubscription();
  }
  return ok;
}

std::uint64_t LockCoordinator::LockoutRemainingMs(std::uint64_t now_ms) const {
  return validator_.LockoutRemainingMs(state_.attempts, now_ms);
}

void LockCoordinator::RefreshMotionSubscription() {
  const bool want = started_ && foreground_ && cfg_.motion.enabled &&
                    motion_sensor_ != nullptr && CanLock();
  if (!want) {
    DropMotionSubscription();
    return;
  }
  if (motion_sub_) {
    return;
  }
  const std::uint64_t generation = ++motion_generation_;
  std::unique_ptr<SensorSubscription> sub;
  const SensorStatus status = motion_sensor_->Subscribe(
      cfg_.motion.interval_ms,
      [this, generation](const MotionSample& sample) {
        if (generation != motion_generation_ || !motion_sub_) {
          return;
        }
        ProcessMotionSample(sample);
      },
      sub);
  if (status != SensorStatus::kOk || !sub) {
    platform::log::Log(Level::kInfo, kLogTag, "motion lock inactive",
                       {{"status", SensorStatusName(status)}});
    ++motion_generation_;
    return;
  }
  motion_sub_ = std::move(sub);
}

void LockCoordinator::RefreshPanicSubscription() {
  const bool want = started_ && cfg_.panic.enabled;
  if (!want) {
    DropPanicSubscription();
    return;
  }
  if (panic_sub_) {
    return;
  }
  const std::uint64_t generation = ++panic_generation_;
  std::unique_ptr<SensorSubscription> sub;
  SensorStatus status = SensorStatus::kUnavailable;
  if (cfg_.panic.variant == PanicVariant::kPress) {
    if (button_source_) {
      status = button_source_->Subscribe(
          [this, generation](const ButtonEvent& event) {
            if (generation != panic_generation_ || !panic_sub_) {
              return;
            }
            ProcessPress(event);
          },
          sub);
    }
  } else if (shake_sensor_) {
    status = shake_sensor_->Subscribe(
        cfg_.panic.shake_interval_ms,
        [this, generation](const MotionSample& sample) {
          if (generation != panic_generation_ || !panic_sub_) {
            return;
          }
          ProcessShakeSample(sample);
        },
        sub);
  }
  if (status != SensorStatus::kOk || !sub) {
    platform::log::Log(Level::kInfo, kLogTag, "panic gesture inactive",
                       {{"status", SensorStatusName(status)}});
    ++panic_generation_;
    return;
  }
  panic_sub_ = std::move(sub);
}

void LockCoordinator::DropMotionSubscription() {
  ++motion_generation_;
  motion_sub_.reset();
}

void LockCoordinator::DropPanicSubscription() {
  ++panic_generation_;
  panic_sub_.reset();
}

}  // namespace dz::guard
