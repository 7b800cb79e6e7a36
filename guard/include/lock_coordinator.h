#ifndef DZ_GUARD_LOCK_COORDINATOR_H
#define DZ_GUARD_LOCK_COORDINATOR_H

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "credential_store.h"
#include "decoy_router.h"
#include "guard_config.h"
#include "guard_types.h"
#include "motion_lock_detector.h"
#include "panic_gesture_detector.h"
#include "passcode_validator.h"
#include "secure_eraser.h"
#include "sensor_source.h"

namespace dz::guard {

struct CoordinatorHooks {
  std::function<void()> on_daily_reset_check;
  std::function<void(bool locked)> on_lock_changed;
  std::function<void()> on_panic_wipe;
};

// Owns SecurityState and is the only writer of it. All calls are expected
// on one thread; sensor callbacks are folded in through the Process*
// entry points.
class LockCoordinator {
 public:
  LockCoordinator(const GuardConfig& cfg,
                  CredentialStore& store,
                  CoordinatorHooks hooks = {});
  ~LockCoordinator();

  LockCoordinator(const LockCoordinator&) = delete;
  LockCoordinator& operator=(const LockCoordinator&) = delete;

  // Reads which codes exist. Starts Locked whenever a passcode is set. A
  // store failure leaves both codes unset and is reported.
  bool Start(std::uint64_t now_ms, std::string& error);

  // Sources are borrowed and must outlive the coordinator or be detached
  // with nullptr.
  void AttachMotionSensor(MotionSensor* sensor);
  void AttachButtonSource(ButtonSource* source);
  void AttachShakeSensor(MotionSensor* sensor);

  void OnBackground(std::uint64_t now_ms);
  void OnForeground(std::uint64_t now_ms);

  ValidationResult Validate(const std::string& code, std::uint64_t now_ms);
  bool Lock();
  void Unlock(std::uint64_t now_ms);
  void SetDecoyMode(bool on);

  std::vector<Message> VisibleMessages(Flavor flavor,
                                       std::uint64_t now_ms) const;
  bool Append(Flavor flavor,
              Role role,
              const std::string& text,
              std::uint64_t now_ms,
              std::string& error);
  void WipeFlavor(Flavor flavor);
  void WipeAll();
  bool SetDecoyPreset(Flavor flavor, DecoyPreset preset, std::string& error);

  void SetFlavor(Flavor flavor);
  void SetPanicEnabled(bool enabled);
  PanicOutcome TriggerPanic(std::uint64_t now_ms);

  bool ProcessMotionSample(const MotionSample& sample);
  PanicOutcome ProcessPress(const ButtonEvent& event);
  PanicOutcome ProcessShakeSample(const MotionSample& sample);

  // Credential changes are refused while decoy mode is on.
  bool SetPasscode(const std::string& code, std::string& error);
  bool SetDuressCode(const std::optional<std::string>& code,
                     std::string& error);
  bool ClearPasscodes(std::string& error);
  std::uint64_t LockoutRemainingMs(std::uint64_t now_ms) const;

  SecurityState Snapshot() const { return state_; }
  bool is_locked() const { return state_.is_locked; }
  bool motion_subscribed() const { return motion_sub_ != nullptr; }
  bool panic_subscribed() const { return panic_sub_ != nullptr; }
  const DecoyRouter& router() const { return router_; }

 private:
  void SetLocked(bool locked, const char* reason);
  void SetDecoyModeInternal(bool on, bool clear_burn);
  void ApplyPanicWipe();
  bool RefreshConfigured(std::string& error);
  bool CanLock() const;
  bool RejectInDecoyMode(std::string& error) const;
  void RefreshMotionSubscription();
  void RefreshPanicSubscription();
  void DropMotionSubscription();
  void DropPanicSubscription();

  GuardConfig cfg_;
  CoordinatorHooks hooks_;
  SecurityState state_;
  PasscodeValidator validator_;
  DecoyRouter router_;
  SecureEraser eraser_;
  MotionLockDetector motion_;
  PanicGestureDetector panic_;

  bool started_{false};
  bool foreground_{true};

  MotionSensor* motion_sensor_{nullptr};
  ButtonSource* button_source_{nullptr};
  MotionSensor* shake_sensor_{nullptr};
  std::unique_ptr<SensorSubscription> motion_sub_;
  std::unique_ptr<SensorSubscription> panic_sub_;
  // Bumped on every teardown so a late callback from an old subscription
  // is dropped.
  std::uint64_t motion_generation_{0};
  std::uint64_t panic_generation_{0};
};

}  // namespace dz::guard

#endif  // DZ_GUARD_LOCK_COORDINATOR_H
