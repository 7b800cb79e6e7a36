#ifndef DZ_GUARD_PANIC_GESTURE_DETECTOR_H
#define DZ_GUARD_PANIC_GESTURE_DETECTOR_H

#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>

#include "guard_config.h"
#include "sensor_source.h"

namespace dz::guard {

enum class PanicOutcome : std::uint8_t {
  kNone = 0,
  kDebounced = 1,
  kTriggered = 2,
  kSuppressedDisabled = 3,
  kSuppressedBackground = 4,
  kSuppressedCooldown = 5,
};

const char* PanicOutcomeName(PanicOutcome outcome);

enum class Recognition : std::uint8_t { kNone = 0, kDebounced = 1, kMatched = 2 };

// N presses, each no more than |press_window_ms| after the previous one.
// All arithmetic uses event timestamps.
class PressPatternMatcher {
 public:
  explicit PressPatternMatcher(const PanicConfig& cfg);

  Recognition OnPress(std::uint64_t ts_ms);
  void Clear();

  std::size_t buffered() const { return presses_.size(); }

 private:
  std::uint64_t window_ms_;
  std::uint64_t debounce_ms_;
  std::uint32_t required_;
  std::deque<std::uint64_t> presses_;
  std::optional<std::uint64_t> last_accepted_ms_;
};

// N threshold crossings of |accel| - 1g inside a rolling window.
class ShakePatternMatcher {
 public:
  explicit ShakePatternMatcher(const PanicConfig& cfg);

  Recognition OnSample(const MotionSample& sample);
  void Clear();

  std::size_t buffered() const { return shakes_.size(); }

 private:
  std::uint64_t window_ms_;
  std::uint64_t debounce_ms_;
  std::uint32_t required_;
  double threshold_g_;
  std::deque<std::uint64_t> shakes_;
  std::optional<std::uint64_t> last_accepted_ms_;
};

// Gates a recognised pattern on enabled / foreground / cooldown. The press
// buffer is cleared on every recognition; the shake buffer only on a fire.
class PanicGestureDetector {
 public:
  explicit PanicGestureDetector(const PanicConfig& cfg);

  PanicOutcome OnButton(const ButtonEvent& event);
  PanicOutcome OnShake(const MotionSample& sample);
  // Manual trigger for settings and test screens; same gates apply.
  PanicOutcome Trigger(std::uint64_t now_ms);

  void SetEnabled(bool enabled);
  void SetForeground(bool foreground) { foreground_ = foreground; }
  // Drops buffered events and the cooldown reference.
  void Reset();

  bool enabled() const { return enabled_; }
  PanicVariant variant() const { return variant_; }
  const PressPatternMatcher& press_matcher() const { return press_; }
  const ShakePatternMatcher& shake_matcher() const { return shake_; }

 private:
  PanicOutcome TryFire(std::uint64_t ts_ms);

  bool enabled_;
  bool foreground_{true};
  PanicVariant variant_;
  std::uint64_t cooldown_ms_;
  std::optional<std::uint64_t> last_fire_ms_;
  PressPatternMatcher press_;
  ShakePatternMatcher shake_;
};

}  // namespace dz::guard

#endif  // DZ_GUARD_PANIC_GESTURE_DETECTOR_H
