#include "panic_gesture_detector.h"

#include <cmath>
#include <cstddef>
#include <optional>
#include <string>

#include "platform_log.h"

namespace dz::guard {

namespace {

constexpr char kLogTag[] = "panic";
constexpr double kGravityG = 1.0;

// True when |ts_ms| is less than |span_ms| after |ref_ms|. Events stamped
// before the reference are late deliveries and count as inside the span.
bool WithinSpan(const std::optional<std::uint64_t>& ref_ms,
                std::uint64_t ts_ms,
                std::uint64_t span_ms) {
  if (!ref_ms.has_value()) {
    return false;
  }
  return ts_ms < *ref_ms || ts_ms - *ref_ms < span_ms;
}

}  // namespace

const char* PanicOutcomeName(PanicOutcome outcome) {
  switch (outcome) {
    case PanicOutcome::kNone:
      return "none";
    case PanicOutcome::kDebounced:
      return "debounced";
    case PanicOutcome::kTriggered:
      return "triggered";
    case PanicOutcome::kSuppressedDisabled:
      return "suppressed_disabled";
    case PanicOutcome::kSuppressedBackground:
      return "suppressed_background";
    case PanicOutcome::kSuppressedCooldown:
      return "suppressed_cooldown";
  }
  return "unknown";
}

PressPatternMatcher::PressPatternMatcher(const PanicConfig& cfg)
    : window_ms_(cfg.press_window_ms),
      debounce_ms_(cfg.press_debounce_ms),
      required_(cfg.required_count) {}

Recognition PressPatternMatcher::OnPress(std::uint64_t ts_ms) {
  if (WithinSpan(last_accepted_ms_, ts_ms, debounce_ms_)) {
    return Recognition::kDebounced;
  }
  last_accepted_ms_ = ts_ms;
  presses_.push_back(ts_ms);

  const std::uint64_t span = window_ms_ * required_;
  while (!presses_.empty() &&
         (presses_.front() > ts_ms || ts_ms - presses_.front() >= span)) {
    presses_.pop_front();
  }
  // Only the trailing run of closely spaced presses can still complete.
  for (std::size_t i = presses_.size(); i > 1; --i) {
    if (presses_[i - 1] - presses_[i - 2] > window_ms_) {
      presses_.erase(presses_.begin(),
                     presses_.begin() + static_cast<std::ptrdiff_t>(i - 1));
      break;
    }
  }
  if (presses_.size() < required_) {
    return Recognition::kNone;
  }
  return Recognition::kMatched;
}

void PressPatternMatcher::Clear() {
  presses_.clear();
}

ShakePatternMatcher::ShakePatternMatcher(const PanicConfig& cfg)
    : window_ms_(cfg.shake_window_ms),
      debounce_ms_(cfg.shake_debounce_ms),
      required_(cfg.required_count),
      threshold_g_(cfg.shake_threshold_g) {}

Recognition ShakePatternMatcher::OnSample(const MotionSample& s) {
  const double magnitude =
      std::sqrt(s.x * s.x + s.y * s.y + s.z * s.z) - kGravityG;
  if (magnitude <= threshold_g_) {
    return Recognition::kNone;
  }
  const std::uint64_t ts_ms = s.timestamp_ms;
  if (WithinSpan(last_accepted_ms_, ts_ms, debounce_ms_)) {
    return Recognition::kDebounced;
  }
  last_accepted_ms_ = ts_ms;
  shakes_.push_back(ts_ms);
  while (!shakes_.empty() &&
         (shakes_.front() > ts_ms || ts_ms - shakes_.front() > window_ms_)) {
    shakes_.pop_front();
  }
  return shakes_.size() >= required_ ? Recognition::kMatched
                                     : Recognition::kNone;
}

void ShakePatternMatcher::Clear() {
  shakes_.clear();
}

PanicGestureDetector::PanicGestureDetector(const PanicConfig& cfg)
    : enabled_(cfg.enabled),
      variant_(cfg.variant),
      cooldown_ms_(cfg.cooldown_ms),
      press_(cfg),
      shake_(cfg) {}

PanicOutcome PanicGestureDetector::TryFire(std::uint64_t ts_ms) {
  if (!enabled_) {
    return PanicOutcome::kSuppressedDisabled;
  }
  if (!foreground_) {
    return PanicOutcome::kSuppressedBackground;
  }
  if (WithinSpan(last_fire_ms_, ts_ms, cooldown_ms_)) {
    return PanicOutcome::kSuppressedCooldown;
  }
  last_fire_ms_ = ts_ms;
  platform::log::Log(platform::log::Level::kInfo, kLogTag, "panic triggered",
                     {{"at_ms", std::to_string(ts_ms)}});
  return PanicOutcome::kTriggered;
}

PanicOutcome PanicGestureDetector::OnButton(const ButtonEvent& event) {
  if (variant_ != PanicVariant::kPress ||
      event.direction != ButtonDirection::kDown) {
    return PanicOutcome::kNone;
  }
  switch (press_.OnPress(event.timestamp_ms)) {
    case Recognition::kNone:
      return PanicOutcome::kNone;
    case Recognition::kDebounced:
      return PanicOutcome::kDebounced;
    case Recognition::kMatched:
      break;
  }
  const PanicOutcome outcome = TryFire(event.timestamp_ms);
  press_.Clear();
  if (outcome != PanicOutcome::kTriggered) {
    platform::log::Log(platform::log::Level::kInfo, kLogTag,
                       "press pattern suppressed",
                       {{"reason", PanicOutcomeName(outcome)}});
  }
  return outcome;
}

PanicOutcome PanicGestureDetector::OnShake(const MotionSample& sample) {
  if (variant_ != PanicVariant::kShake) {
    return PanicOutcome::kNone;
  }
  switch (shake_.OnSample(sample)) {
    case Recognition::kNone:
      return PanicOutcome::kNone;
    case Recognition::kDebounced:
      return PanicOutcome::kDebounced;
    case Recognition::kMatched:
      break;
  }
  const PanicOutcome outcome = TryFire(sample.timestamp_ms);
  if (outcome == PanicOutcome::kTriggered) {
    shake_.Clear();
  }
  return outcome;
}

PanicOutcome PanicGestureDetector::Trigger(std::uint64_t now_ms) {
  return TryFire(now_ms);
}

void PanicGestureDetector::SetEnabled(bool enabled) {
  if (enabled_ == enabled) {
    return;
  }
  enabled_ = enabled;
  Reset();
}

void PanicGestureDetector::Reset() {
  press_.Clear();
  shake_.Clear();
  last_fire_ms_.reset();
}

}  // namespace dz::guard
