#include "motion_lock_detector.h"

#include <cmath>

#include "platform_log.h"

namespace dz::guard {

namespace {

constexpr char kLogTag[] = "motion";

constexpr double kStationaryJitter = 0.05;
constexpr double kHandlingJitter = 0.15;
constexpr double kFaceDownZ = -0.85;
constexpr double kFaceUpZ = 0.85;
constexpr double kTiltedBackZ = -0.2;
constexpr double kMaxTilt = 0.15;
constexpr double kHeldMinZ = 0.3;
constexpr double kHeldMaxZ = 0.7;
constexpr std::uint32_t kLockFrames = 3;
constexpr std::uint32_t kDisarmFrames = 20;

}  // namespace

MotionLockDetector::MotionLockDetector(std::uint64_t unlock_grace_ms)
    : unlock_grace_ms_(unlock_grace_ms) {}

bool MotionLockDetector::InGraceWindow(std::uint64_t now_ms) const {
  if (!last_unlock_ms_.has_value()) {
    return false;
  }
  return now_ms < *last_unlock_ms_ + unlock_grace_ms_;
}

bool MotionLockDetector::OnSample(const MotionSample& s) {
  // The first sample has nothing to compare against and counts as movement.
  double jitter = kHandlingJitter * 2;
  if (last_sample_.has_value()) {
    jitter = std::fabs(s.x - last_sample_->x) +
             std::fabs(s.y - last_sample_->y) +
             std::fabs(s.z - last_sample_->z);
  }
  last_sample_ = s;

  const bool stationary = jitter < kStationaryJitter;
  const bool level = std::fabs(s.x) < kMaxTilt && std::fabs(s.y) < kMaxTilt;
  const bool face_down = s.z < kFaceDownZ;
  const bool held = s.z > kHeldMinZ && s.z < kHeldMaxZ;

  if (held) {
    recently_held_upright_ = true;
    stillness_frames_ = 0;
  }
  if (jitter > kHandlingJitter) {
    stillness_frames_ = 0;
  }

  const bool flat = (s.z > kFaceUpZ || s.z < kTiltedBackZ) && level &&
                    stationary;
  if (flat) {
    if (++flat_frames_ >= kDisarmFrames && recently_held_upright_) {
      recently_held_upright_ = false;
      platform::log::Log(platform::log::Level::kDebug, kLogTag,
                         "disarmed after resting flat");
    }
  } else {
    flat_frames_ = 0;
  }

  if (face_down && level && stationary && recently_held_upright_) {
    ++stillness_frames_;
  } else if (!face_down) {
    stillness_frames_ = 0;
  }

  if (stillness_frames_ < kLockFrames || !recently_held_upright_) {
    return false;
  }
  if (InGraceWindow(s.timestamp_ms)) {
    return false;
  }
  recently_held_upright_ = false;
  stillness_frames_ = 0;
  return true;
}

void MotionLockDetector::NoteUnlock(std::uint64_t now_ms) {
  last_unlock_ms_ = now_ms;
  stillness_frames_ = 0;
  recently_held_upright_ = true;
}

void MotionLockDetector::Reset() {
  last_sample_.reset();
  stillness_frames_ = 0;
  flat_frames_ = 0;
}

}  // namespace dz::guard
