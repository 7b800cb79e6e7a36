#ifndef DZ_GUARD_MOTION_LOCK_DETECTOR_H
#define DZ_GUARD_MOTION_LOCK_DETECTOR_H

#include <cstdint>
#include <optional>

#include "sensor_source.h"

namespace dz::guard {

// Recognises a deliberate flip to face-down after the phone was held.
// Starts disarmed; holding the phone or an unlock arms it. Laying it down
// face-up, or leaving it flat, disarms it again.
class MotionLockDetector {
 public:
  explicit MotionLockDetector(std::uint64_t unlock_grace_ms);

  // Returns true when a lock should be requested.
  bool OnSample(const MotionSample& sample);

  // Starts the post-unlock grace window and re-arms the detector.
  void NoteUnlock(std::uint64_t now_ms);
  // Forgets sample history; the grace window survives.
  void Reset();

  bool armed() const { return recently_held_upright_; }
  std::uint32_t stillness_frames() const { return stillness_frames_; }

 private:
  bool InGraceWindow(std::uint64_t now_ms) const;

  std::uint64_t unlock_grace_ms_;
  std::optional<MotionSample> last_sample_;
  std::uint32_t stillness_frames_{0};
  std::uint32_t flat_frames_{0};
  bool recently_held_upright_{false};
  std::optional<std::uint64_t> last_unlock_ms_;
};

}  // namespace dz::guard

#endif  // DZ_GUARD_MOTION_LOCK_DETECTOR_H
