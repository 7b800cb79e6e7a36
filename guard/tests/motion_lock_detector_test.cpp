#include <cstdint>
#include <iostream>

#include "motion_lock_detector.h"
#include "sensor_source.h"

namespace {

#define FAIL()                                                       \
  do {                                                               \
    std::cerr << "motion_lock_detector_test failed at " << __FILE__  \
              << ":" << __LINE__ << "\n";                            \
    return 1;                                                        \
  } while (false)

using dz::guard::MotionLockDetector;
using dz::guard::MotionSample;

MotionSample Held(std::uint64_t t) { return {0.05, 0.55, 0.5, t}; }
MotionSample FaceDown(std::uint64_t t) { return {0.01, -0.02, -0.99, t}; }
MotionSample FaceUp(std::uint64_t t) { return {0.02, 0.01, 0.98, t}; }

// Feeds |count| samples 100ms apart starting at |t|; returns lock count.
template <typename Make>
int Feed(MotionLockDetector& det, std::uint64_t& t, int count, Make make) {
  int locks = 0;
  for (int i = 0; i < count; ++i) {
    if (det.OnSample(make(t))) {
      ++locks;
    }
    t += 100;
  }
  return locks;
}

}  // namespace

int main() {
  // Held, then flipped face-down: one lock after three still frames.
  {
    MotionLockDetector det(5000);
    std::uint64_t t = 0;
    if (Feed(det, t, 5, Held) != 0) {
      FAIL();
    }
    // Flip frame is movement; three still frames follow.
    if (Feed(det, t, 3, FaceDown) != 0) {
      FAIL();
    }
    if (!det.OnSample(FaceDown(t))) {
      FAIL();
    }
    t += 100;
    if (det.armed()) {
      FAIL();
    }
    if (Feed(det, t, 40, FaceDown) != 0) {
      FAIL();
    }

    // Unlock, pick up and flip again inside the grace window.
    det.NoteUnlock(t);
    const std::uint64_t unlocked_at = t;
    if (Feed(det, t, 3, Held) != 0 || Feed(det, t, 10, FaceDown) != 0) {
      FAIL();
    }
    if (t >= unlocked_at + 5000) {
      FAIL();
    }

    // Grace over: the same gesture locks again.
    t = unlocked_at + 6000;
    if (Feed(det, t, 3, Held) != 0) {
      FAIL();
    }
    if (Feed(det, t, 10, FaceDown) != 1) {
      FAIL();
    }
  }

  // Face-up on a table, never held again: never locks.
  {
    MotionLockDetector det(5000);
    std::uint64_t t = 0;
    if (Feed(det, t, 3, Held) != 0) {
      FAIL();
    }
    if (Feed(det, t, 30, FaceUp) != 0) {
      FAIL();
    }
    if (det.armed()) {
      FAIL();
    }
    if (Feed(det, t, 30, FaceDown) != 0) {
      FAIL();
    }
    if (Feed(det, t, 30, FaceUp) != 0 || Feed(det, t, 30, FaceDown) != 0) {
      FAIL();
    }
  }

  // Brief rest face-up does not disarm.
  {
    MotionLockDetector det(5000);
    std::uint64_t t = 0;
    Feed(det, t, 3, Held);
    if (Feed(det, t, 10, FaceUp) != 0 || !det.armed()) {
      FAIL();
    }
    if (Feed(det, t, 5, FaceDown) != 1) {
      FAIL();
    }
  }

  // Tilted or jittery face-down never counts.
  {
    MotionLockDetector det(5000);
    std::uint64_t t = 0;
    Feed(det, t, 3, Held);
    if (Feed(det, t, 10, [](std::uint64_t ts) {
          return MotionSample{0.3, 0.0, -0.9, ts};
        }) != 0) {
      FAIL();
    }
    if (det.stillness_frames() != 0) {
      FAIL();
    }
    bool flip = false;
    if (Feed(det, t, 20, [&flip](std::uint64_t ts) {
          flip = !flip;
          return MotionSample{0.0, 0.0, flip ? -0.9 : -1.0, ts};
        }) != 0) {
      FAIL();
    }
  }

  // Reset drops history; the first sample after it is movement.
  {
    MotionLockDetector det(5000);
    std::uint64_t t = 0;
    Feed(det, t, 3, Held);
    Feed(det, t, 3, FaceDown);
    if (det.stillness_frames() != 2) {
      FAIL();
    }
    det.Reset();
    if (det.stillness_frames() != 0) {
      FAIL();
    }
    if (det.OnSample(FaceDown(t))) {
      FAIL();
    }
  }

  // Starting face-down and still, never held: stays disarmed.
  {
    MotionLockDetector det(5000);
    std::uint64_t t = 0;
    if (det.armed()) {
      FAIL();
    }
    if (Feed(det, t, 30, FaceDown) != 0 || det.armed()) {
      FAIL();
    }
    // Picking it up arms the next flip.
    if (Feed(det, t, 3, Held) != 0 || !det.armed()) {
      FAIL();
    }
    if (Feed(det, t, 5, FaceDown) != 1) {
      FAIL();
    }
  }

  return 0;
}
