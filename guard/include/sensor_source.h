#ifndef DZ_GUARD_SENSOR_SOURCE_H
#define DZ_GUARD_SENSOR_SOURCE_H

#include <cstdint>
#include <functional>
#include <memory>

namespace dz::guard {

// Acceleration in g, timestamped by the producer.
struct MotionSample {
  double x{0.0};
  double y{0.0};
  double z{0.0};
  std::uint64_t timestamp_ms{0};
};

enum class ButtonDirection : std::uint8_t { kUp = 0, kDown = 1 };

struct ButtonEvent {
  ButtonDirection direction{ButtonDirection::kDown};
  std::uint64_t timestamp_ms{0};
};

enum class SensorStatus : std::uint8_t {
  kOk = 0,
  kUnavailable = 1,
  kPermissionDenied = 2,
};

const char* SensorStatusName(SensorStatus status);

// Destroying the handle stops delivery; no callback runs after the
// destructor returns.
class SensorSubscription {
 public:
  virtual ~SensorSubscription() = default;
};

using MotionCallback = std::function<void(const MotionSample&)>;
using ButtonCallback = std::function<void(const ButtonEvent&)>;

class MotionSensor {
 public:
  virtual ~MotionSensor() = default;

  // kPermissionDenied and kUnavailable are terminal for this attempt; |out|
  // stays empty.
  virtual SensorStatus Subscribe(std::uint32_t interval_ms,
                                 MotionCallback callback,
                                 std::unique_ptr<SensorSubscription>& out) = 0;
};

class ButtonSource {
 public:
  virtual ~ButtonSource() = default;

  virtual SensorStatus Subscribe(ButtonCallback callback,
                                 std::unique_ptr<SensorSubscription>& out) = 0;
};

}  // namespace dz::guard

#endif  // DZ_GUARD_SENSOR_SOURCE_H
