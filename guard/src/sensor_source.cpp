#include "sensor_source.h"

namespace dz::guard {

const char* SensorStatusName(SensorStatus status) {
  switch (status) {
    case SensorStatus::kOk:
      return "ok";
    case SensorStatus::kUnavailable:
      return "unavailable";
    case SensorStatus::kPermissionDenied:
      return "permission_denied";
  }
  return "unknown";
}

}  // namespace dz::guard
