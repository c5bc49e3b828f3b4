#include "bathycat/camera/camera_device.hpp"

namespace bathycat::camera {

const char* to_string(DeviceState s) {
  switch (s) {
    case DeviceState::kOk:       return "ok";
    case DeviceState::kDegraded: return "degraded";
  }
  return "ok";
}

}  // namespace bathycat::camera
