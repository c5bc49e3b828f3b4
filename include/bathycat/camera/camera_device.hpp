#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "bathycat/common/time.hpp"

namespace bathycat::camera {

enum class DeviceState : uint8_t {
  kOk = 0,
  kDegraded = 1,   // captured right after failures or a reinitialization
};

const char* to_string(DeviceState s);

/// One captured image. Moves through the pipeline, never copied.
struct Frame {
  std::vector<uint8_t> data;   // encoded image (MJPEG)
  SteadyTime captured_steady{};
  WallTime captured_wall{};
  uint64_t sequence = 0;       // strictly increasing per session
  DeviceState device_state = DeviceState::kOk;
  int width = 0;
  int height = 0;
};

enum class AcquireStatus : uint8_t {
  kAcquired = 0,
  kNotReady = 1,   // nothing arrived within the read timeout
  kFailed = 2,
};

/// Result of one device read. The status and the buffer are reported
/// separately: a read can succeed and still hand back an empty buffer.
struct DeviceRead {
  AcquireStatus status = AcquireStatus::kFailed;
  std::string reason;            // set with kFailed
  std::vector<uint8_t> buffer;
  int width = 0;
  int height = 0;
  std::optional<SteadyTime> captured_at;   // sensor time, when the driver reports one

  static DeviceRead acquired(std::vector<uint8_t> data, int w, int h,
                             std::optional<SteadyTime> at = std::nullopt) {
    DeviceRead r;
    r.status = AcquireStatus::kAcquired;
    r.buffer = std::move(data);
    r.width = w;
    r.height = h;
    r.captured_at = at;
    return r;
  }
  static DeviceRead not_ready() {
    DeviceRead r;
    r.status = AcquireStatus::kNotReady;
    return r;
  }
  static DeviceRead failed(std::string why) {
    DeviceRead r;
    r.status = AcquireStatus::kFailed;
    r.reason = std::move(why);
    return r;
  }
};

/// What the capture loop needs from a camera.
class CameraDevice {
public:
  virtual ~CameraDevice() = default;

  /// Throws DeviceError.
  virtual void open() = 0;
  virtual void close() = 0;
  virtual bool is_open() const = 0;

  /// Block up to `timeout` for the newest frame. Frames queued behind it are
  /// discarded. Never throws for per-frame problems; those come back as the
  /// read status.
  virtual DeviceRead acquire(std::chrono::milliseconds timeout) = 0;

  /// Tear down and open again. Throws DeviceError.
  virtual void reinitialize() {
    close();
    open();
  }

  virtual std::string describe() const = 0;
};

}  // namespace bathycat::camera
