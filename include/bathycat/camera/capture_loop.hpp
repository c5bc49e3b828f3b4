#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <thread>

#include <rclcpp/rclcpp.hpp>

#include "bathycat/camera/camera_device.hpp"
#include "bathycat/common/bounded_queue.hpp"
#include "bathycat/common/config.hpp"
#include "bathycat/common/session_stats.hpp"
#include "bathycat/common/stop_flag.hpp"

namespace bathycat::camera {

using FrameQueue = DropOldestQueue<Frame>;

/// Why a single acquisition produced no frame.
enum class FailureCause : uint8_t {
  kNotAcquired = 0,   // device reported failure
  kNotReady = 1,      // nothing within the read timeout
  kEmptyBuffer = 2,   // device said acquired, buffer was empty
};

const char* to_string(FailureCause c);

/// Paced camera worker. Produces frames with strictly increasing sequence
/// numbers into a drop-oldest queue and never waits on the consumer.
class CaptureLoop {
public:
  using FatalHandler = std::function<void(const std::string& what)>;

  CaptureLoop(CameraDevice& device,
              FrameQueue& queue,
              StatsRegistry& stats,
              const CaptureParams& params,
              const CameraParams& camera);
  ~CaptureLoop();

  CaptureLoop(const CaptureLoop&) = delete;
  CaptureLoop& operator=(const CaptureLoop&) = delete;

  /// Called once, from the capture thread, when the device is lost.
  void set_fatal_handler(FatalHandler handler) { on_fatal_ = std::move(handler); }

  /// Opens the device if needed (throws DeviceError) and starts the worker.
  bool start();
  void stop();
  bool is_running() const { return running_.load(std::memory_order_acquire); }

  /// One acquire / classify / enqueue pass. Returns the failure cause, or
  /// nothing when a frame was queued. Throws DeviceLostError once recovery
  /// is exhausted.
  std::optional<FailureCause> step();

  uint64_t next_sequence() const { return next_sequence_; }
  int consecutive_failures() const { return consecutive_failures_; }

private:
  void run();
  void record_failure(FailureCause cause, const std::string& reason);
  void recover();

  CameraDevice& device_;
  FrameQueue& queue_;
  StatsRegistry& stats_;
  CaptureParams params_;
  std::chrono::milliseconds read_timeout_;

  FatalHandler on_fatal_;

  uint64_t next_sequence_ = 0;
  int consecutive_failures_ = 0;
  int reinit_attempts_ = 0;       // since the last good frame
  bool degraded_next_ = false;

  std::thread thread_;
  std::atomic<bool> running_{false};
  StopFlag stop_;

  rclcpp::Logger logger_;
  rclcpp::Clock throttle_clock_{RCL_STEADY_TIME};
};

}  // namespace bathycat::camera
