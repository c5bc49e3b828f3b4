#include "bathycat/camera/capture_loop.hpp"

#include <algorithm>

#include "bathycat/common/errors.hpp"
#include "bathycat/common/time.hpp"

namespace bathycat::camera {

const char* to_string(FailureCause c) {
  switch (c) {
    case FailureCause::kNotAcquired: return "not_acquired";
    case FailureCause::kNotReady:    return "not_ready";
    case FailureCause::kEmptyBuffer: return "empty_buffer";
  }
  return "unknown";
}

CaptureLoop::CaptureLoop(CameraDevice& device,
                         FrameQueue& queue,
                         StatsRegistry& stats,
                         const CaptureParams& params,
                         const CameraParams& camera)
  : device_(device),
    queue_(queue),
    stats_(stats),
    params_(params),
    read_timeout_(std::chrono::duration_cast<std::chrono::milliseconds>(
        from_seconds(camera.read_timeout_sec))),
    logger_(rclcpp::get_logger("bathycat.capture")) {}

CaptureLoop::~CaptureLoop() {
  stop();
}

bool CaptureLoop::start() {
  if (running_.load(std::memory_order_acquire)) {
    return false;
  }
  if (!device_.is_open()) {
    device_.open();
  }
  stop_.reset();
  running_.store(true, std::memory_order_release);
  thread_ = std::thread(&CaptureLoop::run, this);
  RCLCPP_INFO(logger_, "Capture started: %s at %.1f fps",
              device_.describe().c_str(), params_.target_fps);
  return true;
}

void CaptureLoop::stop() {
  if (!running_.load(std::memory_order_acquire)) {
    return;
  }
  stop_.request();
  if (thread_.joinable()) {
    thread_.join();
  }
  device_.close();
  running_.store(false, std::memory_order_release);
  RCLCPP_INFO(logger_, "Capture stopped after %lu frames",
              static_cast<unsigned long>(next_sequence_));
}

void CaptureLoop::run() {
  const auto period = from_seconds(1.0 / params_.target_fps);
  SteadyTime next = SteadyClock::now();

  while (!stop_.requested()) {
    try {
      step();
    } catch (const DeviceLostError& e) {
      RCLCPP_ERROR(logger_, "%s", e.what());
      if (on_fatal_) on_fatal_(e.what());
      break;
    }

    // Pace against the schedule, not the previous wakeup, so capture
    // latency does not accumulate. Fall back to now when far behind.
    next += period;
    const SteadyTime now = SteadyClock::now();
    if (now > next + period) {
      next = now;
    }
    if (stop_.wait_until(next)) {
      break;
    }
  }
}

std::optional<FailureCause> CaptureLoop::step() {
  DeviceRead r = device_.acquire(read_timeout_);
  SteadyTime steady = SteadyClock::now();
  WallTime wall = WallClock::now();
  // Prefer the sensor timestamp; the frame may have waited in a buffer.
  if (r.captured_at && *r.captured_at <= steady) {
    wall -= std::chrono::duration_cast<WallClock::duration>(steady - *r.captured_at);
    steady = *r.captured_at;
  }

  // Acquisition status and buffer contents are checked separately.
  if (r.status == AcquireStatus::kFailed) {
    record_failure(FailureCause::kNotAcquired, r.reason);
    return FailureCause::kNotAcquired;
  }
  if (r.status == AcquireStatus::kNotReady) {
    record_failure(FailureCause::kNotReady, "");
    return FailureCause::kNotReady;
  }
  if (r.buffer.empty()) {
    record_failure(FailureCause::kEmptyBuffer, "");
    return FailureCause::kEmptyBuffer;
  }

  Frame frame;
  frame.data = std::move(r.buffer);
  frame.captured_steady = steady;
  frame.captured_wall = wall;
  frame.sequence = next_sequence_++;
  frame.device_state = degraded_next_ ? DeviceState::kDegraded : DeviceState::kOk;
  frame.width = r.width;
  frame.height = r.height;

  if (consecutive_failures_ > 0 || reinit_attempts_ > 0) {
    RCLCPP_INFO(logger_, "Capture recovered at frame %lu after %d failures",
                static_cast<unsigned long>(frame.sequence), consecutive_failures_);
  }
  consecutive_failures_ = 0;
  reinit_attempts_ = 0;
  degraded_next_ = false;

  stats_.update([](SessionStats& s) { ++s.frames_captured; });

  auto evicted = queue_.push(std::move(frame));
  if (evicted) {
    stats_.update([](SessionStats& s) { ++s.frames_dropped_queue; });
    RCLCPP_WARN_THROTTLE(logger_, throttle_clock_, 5000,
                         "Frame queue full, dropped frame %lu",
                         static_cast<unsigned long>(evicted->sequence));
  }
  return std::nullopt;
}

void CaptureLoop::record_failure(FailureCause cause, const std::string& reason) {
  ++consecutive_failures_;
  degraded_next_ = true;

  stats_.update([cause](SessionStats& s) {
    ++s.capture_failures;
    switch (cause) {
      case FailureCause::kNotAcquired: ++s.capture_not_acquired; break;
      case FailureCause::kNotReady:    ++s.capture_not_ready; break;
      case FailureCause::kEmptyBuffer: ++s.capture_empty_buffer; break;
    }
  });

  switch (cause) {
    case FailureCause::kNotAcquired:
      RCLCPP_WARN_THROTTLE(logger_, throttle_clock_, 2000,
                           "Camera did not acquire a frame (%d in a row): %s",
                           consecutive_failures_, reason.c_str());
      break;
    case FailureCause::kNotReady:
      RCLCPP_WARN_THROTTLE(logger_, throttle_clock_, 2000,
                           "Camera produced no frame within %ld ms (%d in a row)",
                           static_cast<long>(read_timeout_.count()), consecutive_failures_);
      break;
    case FailureCause::kEmptyBuffer:
      RCLCPP_WARN_THROTTLE(logger_, throttle_clock_, 2000,
                           "Camera acquired a frame with an empty buffer (%d in a row)",
                           consecutive_failures_);
      break;
  }

  if (consecutive_failures_ >= params_.failure_threshold) {
    recover();
  }
}

void CaptureLoop::recover() {
  const auto base = from_seconds(params_.reinit_backoff_sec);
  const auto cap = from_seconds(params_.reinit_backoff_max_sec);

  while (reinit_attempts_ < params_.max_reinit_attempts) {
    auto backoff = base;
    for (int i = 0; i < reinit_attempts_ && backoff < cap; ++i) backoff *= 2;
    backoff = std::min(backoff, cap);
    ++reinit_attempts_;

    RCLCPP_WARN(logger_, "Camera unresponsive after %d failures, reinitializing (%d/%d) in %.1f s",
                consecutive_failures_, reinit_attempts_, params_.max_reinit_attempts,
                to_seconds(backoff));
    if (stop_.wait_for(backoff)) {
      return;
    }

    stats_.update([](SessionStats& s) { ++s.device_reinitializations; });
    try {
      device_.reinitialize();
    } catch (const DeviceError& e) {
      RCLCPP_WARN(logger_, "Camera reinitialization failed: %s", e.what());
      continue;
    }
    RCLCPP_INFO(logger_, "Camera reinitialized: %s", device_.describe().c_str());
    consecutive_failures_ = 0;
    degraded_next_ = true;
    return;
  }

  throw DeviceLostError("camera " + device_.describe() + " lost after " +
                        std::to_string(reinit_attempts_) + " reinitialization attempts");
}

}  // namespace bathycat::camera
