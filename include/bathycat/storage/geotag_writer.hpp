#pragma once

#include <atomic>
#include <functional>
#include <optional>
#include <string>
#include <thread>

#include <rclcpp/rclcpp.hpp>

#include "bathycat/camera/capture_loop.hpp"
#include "bathycat/common/config.hpp"
#include "bathycat/common/session_stats.hpp"
#include "bathycat/common/stop_flag.hpp"
#include "bathycat/gnss/position_tracker.hpp"
#include "bathycat/storage/sidecar.hpp"
#include "bathycat/storage/storage.hpp"

namespace bathycat::storage {

/// Writer worker: pairs each queued frame with a position and persists the
/// image and its sidecar. Frames leave in the order they were queued.
class GeotagWriter {
public:
  using FatalHandler = std::function<void(const std::string& what)>;

  GeotagWriter(camera::FrameQueue& queue,
               gnss::PositionTracker& tracker,
               Storage& storage,
               StatsRegistry& stats,
               const WriterParams& params);
  ~GeotagWriter();

  GeotagWriter(const GeotagWriter&) = delete;
  GeotagWriter& operator=(const GeotagWriter&) = delete;

  /// Called once when the storage target is judged unrecoverable.
  void set_fatal_handler(FatalHandler handler) { on_fatal_ = std::move(handler); }

  bool start();

  /// Close the queue, write whatever is still in it, then join.
  void stop();

  /// Give up on pending retries and waits. Used when draining must not block.
  void abort();

  bool is_running() const { return running_.load(std::memory_order_acquire); }

  /// Position for `frame`, or nothing if no fix lies within tolerance.
  /// May wait until capture time + tolerance for a fix still on its way.
  std::optional<PositionAtCapture> pair(const camera::Frame& frame);

  /// Pair, write with retries, and account for one frame.
  GeotaggedRecord process(camera::Frame frame);

  bool storage_failed() const { return storage_failed_.load(std::memory_order_acquire); }

  /// Retention pass when free space is below the configured headroom.
  /// Runs at most once per cleanup interval.
  void ensure_headroom();

private:
  void run();
  void tag_image(GeotaggedRecord& record);
  bool write_record(GeotaggedRecord& record);

  camera::FrameQueue& queue_;
  gnss::PositionTracker& tracker_;
  Storage& storage_;
  StatsRegistry& stats_;
  WriterParams params_;

  FatalHandler on_fatal_;
  int consecutive_drops_ = 0;
  std::atomic<bool> storage_failed_{false};
  bool cleanup_ran_ = false;
  SteadyTime last_cleanup_{};

  std::thread thread_;
  std::atomic<bool> running_{false};
  StopFlag abort_;

  rclcpp::Logger logger_;
  rclcpp::Clock throttle_clock_{RCL_STEADY_TIME};
};

}  // namespace bathycat::storage
