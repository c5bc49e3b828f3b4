#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>

#include <rclcpp/rclcpp.hpp>

#include "bathycat/common/config.hpp"
#include "bathycat/common/session_stats.hpp"
#include "bathycat/common/stop_flag.hpp"
#include "bathycat/common/time.hpp"
#include "bathycat/gnss/line_source.hpp"
#include "bathycat/gnss/position_tracker.hpp"

namespace bathycat::gnss {

/// Serial reader worker: line source -> decoder -> position tracker.
/// Bad sentences are counted and dropped; a failing device is reopened
/// with backoff for as long as the reader runs.
class GpsReader {
public:
  GpsReader(std::unique_ptr<LineSource> source,
            PositionTracker& tracker,
            StatsRegistry& stats,
            const GpsParams& params);
  ~GpsReader();

  GpsReader(const GpsReader&) = delete;
  GpsReader& operator=(const GpsReader&) = delete;

  bool start();
  void stop();
  bool is_running() const { return running_.load(std::memory_order_acquire); }

  /// Decode one line and apply it. Returns true if the tracker accepted a
  /// GGA or RMC sentence.
  bool process_line(const std::string& line, SteadyTime now);

private:
  void run();
  bool try_open();

  std::unique_ptr<LineSource> source_;
  PositionTracker& tracker_;
  StatsRegistry& stats_;
  GpsParams params_;

  std::thread thread_;
  std::atomic<bool> running_{false};
  StopFlag stop_;

  std::chrono::nanoseconds backoff_;
  bool opened_once_ = false;
  bool had_fix_ = false;

  rclcpp::Logger logger_;
  rclcpp::Clock throttle_clock_{RCL_STEADY_TIME};
};

}  // namespace bathycat::gnss
