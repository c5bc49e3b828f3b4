#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>
#include <rclcpp/rclcpp.hpp>

#include "bathycat/camera/camera_device.hpp"
#include "bathycat/camera/capture_loop.hpp"
#include "bathycat/common/config.hpp"
#include "bathycat/common/session_stats.hpp"
#include "bathycat/common/time.hpp"
#include "bathycat/gnss/gps_reader.hpp"
#include "bathycat/gnss/line_source.hpp"
#include "bathycat/gnss/position_tracker.hpp"
#include "bathycat/storage/geotag_writer.hpp"
#include "bathycat/storage/storage.hpp"
#include "bathycat/timesync/clock_synchronizer.hpp"
#include "bathycat/timesync/system_clock.hpp"

namespace bathycat {

/// Hardware the session runs on. Tests swap any of these for doubles.
struct SessionDevices {
  std::unique_ptr<gnss::LineSource> gps;
  std::unique_ptr<camera::CameraDevice> camera;
  std::unique_ptr<storage::Storage> storage;
  std::unique_ptr<timesync::SystemClock> clock;          // null: no clock sync
  std::unique_ptr<timesync::NetworkTimeService> ntp;     // null: nothing to suspend
};

/// Serial or replay GPS, V4L2 camera, the selected storage root, the
/// realtime clock and timedatectl.
SessionDevices make_linux_devices(const Config& cfg);

/// One acquisition session. Owns every component and the shared counters.
///
/// start() brings consumers up before producers. stop() reverses that:
/// capture first, then the writer drains the queue, then clock sync, and
/// the GPS reader last so in-flight frames still see the latest fix.
class Session {
public:
  Session(const Config& cfg, SessionDevices devices);
  ~Session();

  Session(const Session&) = delete;
  Session& operator=(const Session&) = delete;

  /// Throws StorageError or DeviceError if the session cannot begin.
  void start();

  /// Orderly shutdown and session summary. Safe to call more than once.
  void stop();

  bool running() const;

  SessionStats stats() const { return stats_.snapshot(); }
  gnss::PositionSnapshot position() const { return tracker_.snapshot(); }

  /// First fatal error reported by a component, if any.
  std::optional<std::string> fatal_error() const;

  nlohmann::json summary_json() const;

  /// Relative path of the summary inside the storage root.
  std::string summary_path() const;

  const Config& config() const { return cfg_; }

private:
  void report_fatal(const std::string& component, const std::string& what);
  void write_summary();

  const Config cfg_;
  SessionDevices devices_;

  StatsRegistry stats_;
  gnss::PositionTracker tracker_;
  camera::FrameQueue queue_;

  std::unique_ptr<gnss::GpsReader> gps_reader_;
  std::unique_ptr<timesync::ClockSynchronizer> clock_sync_;
  std::unique_ptr<camera::CaptureLoop> capture_;
  std::unique_ptr<storage::GeotagWriter> writer_;

  mutable std::mutex mtx_;
  bool running_ = false;
  bool stopped_ = false;
  std::optional<std::string> fatal_;
  WallTime started_wall_{};
  SteadyTime started_steady_{};
  WallTime stopped_wall_{};
  SteadyTime stopped_steady_{};

  rclcpp::Logger logger_;
};

}  // namespace bathycat
