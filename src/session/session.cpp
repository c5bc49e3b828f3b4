#include "bathycat/session/session.hpp"

#include <stdexcept>

#include "bathycat/camera/v4l2_camera.hpp"
#include "bathycat/common/errors.hpp"

namespace bathycat {

SessionDevices make_linux_devices(const Config& cfg) {
  SessionDevices d;
  if (cfg.gps.replay_file.empty()) {
    d.gps = std::make_unique<gnss::SerialPort>(cfg.gps);
  } else {
    d.gps = std::make_unique<gnss::NmeaFileSource>(cfg.gps.replay_file, cfg.gps.replay_rate_hz);
  }
  d.camera = std::make_unique<camera::V4l2Camera>(cfg.camera);
  const storage::StorageRoot root = storage::select_storage_root(cfg.storage);
  d.storage = std::make_unique<storage::FilesystemStorage>(
      root.path, cfg.storage.min_free_mb * 1024 * 1024, root.mount_point);
  if (cfg.clock_sync.enabled) {
    d.clock = std::make_unique<timesync::PosixSystemClock>();
    if (cfg.clock_sync.manage_ntp) {
      d.ntp = std::make_unique<timesync::TimedatectlService>();
    }
  }
  return d;
}

Session::Session(const Config& cfg, SessionDevices devices)
  : cfg_(cfg),
    devices_(std::move(devices)),
    tracker_(cfg.position),
    queue_(cfg.capture.queue_capacity),
    logger_(rclcpp::get_logger("bathycat.session")) {
  if (!devices_.gps || !devices_.camera || !devices_.storage) {
    throw std::invalid_argument("Session needs a GPS source, a camera and a storage target");
  }

  gps_reader_ = std::make_unique<gnss::GpsReader>(
      std::move(devices_.gps), tracker_, stats_, cfg_.gps);

  if (cfg_.clock_sync.enabled && devices_.clock) {
    clock_sync_ = std::make_unique<timesync::ClockSynchronizer>(
        tracker_, *devices_.clock, devices_.ntp.get(), stats_, cfg_.clock_sync);
  }

  capture_ = std::make_unique<camera::CaptureLoop>(
      *devices_.camera, queue_, stats_, cfg_.capture, cfg_.camera);
  capture_->set_fatal_handler([this](const std::string& what) {
    report_fatal("capture", what);
  });

  writer_ = std::make_unique<storage::GeotagWriter>(
      queue_, tracker_, *devices_.storage, stats_, cfg_.writer);
  writer_->set_fatal_handler([this](const std::string& what) {
    report_fatal("writer", what);
  });
}

Session::~Session() {
  stop();
}

void Session::start() {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (running_ || stopped_) {
      throw std::logic_error("Session can only be started once");
    }
  }

  stats_.reset();
  devices_.storage->prepare();
  devices_.storage->check_ready();

  started_wall_ = WallClock::now();
  started_steady_ = SteadyClock::now();

  // Consumers first, so the first frame already has somewhere to go.
  gps_reader_->start();
  if (clock_sync_) clock_sync_->start();
  writer_->start();
  try {
    capture_->start();
  } catch (const DeviceError& e) {
    RCLCPP_FATAL(logger_, "Camera could not be opened: %s", e.what());
    writer_->stop();
    if (clock_sync_) clock_sync_->stop();
    gps_reader_->stop();
    throw;
  }

  {
    std::lock_guard<std::mutex> lock(mtx_);
    running_ = true;
  }
  RCLCPP_INFO(logger_, "Session started at %s, writing to %s",
              format_iso8601(started_wall_).c_str(), devices_.storage->root().c_str());
}

void Session::stop() {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (!running_) return;
    running_ = false;
    stopped_ = true;
  }

  RCLCPP_INFO(logger_, "Session stopping");
  capture_->stop();
  if (writer_->storage_failed()) {
    writer_->abort();
  }
  writer_->stop();
  if (clock_sync_) clock_sync_->stop();
  gps_reader_->stop();

  stopped_wall_ = WallClock::now();
  stopped_steady_ = SteadyClock::now();
  write_summary();

  const SessionStats s = stats_.snapshot();
  RCLCPP_INFO(logger_, "Session finished: %lu captured, %lu written, %lu dropped, %lu unpositioned",
              static_cast<unsigned long>(s.frames_captured),
              static_cast<unsigned long>(s.frames_written),
              static_cast<unsigned long>(s.frames_dropped()),
              static_cast<unsigned long>(s.frames_unpositioned));
}

bool Session::running() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return running_;
}

std::optional<std::string> Session::fatal_error() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return fatal_;
}

void Session::report_fatal(const std::string& component, const std::string& what) {
  std::lock_guard<std::mutex> lock(mtx_);
  if (!fatal_) {
    fatal_ = component + ": " + what;
  }
}

std::string Session::summary_path() const {
  return "sessions/session_" + format_compact_date(started_wall_) + "-" +
         format_compact_time(started_wall_) + ".json";
}

nlohmann::json Session::summary_json() const {
  const SessionStats s = stats_.snapshot();

  bool running_now;
  std::optional<std::string> fatal;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    running_now = running_;
    fatal = fatal_;
  }
  const SteadyTime end_steady = running_now ? SteadyClock::now() : stopped_steady_;
  const WallTime end_wall = running_now ? WallClock::now() : stopped_wall_;
  const double duration = to_seconds(end_steady - started_steady_);

  nlohmann::json j;
  j["session_start"] = format_iso8601(started_wall_);
  j["session_end"] = format_iso8601(end_wall);
  j["duration_s"] = duration;
  j["target_fps"] = cfg_.capture.target_fps;
  j["achieved_fps"] = duration > 0.0 ? static_cast<double>(s.frames_captured) / duration : 0.0;
  j["storage_root"] = devices_.storage->root();

  j["frames"] = {
    {"captured", s.frames_captured},
    {"written", s.frames_written},
    {"dropped", s.frames_dropped()},
    {"dropped_queue", s.frames_dropped_queue},
    {"dropped_write", s.frames_dropped_write},
    {"unpositioned", s.frames_unpositioned},
  };
  j["clock_corrections"] = s.clock_corrections;

  j["counters"] = {
    {"bytes_written", s.bytes_written},
    {"storage_retries", s.storage_retries},
    {"frames_untagged", s.frames_untagged},
    {"cleanup_runs", s.cleanup_runs},
    {"cleanup_files_removed", s.cleanup_files_removed},
    {"cleanup_bytes_freed", s.cleanup_bytes_freed},
    {"capture_failures", s.capture_failures},
    {"capture_not_acquired", s.capture_not_acquired},
    {"capture_not_ready", s.capture_not_ready},
    {"capture_empty_buffer", s.capture_empty_buffer},
    {"device_reinitializations", s.device_reinitializations},
    {"sentences_parsed", s.sentences_parsed},
    {"sentences_rejected", s.sentences_rejected()},
    {"sentences_rejected_checksum", s.sentences_rejected_checksum},
    {"sentences_rejected_malformed", s.sentences_rejected_malformed},
    {"sentences_unrecognized", s.sentences_unrecognized},
    {"time_regressions_rejected", s.time_regressions_rejected},
    {"gps_reopen_attempts", s.gps_reopen_attempts},
    {"clock_sync_failures", s.clock_sync_failures},
  };

  if (fatal) {
    j["fatal_error"] = *fatal;
  } else {
    j["fatal_error"] = nullptr;
  }
  return j;
}

void Session::write_summary() {
  const std::string path = summary_path();
  try {
    devices_.storage->write_atomic(path, summary_json().dump(2));
    RCLCPP_INFO(logger_, "Session summary written to %s/%s",
                devices_.storage->root().c_str(), path.c_str());
  } catch (const StorageError& e) {
    RCLCPP_ERROR(logger_, "Could not write session summary: %s", e.what());
  }
}

}  // namespace bathycat
