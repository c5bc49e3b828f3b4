#include "bathycat/common/config.hpp"

#include <algorithm>
#include <array>

namespace bathycat {

std::vector<std::string> validate_config(const Config& cfg) {
  std::vector<std::string> errors;

  static constexpr std::array<int, 7> kBauds = {4800, 9600, 19200, 38400,
                                                57600, 115200, 460800};
  if (cfg.gps.replay_file.empty()) {
    if (cfg.gps.port.empty()) {
      errors.emplace_back("gps.port must be set");
    }
    if (std::find(kBauds.begin(), kBauds.end(), cfg.gps.baud) == kBauds.end()) {
      errors.emplace_back("gps.baud must be a standard rate");
    }
  } else if (cfg.gps.replay_rate_hz <= 0.0) {
    errors.emplace_back("gps.replay_rate_hz must be positive");
  }
  if (cfg.gps.read_timeout_sec <= 0.0) {
    errors.emplace_back("gps.read_timeout_sec must be positive");
  }

  if (cfg.position.staleness_sec <= 0.0) {
    errors.emplace_back("position.staleness_sec must be positive");
  }
  if (cfg.position.history_size == 0) {
    errors.emplace_back("position.history_size must be at least 1");
  }

  if (cfg.clock_sync.drift_threshold_sec <= 0.0) {
    errors.emplace_back("clock_sync.drift_threshold_sec must be positive");
  }
  if (cfg.clock_sync.cooldown_sec < 0.0) {
    errors.emplace_back("clock_sync.cooldown_sec must not be negative");
  }
  if (cfg.clock_sync.check_interval_sec <= 0.0) {
    errors.emplace_back("clock_sync.check_interval_sec must be positive");
  }

  if (cfg.camera.width <= 0 || cfg.camera.height <= 0) {
    errors.emplace_back("camera resolution must be positive");
  }
  if (cfg.camera.fps <= 0 || cfg.camera.fps > 120) {
    errors.emplace_back("camera.fps must be between 1 and 120");
  }
  if (cfg.camera.pixel_format.size() != 4) {
    errors.emplace_back("camera.pixel_format must be a four character code");
  }
  if (cfg.camera.read_timeout_sec <= 0.0) {
    errors.emplace_back("camera.read_timeout_sec must be positive");
  }
  if (cfg.camera.buffer_count < 2) {
    errors.emplace_back("camera.buffer_count must be at least 2");
  }

  if (cfg.capture.target_fps <= 0.0 || cfg.capture.target_fps > 120.0) {
    errors.emplace_back("capture.target_fps must be between 0 and 120");
  }
  if (cfg.capture.failure_threshold < 1) {
    errors.emplace_back("capture.failure_threshold must be at least 1");
  }
  if (cfg.capture.max_reinit_attempts < 0) {
    errors.emplace_back("capture.max_reinit_attempts must not be negative");
  }
  if (cfg.capture.queue_capacity < 1) {
    errors.emplace_back("capture.queue_capacity must be at least 1");
  }

  if (cfg.writer.pairing_tolerance_sec <= 0.0) {
    errors.emplace_back("writer.pairing_tolerance_sec must be positive");
  } else if (cfg.writer.pairing_tolerance_sec > cfg.position.staleness_sec) {
    errors.emplace_back("writer.pairing_tolerance_sec must not exceed position.staleness_sec");
  }
  if (cfg.writer.filename_prefix.empty() ||
      cfg.writer.filename_prefix.find('/') != std::string::npos) {
    errors.emplace_back("writer.filename_prefix must be a plain name");
  }
  if (cfg.writer.storage_retries < 1) {
    errors.emplace_back("writer.storage_retries must be at least 1");
  }
  if (cfg.writer.max_consecutive_storage_drops < 1) {
    errors.emplace_back("writer.max_consecutive_storage_drops must be at least 1");
  }
  if (cfg.writer.dequeue_timeout_sec <= 0.0) {
    errors.emplace_back("writer.dequeue_timeout_sec must be positive");
  }
  if (cfg.writer.auto_cleanup) {
    if (cfg.writer.days_to_keep < 1) {
      errors.emplace_back("writer.days_to_keep must be at least 1");
    }
    if (cfg.writer.cleanup_free_mb <= cfg.storage.min_free_mb) {
      errors.emplace_back("writer.cleanup_free_mb must exceed storage.min_free_mb");
    }
    if (cfg.writer.cleanup_interval_sec <= 0.0) {
      errors.emplace_back("writer.cleanup_interval_sec must be positive");
    }
  }

  if (cfg.storage.local_path.empty()) {
    errors.emplace_back("storage.local_path must be set");
  }

  return errors;
}

}  // namespace bathycat
