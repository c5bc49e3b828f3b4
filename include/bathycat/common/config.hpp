#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace bathycat {

struct GpsParams {
  std::string port = "/dev/ttyUSB0";
  int baud = 9600;
  double read_timeout_sec = 0.5;     // bound on one serial line wait

  // Bench mode: replay a recorded NMEA log instead of opening the port.
  std::string replay_file;
  double replay_rate_hz = 10.0;      // lines per second

  double reopen_backoff_sec = 1.0;
  double reopen_backoff_max_sec = 10.0;
};

struct PositionParams {
  double staleness_sec = 3.0;        // snapshot is invalid past this age
  std::size_t history_size = 64;     // position samples kept for pairing
};

struct ClockSyncParams {
  bool enabled = true;
  double drift_threshold_sec = 2.0;
  double cooldown_sec = 60.0;
  double check_interval_sec = 1.0;
  bool manage_ntp = true;            // suspend/restore timesyncd around a set
};

struct CameraParams {
  std::string device = "/dev/video0";
  int width = 1920;
  int height = 1080;
  int fps = 30;                      // rate requested from the sensor
  std::string pixel_format = "MJPG"; // V4L2 fourcc
  double read_timeout_sec = 2.0;
  int buffer_count = 4;
};

struct CaptureParams {
  double target_fps = 4.0;
  int failure_threshold = 5;         // consecutive failures before "lost"
  int max_reinit_attempts = 3;
  double reinit_backoff_sec = 0.5;
  double reinit_backoff_max_sec = 8.0;
  std::size_t queue_capacity = 16;
};

struct WriterParams {
  double pairing_tolerance_sec = 1.0;
  std::string filename_prefix = "bathycat";
  int storage_retries = 3;           // attempts per record
  double storage_retry_delay_sec = 0.2;
  int max_consecutive_storage_drops = 5;
  double dequeue_timeout_sec = 0.2;
  bool embed_exif = true;            // capture time and GPS tags in the JPEG

  // Retention: below this headroom, images older than days_to_keep go.
  bool auto_cleanup = true;
  uint64_t cleanup_free_mb = 1024;
  int days_to_keep = 30;
  double cleanup_interval_sec = 60.0;
};

struct StorageParams {
  std::string local_path = "/var/lib/bathycat";
  std::vector<std::string> mount_prefixes = {"/media", "/mnt"};
  bool prefer_removable = true;
  uint64_t min_free_mb = 100;
};

/// The whole pipeline configuration. Built once at startup, then only read.
struct Config {
  GpsParams gps;
  PositionParams position;
  ClockSyncParams clock_sync;
  CameraParams camera;
  CaptureParams capture;
  WriterParams writer;
  StorageParams storage;
};

/// Returns one message per problem; empty when the config is usable.
std::vector<std::string> validate_config(const Config& cfg);

}  // namespace bathycat
