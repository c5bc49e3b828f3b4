// Shared test doubles for the standalone test programs.
//
// Every hardware-facing interface has an in-memory stand-in here so the
// tests run without a receiver, camera, removable medium or root.

#pragma once

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <deque>
#include <iostream>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "bathycat/camera/camera_device.hpp"
#include "bathycat/common/errors.hpp"
#include "bathycat/common/time.hpp"
#include "bathycat/gnss/line_source.hpp"
#include "bathycat/gnss/nmea_decoder.hpp"
#include "bathycat/storage/storage.hpp"
#include "bathycat/timesync/system_clock.hpp"

namespace bathycat::test {

#define CHECK(cond)                                                        \
  do {                                                                     \
    if (!(cond)) {                                                         \
      std::cerr << "✗ " << __FILE__ << ":" << __LINE__ << ": " #cond       \
                << std::endl;                                              \
      return false;                                                        \
    }                                                                      \
  } while (0)

inline bool near(double a, double b, double eps = 1e-6) {
  return (a > b ? a - b : b - a) <= eps;
}

/// "$" + payload + "*hh" with a correct checksum.
inline std::string nmea(const std::string& payload) {
  char cs[8];
  std::snprintf(cs, sizeof(cs), "*%02X", gnss::nmea_checksum(payload));
  return "$" + payload + cs;
}

/// GGA with quality 1, 8 satellites, HDOP 0.9, altitude 12.5.
inline std::string gga(const std::string& hhmmss, const std::string& lat, char ns,
                       const std::string& lon, char ew, int quality = 1) {
  return nmea("GPGGA," + hhmmss + "," + lat + "," + ns + "," + lon + "," + ew + "," +
              std::to_string(quality) + ",08,0.9,12.5,M,46.9,M,,");
}

inline std::string rmc(const std::string& hhmmss, char status, const std::string& lat, char ns,
                       const std::string& lon, char ew, const std::string& ddmmyy) {
  return nmea("GPRMC," + hhmmss + "," + status + "," + lat + "," + ns + "," + lon + "," + ew +
              ",0.5,54.7," + ddmmyy + ",,,A");
}

inline camera::Frame make_frame(uint64_t seq, SteadyTime steady, std::size_t bytes = 1024) {
  camera::Frame f;
  f.data.assign(bytes, 0xAB);
  f.captured_steady = steady;
  f.captured_wall = WallClock::now();
  f.sequence = seq;
  f.width = 1920;
  f.height = 1080;
  return f;
}

/// Smallest baseline JPEG a metadata library will rewrite: SOI, JFIF APP0,
/// a 1x1 greyscale SOF0, SOS, two bytes of scan data, EOI.
inline std::vector<uint8_t> tiny_jpeg() {
  return {0xFF, 0xD8,
          0xFF, 0xE0, 0x00, 0x10, 'J', 'F', 'I', 'F', 0x00, 0x01, 0x01, 0x00,
          0x00, 0x01, 0x00, 0x01, 0x00, 0x00,
          0xFF, 0xC0, 0x00, 0x0B, 0x08, 0x00, 0x01, 0x00, 0x01, 0x01, 0x01, 0x11, 0x00,
          0xFF, 0xDA, 0x00, 0x08, 0x01, 0x01, 0x00, 0x00, 0x3F, 0x00,
          0x12, 0x34,
          0xFF, 0xD9};
}

// ---------------------------------------------------------------------------

/// Lines fed by the test; nothing pending means a read timeout.
class FakeLineSource : public gnss::LineSource {
public:
  void open() override {
    std::lock_guard<std::mutex> lock(mtx_);
    ++open_calls_;
    if (fail_opens_ > 0) {
      --fail_opens_;
      throw DeviceError("fake open failure");
    }
    open_ = true;
  }
  void close() override {
    std::lock_guard<std::mutex> lock(mtx_);
    open_ = false;
  }
  bool is_open() const override {
    std::lock_guard<std::mutex> lock(mtx_);
    return open_;
  }

  std::optional<std::string> read_line(std::chrono::milliseconds timeout) override {
    {
      std::lock_guard<std::mutex> lock(mtx_);
      if (fail_next_read_) {
        fail_next_read_ = false;
        throw DeviceError("fake device unplugged");
      }
      if (!lines_.empty()) {
        std::string l = lines_.front();
        lines_.pop_front();
        return l;
      }
    }
    std::this_thread::sleep_for(std::min(timeout, std::chrono::milliseconds(5)));
    return std::nullopt;
  }

  std::string describe() const override { return "fake-gps"; }

  void push(const std::string& line) {
    std::lock_guard<std::mutex> lock(mtx_);
    lines_.push_back(line);
  }
  void fail_opens(int n) {
    std::lock_guard<std::mutex> lock(mtx_);
    fail_opens_ = n;
  }
  void fail_next_read() {
    std::lock_guard<std::mutex> lock(mtx_);
    fail_next_read_ = true;
  }
  int open_calls() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return open_calls_;
  }

private:
  mutable std::mutex mtx_;
  std::deque<std::string> lines_;
  bool open_ = false;
  int open_calls_ = 0;
  int fail_opens_ = 0;
  bool fail_next_read_ = false;
};

/// Camera returning scripted reads; once the script is empty it returns
/// good frames.
class FakeCamera : public camera::CameraDevice {
public:
  void open() override {
    ++open_calls_;
    if (fail_opens_ > 0) {
      --fail_opens_;
      throw DeviceError("fake camera open failure");
    }
    open_ = true;
  }
  void close() override { open_ = false; }
  bool is_open() const override { return open_; }

  camera::DeviceRead acquire(std::chrono::milliseconds /*timeout*/) override {
    ++acquire_calls_;
    if (delay_.count() > 0) std::this_thread::sleep_for(delay_);
    if (!script_.empty()) {
      camera::DeviceRead r = script_.front();
      script_.pop_front();
      return r;
    }
    if (always_fail_) {
      return camera::DeviceRead::failed("fake failure");
    }
    return camera::DeviceRead::acquired(std::vector<uint8_t>(2048, 0xFF), 1920, 1080);
  }

  void reinitialize() override {
    ++reinit_calls_;
    if (fail_reinits_) {
      throw DeviceError("fake reinit failure");
    }
    open_ = true;
  }

  std::string describe() const override { return "fake-camera"; }

  std::deque<camera::DeviceRead> script_;
  bool always_fail_ = false;
  bool fail_reinits_ = false;
  int fail_opens_ = 0;
  std::chrono::milliseconds delay_{0};

  int open_calls_ = 0;
  int acquire_calls_ = 0;
  int reinit_calls_ = 0;

private:
  bool open_ = false;
};

/// Files held in memory. Failures can be injected per call kind.
class MemoryStorage : public storage::Storage {
public:
  std::string root() const override { return "/mem"; }

  void check_ready() override {
    std::lock_guard<std::mutex> lock(mtx_);
    if (unmounted_) throw StorageError("fake medium unmounted");
  }

  void write_atomic(const std::string& path, const uint8_t* data, std::size_t size) override {
    const auto delay = write_delay();
    if (delay.count() > 0) std::this_thread::sleep_for(delay);
    std::lock_guard<std::mutex> lock(mtx_);
    if (unmounted_) throw StorageError("fake medium unmounted");
    if (fail_writes_ > 0) {
      --fail_writes_;
      throw StorageError("fake write failure");
    }
    if (!fail_suffix_.empty() && path.size() >= fail_suffix_.size() &&
        path.compare(path.size() - fail_suffix_.size(), fail_suffix_.size(), fail_suffix_) == 0 &&
        fail_suffix_count_ > 0) {
      --fail_suffix_count_;
      throw StorageError("fake write failure for " + fail_suffix_);
    }
    ++writes_per_path_[path];
    files_[path] = std::string(reinterpret_cast<const char*>(data), size);
    written_at_[path] = WallClock::now();
  }
  using storage::Storage::write_atomic;

  void remove(const std::string& path) override {
    std::lock_guard<std::mutex> lock(mtx_);
    files_.erase(path);
    written_at_.erase(path);
    removed_.push_back(path);
  }

  uint64_t free_bytes() const override {
    std::lock_guard<std::mutex> lock(mtx_);
    return free_bytes_;
  }

  storage::CleanupResult remove_older_than(std::chrono::seconds max_age) override {
    std::lock_guard<std::mutex> lock(mtx_);
    ++cleanup_calls_;
    storage::CleanupResult r;
    const WallTime cutoff = WallClock::now() - max_age;
    for (auto it = files_.begin(); it != files_.end();) {
      if (it->first.rfind("images/", 0) == 0 && written_at_[it->first] < cutoff) {
        ++r.files;
        r.bytes += it->second.size();
        free_bytes_ += it->second.size();
        written_at_.erase(it->first);
        it = files_.erase(it);
      } else {
        ++it;
      }
    }
    return r;
  }

  /// Place a file as if written at `when`.
  void put(const std::string& path, const std::string& data, WallTime when) {
    std::lock_guard<std::mutex> lock(mtx_);
    files_[path] = data;
    written_at_[path] = when;
  }
  void set_free_bytes(uint64_t n) {
    std::lock_guard<std::mutex> lock(mtx_);
    free_bytes_ = n;
  }
  int cleanup_calls() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return cleanup_calls_;
  }

  void set_unmounted(bool v) {
    std::lock_guard<std::mutex> lock(mtx_);
    unmounted_ = v;
  }
  void fail_writes(int n) {
    std::lock_guard<std::mutex> lock(mtx_);
    fail_writes_ = n;
  }
  void fail_writes_ending_with(const std::string& suffix, int n) {
    std::lock_guard<std::mutex> lock(mtx_);
    fail_suffix_ = suffix;
    fail_suffix_count_ = n;
  }
  void set_write_delay(std::chrono::milliseconds d) {
    std::lock_guard<std::mutex> lock(mtx_);
    write_delay_ = d;
  }
  std::chrono::milliseconds write_delay() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return write_delay_;
  }

  std::map<std::string, std::string> files() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return files_;
  }
  std::map<std::string, int> writes_per_path() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return writes_per_path_;
  }
  std::vector<std::string> removed() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return removed_;
  }

private:
  mutable std::mutex mtx_;
  std::map<std::string, std::string> files_;
  std::map<std::string, WallTime> written_at_;
  std::map<std::string, int> writes_per_path_;
  std::vector<std::string> removed_;
  bool unmounted_ = false;
  int fail_writes_ = 0;
  std::string fail_suffix_;
  int fail_suffix_count_ = 0;
  std::chrono::milliseconds write_delay_{0};
  uint64_t free_bytes_ = uint64_t(1) << 40;
  int cleanup_calls_ = 0;
};

class FakeSystemClock : public timesync::SystemClock {
public:
  explicit FakeSystemClock(WallTime t) : now_(t) {}

  WallTime now() const override { return now_; }
  void set(WallTime t) override {
    ++set_calls_;
    if (refuse_) throw TimeSyncError("fake EPERM");
    now_ = t;
  }

  WallTime now_;
  bool refuse_ = false;
  int set_calls_ = 0;
};

class FakeNtp : public timesync::NetworkTimeService {
public:
  bool is_active() override { return active_; }
  void set_active(bool active) override {
    history_.push_back(active);
    active_ = active;
  }

  bool active_ = true;
  std::vector<bool> history_;
};

}  // namespace bathycat::test
