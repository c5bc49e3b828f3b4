#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <fstream>
#include <optional>
#include <string>

#include "bathycat/common/config.hpp"
#include "bathycat/common/time.hpp"

namespace bathycat::gnss {

/// Where NMEA text comes from. Implementations throw DeviceError when the
/// underlying device fails; the GPS reader then reopens it.
class LineSource {
public:
  virtual ~LineSource() = default;

  virtual void open() = 0;
  virtual void close() = 0;
  virtual bool is_open() const = 0;

  /// Next complete line without its CR/LF, or nullopt if none arrived
  /// within `timeout`.
  virtual std::optional<std::string> read_line(std::chrono::milliseconds timeout) = 0;

  virtual std::string describe() const = 0;
};

/// NMEA receiver on a tty, raw 8N1.
class SerialPort : public LineSource {
public:
  static constexpr std::size_t kMaxLineLength = 256;

  explicit SerialPort(const GpsParams& params);
  ~SerialPort() override;

  SerialPort(const SerialPort&) = delete;
  SerialPort& operator=(const SerialPort&) = delete;

  void open() override;
  void close() override;
  bool is_open() const override { return fd_ >= 0; }

  std::optional<std::string> read_line(std::chrono::milliseconds timeout) override;

  std::string describe() const override;

  /// Lines thrown away for exceeding kMaxLineLength.
  uint64_t overlong_lines() const { return overlong_lines_; }

private:
  bool configure_tty(std::string* err);
  void consume(const char* buf, std::size_t n);

  std::string port_;
  int baud_;

  int fd_ = -1;
  std::string line_;
  bool discarding_ = false;
  std::deque<std::string> ready_;
  uint64_t overlong_lines_ = 0;
};

/// Replays a recorded NMEA log at a fixed line rate. At end of file it
/// keeps returning nothing, like a receiver that went quiet.
class NmeaFileSource : public LineSource {
public:
  NmeaFileSource(std::string path, double lines_per_sec);

  void open() override;
  void close() override;
  bool is_open() const override { return file_.is_open(); }

  std::optional<std::string> read_line(std::chrono::milliseconds timeout) override;

  std::string describe() const override { return "replay:" + path_; }

  bool finished() const { return finished_; }

private:
  std::string path_;
  std::chrono::nanoseconds period_;
  std::ifstream file_;
  SteadyTime next_due_{};
  bool finished_ = false;
};

}  // namespace bathycat::gnss
