#include "bathycat/gnss/line_source.hpp"

#include <fcntl.h>
#include <poll.h>
#include <termios.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <thread>

#include "bathycat/common/errors.hpp"

namespace bathycat::gnss {

namespace {

inline std::string sys_err(const std::string& msg) {
  return msg + ": " + std::strerror(errno);
}

bool baud_to_speed(int baud, speed_t* out) {
  switch (baud) {
    case 4800:   *out = B4800; return true;
    case 9600:   *out = B9600; return true;
    case 19200:  *out = B19200; return true;
    case 38400:  *out = B38400; return true;
    case 57600:  *out = B57600; return true;
    case 115200: *out = B115200; return true;
    case 460800: *out = B460800; return true;
    default:     return false;
  }
}

}  // namespace

// ---------------------------------------------------------------- SerialPort

SerialPort::SerialPort(const GpsParams& params)
  : port_(params.port), baud_(params.baud) {}

SerialPort::~SerialPort() {
  close();
}

void SerialPort::open() {
  close();

  fd_ = ::open(port_.c_str(), O_RDONLY | O_NOCTTY | O_NONBLOCK);
  if (fd_ < 0) {
    throw DeviceError(sys_err("open(" + port_ + ") failed"));
  }

  std::string err;
  if (!configure_tty(&err)) {
    close();
    throw DeviceError(port_ + ": " + err);
  }
}

bool SerialPort::configure_tty(std::string* err) {
  speed_t speed;
  if (!baud_to_speed(baud_, &speed)) {
    if (err) *err = "unsupported baud rate " + std::to_string(baud_);
    return false;
  }

  struct termios tty{};
  if (tcgetattr(fd_, &tty) != 0) {
    if (err) *err = sys_err("tcgetattr failed");
    return false;
  }

  cfmakeraw(&tty);
  cfsetispeed(&tty, speed);
  cfsetospeed(&tty, speed);

  tty.c_cflag |= (CLOCAL | CREAD);
  tty.c_cflag &= ~CSIZE;
  tty.c_cflag |= CS8;
  tty.c_cflag &= ~(PARENB | CSTOPB);

  if (tcsetattr(fd_, TCSANOW, &tty) != 0) {
    if (err) *err = sys_err("tcsetattr failed");
    return false;
  }
  tcflush(fd_, TCIFLUSH);
  return true;
}

void SerialPort::close() {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
  line_.clear();
  discarding_ = false;
  ready_.clear();
}

std::string SerialPort::describe() const {
  return port_ + "@" + std::to_string(baud_);
}

void SerialPort::consume(const char* buf, std::size_t n) {
  for (std::size_t i = 0; i < n; ++i) {
    const char c = buf[i];
    if (c == '\n') {
      if (!discarding_ && !line_.empty()) {
        ready_.push_back(std::move(line_));
      }
      line_.clear();
      discarding_ = false;
    } else if (c != '\r' && !discarding_) {
      line_ += c;
      if (line_.size() > kMaxLineLength) {
        // Garbage or a lost newline; resync on the next one.
        ++overlong_lines_;
        line_.clear();
        discarding_ = true;
      }
    }
  }
}

std::optional<std::string> SerialPort::read_line(std::chrono::milliseconds timeout) {
  if (fd_ < 0) {
    throw DeviceError("serial port " + port_ + " is not open");
  }

  const auto deadline = SteadyClock::now() + timeout;
  char buf[256];

  while (ready_.empty()) {
    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - SteadyClock::now());
    if (remaining.count() <= 0) {
      return std::nullopt;
    }

    struct pollfd pfd{};
    pfd.fd = fd_;
    pfd.events = POLLIN;
    const int rc = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
    if (rc < 0) {
      if (errno == EINTR) continue;
      throw DeviceError(sys_err("poll(" + port_ + ") failed"));
    }
    if (rc == 0) {
      return std::nullopt;
    }
    if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) {
      throw DeviceError("serial port " + port_ + " hung up");
    }

    const ssize_t n = ::read(fd_, buf, sizeof(buf));
    if (n < 0) {
      if (errno == EAGAIN || errno == EINTR) continue;
      throw DeviceError(sys_err("read(" + port_ + ") failed"));
    }
    if (n == 0) {
      throw DeviceError("serial port " + port_ + " returned end of file");
    }
    consume(buf, static_cast<std::size_t>(n));
  }

  std::string line = std::move(ready_.front());
  ready_.pop_front();
  return line;
}

// ------------------------------------------------------------ NmeaFileSource

NmeaFileSource::NmeaFileSource(std::string path, double lines_per_sec)
  : path_(std::move(path)),
    period_(from_seconds(1.0 / std::max(lines_per_sec, 1e-3))) {}

void NmeaFileSource::open() {
  file_.close();
  file_.clear();
  file_.open(path_);
  if (!file_.is_open()) {
    throw DeviceError("cannot open NMEA replay file " + path_);
  }
  finished_ = false;
  next_due_ = SteadyClock::now();
}

void NmeaFileSource::close() {
  file_.close();
}

std::optional<std::string> NmeaFileSource::read_line(std::chrono::milliseconds timeout) {
  if (!file_.is_open()) {
    throw DeviceError("NMEA replay file " + path_ + " is not open");
  }

  const auto now = SteadyClock::now();
  if (finished_ || next_due_ > now + timeout) {
    std::this_thread::sleep_for(timeout);
    return std::nullopt;
  }
  if (next_due_ > now) {
    std::this_thread::sleep_until(next_due_);
  }
  next_due_ += period_;

  std::string line;
  while (std::getline(file_, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (!line.empty()) return line;
  }
  finished_ = true;
  return std::nullopt;
}

}  // namespace bathycat::gnss
