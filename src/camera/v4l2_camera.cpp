#include "bathycat/camera/v4l2_camera.hpp"

#include <linux/videodev2.h>
#include <sys/ioctl.h>
#include <sys/mman.h>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <optional>

#include "bathycat/common/errors.hpp"

namespace bathycat::camera {

namespace {

inline std::string sys_err(const char* msg) {
  std::string s(msg);
  s += ": ";
  s += std::strerror(errno);
  return s;
}

uint32_t fourcc_of(const std::string& code) {
  return v4l2_fourcc(code[0], code[1], code[2], code[3]);
}

// steady_clock is CLOCK_MONOTONIC, the clock V4L2 stamps buffers with.
std::optional<SteadyTime> sensor_time(const struct v4l2_buffer& buf) {
  if ((buf.flags & V4L2_BUF_FLAG_TIMESTAMP_MASK) != V4L2_BUF_FLAG_TIMESTAMP_MONOTONIC) {
    return std::nullopt;
  }
  if (buf.timestamp.tv_sec == 0 && buf.timestamp.tv_usec == 0) {
    return std::nullopt;
  }
  return SteadyTime(std::chrono::duration_cast<SteadyClock::duration>(
      std::chrono::seconds(buf.timestamp.tv_sec) +
      std::chrono::microseconds(buf.timestamp.tv_usec)));
}

}  // namespace

V4l2Camera::V4l2Camera(const CameraParams& params) : params_(params) {}

V4l2Camera::~V4l2Camera() {
  close();
}

std::string V4l2Camera::describe() const {
  return params_.device + " " + std::to_string(width_ ? width_ : params_.width) + "x" +
         std::to_string(height_ ? height_ : params_.height) + " " + params_.pixel_format;
}

bool V4l2Camera::xioctl(unsigned long request, void* arg, const char* what, std::string* err) {
  int rc;
  do {
    rc = ::ioctl(fd_, request, arg);
  } while (rc < 0 && errno == EINTR);
  if (rc < 0) {
    if (err) *err = sys_err(what);
    return false;
  }
  return true;
}

void V4l2Camera::open() {
  close();

  fd_ = ::open(params_.device.c_str(), O_RDWR | O_NONBLOCK);
  if (fd_ < 0) {
    throw DeviceError(sys_err(("open(" + params_.device + ") failed").c_str()));
  }

  // Capabilities, format, rate, buffers, then stream on.
  std::string e;
  if (!query_caps(&e) || !set_format(&e) || !set_frame_rate(&e) ||
      !map_buffers(&e) || !stream_on(&e)) {
    close();
    throw DeviceError(params_.device + ": " + e);
  }
}

bool V4l2Camera::query_caps(std::string* err) {
  struct v4l2_capability cap{};
  if (!xioctl(VIDIOC_QUERYCAP, &cap, "VIDIOC_QUERYCAP failed", err)) {
    return false;
  }
  const uint32_t caps = (cap.capabilities & V4L2_CAP_DEVICE_CAPS) ? cap.device_caps
                                                                  : cap.capabilities;
  if (!(caps & V4L2_CAP_VIDEO_CAPTURE)) {
    if (err) *err = "not a video capture device";
    return false;
  }
  if (!(caps & V4L2_CAP_STREAMING)) {
    if (err) *err = "device does not support streaming I/O";
    return false;
  }
  return true;
}

bool V4l2Camera::set_format(std::string* err) {
  struct v4l2_format fmt{};
  fmt.type = V4L2_BUF_TYPE_VIDEO_CAPTURE;
  fmt.fmt.pix.width = static_cast<uint32_t>(params_.width);
  fmt.fmt.pix.height = static_cast<uint32_t>(params_.height);
  fmt.fmt.pix.pixelformat = fourcc_of(params_.pixel_format);
  fmt.fmt.pix.field = V4L2_FIELD_ANY;

  if (!xioctl(VIDIOC_S_FMT, &fmt, "VIDIOC_S_FMT failed", err)) {
    return false;
  }
  // The driver may substitute; a different pixel format is not usable as-is.
  if (fmt.fmt.pix.pixelformat != fourcc_of(params_.pixel_format)) {
    if (err) *err = "driver refused pixel format " + params_.pixel_format;
    return false;
  }
  width_ = static_cast<int>(fmt.fmt.pix.width);
  height_ = static_cast<int>(fmt.fmt.pix.height);
  return true;
}

bool V4l2Camera::set_frame_rate(std::string* err) {
  struct v4l2_streamparm parm{};
  parm.type = V4L2_BUF_TYPE_VIDEO_CAPTURE;
  if (!xioctl(VIDIOC_G_PARM, &parm, "VIDIOC_G_PARM failed", err)) {
    return false;
  }
  if (!(parm.parm.capture.capability & V4L2_CAP_TIMEPERFRAME)) {
    return true;  // fixed-rate sensor
  }
  parm.parm.capture.timeperframe.numerator = 1;
  parm.parm.capture.timeperframe.denominator = static_cast<uint32_t>(params_.fps);
  return xioctl(VIDIOC_S_PARM, &parm, "VIDIOC_S_PARM failed", err);
}

bool V4l2Camera::map_buffers(std::string* err) {
  struct v4l2_requestbuffers req{};
  req.count = static_cast<uint32_t>(params_.buffer_count);
  req.type = V4L2_BUF_TYPE_VIDEO_CAPTURE;
  req.memory = V4L2_MEMORY_MMAP;
  if (!xioctl(VIDIOC_REQBUFS, &req, "VIDIOC_REQBUFS failed", err)) {
    return false;
  }
  if (req.count < 2) {
    if (err) *err = "driver granted fewer than 2 buffers";
    return false;
  }

  buffers_.resize(req.count);
  for (uint32_t i = 0; i < req.count; ++i) {
    struct v4l2_buffer buf{};
    buf.type = V4L2_BUF_TYPE_VIDEO_CAPTURE;
    buf.memory = V4L2_MEMORY_MMAP;
    buf.index = i;
    if (!xioctl(VIDIOC_QUERYBUF, &buf, "VIDIOC_QUERYBUF failed", err)) {
      return false;
    }

    void* p = ::mmap(nullptr, buf.length, PROT_READ | PROT_WRITE, MAP_SHARED, fd_, buf.m.offset);
    if (p == MAP_FAILED) {
      if (err) *err = sys_err("mmap failed");
      return false;
    }
    buffers_[i].start = p;
    buffers_[i].length = buf.length;

    if (!xioctl(VIDIOC_QBUF, &buf, "VIDIOC_QBUF failed", err)) {
      return false;
    }
  }
  return true;
}

bool V4l2Camera::stream_on(std::string* err) {
  int type = V4L2_BUF_TYPE_VIDEO_CAPTURE;
  if (!xioctl(VIDIOC_STREAMON, &type, "VIDIOC_STREAMON failed", err)) {
    return false;
  }
  streaming_ = true;
  return true;
}

void V4l2Camera::unmap_buffers() {
  for (auto& b : buffers_) {
    if (b.start) {
      ::munmap(b.start, b.length);
    }
  }
  buffers_.clear();
}

void V4l2Camera::close() {
  if (fd_ < 0) return;
  if (streaming_) {
    int type = V4L2_BUF_TYPE_VIDEO_CAPTURE;
    xioctl(VIDIOC_STREAMOFF, &type, "VIDIOC_STREAMOFF failed", nullptr);
    streaming_ = false;
  }
  unmap_buffers();
  ::close(fd_);
  fd_ = -1;
}

DeviceRead V4l2Camera::acquire(std::chrono::milliseconds timeout) {
  if (fd_ < 0 || !streaming_) {
    return DeviceRead::failed("device not open");
  }

  struct pollfd pfd{};
  pfd.fd = fd_;
  pfd.events = POLLIN;
  int rc;
  do {
    rc = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
  } while (rc < 0 && errno == EINTR);
  if (rc < 0) {
    return DeviceRead::failed(sys_err("poll failed"));
  }
  if (rc == 0) {
    return DeviceRead::not_ready();
  }
  if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL)) {
    return DeviceRead::failed("device reported an error or hung up");
  }

  struct v4l2_buffer buf{};
  buf.type = V4L2_BUF_TYPE_VIDEO_CAPTURE;
  buf.memory = V4L2_MEMORY_MMAP;
  std::string e;
  if (!xioctl(VIDIOC_DQBUF, &buf, "VIDIOC_DQBUF failed", &e)) {
    if (errno == EAGAIN) {
      return DeviceRead::not_ready();
    }
    return DeviceRead::failed(e);
  }

  // The sensor runs faster than we sample: older frames pile up in the
  // ring. Hand them back and keep only the newest.
  while (true) {
    struct v4l2_buffer newer{};
    newer.type = V4L2_BUF_TYPE_VIDEO_CAPTURE;
    newer.memory = V4L2_MEMORY_MMAP;
    if (!xioctl(VIDIOC_DQBUF, &newer, "VIDIOC_DQBUF failed", nullptr)) {
      break;  // EAGAIN when nothing newer; other errors show on the next read
    }
    if (!xioctl(VIDIOC_QBUF, &buf, "VIDIOC_QBUF failed", &e)) {
      return DeviceRead::failed(e);
    }
    buf = newer;
  }
  if (buf.index >= buffers_.size()) {
    return DeviceRead::failed("driver returned buffer index out of range");
  }

  // A buffer flagged as corrupt still counts as acquired; its payload is
  // dropped so the loop sees an empty buffer.
  std::vector<uint8_t> data;
  if (!(buf.flags & V4L2_BUF_FLAG_ERROR)) {
    const auto* start = static_cast<const uint8_t*>(buffers_[buf.index].start);
    const std::size_t used = std::min<std::size_t>(buf.bytesused, buffers_[buf.index].length);
    data.assign(start, start + used);
  }
  const std::optional<SteadyTime> taken = sensor_time(buf);

  if (!xioctl(VIDIOC_QBUF, &buf, "VIDIOC_QBUF failed", &e)) {
    return DeviceRead::failed(e);
  }
  return DeviceRead::acquired(std::move(data), width_, height_, taken);
}

}  // namespace bathycat::camera
