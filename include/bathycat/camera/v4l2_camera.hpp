#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "bathycat/camera/camera_device.hpp"
#include "bathycat/common/config.hpp"

namespace bathycat::camera {

/// USB (UVC) camera through V4L2 memory-mapped streaming.
class V4l2Camera : public CameraDevice {
public:
  explicit V4l2Camera(const CameraParams& params);
  ~V4l2Camera() override;

  V4l2Camera(const V4l2Camera&) = delete;
  V4l2Camera& operator=(const V4l2Camera&) = delete;

  void open() override;
  void close() override;
  bool is_open() const override { return fd_ >= 0; }

  DeviceRead acquire(std::chrono::milliseconds timeout) override;

  std::string describe() const override;

  // Negotiated with the driver; valid after open().
  int width() const { return width_; }
  int height() const { return height_; }

private:
  struct MappedBuffer {
    void* start = nullptr;
    std::size_t length = 0;
  };

  bool xioctl(unsigned long request, void* arg, const char* what, std::string* err);

  bool query_caps(std::string* err);
  bool set_format(std::string* err);
  bool set_frame_rate(std::string* err);
  bool map_buffers(std::string* err);
  bool stream_on(std::string* err);
  void unmap_buffers();

  CameraParams params_;
  int fd_{-1};
  bool streaming_ = false;
  int width_ = 0;
  int height_ = 0;
  std::vector<MappedBuffer> buffers_;
};

}  // namespace bathycat::camera
