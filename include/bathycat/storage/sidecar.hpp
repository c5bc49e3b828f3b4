#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "bathycat/camera/camera_device.hpp"
#include "bathycat/common/measured.hpp"
#include "bathycat/common/time.hpp"
#include "bathycat/gnss/gps_fix.hpp"

namespace bathycat::storage {

/// Position attached to a frame.
struct PositionAtCapture {
  double latitude_deg = 0.0;
  double longitude_deg = 0.0;
  Measured<double> altitude_m;
  gnss::FixQuality fix_quality = gnss::FixQuality::kNone;
  Measured<int> satellites_used;
  Measured<double> horizontal_dilution;
  Measured<WallTime> gps_utc_time;
  std::chrono::nanoseconds age{0};   // capture time - fix receive time
};

enum class WriteOutcome : uint8_t {
  kPending = 0,
  kWritten = 1,
  kDropped = 2,
};

/// A frame on its way to storage. No position means unpositioned.
struct GeotaggedRecord {
  camera::Frame frame;
  std::optional<PositionAtCapture> position;
  std::string image_path;     // relative to the storage root
  std::string sidecar_path;
  bool exif_tagged = false;   // image bytes carry our EXIF tags
  WriteOutcome outcome = WriteOutcome::kPending;
};

/// images/YYYYMMDD/<prefix>_YYYYMMDD-HHMMSS-mmm_NNNNNN.jpg, UTC capture time.
std::string image_path_for(const camera::Frame& frame, const std::string& prefix);

/// Same stem, .json extension.
std::string sidecar_path_for(const std::string& image_path);

/// Metadata document written beside the image. Position fields are left out
/// entirely when the record is unpositioned.
nlohmann::json sidecar_json(const GeotaggedRecord& record);

}  // namespace bathycat::storage
