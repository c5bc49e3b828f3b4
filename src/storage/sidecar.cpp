#include "bathycat/storage/sidecar.hpp"

#include <cstdio>

namespace bathycat::storage {

std::string image_path_for(const camera::Frame& frame, const std::string& prefix) {
  const std::string date = format_compact_date(frame.captured_wall);
  char stem[96];
  std::snprintf(stem, sizeof(stem), "_%s-%s-%03d_%06lu.jpg",
                date.c_str(), format_compact_time(frame.captured_wall).c_str(),
                milliseconds_of(frame.captured_wall),
                static_cast<unsigned long>(frame.sequence));
  return "images/" + date + "/" + prefix + stem;
}

std::string sidecar_path_for(const std::string& image_path) {
  const auto dot = image_path.rfind('.');
  const auto slash = image_path.rfind('/');
  if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) {
    return image_path + ".json";
  }
  return image_path.substr(0, dot) + ".json";
}

nlohmann::json sidecar_json(const GeotaggedRecord& record) {
  const camera::Frame& f = record.frame;
  const auto slash = record.image_path.rfind('/');

  nlohmann::json j;
  j["filename"] = (slash == std::string::npos) ? record.image_path
                                               : record.image_path.substr(slash + 1);
  j["capture_time"] = format_iso8601(f.captured_wall);
  j["capture_monotonic_s"] = to_seconds(f.captured_steady.time_since_epoch());
  j["sequence"] = f.sequence;
  j["file_size_bytes"] = f.data.size();
  j["width"] = f.width;
  j["height"] = f.height;
  j["device_state"] = camera::to_string(f.device_state);
  j["positioned"] = record.position.has_value();
  j["exif_tagged"] = record.exif_tagged;

  if (record.position) {
    const PositionAtCapture& p = *record.position;
    j["latitude"] = p.latitude_deg;
    j["longitude"] = p.longitude_deg;
    if (p.altitude_m.is_valid()) {
      j["altitude_m"] = p.altitude_m.value();
    }
    j["fix_quality"] = gnss::to_string(p.fix_quality);
    j["position_age_s"] = to_seconds(p.age);
    if (p.satellites_used.is_valid()) {
      j["satellites_used"] = p.satellites_used.value();
    }
    if (p.horizontal_dilution.is_valid()) {
      j["horizontal_dilution"] = p.horizontal_dilution.value();
    }
    if (p.gps_utc_time.is_valid()) {
      j["gps_utc_time"] = format_iso8601(p.gps_utc_time.value());
    }
  }
  return j;
}

}  // namespace bathycat::storage
