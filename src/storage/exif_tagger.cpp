#include "bathycat/storage/exif_tagger.hpp"

#include <chrono>
#include <cmath>
#include <cstdio>
#include <mutex>

#include <exiv2/exiv2.hpp>
#include <rclcpp/rclcpp.hpp>

#include "bathycat/common/errors.hpp"
#include "bathycat/common/time.hpp"

namespace bathycat::storage {

namespace {

// Exiv2 reports through its own handler; route it to the ROS log.
void exiv2_log(int level, const char* msg) {
  auto logger = rclcpp::get_logger("bathycat.exif");
  if (level >= Exiv2::LogMsg::error) {
    RCLCPP_WARN(logger, "exiv2: %s", msg);
  } else {
    RCLCPP_DEBUG(logger, "exiv2: %s", msg);
  }
}

void init_exiv2() {
  static std::once_flag once;
  std::call_once(once, [] {
    Exiv2::LogMsg::setHandler(exiv2_log);
    Exiv2::LogMsg::setLevel(Exiv2::LogMsg::warn);
  });
}

struct Hms {
  int hour = 0;
  int minute = 0;
  int second = 0;
  int millisecond = 0;
};

Hms hms_of(WallTime t) {
  const auto tod = std::chrono::duration_cast<std::chrono::milliseconds>(
      t - make_utc(civil_date_of(t), std::chrono::microseconds(0)));
  Hms h;
  h.hour = static_cast<int>(tod.count() / 3600000);
  h.minute = static_cast<int>((tod.count() / 60000) % 60);
  h.second = static_cast<int>((tod.count() / 1000) % 60);
  h.millisecond = static_cast<int>(tod.count() % 1000);
  return h;
}

std::string exif_date(WallTime t, char sep) {
  const CivilDate d = civil_date_of(t);
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d%c%02d%c%02d", d.year, sep, d.month, sep, d.day);
  return buf;
}

// "YYYY:MM:DD HH:MM:SS"
std::string exif_datetime(WallTime t) {
  const Hms h = hms_of(t);
  char buf[16];
  std::snprintf(buf, sizeof(buf), " %02d:%02d:%02d", h.hour, h.minute, h.second);
  return exif_date(t, ':') + buf;
}

std::string rational(double value, int denominator) {
  char buf[48];
  std::snprintf(buf, sizeof(buf), "%lld/%d",
                static_cast<long long>(std::llround(std::fabs(value) * denominator)),
                denominator);
  return buf;
}

void set_tag(Exiv2::ExifData& exif, const char* key, const std::string& value) {
  exif[key] = value;
}

void set_tag_if_absent(Exiv2::ExifData& exif, const char* key, const std::string& value) {
  if (exif.findKey(Exiv2::ExifKey(key)) == exif.end()) {
    exif[key] = value;
  }
}

void add_time_tags(Exiv2::ExifData& exif, const camera::Frame& frame) {
  const std::string when = exif_datetime(frame.captured_wall);
  char subsec[8];
  std::snprintf(subsec, sizeof(subsec), "%03d", milliseconds_of(frame.captured_wall));

  set_tag(exif, "Exif.Image.DateTime", when);
  set_tag(exif, "Exif.Photo.DateTimeOriginal", when);
  set_tag(exif, "Exif.Photo.DateTimeDigitized", when);
  set_tag(exif, "Exif.Photo.SubSecTime", subsec);
  set_tag(exif, "Exif.Photo.SubSecTimeOriginal", subsec);
  set_tag(exif, "Exif.Photo.SubSecTimeDigitized", subsec);
}

void add_gps_tags(Exiv2::ExifData& exif, const PositionAtCapture& p) {
  set_tag(exif, "Exif.GPSInfo.GPSVersionID", "2 3 0 0");
  set_tag(exif, "Exif.GPSInfo.GPSLatitudeRef", p.latitude_deg >= 0.0 ? "N" : "S");
  set_tag(exif, "Exif.GPSInfo.GPSLatitude", exif_dms(p.latitude_deg));
  set_tag(exif, "Exif.GPSInfo.GPSLongitudeRef", p.longitude_deg >= 0.0 ? "E" : "W");
  set_tag(exif, "Exif.GPSInfo.GPSLongitude", exif_dms(p.longitude_deg));
  set_tag(exif, "Exif.GPSInfo.GPSMapDatum", "WGS-84");

  if (p.altitude_m.is_valid()) {
    set_tag(exif, "Exif.GPSInfo.GPSAltitudeRef", p.altitude_m.value() >= 0.0 ? "0" : "1");
    set_tag(exif, "Exif.GPSInfo.GPSAltitude", rational(p.altitude_m.value(), 100));
  }
  set_tag(exif, "Exif.GPSInfo.GPSMeasureMode", p.altitude_m.is_valid() ? "3" : "2");
  if (p.satellites_used.is_valid()) {
    set_tag(exif, "Exif.GPSInfo.GPSSatellites", std::to_string(p.satellites_used.value()));
  }
  if (p.horizontal_dilution.is_valid()) {
    set_tag(exif, "Exif.GPSInfo.GPSDOP", rational(p.horizontal_dilution.value(), 100));
  }
  if (p.gps_utc_time.is_valid()) {
    const WallTime t = p.gps_utc_time.value();
    const Hms h = hms_of(t);
    char stamp[48];
    std::snprintf(stamp, sizeof(stamp), "%d/1 %d/1 %d/1000", h.hour, h.minute,
                  h.second * 1000 + h.millisecond);
    set_tag(exif, "Exif.GPSInfo.GPSTimeStamp", stamp);
    set_tag(exif, "Exif.GPSInfo.GPSDateStamp", exif_date(t, ':'));
  }
}

}  // namespace

std::string exif_dms(double deg) {
  const double a = std::fabs(deg);
  int d = static_cast<int>(a);
  const double minutes = (a - d) * 60.0;
  int m = static_cast<int>(minutes);
  long long milli_sec = std::llround((minutes - m) * 60.0 * 1000.0);
  if (milli_sec >= 60000) {
    milli_sec -= 60000;
    ++m;
  }
  if (m >= 60) {
    m -= 60;
    ++d;
  }
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%d/1 %d/1 %lld/1000", d, m, milli_sec);
  return buf;
}

std::vector<uint8_t> embed_exif(const std::vector<uint8_t>& jpeg, const GeotaggedRecord& record) {
  init_exiv2();
  try {
    auto image = Exiv2::ImageFactory::open(jpeg.data(), jpeg.size());
    if (image->mimeType() != "image/jpeg") {
      throw MetadataError("not a JPEG image (" + image->mimeType() + ")");
    }
    image->readMetadata();

    Exiv2::ExifData& exif = image->exifData();
    set_tag(exif, "Exif.Image.Software", "BathyCat Seabed Imager");
    set_tag_if_absent(exif, "Exif.Image.Make", "BathyCat");
    set_tag_if_absent(exif, "Exif.Image.Model", "Seabed Imager");
    add_time_tags(exif, record.frame);
    if (record.position) {
      add_gps_tags(exif, *record.position);
    }
    image->writeMetadata();

    Exiv2::BasicIo& io = image->io();
    const Exiv2::byte* data = io.mmap();
    return std::vector<uint8_t>(data, data + io.size());
  } catch (const Exiv2::Error& e) {
    throw MetadataError(std::string("EXIF tagging failed: ") + e.what());
  }
}

}  // namespace bathycat::storage
