// EXIF Tagger Test
//
// Purpose: Validate the capture time and GPS tags embedded in written JPEGs,
// read back through Exiv2, and the refusal of buffers that are not JPEG.

#include <chrono>
#include <iostream>
#include <string>
#include <vector>

#include <exiv2/exiv2.hpp>

#include "bathycat/common/errors.hpp"
#include "bathycat/storage/exif_tagger.hpp"
#include "test_support.hpp"

using namespace bathycat;
using namespace bathycat::storage;
using namespace std::chrono_literals;
using bathycat::test::make_frame;
using bathycat::test::tiny_jpeg;

namespace {

GeotaggedRecord record_at(const std::vector<uint8_t>& jpeg) {
  GeotaggedRecord r;
  r.frame = make_frame(7, SteadyClock::now());
  r.frame.data = jpeg;
  r.frame.captured_wall = make_utc(CivilDate{2024, 5, 1}, 12h + 34min + 56s + 789ms);
  return r;
}

PositionAtCapture position() {
  PositionAtCapture p;
  p.latitude_deg = -(51.0 + 30.0 / 60.0 + 1.5 / 3600.0);
  p.longitude_deg = 7.5 / 60.0;
  p.altitude_m = Measured<double>::valid(-3.25);
  p.fix_quality = gnss::FixQuality::kGps;
  p.satellites_used = Measured<int>::valid(9);
  p.horizontal_dilution = Measured<double>::valid(0.9);
  p.gps_utc_time = Measured<WallTime>::valid(make_utc(CivilDate{2024, 5, 1}, 12h + 34min + 56s));
  return p;
}

std::string tag(const Exiv2::ExifData& exif, const char* key) {
  auto it = exif.findKey(Exiv2::ExifKey(key));
  return it == exif.end() ? std::string("<absent>") : it->toString();
}

Exiv2::ExifData read_back(const std::vector<uint8_t>& jpeg) {
  auto image = Exiv2::ImageFactory::open(jpeg.data(), jpeg.size());
  image->readMetadata();
  return image->exifData();
}

}  // namespace

// Test 1: Degrees, minutes, seconds as rationals
bool test_dms() {
  CHECK(exif_dms(51.5) == "51/1 30/1 0/1000");
  CHECK(exif_dms(-51.5) == "51/1 30/1 0/1000");
  CHECK(exif_dms(51.0 + 30.0 / 60.0 + 1.5 / 3600.0) == "51/1 30/1 1500/1000");
  CHECK(exif_dms(0.0) == "0/1 0/1 0/1000");
  // Rounding up to a whole minute carries.
  CHECK(exif_dms(10.0 + 59.0 / 60.0 + 59.99999 / 3600.0) == "11/1 0/1 0/1000");
  std::cout << "✓ Test 1: DMS rationals - PASSED" << std::endl;
  return true;
}

// Test 2: A positioned frame carries time and GPS tags
bool test_positioned_tags() {
  GeotaggedRecord r = record_at(tiny_jpeg());
  r.position = position();

  const std::vector<uint8_t> tagged = embed_exif(r.frame.data, r);
  CHECK(tagged.size() > tiny_jpeg().size());
  CHECK(tagged[0] == 0xFF && tagged[1] == 0xD8);

  const Exiv2::ExifData exif = read_back(tagged);
  CHECK(tag(exif, "Exif.Photo.DateTimeOriginal") == "2024:05:01 12:34:56");
  CHECK(tag(exif, "Exif.Photo.SubSecTimeOriginal") == "789");
  CHECK(tag(exif, "Exif.Image.Software") == "BathyCat Seabed Imager");
  CHECK(tag(exif, "Exif.GPSInfo.GPSLatitudeRef") == "S");
  CHECK(tag(exif, "Exif.GPSInfo.GPSLatitude") == "51/1 30/1 1500/1000");
  CHECK(tag(exif, "Exif.GPSInfo.GPSLongitudeRef") == "E");
  CHECK(tag(exif, "Exif.GPSInfo.GPSLongitude") == "0/1 7/1 30000/1000");
  CHECK(tag(exif, "Exif.GPSInfo.GPSAltitudeRef") == "1");
  CHECK(tag(exif, "Exif.GPSInfo.GPSAltitude") == "325/100");
  CHECK(tag(exif, "Exif.GPSInfo.GPSSatellites") == "9");
  CHECK(tag(exif, "Exif.GPSInfo.GPSDOP") == "90/100");
  CHECK(tag(exif, "Exif.GPSInfo.GPSTimeStamp") == "12/1 34/1 56000/1000");
  CHECK(tag(exif, "Exif.GPSInfo.GPSDateStamp") == "2024:05:01");
  CHECK(tag(exif, "Exif.GPSInfo.GPSMapDatum") == "WGS-84");
  std::cout << "✓ Test 2: Positioned tags - PASSED" << std::endl;
  return true;
}

// Test 3: An unpositioned frame gets the time but no GPS block
bool test_unpositioned_tags() {
  GeotaggedRecord r = record_at(tiny_jpeg());
  const Exiv2::ExifData exif = read_back(embed_exif(r.frame.data, r));
  CHECK(tag(exif, "Exif.Photo.DateTimeOriginal") == "2024:05:01 12:34:56");
  CHECK(tag(exif, "Exif.GPSInfo.GPSLatitude") == "<absent>");
  CHECK(tag(exif, "Exif.GPSInfo.GPSLongitude") == "<absent>");
  std::cout << "✓ Test 3: Unpositioned tags - PASSED" << std::endl;
  return true;
}

// Test 4: Anything that is not a JPEG is refused
bool test_not_a_jpeg() {
  GeotaggedRecord r = record_at(std::vector<uint8_t>(256, 0xAB));
  bool threw = false;
  try {
    embed_exif(r.frame.data, r);
  } catch (const MetadataError&) {
    threw = true;
  }
  CHECK(threw);
  std::cout << "✓ Test 4: Not a JPEG - PASSED" << std::endl;
  return true;
}

int main() {
  std::cout << "=== EXIF Tagger Test ===" << std::endl;

  if (!test_dms()) return 1;
  if (!test_positioned_tags()) return 1;
  if (!test_unpositioned_tags()) return 1;
  if (!test_not_a_jpeg()) return 1;

  std::cout << "\nAll EXIF tagger tests passed" << std::endl;
  return 0;
}
