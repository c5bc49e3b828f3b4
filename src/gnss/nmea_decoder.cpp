// Checksummed GGA / RMC decoding. Everything else decodes as Unrecognized.
#include "bathycat/gnss/nmea_decoder.hpp"

#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <vector>

#include "bathycat/common/errors.hpp"

namespace bathycat::gnss {

namespace {

constexpr std::size_t kGgaMinFields = 9;  // through altitude
constexpr std::size_t kRmcMinFields = 9;  // through date

std::string_view trim(std::string_view s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
  return s;
}

// Split "A,B,,C" into {"A","B","","C"}; empty fields are kept.
std::vector<std::string_view> split_fields(std::string_view s) {
  std::vector<std::string_view> out;
  std::size_t start = 0;
  while (true) {
    const std::size_t comma = s.find(',', start);
    if (comma == std::string_view::npos) {
      out.push_back(s.substr(start));
      break;
    }
    out.push_back(s.substr(start, comma - start));
    start = comma + 1;
  }
  return out;
}

int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

[[noreturn]] void malformed(const std::string& what) {
  throw MalformedSentenceError("malformed NMEA sentence: " + what);
}

bool all_digits(std::string_view s) {
  if (s.empty()) return false;
  for (char c : s) {
    if (!std::isdigit(static_cast<unsigned char>(c))) return false;
  }
  return true;
}

// Plain decimal: optional sign, digits, at most one '.'. No exponents,
// no "nan"/"inf", which strtod would otherwise accept.
double parse_decimal(std::string_view field, const char* name, bool allow_sign) {
  std::size_t i = 0;
  if (allow_sign && !field.empty() && (field[0] == '-' || field[0] == '+')) i = 1;
  bool seen_digit = false;
  bool seen_dot = false;
  for (; i < field.size(); ++i) {
    const char c = field[i];
    if (std::isdigit(static_cast<unsigned char>(c))) {
      seen_digit = true;
    } else if (c == '.' && !seen_dot) {
      seen_dot = true;
    } else {
      malformed(std::string(name) + " '" + std::string(field) + "' is not a number");
    }
  }
  if (!seen_digit) {
    malformed(std::string(name) + " '" + std::string(field) + "' is not a number");
  }
  const std::string copy(field);
  return std::strtod(copy.c_str(), nullptr);
}

int parse_int(std::string_view field, const char* name) {
  if (!all_digits(field) || field.size() > 6) {
    malformed(std::string(name) + " '" + std::string(field) + "' is not an integer");
  }
  int v = 0;
  for (char c : field) v = v * 10 + (c - '0');
  return v;
}

// "hhmmss" or "hhmmss.sss"
Measured<std::chrono::microseconds> parse_time_of_day(std::string_view field) {
  if (field.empty()) return Measured<std::chrono::microseconds>::absent();
  if (field.size() < 6 || !all_digits(field.substr(0, 6))) {
    malformed("time '" + std::string(field) + "'");
  }

  const int hh = (field[0] - '0') * 10 + (field[1] - '0');
  const int mm = (field[2] - '0') * 10 + (field[3] - '0');
  const int ss = (field[4] - '0') * 10 + (field[5] - '0');

  int64_t frac_us = 0;
  if (field.size() > 6) {
    if (field[6] != '.') malformed("time '" + std::string(field) + "'");
    const std::string_view frac = field.substr(7);
    if (!frac.empty() && !all_digits(frac)) malformed("time '" + std::string(field) + "'");
    int64_t scale = 100000;
    for (std::size_t i = 0; i < frac.size() && i < 6; ++i) {
      frac_us += (frac[i] - '0') * scale;
      scale /= 10;
    }
  }

  using namespace std::chrono;
  const microseconds tod = hours(hh) + minutes(mm) + seconds(ss) + microseconds(frac_us);
  if (hh >= 24 || mm >= 60 || ss > 60) {
    return Measured<microseconds>::invalid(tod);
  }
  return Measured<microseconds>::valid(tod);
}

// "ddmmyy"
Measured<CivilDate> parse_date(std::string_view field) {
  if (field.empty()) return Measured<CivilDate>::absent();
  if (field.size() != 6 || !all_digits(field)) {
    malformed("date '" + std::string(field) + "'");
  }
  CivilDate d;
  d.day = (field[0] - '0') * 10 + (field[1] - '0');
  d.month = (field[2] - '0') * 10 + (field[3] - '0');
  const int yy = (field[4] - '0') * 10 + (field[5] - '0');
  d.year = (yy < 80) ? 2000 + yy : 1900 + yy;

  if (d.month < 1 || d.month > 12 || d.day < 1 || d.day > 31) {
    return Measured<CivilDate>::invalid(d);
  }
  return Measured<CivilDate>::valid(d);
}

Measured<double> parse_optional_decimal(std::string_view field, const char* name,
                                        bool allow_sign) {
  if (field.empty()) return Measured<double>::absent();
  return Measured<double>::valid(parse_decimal(field, name, allow_sign));
}

void decode_gga(const std::vector<std::string_view>& f, NmeaSentence* out) {
  if (f.size() < kGgaMinFields) {
    malformed("GGA has " + std::to_string(f.size()) + " fields");
  }

  GpsFix& fix = out->fix;
  fix.utc_time_of_day = parse_time_of_day(f[0]);
  fix.latitude_deg = parse_coordinate(f[1], f[2], true);
  fix.longitude_deg = parse_coordinate(f[3], f[4], false);

  fix.fix_quality = f[5].empty() ? FixQuality::kNone
                                 : fix_quality_from_gga(parse_int(f[5], "GGA quality"));

  if (!f[6].empty()) {
    fix.satellites_used = Measured<int>::valid(parse_int(f[6], "GGA satellites"));
  }
  fix.horizontal_dilution = parse_optional_decimal(f[7], "GGA HDOP", false);
  fix.altitude_m = parse_optional_decimal(f[8], "GGA altitude", true);

  out->fix_valid = (fix.fix_quality != FixQuality::kNone);
}

void decode_rmc(const std::vector<std::string_view>& f, NmeaSentence* out) {
  if (f.size() < kRmcMinFields) {
    malformed("RMC has " + std::to_string(f.size()) + " fields");
  }

  bool active = false;
  if (f[1] == "A") {
    active = true;
  } else if (f[1] != "V") {
    malformed("RMC status '" + std::string(f[1]) + "'");
  }

  GpsFix& fix = out->fix;
  fix.utc_time_of_day = parse_time_of_day(f[0]);
  fix.latitude_deg = parse_coordinate(f[2], f[3], true);
  fix.longitude_deg = parse_coordinate(f[4], f[5], false);
  fix.utc_date = parse_date(f[8]);
  fix.fix_quality = active ? FixQuality::kGps : FixQuality::kNone;

  out->fix_valid = active;
}

}  // namespace

FixQuality fix_quality_from_gga(int code) {
  switch (code) {
    case 1:
      return FixQuality::kGps;
    case 2:
    case 3:
    case 4:
    case 5:
      return FixQuality::kDgps;
    default:
      return FixQuality::kNone;
  }
}

const char* to_string(FixQuality q) {
  switch (q) {
    case FixQuality::kNone: return "none";
    case FixQuality::kGps:  return "gps";
    case FixQuality::kDgps: return "dgps";
  }
  return "none";
}

uint8_t nmea_checksum(std::string_view payload) {
  uint8_t cs = 0;
  for (char c : payload) cs ^= static_cast<uint8_t>(c);
  return cs;
}

Measured<double> parse_coordinate(std::string_view field,
                                  std::string_view hemisphere,
                                  bool is_latitude) {
  if (field.empty()) {
    return Measured<double>::absent();
  }

  const char pos = is_latitude ? 'N' : 'E';
  const char neg = is_latitude ? 'S' : 'W';
  if (hemisphere.size() != 1 || (hemisphere[0] != pos && hemisphere[0] != neg)) {
    malformed(std::string(is_latitude ? "latitude" : "longitude") +
              " hemisphere '" + std::string(hemisphere) + "'");
  }

  // NMEA format: lat = ddmm.mmmm, lon = dddmm.mmmm
  const int max_deg_digits = is_latitude ? 2 : 3;
  const std::size_t dot_pos = field.find('.');
  const std::size_t int_len = (dot_pos == std::string_view::npos) ? field.size() : dot_pos;
  if (int_len < 3 || int_len > static_cast<std::size_t>(max_deg_digits + 2)) {
    malformed("coordinate '" + std::string(field) + "'");
  }
  const std::size_t deg_len = int_len - 2;

  const double deg = parse_decimal(field.substr(0, deg_len), "coordinate degrees", false);
  const double minutes = parse_decimal(field.substr(deg_len), "coordinate minutes", false);

  double value = deg + minutes / 60.0;
  if (hemisphere[0] == neg) value = -value;

  const double limit = is_latitude ? 90.0 : 180.0;
  if (minutes >= 60.0 || std::fabs(value) > limit) {
    return Measured<double>::invalid(value);
  }
  return Measured<double>::valid(value);
}

NmeaSentence decode_nmea(std::string_view line) {
  const std::string_view s = trim(line);
  if (s.size() < 6 || s[0] != '$') {
    malformed("missing '$' start");
  }

  const std::size_t star = s.rfind('*');
  if (star == std::string_view::npos) {
    malformed("missing '*hh' checksum");
  }
  const std::string_view trailer = s.substr(star + 1);
  if (trailer.size() != 2 || hex_value(trailer[0]) < 0 || hex_value(trailer[1]) < 0) {
    malformed("checksum field '" + std::string(trailer) + "'");
  }

  const std::string_view payload = s.substr(1, star - 1);
  const int expected = hex_value(trailer[0]) * 16 + hex_value(trailer[1]);
  const uint8_t actual = nmea_checksum(payload);
  if (actual != expected) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "checksum mismatch: computed %02X, sentence says %.2s",
                  actual, trailer.data());
    throw ChecksumError(buf);
  }

  std::vector<std::string_view> fields = split_fields(payload);
  const std::string_view address = fields.front();
  if (address.size() < 3 || fields.size() < 2) {
    malformed("address field '" + std::string(address) + "'");
  }
  fields.erase(fields.begin());

  NmeaSentence out;
  if (address[0] == 'P') {
    out.talker = "P";
    out.formatter = std::string(address.substr(1));
    return out;
  }

  out.talker = std::string(address.substr(0, 2));
  out.formatter = std::string(address.substr(address.size() - 3));
  if (address.size() != 5) {
    return out;
  }

  if (out.formatter == "GGA") {
    out.type = SentenceType::kGga;
    decode_gga(fields, &out);
  } else if (out.formatter == "RMC") {
    out.type = SentenceType::kRmc;
    decode_rmc(fields, &out);
  }
  return out;
}

}  // namespace bathycat::gnss
