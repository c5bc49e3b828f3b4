#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "bathycat/common/measured.hpp"
#include "bathycat/gnss/gps_fix.hpp"

namespace bathycat::gnss {

enum class SentenceType : uint8_t {
  kUnrecognized = 0,
  kGga = 1,
  kRmc = 2,
};

/// One decoded NMEA 0183 sentence.
struct NmeaSentence {
  SentenceType type = SentenceType::kUnrecognized;
  std::string talker;      // "GP", "GN", "GL", ... ("P" for proprietary)
  std::string formatter;   // "GGA", "RMC", ...

  GpsFix fix;

  /// Receiver's own verdict: GGA quality != 0, RMC status 'A'.
  /// A void RMC decodes normally with this set to false.
  bool fix_valid = false;
};

/// XOR of every byte between '$' and '*'.
uint8_t nmea_checksum(std::string_view payload);

/// Decode a single line ("$GPGGA,...*hh", CR/LF optional).
/// Throws ChecksumError when the *hh trailer does not match, and
/// MalformedSentenceError for anything that cannot be decoded.
NmeaSentence decode_nmea(std::string_view line);

/// Convert an NMEA "ddmm.mmmm" / "dddmm.mmmm" field with its hemisphere
/// letter to signed decimal degrees. An empty field is absent, an
/// out-of-range one is invalid. Throws MalformedSentenceError on bad syntax.
Measured<double> parse_coordinate(std::string_view field,
                                  std::string_view hemisphere,
                                  bool is_latitude);

}  // namespace bathycat::gnss
