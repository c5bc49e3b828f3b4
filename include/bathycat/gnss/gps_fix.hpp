#pragma once

#include <chrono>
#include <cstdint>

#include "bathycat/common/measured.hpp"
#include "bathycat/common/time.hpp"

namespace bathycat::gnss {

enum class FixQuality : uint8_t {
  kNone = 0,
  kGps  = 1,
  kDgps = 2,   // any differential / corrected solution
};

/// Map a GGA quality indicator to FixQuality.
/// 1 = GPS; 2 (DGPS), 3 (PPS), 4 (RTK), 5 (float RTK) = DGPS;
/// 0, 6 (estimated), 7 (manual), 8 (simulation) and unknown codes = none.
FixQuality fix_quality_from_gga(int code);

const char* to_string(FixQuality q);

/// Fields decoded from one NMEA sentence. Each field is valid, invalid or
/// absent on its own; nothing is ever zero-filled.
struct GpsFix {
  Measured<double> latitude_deg;
  Measured<double> longitude_deg;
  Measured<double> altitude_m;            // GGA only, above MSL

  Measured<std::chrono::microseconds> utc_time_of_day;
  Measured<CivilDate> utc_date;           // RMC only

  FixQuality fix_quality = FixQuality::kNone;
  Measured<int> satellites_used;          // GGA only
  Measured<double> horizontal_dilution;   // GGA only

  bool has_position() const {
    return latitude_deg.is_valid() && longitude_deg.is_valid();
  }
};

}  // namespace bathycat::gnss
