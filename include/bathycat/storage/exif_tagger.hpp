#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "bathycat/storage/sidecar.hpp"

namespace bathycat::storage {

/// Copy of `jpeg` carrying the capture time and, when the record is
/// positioned, the GPS tags. Existing EXIF is kept; our tags overwrite.
/// Throws MetadataError when the buffer is not a JPEG that can be rewritten.
std::vector<uint8_t> embed_exif(const std::vector<uint8_t>& jpeg, const GeotaggedRecord& record);

/// Degrees, minutes and seconds of |deg| as EXIF rationals,
/// e.g. "51/1 30/1 1500/1000".
std::string exif_dms(double deg);

}  // namespace bathycat::storage
