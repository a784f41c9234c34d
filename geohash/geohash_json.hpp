#pragma once

#include "geohash/decoded_cell.hpp"
#include "geohash/geohash_defines.hpp"

#include <cstddef>
#include <string>

namespace geohash
{
// Serializes |cell| as a GeoJSON Feature:
// {"type": "Feature",
//  "geometry": {"type": "Polygon", "coordinates": [[SW, SE, NE, NW, SW]]},
//  "properties": {"geohash": ..., "center": [lon, lat], "error": [lonErr, latErr]}}
// Coordinates are written with |digits| digits after the decimal point.
std::string ToGeoJson(std::string const & geohash, DecodedCell const & cell,
                      size_t digits = kGeoJsonDigits);

// Decodes |geohash| and serializes the result.
std::string ToGeoJson(std::string const & geohash, size_t digits = kGeoJsonDigits);
}  // namespace geohash
