#pragma once

#include <cstddef>

namespace geohash
{
double constexpr kLonMin = -180.0;
double constexpr kLonMax = 180.0;
double constexpr kLatMin = -90.0;
double constexpr kLatMax = 90.0;
double constexpr kLonSpan = kLonMax - kLonMin;

size_t constexpr kBitsPerSymbol = 5;
size_t constexpr kAlphabetSize = 32;

// 12 symbols give a cell of about 3.7 cm x 1.9 cm.
size_t constexpr kDefaultPrecision = 12;

// 20 symbols put 50 bits on each axis. Past that the cell size approaches the spacing of
// doubles near the ends of the ranges: extra symbols stop shrinking the cell and a decoded
// center no longer encodes back to the same geohash.
size_t constexpr kMaxMeaningfulPrecision = 20;

// Longer geohashes are rejected.
size_t constexpr kMaxPrecision = 64;

// Fractional digits of coordinates in GeoJSON output.
size_t constexpr kGeoJsonDigits = 9;

char constexpr kAlphabet[] = "0123456789bcdefghjkmnpqrstuvwxyz";
}  // namespace geohash
