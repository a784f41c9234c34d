#pragma once

#include "geohash/decoded_cell.hpp"
#include "geohash/geohash_defines.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace geohash
{
size_t constexpr kNeighborsCount = 9;

/// Encodes a point into a geohash of |precision| symbols.
/// @throws InvalidPrecisionException if |precision| is zero or above kMaxPrecision.
/// @throws InvalidCoordinateException if |lon| is outside [-180, 180] or |lat| is outside
/// [-90, 90].
std::string Encode(double lon, double lat, size_t precision = kDefaultPrecision);

/// @throws InvalidPrecisionException for an empty geohash or one longer than kMaxPrecision.
/// @throws InvalidCharacterException for the first symbol outside the alphabet.
DecodedCell Decode(std::string const & geohash);

/// Returns the 3x3 block of cells around |geohash|, the cell itself included, all of the same
/// precision. Columns go west to east and cells inside a column north to south:
///   0 3 6
///   1 4 7
///   2 5 8
/// Longitude wraps around the antimeridian. Latitude is clamped, so beyond a pole a neighbor
/// repeats the boundary cell.
std::vector<std::string> Neighbors(std::string const & geohash);

/// @return |geohash| without its last symbol.
/// @throws InvalidPrecisionException if |geohash| has less than two symbols.
std::string Parent(std::string const & geohash);

/// @return The 32 cells one symbol longer than |geohash| in alphabet order.
/// The children of an empty geohash are the 32 top level cells.
std::vector<std::string> Children(std::string const & geohash);

// Maps |lon| into [-180, 180). Values already in range are returned as is.
double WrapLongitude(double lon);
}  // namespace geohash
