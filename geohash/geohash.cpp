#include "geohash/geohash.hpp"

#include "geohash/alphabet.hpp"
#include "geohash/geohash_exceptions.hpp"
#include "geohash/interval.hpp"

#include "base/assert.hpp"
#include "base/logging.hpp"
#include "base/macros.hpp"
#include "base/math.hpp"

#include <cmath>

namespace geohash
{
namespace
{
Interval const kLonInterval(kLonMin, kLonMax);
Interval const kLatInterval(kLatMin, kLatMax);

void CheckPrecision(size_t precision)
{
  if (precision == 0)
    MYTHROW(InvalidPrecisionException, ("Precision must be at least 1"));
  if (precision > kMaxPrecision)
    MYTHROW(InvalidPrecisionException, ("Precision", precision, "is above", kMaxPrecision));

  CLOG(LDEBUG, precision <= kMaxMeaningfulPrecision,
       ("Precision", precision, "is beyond double resolution, extra symbols carry no data"));
}

void CheckCoordinates(double lon, double lat)
{
  if (!std::isfinite(lon) || !base::Between(kLonMin, kLonMax, lon))
    MYTHROW(InvalidCoordinateException, ("Longitude", lon, "is out of [-180, 180]"));
  if (!std::isfinite(lat) || !base::Between(kLatMin, kLatMax, lat))
    MYTHROW(InvalidCoordinateException, ("Latitude", lat, "is out of [-90, 90]"));
}
}  // namespace

std::string Encode(double lon, double lat, size_t precision)
{
  CheckPrecision(precision);
  CheckCoordinates(lon, lat);

  Bits const bits = Interleave(Locate(kLonInterval, lon, LonBitsCount(precision)),
                               Locate(kLatInterval, lat, LatBitsCount(precision)));
  ASSERT_EQUAL(bits.size(), precision * kBitsPerSymbol, ());

  return BitsToGeohash(bits);
}

DecodedCell Decode(std::string const & geohash)
{
  CheckPrecision(geohash.size());

  Bits lonBits;
  Bits latBits;
  Deinterleave(GeohashToBits(geohash), lonBits, latBits);
  ASSERT_EQUAL(lonBits.size(), LonBitsCount(geohash.size()), (geohash));
  ASSERT_EQUAL(latBits.size(), LatBitsCount(geohash.size()), (geohash));

  return DecodedCell(Refine(kLonInterval, lonBits), Refine(kLatInterval, latBits),
                     geohash.size());
}

std::vector<std::string> Neighbors(std::string const & geohash)
{
  DecodedCell const cell = Decode(geohash);
  double const width = cell.GetWidth();
  double const height = cell.GetHeight();

  std::vector<std::string> result;
  result.reserve(kNeighborsCount);
  for (int const lonDelta : {-1, 0, 1})
  {
    double const lon = WrapLongitude(cell.GetLon() + lonDelta * width);
    for (int const latDelta : {1, 0, -1})
    {
      double const lat = base::Clamp(cell.GetLat() + latDelta * height, kLatMin, kLatMax);
      result.push_back(Encode(lon, lat, geohash.size()));
    }
  }

  CHECK_EQUAL(result.size(), kNeighborsCount, (geohash));
  return result;
}

std::string Parent(std::string const & geohash)
{
  if (geohash.size() < 2)
    MYTHROW(InvalidPrecisionException, ("Geohash", geohash, "has no parent"));

  // Validates the symbols.
  UNUSED_VALUE(GeohashToBits(geohash));
  return geohash.substr(0, geohash.size() - 1);
}

std::vector<std::string> Children(std::string const & geohash)
{
  if (!geohash.empty())
    UNUSED_VALUE(GeohashToBits(geohash));

  std::vector<std::string> result;
  result.reserve(kAlphabetSize);
  for (size_t i = 0; i < kAlphabetSize; ++i)
    result.push_back(geohash + kAlphabet[i]);
  return result;
}

double WrapLongitude(double lon)
{
  if (lon >= kLonMin && lon < kLonMax)
    return lon;

  double wrapped = std::fmod(lon - kLonMin, kLonSpan);
  if (wrapped < 0)
    wrapped += kLonSpan;
  wrapped += kLonMin;
  // fmod() of a tiny negative value plus the span may round up to the span itself.
  return wrapped >= kLonMax ? kLonMin : wrapped;
}
}  // namespace geohash
