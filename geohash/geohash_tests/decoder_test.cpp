#include "testing/testing.hpp"

#include "geohash/alphabet.hpp"
#include "geohash/decoded_cell.hpp"
#include "geohash/geohash.hpp"
#include "geohash/geohash_exceptions.hpp"
#include "geohash/interval.hpp"

#include <string>

using namespace geohash;
using namespace std;

namespace
{
// Half-size of a cell along an axis after |bits| bisections of [-range, range].
double HalfSize(double range, size_t bits) { return range / static_cast<double>(1ULL << bits); }
}  // namespace

UNIT_TEST(Interval_Refine)
{
  Interval const lon(-180.0, 180.0);

  TEST_EQUAL(Refine(lon, {}), lon, ());
  TEST_EQUAL(Refine(lon, {1}), Interval(0.0, 180.0), ());
  TEST_EQUAL(Refine(lon, {1, 0}), Interval(0.0, 90.0), ());
  TEST_EQUAL(Refine(lon, {0, 0, 1}), Interval(-135.0, -90.0), ());

  Interval const refined = Refine(Interval(-90.0, 90.0), {1, 1, 0, 1});
  TEST_EQUAL(refined.Mid(), 61.875, ());
  TEST_EQUAL(refined.Error(), 5.625, ());
}

UNIT_TEST(Interval_Locate)
{
  Interval const lat(-90.0, 90.0);

  TEST_EQUAL(Locate(lat, 0.0, 3), Bits({1, 0, 0}), ());
  TEST_EQUAL(Locate(lat, -90.0, 3), Bits({0, 0, 0}), ());
  TEST_EQUAL(Locate(lat, 90.0, 3), Bits({1, 1, 1}), ());
  TEST(Locate(lat, 10.0, 0).empty(), ());

  Bits const bits = Locate(lat, 47.6205, 30);
  Interval const cell = Refine(lat, bits);
  TEST_LESS_OR_EQUAL(cell.m_min, 47.6205, ());
  TEST_LESS(47.6205, cell.m_max, ());
}

UNIT_TEST(Decode_KnownPlace)
{
  DecodedCell const cell = Decode("c22yzv5cw8te");

  TEST_NEAR(cell.GetLon(), -122.3493, 1e-7, ());
  TEST_NEAR(cell.GetLat(), 47.6205, 1e-7, ());
  TEST_EQUAL(cell.GetLonErr(), HalfSize(180.0, 30), ());
  TEST_EQUAL(cell.GetLatErr(), HalfSize(90.0, 30), ());
  TEST_LESS(cell.GetLonErr(), 1e-6, ());
  TEST_LESS(cell.GetLatErr(), 1e-6, ());
  TEST_EQUAL(cell.GetPrecision(), 12, ());

  m2::PointD const point = cell.GetPoint();
  TEST_EQUAL(point.x, cell.GetLon(), ());
  TEST_EQUAL(point.y, cell.GetLat(), ());
}

UNIT_TEST(Decode_PointWithErrorIsLongitudeFirst)
{
  DecodedCell const cell = Decode("ezs42");
  PointWithError const p = cell.GetPointWithError();

  TEST_EQUAL(p.m_lon, -5.60302734375, ());
  TEST_EQUAL(p.m_lat, 42.60498046875, ());
  TEST_EQUAL(p.m_lonErr, 0.02197265625, ());
  TEST_EQUAL(p.m_latErr, 0.02197265625, ());

  TEST_EQUAL(ToString(cell, GeoType::Point), "-5.60302734375 42.60498046875", ());
  TEST_EQUAL(ToString(cell, GeoType::PointErr),
             "-5.60302734375 42.60498046875 0.02197265625 0.02197265625", ());
}

UNIT_TEST(Decode_SingleSymbol)
{
  DecodedCell const s = Decode("s");
  TEST_EQUAL(s.GetPoint(), m2::PointD(22.5, 22.5), ());
  TEST_EQUAL(s.GetLonErr(), 22.5, ());
  TEST_EQUAL(s.GetLatErr(), 22.5, ());
  TEST_EQUAL(s.GetWidth(), 45.0, ());
  TEST_EQUAL(s.GetHeight(), 45.0, ());

  DecodedCell const seven = Decode("7");
  TEST_EQUAL(seven.GetPoint(), m2::PointD(-22.5, -22.5), ());

  DecodedCell const zero = Decode("0");
  TEST_EQUAL(zero.GetRect(), m2::RectD(-180.0, -90.0, -135.0, -45.0), ());
}

UNIT_TEST(Decode_Polygon)
{
  DecodedCell const cell = Decode("s");

  DecodedCell::Polygon const polygon = cell.GetPolygon();
  TEST_EQUAL(polygon[0], m2::PointD(0.0, 0.0), ("SW"));
  TEST_EQUAL(polygon[1], m2::PointD(45.0, 0.0), ("SE"));
  TEST_EQUAL(polygon[2], m2::PointD(0.0, 45.0), ("NW"));
  TEST_EQUAL(polygon[3], m2::PointD(45.0, 45.0), ("NE"));
  TEST_EQUAL(ToString(cell, GeoType::Polygon), "0 0\n45 0\n0 45\n45 45", ());

  DecodedCell::Ring const ring = cell.GetRing();
  TEST_EQUAL(ring[0], m2::PointD(0.0, 0.0), ());
  TEST_EQUAL(ring[1], m2::PointD(45.0, 0.0), ());
  TEST_EQUAL(ring[2], m2::PointD(45.0, 45.0), ());
  TEST_EQUAL(ring[3], m2::PointD(0.0, 45.0), ());
  TEST_EQUAL(ring[4], ring[0], ());
}

UNIT_TEST(Decode_ErrorsHalveWithPrecision)
{
  string const geohash = "c22yzv5cw8te";
  for (size_t precision = 1; precision < geohash.size(); ++precision)
  {
    DecodedCell const coarse = Decode(geohash.substr(0, precision));
    DecodedCell const fine = Decode(geohash.substr(0, precision + 1));

    TEST_LESS(fine.GetLonErr(), coarse.GetLonErr(), (precision));
    TEST_LESS(fine.GetLatErr(), coarse.GetLatErr(), (precision));

    size_t const lonSteps = LonBitsCount(precision + 1) - LonBitsCount(precision);
    size_t const latSteps = LatBitsCount(precision + 1) - LatBitsCount(precision);
    TEST_EQUAL(fine.GetLonErr(), coarse.GetLonErr() / (1 << lonSteps), (precision));
    TEST_EQUAL(fine.GetLatErr(), coarse.GetLatErr() / (1 << latSteps), (precision));

    TEST(coarse.GetRect().IsRectInside(fine.GetRect()), (precision));
    TEST_EQUAL(coarse.GetLonErr(), HalfSize(180.0, LonBitsCount(precision)), (precision));
    TEST_EQUAL(coarse.GetLatErr(), HalfSize(90.0, LatBitsCount(precision)), (precision));
  }
}

UNIT_TEST(Decode_InvalidInput)
{
  TEST_THROW(Decode(""), InvalidPrecisionException, ());
  TEST_THROW(Decode("c22yav"), InvalidCharacterException, ());
  TEST_THROW(Decode("C22YZV"), InvalidCharacterException, ());
  TEST_THROW(Decode("c22 yzv"), GeohashException, ());
  TEST_THROW(Decode(string(kMaxPrecision + 1, 'z')), InvalidPrecisionException, ());
  TEST_EQUAL(Decode(string(kMaxPrecision, 'z')).GetPrecision(), kMaxPrecision, ());

  try
  {
    Decode("u4pruydqqvi");
    TEST(false, ("Exception was not thrown"));
  }
  catch (InvalidCharacterException const & e)
  {
    TEST_EQUAL(e.Symbol(), 'i', ());
    TEST_EQUAL(e.Position(), 10, ());
  }
}

UNIT_TEST(GeoType_Names)
{
  TEST_EQUAL(GeoTypeFromString("point"), GeoType::Point, ());
  TEST_EQUAL(GeoTypeFromString("pointerr"), GeoType::PointErr, ());
  TEST_EQUAL(GeoTypeFromString("polygon"), GeoType::Polygon, ());

  for (auto const type : {GeoType::Point, GeoType::PointErr, GeoType::Polygon})
    TEST_EQUAL(GeoTypeFromString(ToString(type)), type, ());

  TEST(!ParseGeoType("bbox"), ());
  TEST(!ParseGeoType("Point"), ());
  TEST(!ParseGeoType(""), ());
  TEST_THROW(GeoTypeFromString("pointround"), InvalidGeotypeException, ());
}
