#include "geohash/decoded_cell.hpp"

#include "geohash/geohash_exceptions.hpp"

#include "base/assert.hpp"

#include <iomanip>
#include <limits>
#include <sstream>

namespace geohash
{
namespace
{
void PrintCoordinates(std::ostream & out, double lon, double lat)
{
  out << lon << " " << lat;
}
}  // namespace

std::string ToString(GeoType type)
{
  switch (type)
  {
  case GeoType::Point: return "point";
  case GeoType::PointErr: return "pointerr";
  case GeoType::Polygon: return "polygon";
  }
  UNREACHABLE();
}

std::string DebugPrint(GeoType type) { return ToString(type); }

boost::optional<GeoType> ParseGeoType(std::string const & name)
{
  for (auto const type : {GeoType::Point, GeoType::PointErr, GeoType::Polygon})
  {
    if (name == ToString(type))
      return type;
  }
  return {};
}

GeoType GeoTypeFromString(std::string const & name)
{
  auto const type = ParseGeoType(name);
  if (!type)
  {
    MYTHROW(InvalidGeotypeException,
            ("Unknown geotype", name, ". Use point, pointerr or polygon."));
  }
  return *type;
}

std::string DebugPrint(PointWithError const & p)
{
  std::ostringstream out;
  out << std::setprecision(std::numeric_limits<double>::max_digits10) << "PointWithError [ "
      << p.m_lon << ", " << p.m_lat << " +- " << p.m_lonErr << ", " << p.m_latErr << " ]";
  return out.str();
}

DecodedCell::DecodedCell(Interval const & lon, Interval const & lat, size_t precision)
  : m_lon(lon.Mid())
  , m_lat(lat.Mid())
  , m_lonErr(lon.Error())
  , m_latErr(lat.Error())
  , m_precision(precision)
{
  ASSERT_GREATER_OR_EQUAL(m_lonErr, 0.0, (lon));
  ASSERT_GREATER_OR_EQUAL(m_latErr, 0.0, (lat));
}

m2::RectD DecodedCell::GetRect() const
{
  return m2::RectD(m_lon - m_lonErr, m_lat - m_latErr, m_lon + m_lonErr, m_lat + m_latErr);
}

DecodedCell::Polygon DecodedCell::GetPolygon() const
{
  auto const rect = GetRect();
  return {{rect.LeftBottom(), rect.RightBottom(), rect.LeftTop(), rect.RightTop()}};
}

DecodedCell::Ring DecodedCell::GetRing() const
{
  auto const rect = GetRect();
  return {{rect.LeftBottom(), rect.RightBottom(), rect.RightTop(), rect.LeftTop(),
           rect.LeftBottom()}};
}

std::string ToString(DecodedCell const & cell, GeoType type)
{
  std::ostringstream out;
  out << std::setprecision(std::numeric_limits<double>::max_digits10);
  switch (type)
  {
  case GeoType::Point:
    PrintCoordinates(out, cell.GetLon(), cell.GetLat());
    break;
  case GeoType::PointErr:
    PrintCoordinates(out, cell.GetLon(), cell.GetLat());
    out << " ";
    PrintCoordinates(out, cell.GetLonErr(), cell.GetLatErr());
    break;
  case GeoType::Polygon:
  {
    auto const * delimiter = "";
    for (auto const & corner : cell.GetPolygon())
    {
      out << delimiter;
      PrintCoordinates(out, corner.x, corner.y);
      delimiter = "\n";
    }
    break;
  }
  }
  return out.str();
}

std::string DebugPrint(DecodedCell const & cell)
{
  std::ostringstream out;
  out << "DecodedCell [ precision: " << cell.GetPrecision() << ", "
      << DebugPrint(cell.GetPointWithError()) << " ]";
  return out.str();
}
}  // namespace geohash
