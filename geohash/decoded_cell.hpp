#pragma once

#include "geohash/interval.hpp"

#include "geometry/point2d.hpp"
#include "geometry/rect2d.hpp"

#include <array>
#include <cstddef>
#include <string>

#include <boost/optional.hpp>

namespace geohash
{
// Views of a decoded geohash a caller may ask for by name.
enum class GeoType
{
  Point,
  PointErr,
  Polygon
};

std::string ToString(GeoType type);
std::string DebugPrint(GeoType type);

// Accepts "point", "pointerr" and "polygon".
boost::optional<GeoType> ParseGeoType(std::string const & name);

/// @throws InvalidGeotypeException for any other name.
GeoType GeoTypeFromString(std::string const & name);

struct PointWithError
{
  double m_lon = 0.0;
  double m_lat = 0.0;
  double m_lonErr = 0.0;
  double m_latErr = 0.0;
};

std::string DebugPrint(PointWithError const & p);

// The cell of a decoded geohash: its center and the half-sizes along both axes.
// Every view is longitude first.
class DecodedCell
{
public:
  using Polygon = std::array<m2::PointD, 4>;
  using Ring = std::array<m2::PointD, 5>;

  DecodedCell() = default;
  DecodedCell(Interval const & lon, Interval const & lat, size_t precision);

  double GetLon() const { return m_lon; }
  double GetLat() const { return m_lat; }
  double GetLonErr() const { return m_lonErr; }
  double GetLatErr() const { return m_latErr; }
  size_t GetPrecision() const { return m_precision; }

  double GetWidth() const { return 2 * m_lonErr; }
  double GetHeight() const { return 2 * m_latErr; }

  m2::PointD GetPoint() const { return {m_lon, m_lat}; }
  PointWithError GetPointWithError() const { return {m_lon, m_lat, m_lonErr, m_latErr}; }
  m2::RectD GetRect() const;

  // Corners in the order SW, SE, NW, NE. The ring is not closed.
  Polygon GetPolygon() const;

  // Counter-clockwise closed ring SW, SE, NE, NW, SW, as GeoJSON polygons expect.
  Ring GetRing() const;

  bool Contains(m2::PointD const & p) const { return GetRect().IsPointInside(p); }

private:
  double m_lon = 0.0;
  double m_lat = 0.0;
  double m_lonErr = 0.0;
  double m_latErr = 0.0;
  size_t m_precision = 0;
};

// Text form of the |type| view: "lon lat", "lon lat lonErr latErr" or four "lon lat" lines.
std::string ToString(DecodedCell const & cell, GeoType type);

std::string DebugPrint(DecodedCell const & cell);
}  // namespace geohash
