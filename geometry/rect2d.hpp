#pragma once

#include "geometry/point2d.hpp"

#include "base/assert.hpp"

#include <algorithm>
#include <sstream>
#include <string>

namespace m2
{
// Axis aligned rectangle. For geographic rects x is longitude and y is latitude.
template <typename T>
class Rect
{
public:
  using value_type = T;

  Rect() = default;

  Rect(T minX, T minY, T maxX, T maxY) : m_minX(minX), m_minY(minY), m_maxX(maxX), m_maxY(maxY)
  {
    ASSERT(minX <= maxX, (minX, maxX));
    ASSERT(minY <= maxY, (minY, maxY));
  }

  Rect(Point<T> const & p1, Point<T> const & p2)
    : m_minX(std::min(p1.x, p2.x))
    , m_minY(std::min(p1.y, p2.y))
    , m_maxX(std::max(p1.x, p2.x))
    , m_maxY(std::max(p1.y, p2.y))
  {
  }

  T minX() const { return m_minX; }
  T minY() const { return m_minY; }
  T maxX() const { return m_maxX; }
  T maxY() const { return m_maxY; }

  Point<T> LeftBottom() const { return Point<T>(m_minX, m_minY); }
  Point<T> RightBottom() const { return Point<T>(m_maxX, m_minY); }
  Point<T> RightTop() const { return Point<T>(m_maxX, m_maxY); }
  Point<T> LeftTop() const { return Point<T>(m_minX, m_maxY); }

  Point<T> Center() const { return Point<T>((m_minX + m_maxX) / 2, (m_minY + m_maxY) / 2); }

  T SizeX() const { return m_maxX - m_minX; }
  T SizeY() const { return m_maxY - m_minY; }

  bool IsPointInside(Point<T> const & pt) const
  {
    return !(pt.x < m_minX || pt.x > m_maxX || pt.y < m_minY || pt.y > m_maxY);
  }

  bool IsRectInside(Rect<T> const & rect) const
  {
    return (m_minX <= rect.m_minX && m_maxX >= rect.m_maxX && m_minY <= rect.m_minY &&
            m_maxY >= rect.m_maxY);
  }

  bool operator==(Rect<T> const & r) const
  {
    return m_minX == r.m_minX && m_minY == r.m_minY && m_maxX == r.m_maxX && m_maxY == r.m_maxY;
  }

private:
  T m_minX = T();
  T m_minY = T();
  T m_maxX = T();
  T m_maxY = T();
};

using RectD = Rect<double>;

template <typename T>
std::string DebugPrint(m2::Rect<T> const & r)
{
  std::ostringstream out;
  out << std::setprecision(std::numeric_limits<T>::max_digits10) << "m2::Rect(" << r.minX()
      << ", " << r.minY() << ", " << r.maxX() << ", " << r.maxY() << ")";
  return out.str();
}
}  // namespace m2
