#pragma once

#include "base/math.hpp"

#include <iomanip>
#include <limits>
#include <sstream>
#include <string>

namespace m2
{
template <typename T>
class Point
{
public:
  using value_type = T;

  T x, y;

  Point() : x(T()), y(T()) {}

  Point(T x_, T y_) : x(x_), y(y_) {}

  Point<T> operator-(Point<T> const & pt) const { return Point<T>(x - pt.x, y - pt.y); }

  Point<T> operator+(Point<T> const & pt) const { return Point<T>(x + pt.x, y + pt.y); }

  Point<T> operator*(T scale) const { return Point<T>(x * scale, y * scale); }

  bool operator==(Point<T> const & p) const { return x == p.x && y == p.y; }
  bool operator!=(Point<T> const & p) const { return !(*this == p); }
};

using PointD = Point<double>;

template <typename T>
std::string DebugPrint(m2::Point<T> const & p)
{
  std::ostringstream out;
  out << std::setprecision(std::numeric_limits<T>::max_digits10) << "(" << p.x << ", " << p.y
      << ")";
  return out.str();
}

template <typename T>
bool AlmostEqualAbs(m2::Point<T> const & a, m2::Point<T> const & b, T eps)
{
  return base::AlmostEqualAbs(a.x, b.x, eps) && base::AlmostEqualAbs(a.y, b.y, eps);
}
}  // namespace m2
