#pragma once

#include "base/assert.hpp"

#include <cmath>

namespace base
{
// Returns true if x and y are equal up to the absolute difference eps.
// Does not produce a sensible result if any of the arguments is NaN or infinity.
template <typename Float>
bool AlmostEqualAbs(Float x, Float y, Float eps)
{
  ASSERT_GREATER_OR_EQUAL(eps, 0.0, ());
  return std::fabs(x - y) < eps;
}

template <typename T>
T Clamp(T const x, T const xmin, T const xmax)
{
  if (x > xmax)
    return xmax;
  if (x < xmin)
    return xmin;
  return x;
}

template <typename T>
bool Between(T const a, T const b, T const x)
{
  return a <= x && x <= b;
}
}  // namespace base
