#pragma once

#include "geohash/alphabet.hpp"

#include <string>

namespace geohash
{
struct Interval
{
  Interval() = default;
  Interval(double min, double max) : m_min(min), m_max(max) {}

  double Mid() const { return (m_min + m_max) / 2; }
  // Half of the width: the distance from Mid() to either end.
  double Error() const { return (m_max - m_min) / 2; }

  // A set bit keeps the upper half, a clear one keeps the lower half.
  Interval Bisect(uint8_t bit) const
  {
    double const mid = Mid();
    return bit ? Interval(mid, m_max) : Interval(m_min, mid);
  }

  bool operator==(Interval const & rhs) const { return m_min == rhs.m_min && m_max == rhs.m_max; }

  double m_min = 0.0;
  double m_max = 0.0;
};

// Applies Bisect() for each bit in order.
Interval Refine(Interval const & initial, Bits const & bits);

// Inverse of Refine(): the |count| bits that select the half containing |value| at each step.
// Values at the midpoint go to the upper half.
Bits Locate(Interval const & initial, double value, size_t count);

std::string DebugPrint(Interval const & interval);
}  // namespace geohash
