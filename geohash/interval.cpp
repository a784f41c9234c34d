#include "geohash/interval.hpp"

#include <numeric>
#include <sstream>

namespace geohash
{
Interval Refine(Interval const & initial, Bits const & bits)
{
  return std::accumulate(bits.begin(), bits.end(), initial,
                         [](Interval const & interval, uint8_t bit) {
                           return interval.Bisect(bit);
                         });
}

Bits Locate(Interval const & initial, double value, size_t count)
{
  Bits bits;
  bits.reserve(count);
  Interval interval = initial;
  for (size_t i = 0; i < count; ++i)
  {
    uint8_t const bit = value >= interval.Mid() ? 1 : 0;
    bits.push_back(bit);
    interval = interval.Bisect(bit);
  }
  return bits;
}

std::string DebugPrint(Interval const & interval)
{
  std::ostringstream out;
  out.precision(17);
  out << "[" << interval.m_min << ", " << interval.m_max << "]";
  return out.str();
}
}  // namespace geohash
