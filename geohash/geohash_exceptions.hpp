#pragma once

#include "base/exception.hpp"

#include <cstddef>
#include <string>

namespace geohash
{
DECLARE_EXCEPTION(GeohashException, RootException);

DECLARE_EXCEPTION(InvalidGeotypeException, GeohashException);
DECLARE_EXCEPTION(InvalidPrecisionException, GeohashException);
DECLARE_EXCEPTION(InvalidLengthException, GeohashException);
DECLARE_EXCEPTION(InvalidCoordinateException, GeohashException);

class InvalidCharacterException : public GeohashException
{
public:
  InvalidCharacterException(char symbol, size_t position, char const * what,
                            std::string const & msg)
    : GeohashException(what, msg), m_symbol(symbol), m_position(position)
  {
  }

  char Symbol() const { return m_symbol; }
  size_t Position() const { return m_position; }

private:
  char m_symbol;
  size_t m_position;
};
}  // namespace geohash

#define MYTHROW_INVALID_CHARACTER(symbol, position, msg)                               \
  throw ::geohash::InvalidCharacterException(                                          \
      symbol, position, EXCEPTION_WHAT(InvalidCharacterException), ::base::Message msg)
