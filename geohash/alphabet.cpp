#include "geohash/alphabet.hpp"

#include "geohash/geohash_defines.hpp"
#include "geohash/geohash_exceptions.hpp"

#include "base/assert.hpp"

#include <array>

namespace geohash
{
namespace
{
uint8_t constexpr kInvalidValue = 0xFF;

std::array<uint8_t, 256> const & GetDecodeTable()
{
  static auto const kTable = [] {
    std::array<uint8_t, 256> table;
    table.fill(kInvalidValue);
    for (size_t i = 0; i < kAlphabetSize; ++i)
      table[static_cast<uint8_t>(kAlphabet[i])] = static_cast<uint8_t>(i);
    return table;
  }();
  return kTable;
}

uint8_t LookupValue(char symbol) { return GetDecodeTable()[static_cast<uint8_t>(symbol)]; }
}  // namespace

bool IsValidSymbol(char symbol) { return LookupValue(symbol) != kInvalidValue; }

bool IsValidGeohash(std::string const & geohash)
{
  if (geohash.empty())
    return false;

  for (char const c : geohash)
  {
    if (!IsValidSymbol(c))
      return false;
  }
  return true;
}

uint8_t SymbolToValue(char symbol, size_t position)
{
  uint8_t const value = LookupValue(symbol);
  if (value == kInvalidValue)
    MYTHROW_INVALID_CHARACTER(symbol, position, ("Invalid geohash symbol", symbol, "at", position));
  return value;
}

char BitsToSymbol(Bits const & bits, size_t offset)
{
  if (offset > bits.size() || bits.size() - offset < kBitsPerSymbol)
  {
    MYTHROW(InvalidLengthException,
            ("Need", kBitsPerSymbol, "bits at offset", offset, "but have", bits.size()));
  }

  uint8_t value = 0;
  for (size_t i = offset; i < offset + kBitsPerSymbol; ++i)
  {
    ASSERT_LESS(bits[i], 2, (i));
    value = static_cast<uint8_t>((value << 1) | bits[i]);
  }
  return kAlphabet[value];
}

std::string BitsToGeohash(Bits const & bits)
{
  if (bits.size() % kBitsPerSymbol != 0)
  {
    MYTHROW(InvalidLengthException,
            ("Bit count", bits.size(), "is not a multiple of", kBitsPerSymbol));
  }

  std::string geohash;
  geohash.reserve(bits.size() / kBitsPerSymbol);
  for (size_t offset = 0; offset < bits.size(); offset += kBitsPerSymbol)
    geohash.push_back(BitsToSymbol(bits, offset));
  return geohash;
}

Bits GeohashToBits(std::string const & geohash)
{
  Bits bits;
  bits.reserve(geohash.size() * kBitsPerSymbol);
  for (size_t i = 0; i < geohash.size(); ++i)
  {
    char const c = geohash[i];
    if (!IsValidSymbol(c))
    {
      MYTHROW_INVALID_CHARACTER(c, i, ("Invalid symbol", c, "at position", i, "of", geohash,
                                       ". Use 0-9, b-h, j, k, m, n, p-z."));
    }

    uint8_t const value = SymbolToValue(c, i);
    for (size_t shift = kBitsPerSymbol; shift > 0; --shift)
      bits.push_back((value >> (shift - 1)) & 0x1);
  }
  return bits;
}

Bits Interleave(Bits const & lonBits, Bits const & latBits)
{
  if (lonBits.size() != latBits.size() && lonBits.size() != latBits.size() + 1)
  {
    MYTHROW(InvalidLengthException, ("Cannot interleave", lonBits.size(), "longitude bits with",
                                     latBits.size(), "latitude bits"));
  }

  Bits bits;
  bits.reserve(lonBits.size() + latBits.size());
  for (size_t i = 0; i < latBits.size(); ++i)
  {
    bits.push_back(lonBits[i]);
    bits.push_back(latBits[i]);
  }
  if (lonBits.size() > latBits.size())
    bits.push_back(lonBits.back());
  return bits;
}

void Deinterleave(Bits const & bits, Bits & lonBits, Bits & latBits)
{
  lonBits.clear();
  latBits.clear();
  lonBits.reserve((bits.size() + 1) / 2);
  latBits.reserve(bits.size() / 2);
  for (size_t i = 0; i < bits.size(); ++i)
  {
    if (i % 2 == 0)
      lonBits.push_back(bits[i]);
    else
      latBits.push_back(bits[i]);
  }
}

size_t LonBitsCount(size_t precision) { return (precision * kBitsPerSymbol + 1) / 2; }

size_t LatBitsCount(size_t precision) { return precision * kBitsPerSymbol / 2; }
}  // namespace geohash
