#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace geohash
{
// One element per bit, each element is 0 or 1. The first element is the most significant bit.
using Bits = std::vector<uint8_t>;

bool IsValidSymbol(char symbol);
bool IsValidGeohash(std::string const & geohash);

/// @return Value in [0, 32) of a symbol.
/// @throws InvalidCharacterException carrying |position| if |symbol| is not in the alphabet.
uint8_t SymbolToValue(char symbol, size_t position);

/// Maps five bits starting at |offset| to a symbol.
/// @throws InvalidLengthException if less than five bits remain.
char BitsToSymbol(Bits const & bits, size_t offset = 0);

/// @throws InvalidLengthException if bits.size() is not a multiple of five.
std::string BitsToGeohash(Bits const & bits);

/// @throws InvalidCharacterException with the first foreign symbol and its position.
Bits GeohashToBits(std::string const & geohash);

// Longitude bits go to even positions, latitude bits to odd ones.
// |lonBits| may be one bit longer than |latBits|, never shorter.
Bits Interleave(Bits const & lonBits, Bits const & latBits);
void Deinterleave(Bits const & bits, Bits & lonBits, Bits & latBits);

// Number of longitude and latitude bits in a geohash of |precision| symbols.
size_t LonBitsCount(size_t precision);
size_t LatBitsCount(size_t precision);
}  // namespace geohash
