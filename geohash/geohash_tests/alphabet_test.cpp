#include "testing/testing.hpp"

#include "geohash/alphabet.hpp"
#include "geohash/geohash_defines.hpp"
#include "geohash/geohash_exceptions.hpp"

#include <string>

using namespace geohash;

UNIT_TEST(Alphabet_Symbols)
{
  std::string const alphabet = kAlphabet;
  TEST_EQUAL(alphabet.size(), kAlphabetSize, ());

  for (size_t i = 0; i < alphabet.size(); ++i)
  {
    TEST(IsValidSymbol(alphabet[i]), (alphabet[i]));
    TEST_EQUAL(SymbolToValue(alphabet[i], i), i, (alphabet[i]));
  }

  for (char const c : std::string("ailoABCZ-_ /"))
  {
    TEST(!IsValidSymbol(c), (c));
    TEST_THROW(SymbolToValue(c, 0), InvalidCharacterException, (c));
  }
  TEST(!IsValidSymbol('\0'), ());
  TEST(!IsValidSymbol(static_cast<char>(0xC3)), ());
}

UNIT_TEST(Alphabet_BitsToSymbol)
{
  TEST_EQUAL(BitsToSymbol({0, 0, 0, 0, 0}), '0', ());
  TEST_EQUAL(BitsToSymbol({0, 1, 0, 1, 0}), 'b', ());
  TEST_EQUAL(BitsToSymbol({1, 1, 1, 1, 1}), 'z', ());
  TEST_EQUAL(BitsToSymbol({1, 1, 1, 0, 0, 0, 0}, 2), 'h', ());

  TEST_THROW(BitsToSymbol({1, 0, 1, 0}), InvalidLengthException, ());
  TEST_THROW(BitsToSymbol({1, 0, 1, 0, 1, 1}, 2), InvalidLengthException, ());
  TEST_THROW(BitsToSymbol({1, 0, 1, 0, 1}, 7), InvalidLengthException, ());
}

UNIT_TEST(Alphabet_BitsToGeohash)
{
  TEST_EQUAL(BitsToGeohash({}), "", ());
  TEST_EQUAL(BitsToGeohash({0, 1, 0, 1, 1, 0, 0, 0, 0, 1}), "c1", ());
  TEST_THROW(BitsToGeohash({0, 1, 0, 1, 1, 0}), InvalidLengthException, ());
}

UNIT_TEST(Alphabet_GeohashToBits)
{
  Bits const expected = {0, 1, 0, 1, 1, 1, 1, 1, 1, 1, 0, 0, 0, 0, 0};
  TEST_EQUAL(GeohashToBits("cz0"), expected, ());
  TEST_EQUAL(GeohashToBits("c22yzv5cw8te").size(), 60, ());
  TEST(GeohashToBits("").empty(), ());
}

UNIT_TEST(Alphabet_InvalidCharacterPosition)
{
  try
  {
    GeohashToBits("c22yav");
    TEST(false, ("Exception was not thrown"));
  }
  catch (InvalidCharacterException const & e)
  {
    TEST_EQUAL(e.Symbol(), 'a', ());
    TEST_EQUAL(e.Position(), 4, ());
    TEST(e.Msg().find("c22yav") != std::string::npos, (e.Msg()));
  }

  try
  {
    SymbolToValue('o', 7);
    TEST(false, ("Exception was not thrown"));
  }
  catch (InvalidCharacterException const & e)
  {
    TEST_EQUAL(e.Symbol(), 'o', ());
    TEST_EQUAL(e.Position(), 7, ());
  }

  // Upper case is not a part of the alphabet.
  TEST_THROW(GeohashToBits("C22YZV"), InvalidCharacterException, ());
  TEST(!IsValidGeohash("C22YZV"), ());
  TEST(!IsValidGeohash(""), ());
  TEST(IsValidGeohash("c22yzv"), ());
}

UNIT_TEST(Alphabet_Interleave)
{
  Bits const lon = {1, 1, 1};
  Bits const lat = {0, 0};
  Bits const expected = {1, 0, 1, 0, 1};
  TEST_EQUAL(Interleave(lon, lat), expected, ());
  TEST_EQUAL(Interleave({1, 0}, {0, 1}), Bits({1, 0, 0, 1}), ());
  TEST(Interleave({}, {}).empty(), ());

  TEST_THROW(Interleave({1}, {0, 1}), InvalidLengthException, ());
  TEST_THROW(Interleave({1, 1, 1}, {0}), InvalidLengthException, ());
}

UNIT_TEST(Alphabet_Deinterleave)
{
  Bits lon;
  Bits lat;
  Deinterleave({1, 0, 1, 1, 0}, lon, lat);
  TEST_EQUAL(lon, Bits({1, 1, 0}), ());
  TEST_EQUAL(lat, Bits({0, 1}), ());

  Bits const bits = GeohashToBits("ezs42");
  Deinterleave(bits, lon, lat);
  TEST_EQUAL(lon.size(), 13, ());
  TEST_EQUAL(lat.size(), 12, ());
  TEST_EQUAL(Interleave(lon, lat), bits, ());
}

UNIT_TEST(Alphabet_AxisBitCounts)
{
  TEST_EQUAL(LonBitsCount(1), 3, ());
  TEST_EQUAL(LatBitsCount(1), 2, ());
  TEST_EQUAL(LonBitsCount(2), 5, ());
  TEST_EQUAL(LatBitsCount(2), 5, ());
  TEST_EQUAL(LonBitsCount(12), 30, ());
  TEST_EQUAL(LatBitsCount(12), 30, ());
  for (size_t precision = 1; precision <= 20; ++precision)
    TEST_EQUAL(LonBitsCount(precision) + LatBitsCount(precision), 5 * precision, (precision));
}
