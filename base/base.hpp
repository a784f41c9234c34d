#pragma once

#include <cstddef>
#include <cstdint>

#if defined(DEBUG) || defined(_DEBUG)
  #define GEOHASH_DEBUG
#else
  #define GEOHASH_RELEASE
#endif
