#pragma once

#include "base/base.hpp"
#include "base/internal/message.hpp"
#include "base/src_point.hpp"

#include <cstdlib>
#include <string>

namespace base
{
// Called when ASSERT or CHECK failed.
// If returns true then crash application.
bool OnAssertFailed(SrcPoint const & srcPoint, std::string const & msg);
}  // namespace base

#define ASSERT_FAIL_IMPL(msg)                    \
  do                                             \
  {                                              \
    if (::base::OnAssertFailed(SRC(), msg))      \
      std::abort();                              \
  } while (false)

#define CHECK(X, msg)                                                          \
  do                                                                           \
  {                                                                            \
    if (!(X))                                                                  \
      ASSERT_FAIL_IMPL(::base::Message("CHECK(" #X ")", ::base::Message msg)); \
  } while (false)

#define CHECK_EQUAL(X, Y, msg)                                                          \
  do                                                                                    \
  {                                                                                     \
    if (!((X) == (Y)))                                                                  \
      ASSERT_FAIL_IMPL(::base::Message("CHECK(" #X " == " #Y ")", ::base::Message(X),   \
                                       ::base::Message(Y), ::base::Message msg));       \
  } while (false)

#define CHECK_NOT_EQUAL(X, Y, msg)                                                      \
  do                                                                                    \
  {                                                                                     \
    if (!((X) != (Y)))                                                                  \
      ASSERT_FAIL_IMPL(::base::Message("CHECK(" #X " != " #Y ")", ::base::Message(X),   \
                                       ::base::Message(Y), ::base::Message msg));       \
  } while (false)

#define CHECK_LESS(X, Y, msg)                                                           \
  do                                                                                    \
  {                                                                                     \
    if (!((X) < (Y)))                                                                   \
      ASSERT_FAIL_IMPL(::base::Message("CHECK(" #X " < " #Y ")", ::base::Message(X),    \
                                       ::base::Message(Y), ::base::Message msg));       \
  } while (false)

#define CHECK_LESS_OR_EQUAL(X, Y, msg)                                                  \
  do                                                                                    \
  {                                                                                     \
    if (!((X) <= (Y)))                                                                  \
      ASSERT_FAIL_IMPL(::base::Message("CHECK(" #X " <= " #Y ")", ::base::Message(X),   \
                                       ::base::Message(Y), ::base::Message msg));       \
  } while (false)

#define CHECK_GREATER(X, Y, msg)                                                        \
  do                                                                                    \
  {                                                                                     \
    if (!((X) > (Y)))                                                                   \
      ASSERT_FAIL_IMPL(::base::Message("CHECK(" #X " > " #Y ")", ::base::Message(X),    \
                                       ::base::Message(Y), ::base::Message msg));       \
  } while (false)

#define CHECK_GREATER_OR_EQUAL(X, Y, msg)                                               \
  do                                                                                    \
  {                                                                                     \
    if (!((X) >= (Y)))                                                                  \
      ASSERT_FAIL_IMPL(::base::Message("CHECK(" #X " >= " #Y ")", ::base::Message(X),   \
                                       ::base::Message(Y), ::base::Message msg));       \
  } while (false)

#ifdef GEOHASH_DEBUG
#define ASSERT(X, msg) CHECK(X, msg)
#define ASSERT_EQUAL(X, Y, msg) CHECK_EQUAL(X, Y, msg)
#define ASSERT_LESS(X, Y, msg) CHECK_LESS(X, Y, msg)
#define ASSERT_LESS_OR_EQUAL(X, Y, msg) CHECK_LESS_OR_EQUAL(X, Y, msg)
#define ASSERT_GREATER_OR_EQUAL(X, Y, msg) CHECK_GREATER_OR_EQUAL(X, Y, msg)
#else
#define ASSERT(X, msg)
#define ASSERT_EQUAL(X, Y, msg)
#define ASSERT_LESS(X, Y, msg)
#define ASSERT_LESS_OR_EQUAL(X, Y, msg)
#define ASSERT_GREATER_OR_EQUAL(X, Y, msg)
#endif

#define UNREACHABLE()                                   \
  do                                                    \
  {                                                     \
    ASSERT_FAIL_IMPL(::base::Message("UNREACHABLE")); \
    std::abort();                                       \
  } while (false)
