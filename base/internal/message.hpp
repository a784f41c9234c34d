#pragma once

#include <array>
#include <iomanip>
#include <iterator>
#include <limits>
#include <list>
#include <map>
#include <set>
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include <boost/optional.hpp>

/// @name Declarations.
//@{
template <typename T> inline std::string DebugPrint(T const & t);

inline std::string DebugPrint(std::string const & t);
inline std::string DebugPrint(char const * t);
inline std::string DebugPrint(char t);
inline std::string DebugPrint(signed char t);
inline std::string DebugPrint(unsigned char t);

template <typename U, typename V> inline std::string DebugPrint(std::pair<U, V> const & p);
template <typename T> inline std::string DebugPrint(std::list<T> const & v);
template <typename T> inline std::string DebugPrint(std::vector<T> const & v);
template <typename T, size_t N> inline std::string DebugPrint(std::array<T, N> const & v);
template <typename T, typename C = std::less<T>>
inline std::string DebugPrint(std::set<T, C> const & v);
template <typename U, typename V, typename C = std::less<U>>
inline std::string DebugPrint(std::map<U, V, C> const & v);
template <typename T> inline std::string DebugPrint(boost::optional<T> const & p);
//@}

inline std::string DebugPrint(std::string const & t)
{
  return t;
}

inline std::string DebugPrint(char const * t)
{
  if (t)
    return std::string(t);
  return std::string("NULL string pointer");
}

inline std::string DebugPrint(char t)
{
  return std::string(1, t);
}

inline std::string DebugPrint(signed char t)
{
  return DebugPrint(static_cast<int>(t));
}

inline std::string DebugPrint(unsigned char t)
{
  return DebugPrint(static_cast<unsigned int>(t));
}

template <typename U, typename V> inline std::string DebugPrint(std::pair<U, V> const & p)
{
  std::ostringstream out;
  out << "(" << DebugPrint(p.first) << ", " << DebugPrint(p.second) << ")";
  return out.str();
}

namespace base
{
namespace internal
{
template <typename It> inline std::string DebugPrintSequence(It beg, It end)
{
  using ::DebugPrint;
  std::ostringstream out;
  out << "[" << std::distance(beg, end) << ":";
  for (; beg != end; ++beg)
    out << " " << DebugPrint(*beg);
  out << " ]";
  return out.str();
}
}  // namespace internal
}  // namespace base

template <typename T, size_t N> inline std::string DebugPrint(std::array<T, N> const & v)
{
  return ::base::internal::DebugPrintSequence(v.begin(), v.end());
}

template <typename T> inline std::string DebugPrint(std::vector<T> const & v)
{
  return ::base::internal::DebugPrintSequence(v.begin(), v.end());
}

template <typename T> inline std::string DebugPrint(std::list<T> const & v)
{
  return ::base::internal::DebugPrintSequence(v.begin(), v.end());
}

template <typename T, typename C> inline std::string DebugPrint(std::set<T, C> const & v)
{
  return ::base::internal::DebugPrintSequence(v.begin(), v.end());
}

template <typename U, typename V, typename C>
inline std::string DebugPrint(std::map<U, V, C> const & v)
{
  return ::base::internal::DebugPrintSequence(v.begin(), v.end());
}

template <typename T> inline std::string DebugPrint(boost::optional<T> const & p)
{
  if (p)
    return "optional(" + DebugPrint(*p) + ")";
  return "none";
}

template <typename T> inline std::string DebugPrint(T const & t)
{
  std::ostringstream out;
  // Coordinates need more than the default six significant digits.
  if (std::is_floating_point<T>::value)
    out << std::setprecision(std::numeric_limits<T>::max_digits10);
  out << t;
  return out.str();
}

namespace base
{
inline std::string Message()
{
  return std::string();
}

template <typename T> std::string Message(T const & t)
{
  using ::DebugPrint;
  return DebugPrint(t);
}

template <typename T, typename... Args> std::string Message(T const & t, Args const &... others)
{
  using ::DebugPrint;
  return DebugPrint(t) + " " + Message(others...);
}
}  // namespace base
