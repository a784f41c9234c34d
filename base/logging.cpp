#include "base/logging.hpp"

#include "base/assert.hpp"

#include <algorithm>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <utility>

namespace base
{
namespace
{
std::mutex g_logMutex;
}  // namespace

std::string ToString(LogLevel level)
{
  auto const & names = GetLogLevelNames();
  CHECK_LESS(static_cast<size_t>(level), names.size(), ());
  return names[level];
}

bool FromString(std::string const & s, LogLevel & level)
{
  auto const & names = GetLogLevelNames();
  auto it = std::find(names.begin(), names.end(), s);
  if (it == names.end())
    return false;
  level = static_cast<LogLevel>(std::distance(names.begin(), it));
  return true;
}

std::array<char const *, NUM_LOG_LEVELS> const & GetLogLevelNames()
{
  static std::array<char const *, NUM_LOG_LEVELS> const kNames = {
      {"DEBUG", "INFO", "WARNING", "ERROR", "CRITICAL"}};
  return kNames;
}

void LogMessageDefault(LogLevel level, SrcPoint const & srcPoint, std::string const & msg)
{
  std::lock_guard<std::mutex> lock(g_logMutex);

  std::ostringstream out;
  out << std::left << std::setw(8) << ToString(level) << " " << DebugPrint(srcPoint) << msg
      << std::endl;
  std::cerr << out.str();

  CHECK_LESS(level, g_LogAbortLevel, ("Abort. Log level is too serious", level));
}

void LogMessageTests(LogLevel level, SrcPoint const & srcPoint, std::string const & msg)
{
  std::lock_guard<std::mutex> lock(g_logMutex);

  std::ostringstream out;
  out << DebugPrint(srcPoint) << msg << std::endl;
  std::cerr << out.str();

  CHECK_LESS(level, g_LogAbortLevel, ("Abort. Log level is too serious", level));
}

LogMessageFn LogMessage = &LogMessageDefault;

LogMessageFn SetLogMessageFn(LogMessageFn fn)
{
  std::swap(LogMessage, fn);
  return fn;
}

#ifdef GEOHASH_DEBUG
LogLevel g_LogLevel = LDEBUG;
#else
LogLevel g_LogLevel = LINFO;
#endif

LogLevel g_LogAbortLevel = LCRITICAL;
}  // namespace base
