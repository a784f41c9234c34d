#pragma once

#include "base/base.hpp"
#include "base/internal/message.hpp"
#include "base/src_point.hpp"

#include <array>
#include <string>

namespace base
{
enum LogLevel
{
  LDEBUG,
  LINFO,
  LWARNING,
  LERROR,
  LCRITICAL,

  NUM_LOG_LEVELS
};

std::string ToString(LogLevel level);
bool FromString(std::string const & s, LogLevel & level);
std::array<char const *, NUM_LOG_LEVELS> const & GetLogLevelNames();

inline std::string DebugPrint(LogLevel level) { return ToString(level); }

using LogMessageFn = void (*)(LogLevel level, SrcPoint const &, std::string const &);

LogMessageFn SetLogMessageFn(LogMessageFn fn);

void LogMessageDefault(LogLevel level, SrcPoint const & srcPoint, std::string const & msg);
void LogMessageTests(LogLevel level, SrcPoint const & srcPoint, std::string const & msg);

extern LogMessageFn LogMessage;
extern LogLevel g_LogLevel;
extern LogLevel g_LogAbortLevel;

/// Sets the log level and restores the previous one when the guard goes out of scope.
class ScopedLogLevelChanger
{
public:
  explicit ScopedLogLevelChanger(LogLevel temporaryLogLevel = LERROR)
    : m_old(g_LogLevel)
  {
    g_LogLevel = temporaryLogLevel;
  }

  ~ScopedLogLevelChanger() { g_LogLevel = m_old; }

private:
  LogLevel m_old;
};
}  // namespace base

using ::base::LDEBUG;
using ::base::LINFO;
using ::base::LWARNING;
using ::base::LERROR;
using ::base::LCRITICAL;
using ::base::NUM_LOG_LEVELS;

// Writes a message if its level is not below g_LogLevel.
// Arguments are evaluated only when the message is written.
#define LOG(level, msg)                                          \
  do                                                             \
  {                                                              \
    if ((level) >= ::base::g_LogLevel)                           \
      ::base::LogMessage(level, SRC(), ::base::Message msg);     \
  } while (false)

// Conditional log. Logs the message if X is false.
#define CLOG(level, X, msg)                                         \
  do                                                                \
  {                                                                 \
    if (!(X))                                                       \
      LOG(level, (SRC(), "CLOG(" #X ")", ::base::Message msg));     \
  } while (false)
