#include "base/exception.hpp"

RootException::RootException(char const * what, std::string const & msg) : m_msg(msg)
{
  m_whatWithMsg = what;
  if (!m_msg.empty())
  {
    m_whatWithMsg += ", \"";
    m_whatWithMsg += m_msg;
    m_whatWithMsg += "\"";
  }
}
