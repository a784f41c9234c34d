#include "base/src_point.hpp"

#include <sstream>

namespace base
{
void SrcPoint::TruncateFileName()
{
  size_t const kMaxComponents = 2;
  char const * p[kMaxComponents + 1] = {m_fileName, m_fileName, m_fileName};
  for (char const * it = m_fileName; *it; ++it)
  {
    if (*it == '/' || *it == '\\')
    {
      for (size_t i = kMaxComponents; i > 0; --i)
        p[i] = p[i - 1];
      p[0] = it + 1;
    }
  }
  m_fileName = p[kMaxComponents - 1];
}

std::string SrcPoint::ToString() const
{
  std::ostringstream out;
  if (m_line > 0)
  {
    out << m_fileName << ":" << m_line;
    if (m_function[0] != '\0')
      out << " " << m_function << "()";
    out << " ";
  }
  return out.str();
}

std::string DebugPrint(SrcPoint const & srcPoint) { return srcPoint.ToString(); }
}  // namespace base
