#pragma once

#include <string>

#define SRC() base::SrcPoint(__FILE__, __LINE__, __func__)

namespace base
{
class SrcPoint
{
public:
  SrcPoint() : m_fileName(""), m_line(-1), m_function("") {}
  SrcPoint(char const * fileName, int line, char const * function)
    : m_fileName(fileName), m_line(line), m_function(function)
  {
    TruncateFileName();
  }

  char const * FileName() const { return m_fileName; }
  int Line() const { return m_line; }
  char const * Function() const { return m_function; }

  std::string ToString() const;

private:
  // Keeps only the last two path components: "geohash/alphabet.cpp".
  void TruncateFileName();

  char const * m_fileName;
  int m_line;
  char const * m_function;
};

std::string DebugPrint(SrcPoint const & srcPoint);
}  // namespace base
