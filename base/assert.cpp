#include "base/assert.hpp"

#include <iostream>

namespace base
{
bool OnAssertFailed(SrcPoint const & srcPoint, std::string const & msg)
{
  std::cerr << "ASSERT FAILED" << std::endl
            << srcPoint.FileName() << ":" << srcPoint.Line() << std::endl
            << msg << std::endl;
  return true;
}
}  // namespace base
