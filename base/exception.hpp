#pragma once

#include "base/internal/message.hpp"
#include "base/macros.hpp"

#include <exception>
#include <string>

class RootException : public std::exception
{
public:
  RootException(char const * what, std::string const & msg);

  virtual ~RootException() noexcept = default;

  std::string const & Msg() const { return m_msg; }

  // std::exception overrides:
  char const * what() const noexcept override { return m_whatWithMsg.c_str(); }

private:
  std::string m_whatWithMsg;
  std::string m_msg;
};

#define DECLARE_EXCEPTION(exception_name, base_exception)                                     \
  class exception_name : public base_exception                                                \
  {                                                                                           \
  public:                                                                                     \
    exception_name(char const * what, std::string const & msg) : base_exception(what, msg) {} \
  }

#define EXCEPTION_WHAT(exception_name) #exception_name " " __FILE__ ":" TO_STRING(__LINE__)

#define MYTHROW(exception_name, msg) \
  throw exception_name(EXCEPTION_WHAT(exception_name), ::base::Message msg)
