#include "hpr/ReaderError.hpp"
#include <string>

namespace hpr
{

const char * ErrorCodeName(ErrorCode code)
{
  switch (code)
  {
  case ErrorCode::ResourceNotFound: return "ResourceNotFound";
  case ErrorCode::ProbeFailed: return "ProbeFailed";
  case ErrorCode::FetchFailed: return "FetchFailed";
  case ErrorCode::ParseFailed: return "ParseFailed";
  case ErrorCode::IncompleteFetch: return "IncompleteFetch";
  case ErrorCode::MissingBlock: return "MissingBlock";
  case ErrorCode::InternalExpectationFail: return "InternalExpectationFail";
  }
  return "Unknown";
}

class ReaderError::Impl
{
public:
  ErrorCode code;
  std::string message;
};

ReaderError::ReaderError(ErrorCode code, const char * msg)
  : runtime_error(msg)
  , m_impl(new Impl)
{
  m_impl->message = msg;
  m_impl->code = code;
}

ReaderError::ReaderError(ErrorCode code, std::string const & msg)
  : ReaderError(code, msg.c_str())
{
}

ReaderError::ReaderError(ReaderError && src)
  : runtime_error(src)
  , m_impl(src.m_impl)
{
  src.m_impl = nullptr;
}

ReaderError::ReaderError(ReaderError const & src)
  : runtime_error(src)
  , m_impl(new Impl(*src.m_impl))
{
}

ReaderError::~ReaderError()
{
  delete m_impl;
}

ReaderError & ReaderError::operator=(ReaderError const & src)
{
  runtime_error::operator=(src);
  *m_impl = *src.m_impl;
  return *this;
}

ReaderError & ReaderError::operator=(ReaderError && src)
{
  runtime_error::operator=(src);
  delete m_impl;
  m_impl = src.m_impl;
  src.m_impl = nullptr;
  return *this;
}

ErrorCode ReaderError::code() const
{
  return m_impl->code;
}

const char * ReaderError::message() const
{
  return m_impl->message.c_str();
}

}
