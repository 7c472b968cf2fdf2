#pragma once

#include <string>
#include "hpr/ReaderError.hpp"

namespace hpr
{

[[noreturn]]
inline void ThrowReaderError(ErrorCode code, const char * description)
{
  throw ReaderError(code, description);
}

[[noreturn]]
inline void ThrowReaderError(ErrorCode code, std::string const & description)
{
  throw ReaderError(code, description);
}

}

#define HPR_STRINGIFY_IMPL(s) #s
#define HPR_STRINGIFY(s) HPR_STRINGIFY_IMPL(s)

#define HPR_PARSE_ASSERT(expression) \
  (void)((!!(expression)) || (::hpr::ThrowReaderError(::hpr::ErrorCode::ParseFailed, \
    "Malformed response at " __FILE__ " (" HPR_STRINGIFY(__LINE__) ")"), false))

#define HPR_ASSERT(expression) \
  (void)((!!(expression)) || (::hpr::ThrowReaderError(::hpr::ErrorCode::InternalExpectationFail, \
    "Internal expectation fail at " __FILE__ " (" HPR_STRINGIFY(__LINE__) ")"), false))
