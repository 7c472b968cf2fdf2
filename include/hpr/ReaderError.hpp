#ifndef _HPR_API_READER_ERROR_H
#define _HPR_API_READER_ERROR_H

#include <stdexcept>
#include <string>
#include "hpr/Defs.hpp"

namespace hpr
{

enum class ErrorCode
{
  ResourceNotFound,
  ProbeFailed,
  FetchFailed,
  ParseFailed,
  IncompleteFetch,
  MissingBlock,
  InternalExpectationFail
};

HPR_API_DECL const char * ErrorCodeName(ErrorCode);

class HPR_API_DECL ReaderError: public std::runtime_error
{
public:
  ReaderError(ErrorCode code, const char * msg);
  ReaderError(ErrorCode code, std::string const & msg);
  ReaderError(ReaderError const &);
  ReaderError(ReaderError &&);
  ~ReaderError();

  ReaderError & operator=(ReaderError const &);
  ReaderError & operator=(ReaderError &&);

  ErrorCode code() const;
  const char * message() const;

private:
  class Impl;
  Impl * m_impl;
};

}

#endif
