#pragma once

#include <string>
#include "hpr/IHttpTransport.hpp"

namespace hpr
{

// Splits a multipart body into parts. Parts reference the body passed to
// constructor, so it must outlive them.
class MultipartReader
{
public:
  struct Part
  {
    HttpHeaders headers;
    const char * data;
    size_t size;

    std::string const * header(const char * name) const;
  };

  MultipartReader(std::string const & body, std::string const & boundary);

  // Returns false after the closing delimiter.
  // Throws ReaderError(ParseFailed) on broken framing.
  bool nextPart(Part &);

private:
  std::string const & m_body;
  std::string const m_delimiter;
  size_t m_position;
  bool m_finished;

  void seekFirstDelimiter();
  bool readDelimiterLine();
  void readHeaders(HttpHeaders &);
  bool readLine(std::string & line);
};

}
