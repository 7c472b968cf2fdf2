#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <boost/optional.hpp>

namespace hpr
{

struct MediaType
{
  std::string type; // "type/subtype", lower case
  std::map<std::string, std::string> parameters; // keys in lower case

  boost::optional<std::string> parameter(const char * name) const;
};

// Parses Content-Type header value. Throws ReaderError(ParseFailed).
MediaType ParseMediaType(std::string const &);

struct ContentRange
{
  uint64_t start;
  uint64_t end; // inclusive
  boost::optional<uint64_t> totalSize; // absent for "*"
};

// Parses "bytes 0-99/1000". Throws ReaderError(ParseFailed).
ContentRange ParseContentRange(std::string const &);

}
