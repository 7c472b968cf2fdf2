#include "MediaType.hpp"
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/lexical_cast.hpp>
#include "util/Assert.hpp"

namespace hpr
{

namespace
{
  inline bool IsTokenChar(char c)
  {
    return c > ' ' && c < 127 && std::string("()<>@,;:\\\"/[]?=").find(c) == std::string::npos;
  }

  inline void SkipSpaces(std::string const & value, size_t & pos)
  {
    while (pos < value.size() && (value[pos] == ' ' || value[pos] == '\t'))
      ++pos;
  }

  std::string ReadToken(std::string const & value, size_t & pos)
  {
    size_t start = pos;
    while (pos < value.size() && IsTokenChar(value[pos]))
      ++pos;
    return value.substr(start, pos - start);
  }

  std::string ReadQuotedString(std::string const & value, size_t & pos)
  {
    HPR_ASSERT(value[pos] == '"');
    std::string result;
    for (++pos; pos < value.size(); ++pos)
    {
      if (value[pos] == '"')
      {
        ++pos;
        return result;
      }
      if (value[pos] == '\\')
      {
        ++pos;
        if (pos == value.size())
          break;
      }
      result += value[pos];
    }
    ThrowReaderError(ErrorCode::ParseFailed, "Unterminated quoted string in media type: " + value);
  }

  uint64_t ParseOffset(std::string const & text, std::string const & header)
  {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos)
      ThrowReaderError(ErrorCode::ParseFailed, "Invalid Content-Range: " + header);
    try
    {
      return boost::lexical_cast<uint64_t>(text);
    }
    catch (boost::bad_lexical_cast const &)
    {
      ThrowReaderError(ErrorCode::ParseFailed, "Invalid Content-Range: " + header);
    }
  }
}

boost::optional<std::string> MediaType::parameter(const char * name) const
{
  auto it = parameters.find(name);
  if (it == parameters.end())
    return boost::none;
  return it->second;
}

MediaType ParseMediaType(std::string const & value)
{
  MediaType result;
  size_t pos = 0;
  SkipSpaces(value, pos);
  std::string type = ReadToken(value, pos);
  if (type.empty() || pos == value.size() || value[pos] != '/')
    ThrowReaderError(ErrorCode::ParseFailed, "Invalid media type: " + value);
  ++pos;
  std::string subtype = ReadToken(value, pos);
  HPR_PARSE_ASSERT(!subtype.empty());
  result.type = boost::algorithm::to_lower_copy(type + '/' + subtype);

  for (;;)
  {
    SkipSpaces(value, pos);
    if (pos == value.size())
      break;
    if (value[pos] != ';')
      ThrowReaderError(ErrorCode::ParseFailed, "Invalid media type parameters: " + value);
    ++pos;
    SkipSpaces(value, pos);
    if (pos == value.size())
      break; // trailing ';' is tolerated
    std::string name = boost::algorithm::to_lower_copy(ReadToken(value, pos));
    if (name.empty() || pos == value.size() || value[pos] != '=')
      ThrowReaderError(ErrorCode::ParseFailed, "Invalid media type parameter: " + value);
    ++pos;
    std::string parameterValue;
    if (pos < value.size() && value[pos] == '"')
      parameterValue = ReadQuotedString(value, pos);
    else
      parameterValue = ReadToken(value, pos);
    if (parameterValue.empty())
      ThrowReaderError(ErrorCode::ParseFailed, "Empty media type parameter: " + value);
    if (!result.parameters.emplace(name, parameterValue).second)
      ThrowReaderError(ErrorCode::ParseFailed, "Duplicate media type parameter: " + value);
  }
  return result;
}

ContentRange ParseContentRange(std::string const & header)
{
  std::string value = boost::algorithm::trim_copy(header);
  if (!boost::algorithm::istarts_with(value, "bytes "))
    ThrowReaderError(ErrorCode::ParseFailed, "Invalid Content-Range: " + header);
  value = boost::algorithm::trim_left_copy(value.substr(6));

  size_t dash = value.find('-');
  size_t slash = value.find('/');
  HPR_PARSE_ASSERT(dash != std::string::npos && slash != std::string::npos && dash < slash);

  ContentRange range;
  range.start = ParseOffset(value.substr(0, dash), header);
  range.end = ParseOffset(value.substr(dash + 1, slash - dash - 1), header);
  std::string total = value.substr(slash + 1);
  if (total != "*")
    range.totalSize = ParseOffset(total, header);
  HPR_PARSE_ASSERT(range.start <= range.end);
  return range;
}

}
