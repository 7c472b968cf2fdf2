#include "MultipartReader.hpp"
#include <algorithm>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/algorithm/string/trim.hpp>
#include "util/Assert.hpp"

namespace hpr
{

std::string const * MultipartReader::Part::header(const char * name) const
{
  for (auto const & header : headers)
    if (boost::algorithm::iequals(header.first, name))
      return &header.second;
  return nullptr;
}

MultipartReader::MultipartReader(std::string const & body, std::string const & boundary)
  : m_body(body)
  , m_delimiter("--" + boundary)
  , m_position(0)
  , m_finished(false)
{
  if (boundary.empty())
    ThrowReaderError(ErrorCode::ParseFailed, "Empty multipart boundary");
  seekFirstDelimiter();
}

bool MultipartReader::nextPart(Part & part)
{
  if (m_finished)
    return false;

  // m_position is at the start of a delimiter
  if (!readDelimiterLine())
  {
    m_finished = true;
    return false;
  }

  part.headers.clear();
  readHeaders(part.headers);

  // Headers end with a line break, so the search may start at it: a delimiter
  // right after the headers gives an empty body
  size_t bodyStart = m_position;
  size_t found = m_body.find("\n" + m_delimiter, bodyStart - 1);
  if (found == std::string::npos)
    ThrowReaderError(ErrorCode::ParseFailed, "Truncated multipart part");
  size_t bodyEnd = std::max(found, bodyStart);
  if (bodyEnd > bodyStart && m_body[bodyEnd - 1] == '\r')
    --bodyEnd;

  part.data = m_body.data() + bodyStart;
  part.size = bodyEnd - bodyStart;
  m_position = found + 1;
  return true;
}

void MultipartReader::seekFirstDelimiter()
{
  // Preamble is skipped
  size_t pos = 0;
  for (;;)
  {
    pos = m_body.find(m_delimiter, pos);
    if (pos == std::string::npos)
      ThrowReaderError(ErrorCode::ParseFailed, "Multipart boundary not found in response body");
    if (pos == 0 || m_body[pos - 1] == '\n')
      break;
    ++pos;
  }
  m_position = pos;
}

// Returns false for the closing delimiter
bool MultipartReader::readDelimiterLine()
{
  HPR_ASSERT(m_body.compare(m_position, m_delimiter.size(), m_delimiter) == 0);
  m_position += m_delimiter.size();
  if (m_body.compare(m_position, 2, "--") == 0)
  {
    m_position += 2;
    return false;
  }
  std::string padding;
  if (!readLine(padding))
    ThrowReaderError(ErrorCode::ParseFailed, "Truncated multipart delimiter");
  HPR_PARSE_ASSERT(boost::algorithm::trim_copy(padding).empty());
  return true;
}

void MultipartReader::readHeaders(HttpHeaders & headers)
{
  std::string line;
  for (;;)
  {
    if (!readLine(line))
      ThrowReaderError(ErrorCode::ParseFailed, "Truncated multipart part headers");
    if (line.empty())
      return;
    size_t colon = line.find(':');
    if (colon == std::string::npos || colon == 0)
      ThrowReaderError(ErrorCode::ParseFailed, "Invalid multipart part header: " + line);
    headers.emplace_back(
      boost::algorithm::trim_copy(line.substr(0, colon)),
      boost::algorithm::trim_copy(line.substr(colon + 1)));
  }
}

// Reads up to LF, strips CR. Returns false if there is no complete line.
bool MultipartReader::readLine(std::string & line)
{
  size_t end = m_body.find('\n', m_position);
  if (end == std::string::npos)
    return false;
  line.assign(m_body, m_position, end - m_position);
  if (!line.empty() && line.back() == '\r')
    line.pop_back();
  m_position = end + 1;
  return true;
}

}
