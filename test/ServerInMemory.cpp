#include "ServerInMemory.hpp"
#include <algorithm>
#include <random>
#include <stdexcept>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <boost/lexical_cast.hpp>
#include "hpr/ReaderError.hpp"

const char ServerInMemory::Url[] = "http://example.com/resource.bin";
const char ServerInMemory::Boundary[] = "3d6b6a416f9b5";

namespace
{
  std::string ContentRange(uint64_t start, uint64_t end, size_t size, bool shift)
  {
    if (shift)
    {
      ++start;
      ++end;
    }
    return "bytes " + std::to_string(start) + "-" + std::to_string(end) + "/" + std::to_string(size);
  }
}

ServerInMemory::ServerInMemory(std::vector<char> const & data)
  : m_data(data)
  , m_headRequests(0)
{
}

std::vector<char> ServerInMemory::MakeData(size_t size, unsigned seed)
{
  std::vector<char> data(size);
  std::minstd_rand random_engine(seed + 1);
  std::uniform_int_distribution<int> uniform_dist(0, 255);
  for (auto & c : data)
    c = static_cast<char>(uniform_dist(random_engine));
  return data;
}

size_t ServerInMemory::headRequests() const
{
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_headRequests;
}

size_t ServerInMemory::getRequests() const
{
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_rangeHeaders.size();
}

std::vector<std::string> ServerInMemory::rangeHeaders() const
{
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_rangeHeaders;
}

hpr::HttpResponse ServerInMemory::perform(hpr::HttpRequest const & request)
{
  if (request.url != Url)
    throw std::runtime_error("ServerInMemory: Unexpected url " + request.url);

  std::string rangeHeader;
  for (auto const & header : request.headers)
    if (header.first == "Range")
      rangeHeader = header.second;

  {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (request.method == hpr::HttpMethod::Head)
      ++m_headRequests;
    else
      m_rangeHeaders.push_back(rangeHeader);
  }

  if (failTransport)
    throw hpr::ReaderError(hpr::ErrorCode::FetchFailed, "Connection refused");

  hpr::HttpResponse response;
  if (request.method == hpr::HttpMethod::Head)
  {
    response.status = headStatus;
    if (sendContentLength)
      response.headers.emplace_back("content-length", std::to_string(m_data.size()));
    return response;
  }

  if (ignoreRange || rangeHeader.empty())
  {
    response.status = 200;
    response.headers.emplace_back("Content-Type", "application/octet-stream");
    response.body.assign(m_data.begin(), m_data.end());
  }
  else
    response = rangeResponse(rangeHeader);

  if (getStatus != 0)
    response.status = getStatus;
  return response;
}

hpr::HttpResponse ServerInMemory::rangeResponse(std::string const & rangeHeader) const
{
  if (rangeHeader.compare(0, 6, "bytes=") != 0)
    throw std::runtime_error("ServerInMemory: Unexpected Range " + rangeHeader);

  std::vector<std::string> specs;
  boost::algorithm::split(specs, rangeHeader.substr(6), boost::algorithm::is_any_of(","));
  std::vector<std::pair<uint64_t, uint64_t>> ranges;
  for (auto const & spec : specs)
  {
    auto dash = spec.find('-');
    uint64_t start = boost::lexical_cast<uint64_t>(spec.substr(0, dash));
    uint64_t end = boost::lexical_cast<uint64_t>(spec.substr(dash + 1));
    if (end >= m_data.size() || start > end)
      throw std::runtime_error("ServerInMemory: Range out of resource " + spec);
    ranges.emplace_back(start, end);
  }
  for (size_t i = 0; i < dropLastParts && !ranges.empty(); ++i)
    ranges.pop_back();
  for (size_t i = 0; i < extraParts; ++i)
    ranges.push_back(ranges.back());

  hpr::HttpResponse response;
  response.status = 206;
  auto partBody = [this](std::pair<uint64_t, uint64_t> const & range)
  {
    size_t length = static_cast<size_t>(range.second - range.first + 1);
    length -= std::min(length, truncateBytes);
    return std::string(m_data.data() + range.first, length);
  };

  if (mergeRanges)
    ranges = {std::make_pair(ranges.front().first, ranges.back().second)};

  if (specs.size() == 1 || collapseRanges || mergeRanges)
  {
    response.headers.emplace_back("Content-Type", "application/octet-stream");
    response.headers.emplace_back("Content-Range",
      ContentRange(ranges.front().first, ranges.front().second, m_data.size(), mislabelParts));
    response.body = partBody(ranges.front());
    return response;
  }

  std::string const eol = useBareLF ? "\n" : "\r\n";
  response.headers.emplace_back("Content-Type",
    omitBoundary
      ? std::string("multipart/byteranges")
      : std::string("multipart/byteranges; boundary=") + Boundary);
  std::string & body = response.body;
  for (auto const & range : ranges)
  {
    body += eol + "--" + Boundary + eol;
    body += "Content-Type: application/octet-stream" + eol;
    body += "Content-Range: " + ContentRange(range.first, range.second, m_data.size(), mislabelParts) + eol;
    body += eol;
    body += partBody(range);
  }
  if (!omitClosingDelimiter)
    body += eol + "--" + Boundary + "--" + eol;
  return response;
}
