#include "RangeFetcher.hpp"
#include <spdlog/spdlog.h>
#include "hpr/Logger.hpp"
#include "MediaType.hpp"
#include "util/Assert.hpp"

namespace hpr
{

namespace
{
  const char MultipartByteRanges[] = "multipart/byteranges";

  std::string RangeString(ByteRange const & range)
  {
    return std::to_string(range.start) + "-" + std::to_string(range.end);
  }
}

RangeFetcher::RangeFetcher(IHttpTransport & transport, std::string const & url,
  uint64_t resourceSize, BlockCache & cache)
  : m_transport(transport)
  , m_url(url)
  , m_resourceSize(resourceSize)
  , m_cache(cache)
  , m_logger(logger())
{}

void RangeFetcher::fetch(ByteRanges const & ranges)
{
  if (ranges.empty())
    return;

  HttpRequest request;
  request.method = HttpMethod::Get;
  request.url = m_url;
  request.headers.emplace_back("Range", FormatRangeHeader(ranges));
  m_logger->debug("GET {} Range: {}", m_url, request.headers.back().second);

  // Transport failures are already reported as FetchFailed
  HttpResponse response = m_transport.perform(request);

  if (response.status == 200)
  {
    storeWholeResource(response, ranges);
    return;
  }
  if (response.status != 206)
    ThrowReaderError(ErrorCode::FetchFailed,
      "GET " + m_url + " returned status " + std::to_string(response.status));

  std::string const * contentType = response.header("Content-Type");
  if (contentType)
  {
    MediaType mediaType = ParseMediaType(*contentType);
    if (mediaType.type == MultipartByteRanges)
    {
      boost::optional<std::string> boundary = mediaType.parameter("boundary");
      if (!boundary)
        ThrowReaderError(ErrorCode::ParseFailed, "multipart/byteranges response without boundary");
      storeMultipart(response, *boundary, ranges);
      return;
    }
  }
  storeSinglePart(response, ranges);
}

void RangeFetcher::storeMultipart(HttpResponse const & response, std::string const & boundary,
  ByteRanges const & ranges)
{
  BlockCache::Batch batch;
  MultipartReader reader(response.body, boundary);
  MultipartReader::Part part;
  while (reader.nextPart(part))
  {
    if (batch.size() == ranges.size())
      ThrowReaderError(ErrorCode::ParseFailed,
        "Response has more parts than " + std::to_string(ranges.size()) + " requested ranges");
    ByteRange const & range = ranges[batch.size()];
    if (std::string const * contentRange = part.header("Content-Range"))
      checkContentRange(*contentRange, range);
    checkPartSize(part.size, range);
    batch.emplace_back(range.blockIndex, BlockData(part.data, part.data + part.size));
  }

  size_t received = batch.size();
  m_logger->debug("GET {}: {} of {} parts received", m_url, received, ranges.size());
  m_cache.insert(std::move(batch));

  if (received < ranges.size())
  {
    m_logger->warn("GET {}: range {} and further are missing in response",
      m_url, RangeString(ranges[received]));
    ThrowReaderError(ErrorCode::IncompleteFetch,
      "Received " + std::to_string(received) + " of " + std::to_string(ranges.size()) + " requested ranges");
  }
}

void RangeFetcher::storeSinglePart(HttpResponse const & response, ByteRanges const & ranges)
{
  ByteRange const & range = ranges.front();
  size_t bodySize = response.body.size();
  if (std::string const * contentRange = response.header("Content-Range"))
  {
    ContentRange received = ParseContentRange(*contentRange);
    if (received.start != range.start)
      ThrowReaderError(ErrorCode::ParseFailed,
        "Content-Range '" + *contentRange + "' doesn't match requested range " + RangeString(range));
    if (bodySize < received.end - received.start + 1)
      ThrowReaderError(ErrorCode::FetchFailed,
        "Response body is shorter than Content-Range '" + *contentRange + "'");
    if (bodySize > received.end - received.start + 1)
      ThrowReaderError(ErrorCode::ParseFailed,
        "Response body is longer than Content-Range '" + *contentRange + "'");
    // Server might have merged ranges, only the first one is taken
    if (received.end > range.end)
      bodySize = range.length();
  }
  checkPartSize(bodySize, range);

  m_cache.insert(range.blockIndex, BlockData(response.body.data(), response.body.data() + bodySize));

  if (ranges.size() > 1)
  {
    m_logger->warn("GET {}: single part response to {} ranges", m_url, ranges.size());
    ThrowReaderError(ErrorCode::IncompleteFetch,
      "Single part response to " + std::to_string(ranges.size()) + " requested ranges");
  }
}

void RangeFetcher::storeWholeResource(HttpResponse const & response, ByteRanges const & ranges)
{
  m_logger->debug("GET {}: server ignored Range, whole resource received", m_url);
  if (response.body.size() != m_resourceSize)
    ThrowReaderError(ErrorCode::FetchFailed,
      "Response body has " + std::to_string(response.body.size()) + " bytes, expected "
      + std::to_string(m_resourceSize));

  BlockCache::Batch batch;
  for (auto const & range : ranges)
  {
    HPR_ASSERT(range.end < m_resourceSize);
    auto first = response.body.begin() + range.start;
    batch.emplace_back(range.blockIndex, BlockData(first, first + range.length()));
  }
  m_cache.insert(std::move(batch));
}

void RangeFetcher::checkPartSize(size_t actualSize, ByteRange const & range)
{
  if (actualSize < range.length())
    ThrowReaderError(ErrorCode::FetchFailed,
      "Short read for range " + RangeString(range) + ": " + std::to_string(actualSize) + " bytes");
  if (actualSize > range.length())
    ThrowReaderError(ErrorCode::ParseFailed,
      "Too long part for range " + RangeString(range) + ": " + std::to_string(actualSize) + " bytes");
}

void RangeFetcher::checkContentRange(std::string const & header, ByteRange const & range)
{
  ContentRange received = ParseContentRange(header);
  if (received.start != range.start || received.end != range.end)
    ThrowReaderError(ErrorCode::ParseFailed,
      "Content-Range '" + header + "' doesn't match requested range " + RangeString(range));
}

}
