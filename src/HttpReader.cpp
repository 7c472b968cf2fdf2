#include "hpr/HttpReader.hpp"
#include <algorithm>
#include <stdexcept>
#include <spdlog/spdlog.h>
#include "hpr/Logger.hpp"
#include "BlockCache.hpp"
#include "RangeCoalescer.hpp"
#include "RangeFetcher.hpp"
#include "SizeProbe.hpp"
#include "util/Assert.hpp"

namespace hpr
{

struct HttpReader::Impl
{
  Impl(std::string const & url, std::shared_ptr<IHttpTransport> const & transport, ReaderOptions const & options)
    : m_url(url)
    , m_transport(transport)
    , m_size(ProbeResourceSize(*transport, url))
    , m_coalescer(m_size, options.blockSize)
    , m_fetcher(*transport, url, m_size, m_cache)
    , m_logger(logger())
  {}

  std::string const m_url;
  std::shared_ptr<IHttpTransport> const m_transport;
  uint64_t const m_size;
  RangeCoalescer const m_coalescer;
  BlockCache m_cache;
  RangeFetcher m_fetcher;
  std::shared_ptr<spdlog::logger> const m_logger;

  void copyToBuffer(uint64_t position, size_t size, char * buffer) const;
};

void HttpReader::Impl::copyToBuffer(uint64_t position, size_t size, char * buffer) const
{
  // RangeFetcher either stores every requested range or throws, so MissingBlock here means
  // a broken fetcher or transport contract. Blocks are never removed, so buffer is touched
  // only when all of them are present.
  auto blocks = m_coalescer.coveringBlocks(position, size);
  std::vector<BlockIndex> missing = m_cache.missingBlocks(blocks.first, blocks.second);
  if (!missing.empty())
    ThrowReaderError(ErrorCode::MissingBlock,
      "Block " + std::to_string(missing.front()) + " of " + m_url + " is missing after fetch");

  size_t const blockSize = m_coalescer.blockSize();
  BlockIndex blockIndex = blocks.first;
  size_t offsetInBlock = position % blockSize;
  size_t copied = 0;
  while (copied < size)
  {
    size_t chunkSize = std::min(size - copied, blockSize - offsetInBlock);
    if (!m_cache.copy(blockIndex, offsetInBlock, chunkSize, buffer + copied))
      ThrowReaderError(ErrorCode::MissingBlock,
        "Block " + std::to_string(blockIndex) + " of " + m_url + " is shorter than expected");
    copied += chunkSize;
    ++blockIndex;
    offsetInBlock = 0;
  }
}

HttpReader::HttpReader(std::string const & url, std::shared_ptr<IHttpTransport> const & transport,
  ReaderOptions const & options)
  : m_impl(nullptr)
{
  if (!transport)
    throw std::invalid_argument("HTTP transport is required");
  if (options.blockSize == 0)
    throw std::invalid_argument("Block size must be positive");
  m_impl = new Impl(url, transport, options);
}

HttpReader::~HttpReader()
{
  delete m_impl;
}

uint64_t HttpReader::size() const
{
  return m_impl->m_size;
}

size_t HttpReader::read(uint64_t position, size_t size, void * buffer) const
{
  if (size == 0)
    return 0;
  if (!buffer)
    throw std::invalid_argument("Null buffer passed to HttpReader::read");
  if (position >= m_impl->m_size)
    return 0;
  size = static_cast<size_t>(std::min(uint64_t(size), m_impl->m_size - position));

  ByteRanges ranges = m_impl->m_coalescer.missingRanges(position, size, m_impl->m_cache);
  if (ranges.empty())
    m_impl->m_logger->trace("Read {}+{} of {} served from cache", position, size, m_impl->m_url);
  // No lock is held here, concurrent reads may fetch the same block
  m_impl->m_fetcher.fetch(ranges);

  m_impl->copyToBuffer(position, size, static_cast<char *>(buffer));
  return size;
}

std::string const & HttpReader::url() const
{
  return m_impl->m_url;
}

size_t HttpReader::blockSize() const
{
  return m_impl->m_coalescer.blockSize();
}

size_t HttpReader::cachedBlocksCount() const
{
  return m_impl->m_cache.size();
}

std::unique_ptr<IReader> OpenHttpReader(const char * url, ReaderOptions const & options)
{
  return std::unique_ptr<IReader>(new HttpReader(url, CreateCurlTransport(options), options));
}

}
