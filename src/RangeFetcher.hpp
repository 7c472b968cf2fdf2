#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include "hpr/IHttpTransport.hpp"
#include "BlockCache.hpp"
#include "MultipartReader.hpp"
#include "RangeCoalescer.hpp"

namespace spdlog
{
class logger;
}

namespace hpr
{

// Downloads block ranges of one resource into the cache
class RangeFetcher
{
public:
  RangeFetcher(IHttpTransport &, std::string const & url, uint64_t resourceSize, BlockCache &);

  // One GET for all ranges, nothing is sent for an empty list.
  // Response parts are matched to 'ranges' by position.
  // Throws ReaderError(FetchFailed, ParseFailed or IncompleteFetch).
  void fetch(ByteRanges const & ranges);

private:
  IHttpTransport & m_transport;
  std::string const m_url;
  uint64_t const m_resourceSize;
  BlockCache & m_cache;
  std::shared_ptr<spdlog::logger> const m_logger;

  void storeMultipart(HttpResponse const &, std::string const & boundary, ByteRanges const &);
  void storeSinglePart(HttpResponse const &, ByteRanges const &);
  void storeWholeResource(HttpResponse const &, ByteRanges const &);

  static void checkPartSize(size_t actualSize, ByteRange const &);
  static void checkContentRange(std::string const & header, ByteRange const &);
};

}
