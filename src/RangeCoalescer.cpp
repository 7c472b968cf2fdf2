#include "RangeCoalescer.hpp"
#include <algorithm>
#include <stdexcept>
#include "BlockCache.hpp"
#include "util/Assert.hpp"
#include "util/CeilDiv.hpp"

namespace hpr
{

RangeCoalescer::RangeCoalescer(uint64_t resourceSize, size_t blockSize)
  : m_resourceSize(resourceSize)
  , m_blockSize(blockSize)
{
  if (blockSize == 0)
    throw std::invalid_argument("Block size must be positive");
}

std::pair<BlockIndex, BlockIndex> RangeCoalescer::coveringBlocks(uint64_t position, size_t size) const
{
  BlockIndex first = position / m_blockSize;
  if (size == 0)
    return std::make_pair(first, first);
  return std::make_pair(first, util::CeilDiv(position + size, uint64_t(m_blockSize)));
}

ByteRange RangeCoalescer::blockRange(BlockIndex blockIndex) const
{
  uint64_t start = blockIndex * m_blockSize;
  HPR_ASSERT(start < m_resourceSize);
  ByteRange range;
  range.blockIndex = blockIndex;
  range.start = start;
  range.end = std::min(start + m_blockSize - 1, m_resourceSize - 1);
  return range;
}

ByteRanges RangeCoalescer::missingRanges(uint64_t position, size_t size, BlockCache const & cache) const
{
  auto blocks = coveringBlocks(position, size);
  ByteRanges ranges;
  for (BlockIndex blockIndex : cache.missingBlocks(blocks.first, blocks.second))
    ranges.push_back(blockRange(blockIndex));
  return ranges;
}

std::string FormatRangeHeader(ByteRanges const & ranges)
{
  std::string header("bytes=");
  for (size_t i = 0; i < ranges.size(); ++i)
  {
    if (i > 0)
      header += ',';
    header += std::to_string(ranges[i].start);
    header += '-';
    header += std::to_string(ranges[i].end);
  }
  return header;
}

}
