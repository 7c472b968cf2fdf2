#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "hpr/Common.hpp"

namespace hpr
{

class BlockCache;

struct ByteRange
{
  BlockIndex blockIndex;
  uint64_t start;
  uint64_t end; // inclusive

  uint64_t length() const { return end - start + 1; }

  bool operator==(ByteRange const & rhs) const
  {
    return blockIndex == rhs.blockIndex && start == rhs.start && end == rhs.end;
  }
};

typedef std::vector<ByteRange> ByteRanges;

// Maps reads onto blocks of one resource
class RangeCoalescer
{
public:
  RangeCoalescer(uint64_t resourceSize, size_t blockSize);

  size_t blockSize() const { return m_blockSize; }

  // Blocks fully covering [position, position + size) as [first, last)
  std::pair<BlockIndex, BlockIndex> coveringBlocks(uint64_t position, size_t size) const;

  // Byte range of the block, clipped to the end of resource
  ByteRange blockRange(BlockIndex) const;

  // Ranges of the covering blocks absent in the cache, ascending by block index.
  // Order has to be preserved up to response parsing.
  ByteRanges missingRanges(uint64_t position, size_t size, BlockCache const &) const;

private:
  uint64_t const m_resourceSize;
  size_t const m_blockSize;
};

// "bytes=0-131071,131072-262143"
std::string FormatRangeHeader(ByteRanges const &);

}
