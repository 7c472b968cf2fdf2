#pragma once

#include <cstdint>
#include <memory>
#include <unordered_map>
#include <vector>
#include <boost/thread/shared_mutex.hpp>
#include "hpr/Common.hpp"

namespace hpr
{

typedef std::vector<char> BlockData;

// Blocks of one resource. Grows monotonically: a block once stored is never
// replaced or removed, so readers may keep a reference to its bytes.
class BlockCache
{
public:
  typedef std::vector<std::pair<BlockIndex, BlockData>> Batch;

  bool contains(BlockIndex) const;
  size_t size() const;

  // Indices of [first, last) which are absent, taken under one shared lock.
  std::vector<BlockIndex> missingBlocks(BlockIndex first, BlockIndex last) const;

  // Returns false if block was already present; stored content is kept then.
  bool insert(BlockIndex, BlockData &&);
  // All blocks of the batch are stored under one exclusive lock.
  void insert(Batch &&);

  // Copies [offsetInBlock, offsetInBlock + size) of the block to 'buffer'.
  // Returns false if the block is absent or shorter than requested.
  bool copy(BlockIndex, size_t offsetInBlock, size_t size, char * buffer) const;

private:
  mutable boost::shared_mutex m_mutex;
  // Blocks are held by pointer so that rehashing doesn't move their bytes
  std::unordered_map<BlockIndex, std::unique_ptr<BlockData const>> m_blocks;
};

}
