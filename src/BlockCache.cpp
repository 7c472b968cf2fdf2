#include "BlockCache.hpp"
#include <algorithm>
#include <boost/thread/locks.hpp>

namespace hpr
{

bool BlockCache::contains(BlockIndex blockIndex) const
{
  boost::shared_lock<boost::shared_mutex> lock(m_mutex);
  return m_blocks.count(blockIndex) != 0;
}

size_t BlockCache::size() const
{
  boost::shared_lock<boost::shared_mutex> lock(m_mutex);
  return m_blocks.size();
}

std::vector<BlockIndex> BlockCache::missingBlocks(BlockIndex first, BlockIndex last) const
{
  std::vector<BlockIndex> result;
  boost::shared_lock<boost::shared_mutex> lock(m_mutex);
  for (BlockIndex blockIndex = first; blockIndex < last; ++blockIndex)
    if (m_blocks.count(blockIndex) == 0)
      result.push_back(blockIndex);
  return result;
}

bool BlockCache::insert(BlockIndex blockIndex, BlockData && data)
{
  std::unique_ptr<BlockData const> block(new BlockData(std::move(data)));
  boost::unique_lock<boost::shared_mutex> lock(m_mutex);
  return m_blocks.emplace(blockIndex, std::move(block)).second;
}

void BlockCache::insert(Batch && batch)
{
  std::vector<std::pair<BlockIndex, std::unique_ptr<BlockData const>>> blocks;
  blocks.reserve(batch.size());
  for (auto & item : batch)
    blocks.emplace_back(item.first, std::unique_ptr<BlockData const>(new BlockData(std::move(item.second))));
  batch.clear();

  boost::unique_lock<boost::shared_mutex> lock(m_mutex);
  for (auto & item : blocks)
    m_blocks.emplace(item.first, std::move(item.second));
}

bool BlockCache::copy(BlockIndex blockIndex, size_t offsetInBlock, size_t size, char * buffer) const
{
  boost::shared_lock<boost::shared_mutex> lock(m_mutex);
  auto it = m_blocks.find(blockIndex);
  if (it == m_blocks.end())
    return false;
  BlockData const & block = *it->second;
  if (offsetInBlock > block.size() || size > block.size() - offsetInBlock)
    return false;
  std::copy_n(block.data() + offsetInBlock, size, buffer);
  return true;
}

}
