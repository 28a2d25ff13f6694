#include "cache/block_cache.hpp"
#include <boost/log/trivial.hpp>

namespace randomfs::cache {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

BlockCache::BlockCache(std::uint64_t max_size, std::unique_ptr<EvictionPolicy> policy)
  : max_size_(max_size)
  , policy_(std::move(policy)) {
  if (max_size_ == 0) {
    BOOST_LOG_TRIVIAL(error) << "Block cache: Cache size must be positive";
    throw ConfigurationError("cache size must be positive");
  }
  if (!policy_) {
    throw ConfigurationError("cache needs an eviction policy");
  }
  BOOST_LOG_TRIVIAL(info) << "Block cache: Initialized with max size " << max_size_
                          << " bytes, policy " << policy_->name();
}

BlockCache::BlockCache(std::uint64_t max_size, EvictionKind kind)
  : BlockCache(max_size, make_eviction_policy(kind)) {
}


//==============================================
// CACHE OPERATIONS
//==============================================

std::optional<codec::Bytes> BlockCache::get(const std::string& id) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = blocks_.find(id);
  if (it == blocks_.end()) {
    misses_++;
    BOOST_LOG_TRIVIAL(trace) << "Block cache: Miss for " << id;
    return std::nullopt;
  }

  hits_++;
  policy_->record_access(id);
  BOOST_LOG_TRIVIAL(trace) << "Block cache: Hit for " << id;
  return it->second;
}

void BlockCache::put(const std::string& id, codec::Bytes block) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it = blocks_.find(id);
  if (it != blocks_.end()) {
    // Overwrite: drop the old length before adding the new one
    current_size_ -= it->second.size();
    current_size_ += block.size();
    it->second = std::move(block);
  } else {
    current_size_ += block.size();
    blocks_.emplace(id, std::move(block));
  }
  policy_->record_insert(id);

  if (current_size_ > max_size_) {
    evict();
  }
}


//==============================================
// QUERY OPERATIONS
//==============================================

bool BlockCache::contains(const std::string& id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return blocks_.count(id) != 0;
}

std::uint64_t BlockCache::current_size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return current_size_;
}

std::size_t BlockCache::entry_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return blocks_.size();
}


//==============================================
// EVICTION
//==============================================

void BlockCache::evict() {
  const std::uint64_t target = max_size_ / 2;
  const std::uint64_t before = current_size_;
  std::size_t evicted = 0;

  while (current_size_ > target) {
    auto victim = policy_->select_victim();
    if (!victim) {
      break;
    }

    auto it = blocks_.find(*victim);
    if (it != blocks_.end()) {
      current_size_ -= it->second.size();
      blocks_.erase(it);
      ++evicted;
    }
    policy_->record_remove(*victim);
  }

  BOOST_LOG_TRIVIAL(debug) << "Block cache: Evicted " << evicted << " blocks, size "
                           << before << " -> " << current_size_ << " (target " << target << ")";
}

} // namespace randomfs::cache
