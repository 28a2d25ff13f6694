#ifndef RANDOMFS_BLOCK_CACHE_HPP
#define RANDOMFS_BLOCK_CACHE_HPP

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include "codec/block_codec.hpp"
#include "cache/eviction_policy.hpp"

namespace randomfs::cache {

class BlockCache {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Throws ConfigurationError if max_size is zero or policy is null
  BlockCache(std::uint64_t max_size, std::unique_ptr<EvictionPolicy> policy);
  explicit BlockCache(std::uint64_t max_size, EvictionKind kind = EvictionKind::LRU);

  BlockCache(const BlockCache&) = delete;
  BlockCache& operator=(const BlockCache&) = delete;


  // ---- CACHE OPERATIONS ----
  // Copy of the cached block, counting a hit or a miss. A miss never fetches.
  std::optional<codec::Bytes> get(const std::string& id);
  // Inserts or overwrites. If the tally then exceeds max_size, entries are
  // evicted until it is at most max_size / 2.
  void put(const std::string& id, codec::Bytes block);


  // ---- QUERY OPERATIONS ----
  bool contains(const std::string& id) const;
  std::uint64_t current_size() const;
  std::uint64_t max_size() const { return max_size_; }
  std::size_t entry_count() const;
  std::uint64_t hits() const { return hits_.load(); }
  std::uint64_t misses() const { return misses_.load(); }
  const char* policy_name() const { return policy_->name(); }

private:
  // ---- PARAMETERS ----
  const std::uint64_t max_size_;
  std::unique_ptr<EvictionPolicy> policy_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, codec::Bytes> blocks_;
  std::uint64_t current_size_ = 0;
  std::atomic<std::uint64_t> hits_{0};
  std::atomic<std::uint64_t> misses_{0};


  // ---- EVICTION ----
  // Caller holds mutex_
  void evict();
};

} // namespace randomfs::cache

#endif // RANDOMFS_BLOCK_CACHE_HPP
