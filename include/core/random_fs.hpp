#ifndef RANDOMFS_RANDOM_FS_HPP
#define RANDOMFS_RANDOM_FS_HPP

#include <cstdint>
#include <istream>
#include <string>
#include "cache/block_cache.hpp"
#include "codec/block_codec.hpp"
#include "codec/locator.hpp"
#include "core/representation.hpp"
#include "core/statistics.hpp"
#include "store/content_store.hpp"

namespace randomfs::core {

struct Options {
  static constexpr std::uint64_t DEFAULT_CACHE_SIZE = 500ull * 1024 * 1024;

  std::uint64_t cache_size = DEFAULT_CACHE_SIZE;
  cache::EvictionKind eviction = cache::EvictionKind::LRU;
};

struct RetrievedFile {
  codec::Bytes payload;
  Representation representation;
};

// Splits files into masked blocks, keeps them in the content store and
// rebuilds them from their representation. Safe to share between threads:
// the cache and the counters carry their own synchronization, block I/O runs
// unlocked.
class RandomFS {
public:
  static constexpr const char* DEFAULT_CONTENT_TYPE = "application/octet-stream";

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Checks the store connection (StoreUnavailable) and the cache size
  // (ConfigurationError). content_store must outlive this instance.
  explicit RandomFS(store::ContentStore& content_store, const Options& options = Options());

  RandomFS(const RandomFS&) = delete;
  RandomFS& operator=(const RandomFS&) = delete;


  // ---- FILE OPERATIONS ----
  // Masks and stores payload, then its representation; returns the locator.
  // Blocks stored before a failure are left in the content store.
  codec::Locator store_file(const std::string& filename, const codec::Bytes& payload,
                            const std::string& content_type);
  codec::Locator store_file(const std::string& filename, std::istream& input,
                            const std::string& content_type);
  // Failures fetching the representation propagate unchanged; anything wrong
  // with the record or its blocks is ReconstructionFailed
  RetrievedFile retrieve_file(const std::string& representation_id);
  RetrievedFile retrieve_locator(const codec::Locator& locator);


  // ---- QUERY OPERATIONS ----
  static codec::Locator parse_locator(const std::string& raw);
  Stats get_stats() const;
  const cache::BlockCache& block_cache() const { return cache_; }

private:
  // ---- PARAMETERS ----
  store::ContentStore& content_store_;
  cache::BlockCache cache_;
  Statistics stats_;


  // ---- BLOCK I/O ----
  // Stores one block and caches it under the returned id
  std::string store_block(codec::Bytes block);
  // Cache first, then the content store; a store hit populates the cache
  codec::Bytes fetch_block(const std::string& id);
};

} // namespace randomfs::core

#endif // RANDOMFS_RANDOM_FS_HPP
