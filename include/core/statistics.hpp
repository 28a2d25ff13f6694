#ifndef RANDOMFS_STATISTICS_HPP
#define RANDOMFS_STATISTICS_HPP

#include <atomic>
#include <cstdint>
#include <string>

namespace randomfs::core {

// Point-in-time copy of the counters
struct Stats {
  std::uint64_t files_stored = 0;
  std::uint64_t blocks_generated = 0;
  std::uint64_t total_size = 0;
  std::uint64_t cache_hits = 0;
  std::uint64_t cache_misses = 0;

  // {"files_stored":...,"blocks_generated":...,...}
  std::string to_json() const;
};

// Monotonic counters owned by one RandomFS instance
class Statistics {
public:
  // Counts one completed store of payload_size bytes in block_count blocks
  void record_store(std::uint64_t block_count, std::uint64_t payload_size);

  std::uint64_t files_stored() const { return files_stored_.load(); }
  std::uint64_t blocks_generated() const { return blocks_generated_.load(); }
  std::uint64_t total_size() const { return total_size_.load(); }

private:
  std::atomic<std::uint64_t> files_stored_{0};
  std::atomic<std::uint64_t> blocks_generated_{0};
  std::atomic<std::uint64_t> total_size_{0};
};

} // namespace randomfs::core

#endif // RANDOMFS_STATISTICS_HPP
