#ifndef RANDOMFS_BLOCK_CODEC_HPP
#define RANDOMFS_BLOCK_CODEC_HPP

#include <cstddef>
#include <cstdint>
#include <vector>
#include "error/randomfs_error.hpp"

namespace randomfs::codec {

using Bytes = std::vector<uint8_t>;

// Read-only view of one slice of a payload
struct Chunk {
  const uint8_t* data = nullptr;
  std::size_t size = 0;
};

// Output of masking one chunk. Both halves are blocks of block_size bytes and
// are stored as separate objects; the pad is single-use and never shared, so
// the scheme hides content but gives no deduplication or deniability.
struct MaskedBlock {
  Bytes data;
  Bytes pad;
};

class BlockCodec {
public:
  // Block sizes per file tier
  static constexpr std::size_t NANO_BLOCK_SIZE = 1024;         // 1 KiB
  static constexpr std::size_t MINI_BLOCK_SIZE = 64 * 1024;    // 64 KiB
  static constexpr std::size_t LARGE_BLOCK_SIZE = 1024 * 1024; // 1 MiB

  // Tier boundaries, inclusive: a file of exactly NANO_THRESHOLD bytes is nano
  static constexpr std::uint64_t NANO_THRESHOLD = 100 * 1024;
  static constexpr std::uint64_t MINI_THRESHOLD = 10 * 1024 * 1024;


  // ---- BLOCK SIZE POLICY ----
  static std::size_t select_block_size(std::uint64_t file_size);


  // ---- CHUNKING ----
  // Splits payload into consecutive block_size slices, the last possibly shorter
  static std::vector<Chunk> chunk(const Bytes& payload, std::size_t block_size);
  static std::vector<Chunk> chunk(const uint8_t* data, std::size_t size, std::size_t block_size);


  // ---- MASKING ----
  // XORs chunk with block_size fresh random bytes; throws EntropyError when
  // the random source fails
  static MaskedBlock mask(const Chunk& chunk, std::size_t block_size);
  // Recovers the first original_length bytes; throws ReconstructionFailed if
  // either half is too short
  static Bytes unmask(const MaskedBlock& block, std::size_t original_length);

private:
  // Fills buffer from the OpenSSL CSPRNG
  static void fill_random(uint8_t* buffer, std::size_t length);
};

} // namespace randomfs::codec

#endif // RANDOMFS_BLOCK_CODEC_HPP
