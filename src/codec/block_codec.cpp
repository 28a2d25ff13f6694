#include "codec/block_codec.hpp"
#include <openssl/rand.h>
#include <openssl/err.h>
#include <algorithm>
#include <climits>
#include <stdexcept>
#include <string>
#include <boost/log/trivial.hpp>

namespace randomfs::codec {

//==============================================
// BLOCK SIZE POLICY
//==============================================

std::size_t BlockCodec::select_block_size(std::uint64_t file_size) {
  if (file_size <= NANO_THRESHOLD) {
    return NANO_BLOCK_SIZE;
  }
  if (file_size <= MINI_THRESHOLD) {
    return MINI_BLOCK_SIZE;
  }
  return LARGE_BLOCK_SIZE;
}


//==============================================
// CHUNKING
//==============================================

std::vector<Chunk> BlockCodec::chunk(const Bytes& payload, std::size_t block_size) {
  return chunk(payload.data(), payload.size(), block_size);
}

std::vector<Chunk> BlockCodec::chunk(const uint8_t* data, std::size_t size, std::size_t block_size) {
  if (block_size == 0) {
    throw std::invalid_argument("Block codec: block size must be positive");
  }

  std::vector<Chunk> chunks;
  chunks.reserve((size + block_size - 1) / block_size);

  for (std::size_t offset = 0; offset < size; offset += block_size) {
    chunks.push_back(Chunk{data + offset, std::min(block_size, size - offset)});
  }

  BOOST_LOG_TRIVIAL(trace) << "Block codec: Split " << size << " bytes into "
                           << chunks.size() << " chunks of " << block_size;
  return chunks;
}


//==============================================
// MASKING
//==============================================

MaskedBlock BlockCodec::mask(const Chunk& chunk, std::size_t block_size) {
  if (chunk.size > block_size) {
    BOOST_LOG_TRIVIAL(error) << "Block codec: Chunk of " << chunk.size
                             << " bytes does not fit block size " << block_size;
    throw std::invalid_argument("Block codec: chunk larger than block size");
  }

  MaskedBlock block;
  block.pad.resize(block_size);
  fill_random(block.pad.data(), block.pad.size());

  // Tail beyond the chunk stays pure random padding
  block.data.resize(block_size);
  fill_random(block.data.data(), block.data.size());

  for (std::size_t i = 0; i < chunk.size; ++i) {
    block.data[i] = chunk.data[i] ^ block.pad[i];
  }

  return block;
}

Bytes BlockCodec::unmask(const MaskedBlock& block, std::size_t original_length) {
  if (block.data.size() < original_length || block.pad.size() < original_length) {
    BOOST_LOG_TRIVIAL(error) << "Block codec: Cannot recover " << original_length
                             << " bytes from block of " << block.data.size()
                             << " and pad of " << block.pad.size();
    throw ReconstructionFailed("block shorter than expected payload length "
                               + std::to_string(original_length));
  }

  Bytes payload(original_length);
  for (std::size_t i = 0; i < original_length; ++i) {
    payload[i] = block.data[i] ^ block.pad[i];
  }
  return payload;
}

void BlockCodec::fill_random(uint8_t* buffer, std::size_t length) {
  // RAND_bytes takes an int length
  while (length > 0) {
    int step = static_cast<int>(std::min<std::size_t>(length, INT_MAX));
    if (RAND_bytes(buffer, step) != 1) {
      unsigned long code = ERR_get_error();
      char reason[256] = {0};
      ERR_error_string_n(code, reason, sizeof(reason));
      BOOST_LOG_TRIVIAL(error) << "Block codec: Random source failure: " << reason;
      throw EntropyError(reason);
    }
    buffer += step;
    length -= static_cast<std::size_t>(step);
  }
}

} // namespace randomfs::codec
