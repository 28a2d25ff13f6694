#ifndef RANDOMFS_REPRESENTATION_HPP
#define RANDOMFS_REPRESENTATION_HPP

#include <cstdint>
#include <string>
#include <vector>
#include "codec/block_codec.hpp"
#include "error/randomfs_error.hpp"

namespace randomfs::core {

// Manifest needed to rebuild one stored file from its blocks
struct Representation {
  static constexpr const char* FORMAT_VERSION = "v4";

  std::string filename;
  std::uint64_t file_size = 0;
  // Masked data blocks and their pads, both in file order
  std::vector<std::string> block_ids;
  std::vector<std::string> pad_ids;
  std::size_t block_size = 0;
  std::int64_t created_at = 0;
  std::string content_type;
  std::string format_version = FORMAT_VERSION;


  // ---- LAYOUT ----
  // ceil(file_size / block_size)
  std::size_t expected_block_count() const;
  // Payload bytes carried by block index: block_size for all but the last
  std::size_t payload_length(std::size_t index) const;
  // Throws ReconstructionFailed if the fields do not describe a rebuildable file
  void validate() const;


  // ---- SERIALIZATION ----
  // Self-describing JSON with field names. Numbers are written as JSON
  // strings and an empty id list as "", so readers outside this codebase must
  // accept both; deserialize reads strings and numbers alike.
  codec::Bytes serialize() const;
  // Checks the version before anything else; throws ReconstructionFailed
  static Representation deserialize(const codec::Bytes& data);
};

} // namespace randomfs::core

#endif // RANDOMFS_REPRESENTATION_HPP
