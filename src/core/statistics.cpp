#include "core/statistics.hpp"
#include <sstream>
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

namespace randomfs::core {

std::string Stats::to_json() const {
  boost::property_tree::ptree tree;
  tree.put("files_stored", files_stored);
  tree.put("blocks_generated", blocks_generated);
  tree.put("total_size", total_size);
  tree.put("cache_hits", cache_hits);
  tree.put("cache_misses", cache_misses);

  std::ostringstream out;
  boost::property_tree::write_json(out, tree, false);
  return out.str();
}

void Statistics::record_store(std::uint64_t block_count, std::uint64_t payload_size) {
  files_stored_++;
  blocks_generated_ += block_count;
  total_size_ += payload_size;
}

} // namespace randomfs::core
