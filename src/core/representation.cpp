#include "core/representation.hpp"
#include <algorithm>
#include <sstream>
#include <boost/log/trivial.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

namespace randomfs::core {

namespace pt = boost::property_tree;

//==============================================
// LAYOUT
//==============================================

std::size_t Representation::expected_block_count() const {
  if (block_size == 0) {
    return 0;
  }
  return static_cast<std::size_t>(file_size / block_size + (file_size % block_size != 0 ? 1 : 0));
}

std::size_t Representation::payload_length(std::size_t index) const {
  std::uint64_t offset = static_cast<std::uint64_t>(index) * block_size;
  if (offset >= file_size) {
    return 0;
  }
  return static_cast<std::size_t>(std::min<std::uint64_t>(block_size, file_size - offset));
}

void Representation::validate() const {
  if (format_version != FORMAT_VERSION) {
    throw ReconstructionFailed("unsupported representation version '" + format_version + "'");
  }
  if (block_size != codec::BlockCodec::NANO_BLOCK_SIZE && block_size != codec::BlockCodec::MINI_BLOCK_SIZE
      && block_size != codec::BlockCodec::LARGE_BLOCK_SIZE) {
    throw ReconstructionFailed("representation has an unknown block size " + std::to_string(block_size));
  }
  if (block_ids.size() != expected_block_count()) {
    throw ReconstructionFailed("representation lists " + std::to_string(block_ids.size())
                               + " blocks for " + std::to_string(file_size) + " bytes at block size "
                               + std::to_string(block_size));
  }
  if (pad_ids.size() != block_ids.size()) {
    throw ReconstructionFailed("representation lists " + std::to_string(pad_ids.size())
                               + " pads for " + std::to_string(block_ids.size()) + " blocks");
  }
  for (std::size_t i = 0; i < block_ids.size(); ++i) {
    if (block_ids[i].empty() || pad_ids[i].empty()) {
      throw ReconstructionFailed("empty block id at index " + std::to_string(i));
    }
  }
}


//==============================================
// SERIALIZATION
//==============================================

codec::Bytes Representation::serialize() const {
  pt::ptree tree;
  tree.put("version", format_version);
  tree.put("filename", filename);
  tree.put("filesize", file_size);
  tree.put("block_size", block_size);
  tree.put("timestamp", created_at);
  tree.put("content_type", content_type);

  auto put_ids = [&tree](const char* key, const std::vector<std::string>& ids) {
    pt::ptree list;
    for (const auto& id : ids) {
      pt::ptree item;
      item.put_value(id);
      list.push_back(std::make_pair("", item));
    }
    tree.add_child(key, list);
  };
  put_ids("block_hashes", block_ids);
  put_ids("randomizer_hashes", pad_ids);

  std::ostringstream out;
  pt::write_json(out, tree, false);
  const std::string json = out.str();
  return codec::Bytes(json.begin(), json.end());
}

Representation Representation::deserialize(const codec::Bytes& data) {
  pt::ptree tree;
  try {
    std::istringstream input(std::string(data.begin(), data.end()));
    pt::read_json(input, tree);
  } catch (const pt::json_parser_error& e) {
    BOOST_LOG_TRIVIAL(error) << "Representation: Not valid JSON: " << e.what();
    throw ReconstructionFailed("representation is not valid JSON: " + std::string(e.what()));
  }

  Representation rep;
  try {
    rep.format_version = tree.get<std::string>("version");
    if (rep.format_version != FORMAT_VERSION) {
      BOOST_LOG_TRIVIAL(error) << "Representation: Unsupported version " << rep.format_version;
      throw ReconstructionFailed("unsupported representation version '" + rep.format_version + "'");
    }

    rep.filename = tree.get<std::string>("filename");
    rep.file_size = tree.get<std::uint64_t>("filesize");
    rep.block_size = tree.get<std::size_t>("block_size");
    rep.created_at = tree.get<std::int64_t>("timestamp");
    rep.content_type = tree.get<std::string>("content_type", "");

    for (const auto& item : tree.get_child("block_hashes")) {
      rep.block_ids.push_back(item.second.get_value<std::string>());
    }
    for (const auto& item : tree.get_child("randomizer_hashes")) {
      rep.pad_ids.push_back(item.second.get_value<std::string>());
    }
  } catch (const pt::ptree_error& e) {
    BOOST_LOG_TRIVIAL(error) << "Representation: Missing or bad field: " << e.what();
    throw ReconstructionFailed("representation field: " + std::string(e.what()));
  }

  rep.validate();
  return rep;
}

} // namespace randomfs::core
