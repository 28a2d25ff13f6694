#include "core/random_fs.hpp"
#include <chrono>
#include <filesystem>
#include <iterator>
#include <stdexcept>
#include <boost/log/trivial.hpp>

namespace randomfs::core {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

RandomFS::RandomFS(store::ContentStore& content_store, const Options& options)
  : content_store_(content_store)
  , cache_(options.cache_size, options.eviction) {
  BOOST_LOG_TRIVIAL(info) << "RandomFS: Initializing with " << content_store_.describe()
                          << ", cache " << options.cache_size << " bytes";

  content_store_.check_connection();

  BOOST_LOG_TRIVIAL(info) << "RandomFS: Initialization complete";
}


//==============================================
// FILE OPERATIONS
//==============================================

codec::Locator RandomFS::store_file(const std::string& filename, const codec::Bytes& payload,
                                    const std::string& content_type) {
  std::string base_name = std::filesystem::path(filename).filename().string();
  if (base_name.empty() || base_name == "." || base_name == "..") {
    BOOST_LOG_TRIVIAL(error) << "RandomFS: Cannot derive a file name from '" << filename << "'";
    throw std::invalid_argument("RandomFS: no file name in '" + filename + "'");
  }

  BOOST_LOG_TRIVIAL(info) << "RandomFS: Storing file " << base_name << " (" << payload.size() << " bytes)";

  const std::size_t block_size = codec::BlockCodec::select_block_size(payload.size());
  const auto chunks = codec::BlockCodec::chunk(payload, block_size);
  BOOST_LOG_TRIVIAL(debug) << "RandomFS: Using block size " << block_size << " for " << chunks.size() << " chunks";

  Representation rep;
  rep.filename = base_name;
  rep.file_size = payload.size();
  rep.block_size = block_size;
  rep.content_type = content_type.empty() ? DEFAULT_CONTENT_TYPE : content_type;
  rep.block_ids.reserve(chunks.size());
  rep.pad_ids.reserve(chunks.size());

  // Order of block_ids is the reconstruction order
  for (std::size_t i = 0; i < chunks.size(); ++i) {
    codec::MaskedBlock masked = codec::BlockCodec::mask(chunks[i], block_size);
    rep.block_ids.push_back(store_block(std::move(masked.data)));
    rep.pad_ids.push_back(store_block(std::move(masked.pad)));
    BOOST_LOG_TRIVIAL(trace) << "RandomFS: Block " << i << " stored as " << rep.block_ids.back();
  }

  rep.created_at = std::chrono::duration_cast<std::chrono::seconds>(
                     std::chrono::system_clock::now().time_since_epoch()).count();

  const std::string rep_id = content_store_.put(rep.serialize());

  stats_.record_store(chunks.size(), payload.size());

  codec::Locator locator;
  locator.scheme = codec::LocatorCodec::SCHEME;
  locator.host = codec::LocatorCodec::HOST;
  locator.version = rep.format_version;
  locator.file_size = rep.file_size;
  locator.file_name = rep.filename;
  locator.timestamp = rep.created_at;
  locator.representation_id = rep_id;

  BOOST_LOG_TRIVIAL(info) << "RandomFS: Stored file " << base_name << " (" << payload.size() << " bytes) with "
                          << chunks.size() << " blocks, representation " << rep_id;
  return locator;
}

codec::Locator RandomFS::store_file(const std::string& filename, std::istream& input,
                                    const std::string& content_type) {
  if (!input.good()) {
    BOOST_LOG_TRIVIAL(error) << "RandomFS: Invalid input stream for file: " << filename;
    throw std::invalid_argument("RandomFS: invalid input stream");
  }

  codec::Bytes payload((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
  if (input.bad()) {
    BOOST_LOG_TRIVIAL(error) << "RandomFS: Failed reading input stream for file: " << filename;
    throw std::runtime_error("RandomFS: failed to read input stream");
  }
  return store_file(filename, payload, content_type);
}

RetrievedFile RandomFS::retrieve_file(const std::string& representation_id) {
  BOOST_LOG_TRIVIAL(info) << "RandomFS: Retrieving representation " << representation_id;

  // Store errors on the record itself reach the caller untouched
  codec::Bytes record = content_store_.get(representation_id);

  RetrievedFile file;
  file.representation = Representation::deserialize(record);
  const Representation& rep = file.representation;

  for (std::size_t i = 0; i < rep.block_ids.size(); ++i) {
    codec::MaskedBlock masked;
    try {
      masked.data = fetch_block(rep.block_ids[i]);
      masked.pad = fetch_block(rep.pad_ids[i]);
    } catch (const RandomFSError& e) {
      BOOST_LOG_TRIVIAL(error) << "RandomFS: Failed to retrieve block " << i << ": " << e.what();
      throw ReconstructionFailed("block " + std::to_string(i) + " of " + representation_id + ": " + e.what());
    }

    // Full block for all but the last; the last carries what is left
    const std::size_t length = (i + 1 < rep.block_ids.size())
                                 ? rep.block_size
                                 : static_cast<std::size_t>(rep.file_size - file.payload.size());
    codec::Bytes chunk = codec::BlockCodec::unmask(masked, length);
    file.payload.insert(file.payload.end(), chunk.begin(), chunk.end());
  }

  if (file.payload.size() != rep.file_size) {
    throw ReconstructionFailed("rebuilt " + std::to_string(file.payload.size()) + " of "
                               + std::to_string(rep.file_size) + " bytes");
  }

  BOOST_LOG_TRIVIAL(info) << "RandomFS: Retrieved file " << rep.filename << " (" << rep.file_size
                          << " bytes) from " << rep.block_ids.size() << " blocks";
  return file;
}

RetrievedFile RandomFS::retrieve_locator(const codec::Locator& locator) {
  return retrieve_file(locator.representation_id);
}


//==============================================
// QUERY OPERATIONS
//==============================================

codec::Locator RandomFS::parse_locator(const std::string& raw) {
  return codec::LocatorCodec::parse(raw);
}

Stats RandomFS::get_stats() const {
  Stats stats;
  stats.files_stored = stats_.files_stored();
  stats.blocks_generated = stats_.blocks_generated();
  stats.total_size = stats_.total_size();
  stats.cache_hits = cache_.hits();
  stats.cache_misses = cache_.misses();
  return stats;
}


//==============================================
// BLOCK I/O
//==============================================

std::string RandomFS::store_block(codec::Bytes block) {
  std::string id = content_store_.put(block);
  cache_.put(id, std::move(block));
  return id;
}

codec::Bytes RandomFS::fetch_block(const std::string& id) {
  if (auto cached = cache_.get(id)) {
    return std::move(*cached);
  }

  codec::Bytes block = content_store_.get(id);
  cache_.put(id, block);
  return block;
}

} // namespace randomfs::core
