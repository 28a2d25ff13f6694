#include "store/local_store.hpp"
#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>
#include <openssl/evp.h>
#include <boost/log/trivial.hpp>

namespace randomfs {
namespace store {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

// Initialize store with base directory path and ensure it exists
LocalStore::LocalStore(const std::string& base_path) : base_path_(base_path) {
  BOOST_LOG_TRIVIAL(info) << "Local store: Initializing with base path: " << base_path;
  if (base_path.empty()) {
    throw ConfigurationError("Local store: empty data directory");
  }
  try {
    check_directory_exists(base_path_);
  } catch (const std::filesystem::filesystem_error& e) {
    BOOST_LOG_TRIVIAL(error) << "Local store: Cannot create data directory: " << e.what();
    throw ConfigurationError("Local store: cannot create data directory " + base_path + ": " + e.what());
  }
  if (!std::filesystem::is_directory(base_path_)) {
    BOOST_LOG_TRIVIAL(error) << "Local store: Data path is not a directory: " << base_path;
    throw ConfigurationError("Local store: " + base_path + " is not a directory");
  }
  BOOST_LOG_TRIVIAL(debug) << "Local store: Directory created/verified at: " << base_path;
}


//==============================================
// CORE STORAGE OPERATIONS
//==============================================

std::string LocalStore::put(const codec::Bytes& data) {
  std::string hash = hash_content(data);
  std::filesystem::path file_path = get_path_for_hash(hash);
  BOOST_LOG_TRIVIAL(debug) << "Local store: Storing " << data.size() << " bytes as " << hash;

  std::lock_guard<std::mutex> lock(write_mutex_);

  // Same content, same id: nothing left to write
  if (std::filesystem::exists(file_path)) {
    BOOST_LOG_TRIVIAL(trace) << "Local store: Object already present: " << hash;
    return hash;
  }

  try {
    check_directory_exists(file_path.parent_path());
  } catch (const std::filesystem::filesystem_error& e) {
    BOOST_LOG_TRIVIAL(error) << "Local store: Failed to create directory: " << e.what();
    throw StoreUnavailable("Local store: " + std::string(e.what()));
  }

  // Write beside the target and rename so readers never see a partial object
  std::filesystem::path tmp_path = file_path;
  tmp_path += ".tmp";

  std::ofstream file(tmp_path, std::ios::binary | std::ios::trunc);
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "Local store: Failed to create file: " << tmp_path.string();
    throw StoreUnavailable("Local store: failed to create file " + tmp_path.string());
  }
  file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
  file.close();
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "Local store: Failed to write file: " << tmp_path.string();
    std::error_code ignored;
    std::filesystem::remove(tmp_path, ignored);
    throw StoreUnavailable("Local store: failed to write file " + tmp_path.string());
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, file_path, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Local store: Failed to commit object " << hash << ": " << ec.message();
    throw StoreUnavailable("Local store: failed to commit object: " + ec.message());
  }

  BOOST_LOG_TRIVIAL(debug) << "Local store: Successfully stored " << data.size() << " bytes as " << hash;
  return hash;
}

codec::Bytes LocalStore::get(const std::string& id) {
  BOOST_LOG_TRIVIAL(debug) << "Local store: Retrieving object: " << id;

  std::filesystem::path file_path = resolve_existing(id);

  std::ifstream file(file_path, std::ios::binary);
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "Local store: Failed to open file: " << file_path.string();
    throw StoreUnavailable("Local store: failed to open file " + file_path.string());
  }

  codec::Bytes data(static_cast<std::size_t>(std::filesystem::file_size(file_path)));
  if (!data.empty() && !file.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(data.size()))) {
    BOOST_LOG_TRIVIAL(error) << "Local store: Short read on " << file_path.string();
    throw StoreUnavailable("Local store: failed to read file " + file_path.string());
  }

  BOOST_LOG_TRIVIAL(debug) << "Local store: Successfully read " << data.size() << " bytes for: " << id;
  return data;
}

void LocalStore::check_connection() {
  if (!std::filesystem::is_directory(base_path_)) {
    BOOST_LOG_TRIVIAL(error) << "Local store: Data directory vanished: " << base_path_.string();
    throw StoreUnavailable("Local store: data directory " + base_path_.string() + " is missing");
  }
}

std::string LocalStore::describe() const {
  return "local:" + base_path_.string();
}


//==============================================
// QUERY OPERATIONS
//==============================================

bool LocalStore::has(const std::string& id) const {
  if (!is_valid_id(id)) {
    return false;
  }
  bool exists = std::filesystem::exists(get_path_for_hash(id));
  BOOST_LOG_TRIVIAL(trace) << "Local store: Object " << id << (exists ? " exists" : " not found");
  return exists;
}

std::uintmax_t LocalStore::get_object_size(const std::string& id) const {
  return std::filesystem::file_size(resolve_existing(id));
}

void LocalStore::clear() {
  BOOST_LOG_TRIVIAL(info) << "Local store: Clearing entire store at: " << base_path_;
  std::lock_guard<std::mutex> lock(write_mutex_);
  std::filesystem::remove_all(base_path_);
  check_directory_exists(base_path_);
}


//==============================================
// CAS STORAGE SUPPORT
//==============================================

std::string LocalStore::hash_content(const codec::Bytes& data) const {
  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len;

  // Create a new message digest context for the hashing operation
  EVP_MD_CTX* ctx = EVP_MD_CTX_new();
  if (!ctx) {
    throw StoreUnavailable("Local store: failed to create hash context");
  }

  if (!EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr)
      || !EVP_DigestUpdate(ctx, data.data(), data.size())
      || !EVP_DigestFinal_ex(ctx, hash, &hash_len)) {
    EVP_MD_CTX_free(ctx);
    throw StoreUnavailable("Local store: failed to hash content");
  }

  EVP_MD_CTX_free(ctx);

  // Convert the raw hash bytes to a hexadecimal string
  std::stringstream ss;
  for (unsigned int i = 0; i < hash_len; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0')
       << static_cast<int>(hash[i]);
  }
  return ss.str();
}

std::filesystem::path LocalStore::get_path_for_hash(const std::string& hash) const {
  std::filesystem::path path = base_path_;

  for (size_t i = 0; i < 6; i += 2) {
    path /= hash.substr(i, 2);
  }

  path /= hash.substr(6);
  return path;
}

bool LocalStore::is_valid_id(const std::string& id) {
  if (id.size() != 2 * 32) {
    return false;
  }
  for (char c : id) {
    if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) {
      return false;
    }
  }
  return true;
}


//==============================================
// UTILITY METHODS
//==============================================

void LocalStore::check_directory_exists(const std::filesystem::path& path) const {
  if (!std::filesystem::exists(path)) {
    std::filesystem::create_directories(path);
  }
}

std::filesystem::path LocalStore::resolve_existing(const std::string& id) const {
  // Anything that is not a digest cannot name an object and must not reach the filesystem
  if (!is_valid_id(id)) {
    BOOST_LOG_TRIVIAL(debug) << "Local store: Rejecting malformed id: " << id;
    throw NotFound("Local store: no object " + id);
  }
  std::filesystem::path file_path = get_path_for_hash(id);
  if (!std::filesystem::exists(file_path)) {
    BOOST_LOG_TRIVIAL(debug) << "Local store: Object not found: " << file_path.string();
    throw NotFound("Local store: no object " + id);
  }
  return file_path;
}

} // namespace store
} // namespace randomfs
