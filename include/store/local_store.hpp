#pragma once

#include <string>
#include <filesystem>
#include <mutex>
#include "store/content_store.hpp"

namespace randomfs {
namespace store {

// Content store kept on the local filesystem, addressed by SHA-256 of the bytes
class LocalStore : public ContentStore {
public:

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Creates base_path if needed; throws ConfigurationError if it is unusable
  explicit LocalStore(const std::string& base_path);


  // ---- CORE STORAGE OPERATIONS ----
  std::string put(const codec::Bytes& data) override;
  codec::Bytes get(const std::string& id) override;
  void check_connection() override;
  std::string describe() const override;


  // ---- QUERY OPERATIONS ----
  // Checks if an object exists for the given id
  bool has(const std::string& id) const;
  // Returns the size of the stored object in bytes
  std::uintmax_t get_object_size(const std::string& id) const;
  // Removes every stored object
  void clear();

  const std::filesystem::path& base_path() const { return base_path_; }

private:
  // ---- PARAMETERS ----
  // Root path for all stored objects
  std::filesystem::path base_path_;
  // Serializes writers so two puts of the same content do not interleave
  std::mutex write_mutex_;


  // ---- CAS STORAGE SUPPORT ----
  // Generate SHA-256 hex digest of data using OpenSSL EVP
  std::string hash_content(const codec::Bytes& data) const;
  // Creates a directory structure using parts of the hash:
  // {base_path}/{hash[0:2]}/{hash[2:4]}/{hash[4:6]}/{remaining_hash}
  std::filesystem::path get_path_for_hash(const std::string& hash) const;
  // True for 64 lowercase hex characters
  static bool is_valid_id(const std::string& id);


  // ---- UTILITY METHODS ----
  // Ensures directory exists, create if needed
  void check_directory_exists(const std::filesystem::path& path) const;
  // Resolves an id to its path, throws NotFound if the object does not exist
  std::filesystem::path resolve_existing(const std::string& id) const;
};

} // namespace store
} // namespace randomfs
