#ifndef RANDOMFS_CONTENT_STORE_HPP
#define RANDOMFS_CONTENT_STORE_HPP

#include <string>
#include "codec/block_codec.hpp"
#include "error/randomfs_error.hpp"

namespace randomfs::store {

// Content-addressed object store: put bytes, get an id back; get bytes by id.
// Implementations are called from many threads at once and never retry.
class ContentStore {
public:
  virtual ~ContentStore() = default;

  // Returns the id the store assigned. Throws StoreUnavailable or StoreRejected.
  virtual std::string put(const codec::Bytes& data) = 0;
  // Throws NotFound, StoreUnavailable or StoreRejected
  virtual codec::Bytes get(const std::string& id) = 0;
  // Throws StoreUnavailable if the store cannot serve requests
  virtual void check_connection() = 0;
  // Short description for logs
  virtual std::string describe() const = 0;
};

} // namespace randomfs::store

#endif // RANDOMFS_CONTENT_STORE_HPP
