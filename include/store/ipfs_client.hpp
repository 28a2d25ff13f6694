#ifndef RANDOMFS_IPFS_CLIENT_HPP
#define RANDOMFS_IPFS_CLIENT_HPP

#include <string>
#include "store/content_store.hpp"

namespace randomfs::store {

// ContentStore backed by the HTTP API of an IPFS daemon. Every call opens its
// own connection, so one client may be shared between threads.
class IpfsClient : public ContentStore {
public:
  static constexpr const char* DEFAULT_ENDPOINT = "http://localhost:5001";

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Accepts http://host[:port][/prefix]; throws ConfigurationError otherwise
  explicit IpfsClient(const std::string& endpoint = DEFAULT_ENDPOINT);


  // ---- CONTENT STORE OPERATIONS ----
  // POST /api/v0/add, returns the Hash of the reply
  std::string put(const codec::Bytes& data) override;
  // POST /api/v0/cat?arg=<id>
  codec::Bytes get(const std::string& id) override;
  // POST /api/v0/version
  void check_connection() override;
  std::string describe() const override;


  // ---- GETTERS ----
  const std::string& host() const { return host_; }
  const std::string& port() const { return port_; }

private:
  struct HttpResponse {
    unsigned status = 0;
    std::string body;
  };

  // ---- PARAMETERS ----
  std::string endpoint_;
  std::string host_;
  std::string port_;
  std::string prefix_;


  // ---- HTTP TRANSPORT ----
  // Sends one POST and reads the whole reply. Throws StoreUnavailable on any
  // resolve, connect, write or read failure.
  HttpResponse post(const std::string& target, const std::string& content_type,
                    std::string body) const;


  // ---- UTILITY METHODS ----
  void parse_endpoint(const std::string& endpoint);
  static std::string make_boundary();
  static std::string url_escape(const std::string& value);
  // "Message" member of an API error reply, or the raw body
  static std::string error_message(const std::string& body);
};

} // namespace randomfs::store

#endif // RANDOMFS_IPFS_CLIENT_HPP
