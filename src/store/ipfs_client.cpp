#include "store/ipfs_client.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <random>
#include <sstream>
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/log/trivial.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

namespace randomfs::store {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace pt = boost::property_tree;
using tcp = net::ip::tcp;

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

IpfsClient::IpfsClient(const std::string& endpoint) : endpoint_(endpoint) {
  parse_endpoint(endpoint);
  BOOST_LOG_TRIVIAL(info) << "IPFS client: Using API at " << host_ << ":" << port_ << prefix_;
}


//==============================================
// CONTENT STORE OPERATIONS
//==============================================

std::string IpfsClient::put(const codec::Bytes& data) {
  BOOST_LOG_TRIVIAL(debug) << "IPFS client: Adding " << data.size() << " bytes";

  const std::string boundary = make_boundary();
  std::string body;
  body.reserve(data.size() + 256);
  body += "--" + boundary + "\r\n";
  body += "Content-Disposition: form-data; name=\"file\"; filename=\"data\"\r\n";
  body += "Content-Type: application/octet-stream\r\n\r\n";
  body.append(reinterpret_cast<const char*>(data.data()), data.size());
  body += "\r\n--" + boundary + "--\r\n";

  HttpResponse response = post("/api/v0/add", "multipart/form-data; boundary=" + boundary,
                               std::move(body));
  if (response.status != 200) {
    BOOST_LOG_TRIVIAL(error) << "IPFS client: Add failed with status " << response.status;
    throw StoreRejected("IPFS add failed with status " + std::to_string(response.status)
                        + ": " + error_message(response.body));
  }

  // One JSON object per added entry; a single file yields one line
  std::string first_line = response.body.substr(0, response.body.find('\n'));
  try {
    pt::ptree reply;
    std::istringstream input(first_line);
    pt::read_json(input, reply);
    std::string hash = reply.get<std::string>("Hash");
    if (hash.empty()) {
      throw StoreRejected("IPFS add reply carries an empty Hash");
    }
    BOOST_LOG_TRIVIAL(debug) << "IPFS client: Added " << data.size() << " bytes as " << hash;
    return hash;
  } catch (const pt::ptree_error& e) {
    BOOST_LOG_TRIVIAL(error) << "IPFS client: Unreadable add reply: " << e.what();
    throw StoreRejected("IPFS add reply is not understood: " + std::string(e.what()));
  }
}

codec::Bytes IpfsClient::get(const std::string& id) {
  BOOST_LOG_TRIVIAL(debug) << "IPFS client: Fetching " << id;

  HttpResponse response = post("/api/v0/cat?arg=" + url_escape(id), "", "");
  if (response.status == 200) {
    BOOST_LOG_TRIVIAL(debug) << "IPFS client: Fetched " << response.body.size() << " bytes for " << id;
    return codec::Bytes(response.body.begin(), response.body.end());
  }

  std::string message = error_message(response.body);
  std::string lowered = message;
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  // The daemon answers 500 with a message for absent or unparsable ids
  if (response.status == 404
      || (response.status == 500 && (lowered.find("not found") != std::string::npos
                                     || lowered.find("invalid") != std::string::npos))) {
    BOOST_LOG_TRIVIAL(info) << "IPFS client: No object " << id << ": " << message;
    throw NotFound("IPFS has no object " + id + ": " + message);
  }

  BOOST_LOG_TRIVIAL(error) << "IPFS client: Cat failed with status " << response.status;
  throw StoreRejected("IPFS cat failed with status " + std::to_string(response.status)
                      + ": " + message);
}

void IpfsClient::check_connection() {
  HttpResponse response = post("/api/v0/version", "", "");
  if (response.status != 200) {
    BOOST_LOG_TRIVIAL(error) << "IPFS client: Daemon not accessible, status " << response.status;
    throw StoreUnavailable("IPFS daemon not accessible, status " + std::to_string(response.status));
  }
  BOOST_LOG_TRIVIAL(info) << "IPFS client: Daemon reachable at " << endpoint_;
}

std::string IpfsClient::describe() const {
  return "ipfs:" + endpoint_;
}


//==============================================
// HTTP TRANSPORT
//==============================================

IpfsClient::HttpResponse IpfsClient::post(const std::string& target, const std::string& content_type,
                                          std::string body) const {
  try {
    net::io_context ioc;
    tcp::resolver resolver(ioc);
    beast::tcp_stream stream(ioc);

    stream.connect(resolver.resolve(host_, port_));

    http::request<http::string_body> request{http::verb::post, prefix_ + target, 11};
    request.set(http::field::host, host_);
    request.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    if (!content_type.empty()) {
      request.set(http::field::content_type, content_type);
    }
    request.body() = std::move(body);
    request.prepare_payload();

    http::write(stream, request);

    beast::flat_buffer buffer;
    http::response_parser<http::string_body> parser;
    parser.body_limit(boost::none);
    http::read(stream, buffer, parser);

    // Peer may already have closed its side
    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);

    HttpResponse response;
    response.status = parser.get().result_int();
    response.body = std::move(parser.get().body());
    BOOST_LOG_TRIVIAL(trace) << "IPFS client: " << target << " -> " << response.status
                             << " (" << response.body.size() << " bytes)";
    return response;
  } catch (const boost::system::system_error& e) {
    BOOST_LOG_TRIVIAL(error) << "IPFS client: Transport failure on " << target << ": " << e.what();
    throw StoreUnavailable("IPFS at " + endpoint_ + ": " + e.what());
  }
}


//==============================================
// UTILITY METHODS
//==============================================

void IpfsClient::parse_endpoint(const std::string& endpoint) {
  const std::string scheme = "http://";
  if (endpoint.compare(0, scheme.size(), scheme) != 0) {
    BOOST_LOG_TRIVIAL(error) << "IPFS client: Unsupported endpoint: " << endpoint;
    throw ConfigurationError("IPFS endpoint must start with http://: " + endpoint);
  }

  std::string rest = endpoint.substr(scheme.size());
  std::size_t slash = rest.find('/');
  std::string authority = rest.substr(0, slash);
  prefix_ = slash == std::string::npos ? "" : rest.substr(slash);
  while (!prefix_.empty() && prefix_.back() == '/') {
    prefix_.pop_back();
  }

  std::size_t colon = authority.rfind(':');
  if (colon == std::string::npos) {
    host_ = authority;
    port_ = "80";
  } else {
    host_ = authority.substr(0, colon);
    port_ = authority.substr(colon + 1);
  }

  if (host_.empty()) {
    throw ConfigurationError("IPFS endpoint has no host: " + endpoint);
  }
  if (port_.empty() || port_.size() > 5 || !std::all_of(port_.begin(), port_.end(), [](char c) { return c >= '0' && c <= '9'; })
      || std::stoul(port_) == 0 || std::stoul(port_) > 65535) {
    throw ConfigurationError("IPFS endpoint has an invalid port: " + endpoint);
  }
}

std::string IpfsClient::make_boundary() {
  std::random_device rd;
  std::mt19937_64 gen(rd());
  std::ostringstream ss;
  ss << "randomfs-" << std::hex << gen() << gen();
  return ss.str();
}

std::string IpfsClient::url_escape(const std::string& value) {
  std::ostringstream escaped;
  escaped << std::hex << std::uppercase;
  for (unsigned char c : value) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
      escaped << static_cast<char>(c);
    } else {
      escaped << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
    }
  }
  return escaped.str();
}

std::string IpfsClient::error_message(const std::string& body) {
  try {
    pt::ptree reply;
    std::istringstream input(body);
    pt::read_json(input, reply);
    return reply.get<std::string>("Message", body);
  } catch (const pt::ptree_error&) {
    return body;
  }
}

} // namespace randomfs::store
