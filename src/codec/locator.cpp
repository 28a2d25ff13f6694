#include "codec/locator.hpp"
#include <openssl/evp.h>
#include <algorithm>
#include <limits>
#include <sstream>
#include <vector>
#include <boost/log/trivial.hpp>

namespace randomfs::codec {

bool Locator::operator==(const Locator& other) const {
  return scheme == other.scheme
      && host == other.host
      && version == other.version
      && file_size == other.file_size
      && file_name == other.file_name
      && timestamp == other.timestamp
      && representation_id == other.representation_id;
}

//==============================================
// SERIALIZATION AND PARSING
//==============================================

std::string LocatorCodec::serialize(const Locator& locator) {
  const std::string scheme = locator.scheme.empty() ? SCHEME : locator.scheme;
  if (scheme != SCHEME) {
    throw MalformedLocator("unsupported scheme '" + scheme + "'");
  }

  // Segments are positional, so a stray separator would shift every field after it
  for (const std::string* field : {&locator.host, &locator.version,
                                   &locator.file_name, &locator.representation_id}) {
    if (field->empty() || field->find('/') != std::string::npos) {
      throw MalformedLocator("field '" + *field + "' cannot be placed in a locator");
    }
  }
  if (locator.timestamp < 0) {
    throw MalformedLocator("negative timestamp");
  }

  std::ostringstream out;
  out << scheme << "://" << locator.host
      << '/' << locator.version
      << '/' << locator.file_size
      << '/' << locator.file_name
      << '/' << locator.timestamp
      << '/' << locator.representation_id;
  return out.str();
}

Locator LocatorCodec::parse(const std::string& raw) {
  BOOST_LOG_TRIVIAL(debug) << "Locator: Parsing " << raw;

  const std::string prefix = std::string(SCHEME) + "://";
  if (!has_scheme(raw)) {
    BOOST_LOG_TRIVIAL(warning) << "Locator: Wrong scheme in " << raw;
    throw MalformedLocator("expected scheme '" + std::string(SCHEME) + "'");
  }

  // Split on '/' keeping empty segments so they can be rejected
  std::vector<std::string> segments;
  std::string rest = raw.substr(prefix.size());
  std::size_t start = 0;
  while (true) {
    std::size_t slash = rest.find('/', start);
    segments.push_back(rest.substr(start, slash - start));
    if (slash == std::string::npos) {
      break;
    }
    start = slash + 1;
  }

  if (segments.size() != SEGMENT_COUNT) {
    BOOST_LOG_TRIVIAL(warning) << "Locator: Expected " << SEGMENT_COUNT << " segments, got "
                               << segments.size();
    throw MalformedLocator("expected " + std::to_string(SEGMENT_COUNT) + " segments, got "
                           + std::to_string(segments.size()));
  }
  for (std::size_t i = 0; i < segments.size(); ++i) {
    if (segments[i].empty()) {
      throw MalformedLocator("empty segment at position " + std::to_string(i));
    }
  }

  std::uint64_t timestamp = parse_unsigned(segments[4], "timestamp");
  if (timestamp > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
    throw MalformedLocator("timestamp out of range");
  }

  Locator locator;
  locator.scheme = SCHEME;
  locator.host = segments[0];
  locator.version = segments[1];
  locator.file_size = parse_unsigned(segments[2], "file size");
  locator.file_name = segments[3];
  locator.timestamp = static_cast<std::int64_t>(timestamp);
  locator.representation_id = segments[5];
  return locator;
}

bool LocatorCodec::has_scheme(const std::string& raw) {
  const std::string prefix = std::string(SCHEME) + "://";
  return raw.compare(0, prefix.size(), prefix) == 0;
}

std::uint64_t LocatorCodec::parse_unsigned(const std::string& segment, const char* field) {
  if (segment.empty() || !std::all_of(segment.begin(), segment.end(),
                                      [](char c) { return c >= '0' && c <= '9'; })) {
    throw MalformedLocator(std::string("invalid ") + field + " '" + segment + "'");
  }
  try {
    return std::stoull(segment);
  } catch (const std::out_of_range&) {
    throw MalformedLocator(std::string(field) + " out of range");
  }
}


//==============================================
// URL TOKENS
//==============================================

std::string LocatorCodec::encode_token(const Locator& locator) {
  const std::string raw = serialize(locator);

  std::string token(4 * ((raw.size() + 2) / 3), '\0');
  int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&token[0]),
                                reinterpret_cast<const unsigned char*>(raw.data()),
                                static_cast<int>(raw.size()));
  token.resize(static_cast<std::size_t>(written));

  std::replace(token.begin(), token.end(), '+', '-');
  std::replace(token.begin(), token.end(), '/', '_');
  return token;
}

Locator LocatorCodec::decode_token(const std::string& token) {
  if (token.empty() || token.size() % 4 != 0) {
    throw MalformedLocator("token length is not a multiple of 4");
  }

  // At most two '=', and only at the end
  const std::size_t padding = token.size() - (token.find_last_not_of('=') + 1);
  if (padding > 2 || token.find('=') < token.size() - padding) {
    throw MalformedLocator("token has misplaced padding");
  }

  std::string standard = token;
  for (char& c : standard) {
    if (c == '+' || c == '/') {
      throw MalformedLocator("token is not URL-safe base64");
    }
    if (c == '-') c = '+';
    else if (c == '_') c = '/';
  }

  std::string raw(3 * standard.size() / 4, '\0');
  int decoded = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(&raw[0]),
                                reinterpret_cast<const unsigned char*>(standard.data()),
                                static_cast<int>(standard.size()));
  if (decoded < 0 || static_cast<std::size_t>(decoded) < padding) {
    throw MalformedLocator("token is not valid base64");
  }

  // EVP_DecodeBlock counts padding as zero bytes
  raw.resize(static_cast<std::size_t>(decoded) - padding);

  return parse(raw);
}

} // namespace randomfs::codec
