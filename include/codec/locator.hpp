#ifndef RANDOMFS_LOCATOR_HPP
#define RANDOMFS_LOCATOR_HPP

#include <cstdint>
#include <string>
#include "error/randomfs_error.hpp"

namespace randomfs::codec {

// rd://<host>/<version>/<file_size>/<file_name>/<timestamp>/<representation_id>
struct Locator {
  std::string scheme;
  std::string host;
  std::string version;
  std::uint64_t file_size = 0;
  std::string file_name;
  std::int64_t timestamp = 0;
  std::string representation_id;

  bool operator==(const Locator& other) const;
  bool operator!=(const Locator& other) const { return !(*this == other); }
};

class LocatorCodec {
public:
  static constexpr const char* SCHEME = "rd";
  static constexpr const char* HOST = "randomfs";
  static constexpr std::size_t SEGMENT_COUNT = 6;

  // ---- SERIALIZATION AND PARSING ----
  // Throws MalformedLocator if a field is empty or contains a '/'
  static std::string serialize(const Locator& locator);
  // Throws MalformedLocator on wrong scheme, wrong segment count, empty
  // segments or non-numeric size/timestamp
  static Locator parse(const std::string& raw);


  // ---- URL TOKENS ----
  // URL-safe base64 of the serialized locator, as carried in /rd/<token>
  static std::string encode_token(const Locator& locator);
  static Locator decode_token(const std::string& token);

  // True if raw begins with the rd:// prefix
  static bool has_scheme(const std::string& raw);

private:
  static std::uint64_t parse_unsigned(const std::string& segment, const char* field);
};

} // namespace randomfs::codec

#endif // RANDOMFS_LOCATOR_HPP
