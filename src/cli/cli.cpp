#include "cli/cli.hpp"
#include <fstream>
#include <iostream>
#include <sstream>
#include <boost/log/trivial.hpp>

namespace randomfs {
namespace cli {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CLI::CLI(core::RandomFS& random_fs, std::istream& input, std::ostream& output)
  : running_(false)
  , random_fs_(random_fs)
  , input_(input)
  , output_(output) {
  BOOST_LOG_TRIVIAL(info) << "CLI initialized";
}


//==============================================
// STARTUP
//==============================================

void CLI::run() {
  running_ = true;
  std::string line;

  BOOST_LOG_TRIVIAL(info) << "Starting CLI loop";
  output_ << "RandomFS> " << std::flush;

  while (running_ && std::getline(input_, line)) {
    running_ = execute(line);
    if (running_) {
      output_ << "RandomFS> " << std::flush;
    }
  }

  BOOST_LOG_TRIVIAL(info) << "CLI loop ended";
}


//==============================================
// COMMAND PROCESSING
//==============================================

bool CLI::execute(const std::string& line) {
  std::istringstream iss(line);
  std::string command, first, second;
  iss >> command >> first >> second;

  BOOST_LOG_TRIVIAL(debug) << "Processing command: " << command << " " << first << " " << second;

  if (command.empty()) {
    return true;
  }
  if (command == "quit") {
    return false;
  }

  if (command == "store" && !first.empty()) {
    handle_store_command(first, second);
  }
  else if (command == "get" && !first.empty() && !second.empty()) {
    handle_get_command(first, second);
  }
  else if (command == "parse" && !first.empty()) {
    handle_parse_command(first);
  }
  else if (command == "token" && !first.empty()) {
    handle_token_command(first);
  }
  else if (command == "stats") {
    handle_stats_command();
  }
  else if (command == "health") {
    handle_health_command();
  }
  else if (command == "help") {
    handle_help_command();
  }
  else {
    output_ << "Unknown command or invalid arguments (try 'help')" << std::endl;
  }
  return true;
}

void CLI::handle_store_command(const std::string& path, const std::string& content_type) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    output_ << "Error opening file: " << path << std::endl;
    return;
  }

  try {
    codec::Locator locator = random_fs_.store_file(path, file, content_type);
    output_ << "url:   " << codec::LocatorCodec::serialize(locator) << "\n"
            << "hash:  " << locator.representation_id << "\n"
            << "size:  " << locator.file_size << "\n"
            << "token: " << codec::LocatorCodec::encode_token(locator) << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error storing file", e.what());
  }
}

void CLI::handle_get_command(const std::string& reference, const std::string& output_path) {
  try {
    core::RetrievedFile file = random_fs_.retrieve_file(resolve_representation_id(reference));

    std::ofstream out(output_path, std::ios::binary | std::ios::trunc);
    if (!out) {
      output_ << "Error opening output file: " << output_path << std::endl;
      return;
    }
    out.write(reinterpret_cast<const char*>(file.payload.data()),
              static_cast<std::streamsize>(file.payload.size()));
    if (!out) {
      output_ << "Error writing output file: " << output_path << std::endl;
      return;
    }

    output_ << "Retrieved " << file.representation.filename << " ("
            << file.representation.file_size << " bytes, "
            << file.representation.content_type << ") to " << output_path << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error retrieving file", e.what());
  }
}

void CLI::handle_parse_command(const std::string& reference) {
  try {
    codec::Locator locator = parse_reference(reference);
    output_ << "host:      " << locator.host << "\n"
            << "version:   " << locator.version << "\n"
            << "file size: " << locator.file_size << "\n"
            << "file name: " << locator.file_name << "\n"
            << "timestamp: " << locator.timestamp << "\n"
            << "hash:      " << locator.representation_id << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error parsing locator", e.what());
  }
}

void CLI::handle_token_command(const std::string& locator) {
  try {
    output_ << codec::LocatorCodec::encode_token(core::RandomFS::parse_locator(locator)) << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error encoding locator", e.what());
  }
}

void CLI::handle_stats_command() {
  output_ << random_fs_.get_stats().to_json();
}

void CLI::handle_health_command() {
  output_ << "status: healthy, service: randomfs, version: "
          << core::Representation::FORMAT_VERSION << std::endl;
}

void CLI::handle_help_command() {
  output_ << "Available commands:" << std::endl;
  output_ << "  help                         Display this help message" << std::endl;
  output_ << "  store <file> [content-type]  Store local <file>, print its rd:// locator" << std::endl;
  output_ << "  get <ref> <out-file>         Rebuild the file named by <ref> into <out-file>" << std::endl;
  output_ << "  parse <ref>                  Show the fields of an rd:// locator or token" << std::endl;
  output_ << "  token <rd://...>             Encode a locator as a URL token" << std::endl;
  output_ << "  stats                        Print storage and cache counters" << std::endl;
  output_ << "  health                       Print service status" << std::endl;
  output_ << "  quit                         Exit the shell" << std::endl;
  output_ << "<ref> is an rd:// locator, a URL token or a representation hash" << std::endl << std::endl;
}

void CLI::log_and_display_error(const std::string& message, const std::string& error) {
  BOOST_LOG_TRIVIAL(error) << message << ": " << error;
  output_ << message << ": " << error << std::endl;
}

std::string CLI::resolve_representation_id(const std::string& reference) const {
  if (codec::LocatorCodec::has_scheme(reference)) {
    return core::RandomFS::parse_locator(reference).representation_id;
  }
  // Tokens decode to an rd:// locator; anything else is taken as a hash
  try {
    return codec::LocatorCodec::decode_token(reference).representation_id;
  } catch (const MalformedLocator&) {
    return reference;
  }
}

codec::Locator CLI::parse_reference(const std::string& reference) {
  if (codec::LocatorCodec::has_scheme(reference)) {
    return core::RandomFS::parse_locator(reference);
  }
  return codec::LocatorCodec::decode_token(reference);
}

} // namespace cli
} // namespace randomfs
