#include "cli/cli.hpp"
#include "core/random_fs.hpp"
#include "logger/logger.hpp"
#include "store/ipfs_client.hpp"
#include "store/local_store.hpp"
#include <iostream>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <unordered_map>

struct ProgramOptions {
  std::string store{"ipfs"};
  std::string ipfs{randomfs::store::IpfsClient::DEFAULT_ENDPOINT};
  std::string data_dir{"./data"};
  std::uint64_t cache_size{randomfs::core::Options::DEFAULT_CACHE_SIZE};
  std::string eviction{"lru"};
  std::string log_file{"randomfs.log"};
  std::string log_level{"info"};
  bool valid{false};
};

void print_usage(const std::string& program_name) {
  std::cerr << "Usage: " << program_name << " [options]\n"
        << "Options:\n"
        << "  -s, --store      Block store backend: ipfs or local (default ipfs)\n"
        << "  -i, --ipfs       IPFS API endpoint (default http://localhost:5001)\n"
        << "  -d, --data       Data directory (default ./data)\n"
        << "  -c, --cache      Cache size in bytes (default 524288000)\n"
        << "  -e, --eviction   Cache eviction policy: lru or fifo (default lru)\n"
        << "  -l, --log        Log file (default randomfs.log)\n"
        << "  -v, --log-level  trace, debug, info, warning, error or fatal (default info)\n"
        << "Example: " << program_name << " --store local --data ./blocks --cache 104857600\n";
}

ProgramOptions parse_command_line(int argc, char* argv[]) {
  ProgramOptions options;

  const std::unordered_map<std::string, std::string*> flag_map = {
    {"-s", &options.store},     {"--store", &options.store},
    {"-i", &options.ipfs},      {"--ipfs", &options.ipfs},
    {"-d", &options.data_dir},  {"--data", &options.data_dir},
    {"-e", &options.eviction},  {"--eviction", &options.eviction},
    {"-l", &options.log_file},  {"--log", &options.log_file},
    {"-v", &options.log_level}, {"--log-level", &options.log_level}
  };

  if (argc % 2 == 0) {
    std::cerr << "Error: Every option needs a value\n";
    print_usage(argv[0]);
    return options;
  }

  for (int i = 1; i < argc - 1; i += 2) {
    const std::string flag(argv[i]);
    const std::string value(argv[i + 1]);

    if (flag == "-c" || flag == "--cache") {
      try {
        std::size_t used = 0;
        options.cache_size = std::stoull(value, &used);
        if (used != value.size() || options.cache_size == 0) {
          throw std::invalid_argument(value);
        }
      } catch (const std::exception&) {
        std::cerr << "Error: Invalid cache size: " << value << '\n';
        print_usage(argv[0]);
        return options;
      }
      continue;
    }

    auto it = flag_map.find(flag);
    if (it == flag_map.end()) {
      std::cerr << "Error: Unknown argument: " << flag << '\n';
      print_usage(argv[0]);
      return options;
    }
    *it->second = value;
  }

  if (options.store != "ipfs" && options.store != "local") {
    std::cerr << "Error: Unknown store backend: " << options.store << '\n';
    print_usage(argv[0]);
    return options;
  }

  try {
    randomfs::cache::eviction_kind_from_string(options.eviction);
    randomfs::logging::severity_from_string(options.log_level);
  } catch (const std::invalid_argument& e) {
    std::cerr << "Error: " << e.what() << '\n';
    print_usage(argv[0]);
    return options;
  }

  options.valid = true;
  return options;
}

bool run_shell(const ProgramOptions& options) {
  try {
    randomfs::logging::init_logging(options.log_file,
                                    randomfs::logging::severity_from_string(options.log_level));

    BOOST_LOG_TRIVIAL(info) << "Starting RandomFS";
    BOOST_LOG_TRIVIAL(info) << "Store: " << options.store << ", IPFS API: " << options.ipfs
                            << ", data dir: " << options.data_dir
                            << ", cache: " << options.cache_size << " bytes (" << options.eviction << ")";

    std::unique_ptr<randomfs::store::ContentStore> content_store;
    if (options.store == "local") {
      content_store = std::make_unique<randomfs::store::LocalStore>(options.data_dir);
    } else {
      content_store = std::make_unique<randomfs::store::IpfsClient>(options.ipfs);
    }

    randomfs::core::Options fs_options;
    fs_options.cache_size = options.cache_size;
    fs_options.eviction = randomfs::cache::eviction_kind_from_string(options.eviction);

    randomfs::core::RandomFS random_fs(*content_store, fs_options);
    randomfs::cli::CLI cli(random_fs);

    cli.run();
    return true;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(fatal) << "Failed to start RandomFS: " << e.what();
    std::cerr << "Error: Failed to start RandomFS: " << e.what() << '\n';
    return false;
  }
}

int main(int argc, char* argv[]) {
  if (const auto options = parse_command_line(argc, argv); !options.valid) {
    return 1;
  } else if (!run_shell(options)) {
    return 1;
  }
  return 0;
}
