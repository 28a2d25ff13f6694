#ifndef RANDOMFS_TEST_UTILS_HPP
#define RANDOMFS_TEST_UTILS_HPP

#include <gmock/gmock.h>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <random>
#include <string>
#include <thread>
#include <boost/log/core.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include "codec/block_codec.hpp"
#include "store/content_store.hpp"

// Set logging severity level and configure logging
inline void init_test_logging(boost::log::trivial::severity_level level = boost::log::trivial::warning) {
    // Remove any existing sinks to prevent duplicates
    boost::log::core::get()->remove_all_sinks();

    boost::log::register_simple_formatter_factory<boost::log::trivial::severity_level, char>("Severity");

    boost::log::add_console_log(
        std::cout,
        boost::log::keywords::format = "[%TimeStamp%] [%ThreadID%] [%Severity%] %Message%",
        boost::log::keywords::auto_flush = true
    );

    boost::log::core::get()->set_filter(boost::log::trivial::severity >= level);
    boost::log::core::get()->set_logging_enabled(true);
    boost::log::add_common_attributes();
}

// Deterministic pseudo-random payload
inline randomfs::codec::Bytes make_payload(std::size_t size, std::uint32_t seed = 7) {
    std::mt19937 gen(seed);
    std::uniform_int_distribution<int> dist(0, 255);
    randomfs::codec::Bytes payload(size);
    for (auto& byte : payload) {
        byte = static_cast<uint8_t>(dist(gen));
    }
    return payload;
}

inline randomfs::codec::Bytes to_bytes(const std::string& text) {
    return randomfs::codec::Bytes(text.begin(), text.end());
}

// Fresh directory under the system temp dir, removed on destruction
class TempDir {
public:
    explicit TempDir(const std::string& prefix) {
        static std::atomic<unsigned> counter{0};
        path_ = std::filesystem::temp_directory_path() /
            (prefix + "_" + std::to_string(std::chrono::system_clock::now().time_since_epoch().count())
             + "_" + std::to_string(counter++));
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }
    std::string str() const { return path_.string(); }

private:
    std::filesystem::path path_;
};

class MockContentStore : public randomfs::store::ContentStore {
public:
    MOCK_METHOD(std::string, put, (const randomfs::codec::Bytes& data), (override));
    MOCK_METHOD(randomfs::codec::Bytes, get, (const std::string& id), (override));
    MOCK_METHOD(void, check_connection, (), (override));
    MOCK_METHOD(std::string, describe, (), (const, override));
};

#endif // RANDOMFS_TEST_UTILS_HPP
