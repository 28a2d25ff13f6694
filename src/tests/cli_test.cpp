#include <gtest/gtest.h>
#include <fstream>
#include <iterator>
#include <memory>
#include <sstream>
#include "cli/cli.hpp"
#include "store/local_store.hpp"
#include "test_utils.hpp"

using namespace randomfs;

class CLITest : public ::testing::Test {
protected:
    void SetUp() override {
        init_test_logging();
        dir_ = std::make_unique<TempDir>("randomfs_cli_test");
        store_ = std::make_unique<store::LocalStore>((dir_->path() / "store").string());
        fs_ = std::make_unique<core::RandomFS>(*store_);
        cli_ = std::make_unique<cli::CLI>(*fs_, input_, output_);
    }

    std::string write_file(const std::string& name, const codec::Bytes& content) {
        std::filesystem::path path = dir_->path() / name;
        std::ofstream out(path, std::ios::binary);
        out.write(reinterpret_cast<const char*>(content.data()), static_cast<std::streamsize>(content.size()));
        return path.string();
    }

    static codec::Bytes read_file(const std::string& path) {
        std::ifstream in(path, std::ios::binary);
        return codec::Bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    }

    // Runs one command and returns what it printed
    std::string run(const std::string& line) {
        output_.str("");
        EXPECT_TRUE(cli_->execute(line));
        return output_.str();
    }

    // Value printed after "<key>:" on its own line
    static std::string field(const std::string& text, const std::string& key) {
        std::istringstream lines(text);
        std::string line;
        while (std::getline(lines, line)) {
            if (line.compare(0, key.size() + 1, key + ":") == 0) {
                std::istringstream rest(line.substr(key.size() + 1));
                std::string value;
                rest >> value;
                return value;
            }
        }
        return "";
    }

    std::istringstream input_;
    std::ostringstream output_;
    std::unique_ptr<TempDir> dir_;
    std::unique_ptr<store::LocalStore> store_;
    std::unique_ptr<core::RandomFS> fs_;
    std::unique_ptr<cli::CLI> cli_;
};

TEST_F(CLITest, StoreThenGetByLocator) {
    codec::Bytes content = make_payload(4000, 2);
    std::string path = write_file("input.bin", content);

    std::string stored = run("store " + path + " application/x-test");
    std::string url = field(stored, "url");
    ASSERT_EQ(url.rfind("rd://randomfs/v4/4000/input.bin/", 0), 0u) << stored;
    EXPECT_EQ(field(stored, "size"), "4000");

    std::string out_path = (dir_->path() / "output.bin").string();
    std::string got = run("get " + url + " " + out_path);
    EXPECT_NE(got.find("Retrieved input.bin (4000 bytes, application/x-test)"), std::string::npos) << got;
    EXPECT_EQ(read_file(out_path), content);
}

TEST_F(CLITest, GetByTokenAndHash) {
    codec::Bytes content = to_bytes("tokens and hashes");
    std::string stored = run("store " + write_file("small.txt", content));

    std::string by_token = (dir_->path() / "by_token.txt").string();
    run("get " + field(stored, "token") + " " + by_token);
    EXPECT_EQ(read_file(by_token), content);

    std::string by_hash = (dir_->path() / "by_hash.txt").string();
    run("get " + field(stored, "hash") + " " + by_hash);
    EXPECT_EQ(read_file(by_hash), content);
}

TEST_F(CLITest, ParseLocatorAndToken) {
    const std::string url = "rd://randomfs/v4/1024/example.txt/1700000000/QmAbc";

    std::string parsed = run("parse " + url);
    EXPECT_EQ(field(parsed, "file size"), "1024");
    EXPECT_EQ(field(parsed, "file name"), "example.txt");
    EXPECT_EQ(field(parsed, "timestamp"), "1700000000");
    EXPECT_EQ(field(parsed, "hash"), "QmAbc");

    std::string token = run("token " + url);
    token.erase(token.find_last_not_of("\n") + 1);
    EXPECT_EQ(token, codec::LocatorCodec::encode_token(codec::LocatorCodec::parse(url)));
    EXPECT_EQ(field(run("parse " + token), "hash"), "QmAbc");
}

TEST_F(CLITest, ReportsErrors) {
    EXPECT_NE(run("parse rd://randomfs/v4/abc/x/1/Qm").find("Error parsing locator"), std::string::npos);
    EXPECT_NE(run("store /nonexistent/file.bin").find("Error opening file"), std::string::npos);

    std::string missing = run("get " + std::string(64, 'a') + " " + (dir_->path() / "x").string());
    EXPECT_NE(missing.find("Error retrieving file"), std::string::npos);
    EXPECT_NE(missing.find("Not found"), std::string::npos);
    EXPECT_FALSE(std::filesystem::exists(dir_->path() / "x"));
}

TEST_F(CLITest, StatsAndHealth) {
    run("store " + write_file("counted.bin", make_payload(100)));

    std::string stats = run("stats");
    EXPECT_NE(stats.find("\"files_stored\""), std::string::npos) << stats;
    EXPECT_NE(stats.find("\"blocks_generated\""), std::string::npos);

    EXPECT_NE(run("health").find("status: healthy"), std::string::npos);
    EXPECT_NE(run("help").find("Available commands"), std::string::npos);
}

TEST_F(CLITest, UnknownCommandsAndQuit) {
    EXPECT_NE(run("frobnicate").find("Unknown command"), std::string::npos);
    EXPECT_NE(run("get onlyone").find("Unknown command"), std::string::npos);
    EXPECT_EQ(run(""), "");
    EXPECT_FALSE(cli_->execute("quit"));
}

TEST_F(CLITest, RunLoopStopsAtQuit) {
    input_.str("health\nquit\nhealth\n");
    cli_->run();

    std::string text = output_.str();
    EXPECT_EQ(text.find("status: healthy"), text.rfind("status: healthy"));
    EXPECT_NE(text.find("RandomFS> "), std::string::npos);
}
