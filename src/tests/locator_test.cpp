#include <gtest/gtest.h>
#include "codec/locator.hpp"
#include "test_utils.hpp"

using namespace randomfs;
using namespace randomfs::codec;

class LocatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        init_test_logging();
    }

    static Locator sample() {
        Locator locator;
        locator.scheme = "rd";
        locator.host = "randomfs";
        locator.version = "v4";
        locator.file_size = 1024;
        locator.file_name = "example.txt";
        locator.timestamp = 1700000000;
        locator.representation_id = "QmAbc";
        return locator;
    }
};

TEST_F(LocatorTest, ParsesKnownLocator) {
    Locator locator = LocatorCodec::parse("rd://randomfs/v4/1024/example.txt/1700000000/QmAbc");

    EXPECT_EQ(locator.scheme, "rd");
    EXPECT_EQ(locator.host, "randomfs");
    EXPECT_EQ(locator.version, "v4");
    EXPECT_EQ(locator.file_size, 1024u);
    EXPECT_EQ(locator.file_name, "example.txt");
    EXPECT_EQ(locator.timestamp, 1700000000);
    EXPECT_EQ(locator.representation_id, "QmAbc");
}

TEST_F(LocatorTest, SerializesInFixedOrder) {
    EXPECT_EQ(LocatorCodec::serialize(sample()),
              "rd://randomfs/v4/1024/example.txt/1700000000/QmAbc");
}

TEST_F(LocatorTest, RoundTrip) {
    Locator locator = sample();
    EXPECT_EQ(LocatorCodec::parse(LocatorCodec::serialize(locator)), locator);

    // Numeric-looking names and ids stay in their own positions
    locator.file_name = "1234";
    locator.representation_id = "5678";
    locator.file_size = 0;
    locator.timestamp = 0;
    EXPECT_EQ(LocatorCodec::parse(LocatorCodec::serialize(locator)), locator);
}

TEST_F(LocatorTest, RejectsWrongScheme) {
    EXPECT_THROW(LocatorCodec::parse("http://randomfs/v4/1024/example.txt/1700000000/QmAbc"), MalformedLocator);
    EXPECT_THROW(LocatorCodec::parse("RD://randomfs/v4/1024/example.txt/1700000000/QmAbc"), MalformedLocator);
    EXPECT_THROW(LocatorCodec::parse(""), MalformedLocator);
}

TEST_F(LocatorTest, RejectsWrongSegmentCount) {
    EXPECT_THROW(LocatorCodec::parse("rd://randomfs/v4/1024/example.txt"), MalformedLocator);
    EXPECT_THROW(LocatorCodec::parse("rd://randomfs/v4/1024/example.txt/1700000000"), MalformedLocator);
    EXPECT_THROW(LocatorCodec::parse("rd://randomfs/v4/1024/example.txt/1700000000/QmAbc/extra"), MalformedLocator);
    EXPECT_THROW(LocatorCodec::parse("rd://randomfs/v4/1024//1700000000/QmAbc"), MalformedLocator);
}

TEST_F(LocatorTest, RejectsNonNumericFields) {
    EXPECT_THROW(LocatorCodec::parse("rd://randomfs/v4/big/example.txt/1700000000/QmAbc"), MalformedLocator);
    EXPECT_THROW(LocatorCodec::parse("rd://randomfs/v4/1024/example.txt/yesterday/QmAbc"), MalformedLocator);
    EXPECT_THROW(LocatorCodec::parse("rd://randomfs/v4/-1/example.txt/1700000000/QmAbc"), MalformedLocator);
    EXPECT_THROW(LocatorCodec::parse("rd://randomfs/v4/12kb/example.txt/1700000000/QmAbc"), MalformedLocator);
    EXPECT_THROW(LocatorCodec::parse("rd://randomfs/v4/99999999999999999999999/example.txt/1/QmAbc"), MalformedLocator);
}

TEST_F(LocatorTest, SerializeRejectsUnplaceableFields) {
    Locator locator = sample();
    locator.file_name = "dir/example.txt";
    EXPECT_THROW(LocatorCodec::serialize(locator), MalformedLocator);

    locator = sample();
    locator.representation_id.clear();
    EXPECT_THROW(LocatorCodec::serialize(locator), MalformedLocator);
}

TEST_F(LocatorTest, TokenRoundTrip) {
    Locator locator = sample();
    std::string token = LocatorCodec::encode_token(locator);

    EXPECT_EQ(token.find('+'), std::string::npos);
    EXPECT_EQ(token.find('/'), std::string::npos);
    EXPECT_EQ(token.size() % 4, 0u);
    EXPECT_EQ(LocatorCodec::decode_token(token), locator);
}

TEST_F(LocatorTest, TokenMatchesUrlSafeBase64) {
    Locator locator = sample();
    locator.file_name = "a.txt";
    locator.representation_id = "Qm";
    // base64url("rd://randomfs/v4/1024/a.txt/1700000000/Qm")
    EXPECT_EQ(LocatorCodec::encode_token(locator),
              "cmQ6Ly9yYW5kb21mcy92NC8xMDI0L2EudHh0LzE3MDAwMDAwMDAvUW0=");
}

TEST_F(LocatorTest, BadTokensAreMalformed) {
    EXPECT_THROW(LocatorCodec::decode_token(""), MalformedLocator);
    EXPECT_THROW(LocatorCodec::decode_token("abc"), MalformedLocator);
    EXPECT_THROW(LocatorCodec::decode_token("!!!!"), MalformedLocator);
    // Padding only, or padding in the middle
    EXPECT_THROW(LocatorCodec::decode_token("===="), MalformedLocator);
    EXPECT_THROW(LocatorCodec::decode_token("A==="), MalformedLocator);
    EXPECT_THROW(LocatorCodec::decode_token("AA=="), MalformedLocator);
    EXPECT_THROW(LocatorCodec::decode_token("A=AA"), MalformedLocator);
    EXPECT_THROW(LocatorCodec::decode_token("AA==AAAA"), MalformedLocator);
    // Valid base64 of something that is not a locator
    EXPECT_THROW(LocatorCodec::decode_token("aGVsbG8="), MalformedLocator);
}
