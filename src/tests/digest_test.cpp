#include <gtest/gtest.h>
#include "crypto/digest.hpp"
#include "test_utils.hpp"
#include <sstream>
#include <string>
#include <vector>

using namespace docreg::crypto;

class DigestTest : public ::testing::Test {
protected:
    void SetUp() override {
        quiet_logging();
    }

    const std::string hello_hash = "2cf24dba5fb0a30e26e83b2ac5b9e29e1b161e5c1fa7425e73043362938b9824";
    const std::string empty_hash = "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";
    const std::string abc_hash = "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";
};

// Known SHA-256 vectors
TEST_F(DigestTest, KnownVectors) {
    EXPECT_EQ(sha256_hex(std::string("hello")), hello_hash);
    EXPECT_EQ(sha256_hex(std::string("")), empty_hash);
    EXPECT_EQ(sha256_hex(std::string("abc")), abc_hash);
}

TEST_F(DigestTest, ByteVectorMatchesString) {
    std::vector<uint8_t> bytes = {'a', 'b', 'c'};
    EXPECT_EQ(sha256_hex(bytes), abc_hash);
}

// Stream input larger than the internal buffer
TEST_F(DigestTest, StreamMatchesString) {
    const std::string data(1000000, 'a');
    std::istringstream stream(data);

    Sha256 sha;
    EXPECT_EQ(sha.update(stream), data.size());
    EXPECT_EQ(sha.hex_digest(), "cdc76e5c9914fb9281a1c7e284d73e67f1809a48a497200e046d39ccc7112cd0");
}

TEST_F(DigestTest, EmptyStreamReportsZeroBytes) {
    std::istringstream stream("");
    Sha256 sha;
    EXPECT_EQ(sha.update(stream), 0u);
    EXPECT_EQ(sha.hex_digest(), empty_hash);
}

TEST_F(DigestTest, BadStreamThrows) {
    std::istringstream stream("data");
    stream.setstate(std::ios::failbit);
    EXPECT_THROW(sha256_hex(stream), DigestError);
}

TEST_F(DigestTest, IncrementalUpdatesAndReset) {
    Sha256 sha;
    sha.update(std::string("he"));
    sha.update(std::string("llo"));
    EXPECT_EQ(sha.hex_digest(), hello_hash);

    // hex_digest leaves the object ready for a new message
    sha.update(std::string("abc"));
    EXPECT_EQ(sha.hex_digest(), abc_hash);
}

TEST_F(DigestTest, HexHelpers) {
    const uint8_t bytes[] = {0x00, 0x0f, 0xab, 0xff};
    EXPECT_EQ(to_hex(bytes, sizeof(bytes)), "000fabff");

    EXPECT_TRUE(is_sha256_hex(hello_hash));
    EXPECT_TRUE(is_sha256_hex("2CF24DBA5FB0A30E26E83B2AC5B9E29E1B161E5C1FA7425E73043362938B9824"));
    EXPECT_FALSE(is_sha256_hex("2cf24d"));
    EXPECT_FALSE(is_sha256_hex(std::string(64, 'g')));

    EXPECT_TRUE(hex_equal(hello_hash, "2CF24DBA5FB0A30E26E83B2AC5B9E29E1B161E5C1FA7425E73043362938B9824"));
    EXPECT_FALSE(hex_equal(hello_hash, abc_hash));
    EXPECT_FALSE(hex_equal("abc", "abcd"));
}

TEST_F(DigestTest, RandomBytes) {
    EXPECT_TRUE(random_bytes(0).empty());

    auto first = random_bytes(32);
    auto second = random_bytes(32);
    EXPECT_EQ(first.size(), 32u);
    EXPECT_NE(first, second);
}
