/**
 * @file test_sha256.cpp
 * @brief SHA-256 known-answer and streaming tests
 */

#include "opentreasury/common.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace opentreasury::common;

TEST(SHA256, EmptyString) {
    EXPECT_EQ(sha256(""), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(SHA256, HelloWorld) {
    EXPECT_EQ(sha256("Hello, World!"), "dffd6021bb2bd5b0af676290809ec3a53191dd81c7f70a4b28688a362182986f");
}

TEST(SHA256, Abc) {
    EXPECT_EQ(sha256("abc"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(SHA256, TwoBlockMessage) {
    // 56 bytes: padding spills into a second block
    EXPECT_EQ(sha256("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq"),
              "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");
}

TEST(SHA256, MillionA) {
    EXPECT_EQ(sha256(std::string(1'000'000, 'a')),
              "cdc76e5c9914fb9281a1c7e284d73e67f1809a48a497200e046d39ccc7112cd0");
}

TEST(SHA256, Utf8Input) {
    // Hashes the UTF-8 bytes, not code points
    EXPECT_EQ(sha256("\xc3\xa9"), sha256(std::string{'\xc3', '\xa9'}));
    EXPECT_NE(sha256("\xc3\xa9"), sha256("e"));
}

TEST(SHA256, StreamingMatchesOneShot) {
    const std::string input = "The quick brown fox jumps over the lazy dog, repeatedly and at length.";
    for (std::size_t split = 0; split <= input.size(); split += 7) {
        Sha256 hasher;
        hasher.update(std::string_view(input).substr(0, split));
        hasher.update(std::string_view(input).substr(split));
        EXPECT_EQ(to_hex(hasher.finish()), sha256(input)) << "split at " << split;
    }
}

TEST(SHA256, ResetStartsOver) {
    Sha256 hasher;
    hasher.update(std::string_view("garbage"));
    hasher.reset();
    hasher.update(std::string_view("abc"));
    EXPECT_EQ(to_hex(hasher.finish()), sha256("abc"));
}

TEST(SHA256, HexValidation) {
    EXPECT_TRUE(is_sha256_hex(sha256("x")));
    EXPECT_TRUE(is_sha256_hex("E3B0C44298FC1C149AFBF4C8996FB92427AE41E4649B934CA495991B7852B855"));
    EXPECT_FALSE(is_sha256_hex(""));
    EXPECT_FALSE(is_sha256_hex("e3b0"));
    EXPECT_FALSE(is_sha256_hex("g3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855"));
}
