/**
 * @file test_memo.cpp
 * @brief Anchor memo encoding and tolerant decoding
 */

#include "opentreasury/memo.hpp"

#include <gtest/gtest.h>

using namespace opentreasury::memo;

namespace {

constexpr const char* kTreasury = "9xQeWvG816bUx9EPjHmaT23yvVM2ZWbrrpZb9PusVFin";
constexpr const char* kDigest = "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";

}  // namespace

TEST(Memo, Label) {
    EXPECT_EQ(proof_label(), "OpenTreasury Proof (OTMS v1)");
}

TEST(Memo, EncodeExactText) {
    EXPECT_EQ(encode_memo(std::string(" ") + kTreasury + " ", kDigest, "2024-05-01T12:00:00.000Z"),
              std::string("OpenTreasury Proof (OTMS v1)\n") + "Treasury: " + kTreasury + "\n" + "Hash: "
                  + kDigest + "\n" + "Timestamp: 2024-05-01T12:00:00.000Z");
}

TEST(Memo, DecodeWhatWasEncoded) {
    auto decoded = decode_memo(encode_memo(kTreasury, kDigest, "2024-05-01T12:00:00.000Z"));
    ASSERT_TRUE(decoded) << decoded.error().message;
    EXPECT_EQ(decoded->label, "OpenTreasury Proof (OTMS v1)");
    EXPECT_EQ(decoded->treasury, kTreasury);
    EXPECT_EQ(decoded->digest_hex, kDigest);
    EXPECT_EQ(decoded->timestamp_iso, "2024-05-01T12:00:00.000Z");
}

TEST(Memo, DecodeToleratesOrderCaseAndCrlf) {
    const std::string text = std::string("timestamp:2024-05-01T12:00:00.000Z\r\n") + "HASH:   " + kDigest
                             + "  \r\n" + "treasury: " + kTreasury + "\r\n" + "OpenTreasury Proof (OTMS v1)";
    auto decoded = decode_memo(text);
    ASSERT_TRUE(decoded) << decoded.error().message;
    EXPECT_EQ(decoded->digest_hex, kDigest);
    EXPECT_EQ(decoded->treasury, kTreasury);
    EXPECT_EQ(decoded->timestamp_iso, "2024-05-01T12:00:00.000Z");
    EXPECT_EQ(decoded->label, "OpenTreasury Proof (OTMS v1)");
}

TEST(Memo, DecodeIgnoresUnknownLines) {
    const std::string text = std::string("Some other app\nnote: hello\nHash: ") + kDigest;
    auto decoded = decode_memo(text);
    ASSERT_TRUE(decoded);
    EXPECT_EQ(decoded->digest_hex, kDigest);
    EXPECT_EQ(decoded->treasury, "");
    EXPECT_EQ(decoded->label, "");
}

TEST(Memo, MissingHashLine) {
    auto decoded = decode_memo(std::string("OpenTreasury Proof (OTMS v1)\nTreasury: ") + kTreasury);
    ASSERT_FALSE(decoded);
    EXPECT_EQ(decoded.error().code, opentreasury::errc::kMissingHashLine);
}

TEST(Memo, EmptyHashValue) {
    auto decoded = decode_memo("Hash:   \nTreasury: x");
    ASSERT_FALSE(decoded);
    EXPECT_EQ(decoded.error().code, opentreasury::errc::kMissingHashLine);
}

TEST(Memo, FirstHashLineWins) {
    auto decoded = decode_memo("Hash: aaa\nHash: bbb");
    ASSERT_TRUE(decoded);
    EXPECT_EQ(decoded->digest_hex, "aaa");
}
