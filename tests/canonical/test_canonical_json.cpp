/**
 * @file test_canonical_json.cpp
 * @brief Canonical JSON form: key order, layout, number text, determinism and rejections
 */

#include "opentreasury/canonical_json.hpp"
#include "opentreasury/common.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace opentreasury::canonical;
using Json = nlohmann::json;

TEST(CanonicalJSON, KeyOrderAndIndent)
{
    Json j = Json::parse(R"({"b":1,"a":2})");
    auto canonical = canonicalize(j);
    ASSERT_TRUE(canonical);
    EXPECT_EQ(*canonical, "{\n  \"a\": 2,\n  \"b\": 1\n}");
}

TEST(CanonicalJSON, NestedObjectsInsideArrays)
{
    Json j = Json::parse(R"({"z":[{"y":1,"x":[3,1,2]}],"a":null})");
    auto canonical = canonicalize(j);
    ASSERT_TRUE(canonical);
    EXPECT_EQ(*canonical,
              "{\n"
              "  \"a\": null,\n"
              "  \"z\": [\n"
              "    {\n"
              "      \"x\": [\n"
              "        3,\n"
              "        1,\n"
              "        2\n"
              "      ],\n"
              "      \"y\": 1\n"
              "    }\n"
              "  ]\n"
              "}");
}

TEST(CanonicalJSON, EmptyContainers)
{
    Json j = {
        {"list", Json::array()},
        { "map", Json::object()}
    };
    auto canonical = canonicalize(j);
    ASSERT_TRUE(canonical);
    EXPECT_EQ(*canonical, "{\n  \"list\": [],\n  \"map\": {}\n}");
}

TEST(CanonicalJSON, Scalars)
{
    EXPECT_EQ(*canonicalize(Json(42)), "42");
    EXPECT_EQ(*canonicalize(Json(-7)), "-7");
    EXPECT_EQ(*canonicalize(Json(true)), "true");
    EXPECT_EQ(*canonicalize(Json(nullptr)), "null");
    EXPECT_EQ(*canonicalize(Json("x")), "\"x\"");
}

TEST(CanonicalJSON, UnicodeIsNotEscaped)
{
    Json j = {
        {"note", "caf\xc3\xa9 \xe2\x82\xac"}
    };
    auto canonical = canonicalize(j);
    ASSERT_TRUE(canonical);
    EXPECT_EQ(*canonical, "{\n  \"note\": \"caf\xc3\xa9 \xe2\x82\xac\"\n}");
}

TEST(CanonicalJSON, ControlCharactersEscaped)
{
    Json j = {
        {"s", "a\nb\"c\x01"}
    };
    auto canonical = canonicalize(j);
    ASSERT_TRUE(canonical);
    EXPECT_EQ(*canonical, "{\n  \"s\": \"a\\nb\\\"c\\u0001\"\n}");
}

TEST(CanonicalJSON, InsertionOrderIrrelevant)
{
    Json a = Json::parse(R"({"x":1,"y":{"q":2,"p":3}})");
    Json b = Json::parse(R"({"y":{"p":3,"q":2},"x":1})");
    EXPECT_EQ(*canonicalize(a), *canonicalize(b));
    EXPECT_EQ(*hash_canonical(a), *hash_canonical(b));
}

TEST(CanonicalJSON, Idempotent)
{
    Json j = Json::parse(R"({"b":[{"d":1,"c":2}],"a":"t"})");
    auto first = canonicalize(j);
    ASSERT_TRUE(first);
    auto second = canonicalize(Json::parse(*first));
    ASSERT_TRUE(second);
    EXPECT_EQ(*first, *second);
}

TEST(CanonicalJSON, HashIsSha256OfCanonicalText)
{
    Json j = Json::parse(R"({"b":1,"a":2})");
    auto hash = hash_canonical(j);
    ASSERT_TRUE(hash);
    EXPECT_EQ(*hash, opentreasury::common::sha256("{\n  \"a\": 2,\n  \"b\": 1\n}"));
    EXPECT_EQ(hash->size(), 64U);
}

TEST(CanonicalJSON, FractionalNumbersKept)
{
    Json j = Json::parse(R"({"treasury":"T1","amount":0.5})");
    auto canonical = canonicalize(j);
    ASSERT_TRUE(canonical) << canonical.error().message;
    EXPECT_EQ(*canonical, "{\n  \"amount\": 0.5,\n  \"treasury\": \"T1\"\n}");
    EXPECT_TRUE(validate_for_canonical(j));
}

TEST(CanonicalJSON, NumberFormatting)
{
    auto text = [](const char* literal) { return *canonicalize(Json::parse(literal)); };
    EXPECT_EQ(text("0.5"), "0.5");
    EXPECT_EQ(text("1.0"), "1");
    EXPECT_EQ(text("100.0"), "100");
    EXPECT_EQ(text("-1.5"), "-1.5");
    EXPECT_EQ(text("123.456"), "123.456");
    EXPECT_EQ(text("-0.0"), "0");
    EXPECT_EQ(text("1e21"), "1e+21");
    EXPECT_EQ(text("1.5e300"), "1.5e+300");
    EXPECT_EQ(text("1e20"), "100000000000000000000");
    EXPECT_EQ(text("1e-7"), "1e-7");
    EXPECT_EQ(text("2.5e-8"), "2.5e-8");
    EXPECT_EQ(text("1e-6"), "0.000001");
    EXPECT_EQ(text("0.1"), "0.1");
}

TEST(CanonicalJSON, LargeIntegersFollowDoublePrecision)
{
    EXPECT_EQ(*canonicalize(Json(9007199254740992LL)), "9007199254740992");
    EXPECT_EQ(*canonicalize(Json(-9007199254740992LL)), "-9007199254740992");
    EXPECT_EQ(*canonicalize(Json(18446744073709551615ULL)), "18446744073709552000");
}

TEST(CanonicalJSON, NestingTooDeep)
{
    Json j = 1;
    for (std::size_t i = 0; i <= kMaxDepth; ++i) {
        j = Json::array({j});
    }
    auto canonical = canonicalize(j);
    ASSERT_FALSE(canonical);
    EXPECT_EQ(canonical.error().code, opentreasury::errc::kNestingTooDeep);
}

TEST(CanonicalJSON, NestingAtLimitAccepted)
{
    Json j = 1;
    for (std::size_t i = 0; i < kMaxDepth; ++i) {
        j = Json::array({j});
    }
    EXPECT_TRUE(canonicalize(j));
}

TEST(CanonicalJSON, InvalidUtf8Rejected)
{
    Json j = {
        {"s", std::string("\xff\xfe")}
    };
    auto canonical = canonicalize(j);
    ASSERT_FALSE(canonical);
    EXPECT_EQ(canonical.error().code, opentreasury::errc::kInvalidUtf8);
}

TEST(CanonicalJSON, SortKeysRecursive)
{
    Json j = Json::parse(R"({"b":{"d":1,"c":2},"a":[{"f":1,"e":2}]})");
    Json sorted = j;
    sort_keys_recursive(sorted);
    EXPECT_EQ(sorted, j);
    EXPECT_EQ(sorted.begin().key(), "a");
}
