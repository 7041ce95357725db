/**
 * @file test_schema_validate.cpp
 * @brief Schema validation against the shipped schemas
 */

#include "opentreasury/common.hpp"
#include "opentreasury/schema_validate.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <string>

namespace {

using opentreasury::common::schema_file;
using opentreasury::common::validate_json;

std::string schema(const char* name)
{
    return schema_file(OPENTREASURY_SCHEMA_DIR, name);
}

nlohmann::json sample_document()
{
    return {
        {"version", 1},
        {"standard", "OTMS"},
        {"cluster", "devnet"},
        {"treasury", "9xQeWvG816bUx9EPjHmaT23yvVM2ZWbrrpZb9PusVFin"},
        {"exportedAt", "2024-05-01T12:00:00.000Z"},
        {"entries", nlohmann::json::array({{{"signature", "sig-1"},
                                            {"category", "Grant"},
                                            {"description", "Q2 grant"},
                                            {"proofUrl", ""}}})}
    };
}

}  // namespace

TEST(SchemaValidate, SchemaFileName) {
    EXPECT_EQ(schema_file("schemas", "otms.v1"), "schemas/otms.v1.schema.json");
}

TEST(SchemaValidate, OtmsDocumentAccepted) {
    auto result = validate_json(sample_document(), schema("otms.v1"));
    EXPECT_TRUE(result) << result.error().message;
}

TEST(SchemaValidate, OtmsUnknownCategoryRejected) {
    auto doc = sample_document();
    doc["entries"][0]["category"] = "Payroll";
    auto result = validate_json(doc, schema("otms.v1"));
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, opentreasury::errc::kSchemaInvalid);
}

TEST(SchemaValidate, OtmsWrongVersionRejected) {
    auto doc = sample_document();
    doc["version"] = 2;
    EXPECT_FALSE(validate_json(doc, schema("otms.v1")));
}

TEST(SchemaValidate, LegacyMetaUsesAnnotationDefinition) {
    nlohmann::json good = {
        {"meta", {{"sig-1", {{"label", "Donation"}, {"note", "thanks"}}}}}
    };
    auto accepted = validate_json(good, schema("otms_legacy.v1"));
    EXPECT_TRUE(accepted) << accepted.error().message;

    nlohmann::json bad = {
        {"meta", {{"sig-1", {{"label", "Salary"}}}}}
    };
    EXPECT_FALSE(validate_json(bad, schema("otms_legacy.v1")));
}

TEST(SchemaValidate, ConfigRejectsUnknownKeys) {
    nlohmann::json config = {
        {"schema_version", "config.v1"},
        {"cluster", "devnet"},
        {"colour", "blue"}
    };
    EXPECT_FALSE(validate_json(config, schema("config.v1")));
}

TEST(SchemaValidate, MissingSchemaFile) {
    auto result = validate_json(nlohmann::json::object(), schema("does_not_exist.v1"));
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, "SchemaFileOpenFailed");
}
