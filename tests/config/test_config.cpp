/**
 * @file test_config.cpp
 * @brief Client configuration loading and validation
 */

#include "opentreasury/config.hpp"
#include "opentreasury/version.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <string>

namespace {

namespace fs = std::filesystem;
using namespace opentreasury;
using namespace opentreasury::config;

constexpr const char* kSchemaDir = OPENTREASURY_SCHEMA_DIR;

/// RAII helper to create and clean up a temporary directory
class TempDir {
public:
    explicit TempDir(const std::string& name)
        : m_path(fs::temp_directory_path() / name) {
        fs::remove_all(m_path);
        fs::create_directories(m_path);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(m_path, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const fs::path& path() const { return m_path; }

private:
    fs::path m_path;
};

void write_file(const fs::path& path, const std::string& contents) {
    std::ofstream out(path);
    out << contents;
}

TEST(Config, Defaults) {
    auto config = default_config();
    EXPECT_EQ(config.cluster, "devnet");
    EXPECT_EQ(config.memo_program_id, kMemoProgramId);
    EXPECT_EQ(config.signature_limit, kDefaultSignatureLimit);
    EXPECT_EQ(config.view_mode, ViewMode::kInteractive);
}

TEST(Config, ViewModeNames) {
    EXPECT_EQ(parse_view_mode("interactive"), ViewMode::kInteractive);
    EXPECT_EQ(parse_view_mode(" Public "), ViewMode::kReadOnly);
    EXPECT_EQ(parse_view_mode("readonly"), ViewMode::kReadOnly);
    auto bad = parse_view_mode("admin");
    ASSERT_FALSE(bad);
    EXPECT_EQ(bad.error().code, errc::kValidation);
    EXPECT_EQ(view_mode_name(ViewMode::kReadOnly), "public");
}

TEST(Config, OverlayKeepsUnsetKeys) {
    nlohmann::json payload = {
        {"schema_version", "config.v1"},
        {"cluster", "mainnet-beta"},
        {"view", "public"},
    };
    auto config = apply_config(default_config(), payload, kSchemaDir);
    ASSERT_TRUE(config) << config.error().message;
    EXPECT_EQ(config->cluster, "mainnet-beta");
    EXPECT_EQ(config->view_mode, ViewMode::kReadOnly);
    EXPECT_EQ(config->store_dir, default_config().store_dir);
    EXPECT_EQ(config->signature_limit, kDefaultSignatureLimit);
}

TEST(Config, RejectsUnknownKeysAndBadValues) {
    nlohmann::json unknown = {{"schema_version", "config.v1"}, {"rpc_url", "http://localhost"}};
    auto result = apply_config(default_config(), unknown, kSchemaDir);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, errc::kSchemaInvalid);

    nlohmann::json limit = {{"schema_version", "config.v1"}, {"signature_limit", 0}};
    EXPECT_FALSE(apply_config(default_config(), limit, kSchemaDir));

    nlohmann::json cluster = {{"schema_version", "config.v1"}, {"cluster", "localnet"}};
    EXPECT_FALSE(apply_config(default_config(), cluster, kSchemaDir));
}

TEST(Config, LoadFromFile) {
    TempDir temp_dir("opentreasury_config_load");
    const auto path = temp_dir.path() / "config.json";
    write_file(path, R"({"schema_version": "config.v1", "store_dir": "/var/lib/ot", "signature_limit": 20})");

    auto config = load_config(path.string(), kSchemaDir);
    ASSERT_TRUE(config) << config.error().message;
    EXPECT_EQ(config->store_dir, "/var/lib/ot");
    EXPECT_EQ(config->signature_limit, 20);
    EXPECT_EQ(config->cluster, "devnet");
}

TEST(Config, LoadErrors) {
    auto missing = load_config("/nonexistent/config.json", kSchemaDir);
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().code, errc::kIo);

    TempDir temp_dir("opentreasury_config_errors");
    const auto path = temp_dir.path() / "config.json";
    write_file(path, "{\"schema_version\": ");
    auto broken = load_config(path.string(), kSchemaDir);
    ASSERT_FALSE(broken);
    EXPECT_EQ(broken.error().code, errc::kParse);
}

TEST(Config, ToJsonPassesValidation) {
    auto config = default_config();
    config.view_mode = ViewMode::kReadOnly;
    auto round = apply_config(ClientConfig{}, to_json(config), kSchemaDir);
    ASSERT_TRUE(round) << round.error().message;
    EXPECT_EQ(round->view_mode, ViewMode::kReadOnly);
    EXPECT_EQ(round->memo_program_id, config.memo_program_id);
}

}  // namespace
