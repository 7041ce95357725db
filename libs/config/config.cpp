/**
 * @file config.cpp
 * @brief Loading and validating the client configuration
 */

#include "opentreasury/config.hpp"

#include "opentreasury/schema_validate.hpp"
#include "opentreasury/version.hpp"

#include <format>
#include <fstream>

namespace opentreasury::config {

namespace {

constexpr const char* kConfigSchema = "config.v1";

void read_string(const nlohmann::json& payload, const char* key, std::string& target)
{
    if (auto it = payload.find(key); it != payload.end()) {
        target = it->get<std::string>();
    }
}

}  // namespace

ClientConfig default_config()
{
    return ClientConfig{
        .cluster = kDefaultCluster,
        .memo_program_id = kMemoProgramId,
        .store_dir = ".opentreasury",
        .schema_dir = "schemas",
        .signature_limit = kDefaultSignatureLimit,
        .view_mode = ViewMode::kInteractive,
    };
}

opentreasury::Result<ViewMode> parse_view_mode(std::string_view text)
{
    const auto value = common::trim(text);
    if (common::iequals(value, "interactive")) {
        return ViewMode::kInteractive;
    }
    if (common::iequals(value, "public") || common::iequals(value, "readonly")) {
        return ViewMode::kReadOnly;
    }
    return std::unexpected(Error::make(
        errc::kValidation, std::format("Unknown view mode '{}' (expected interactive or public)", value)));
}

std::string_view view_mode_name(ViewMode mode)
{
    return mode == ViewMode::kReadOnly ? "public" : "interactive";
}

opentreasury::Result<ClientConfig> apply_config(const ClientConfig& base,
                                                const nlohmann::json& payload,
                                                const std::string& schema_dir)
{
    if (auto result = common::validate_json(payload, common::schema_file(schema_dir, kConfigSchema));
        !result) {
        return std::unexpected(Error::make(result.error().code,
                                           "config schema validation failed: " + result.error().message));
    }

    ClientConfig config = base;
    read_string(payload, "cluster", config.cluster);
    read_string(payload, "memo_program_id", config.memo_program_id);
    read_string(payload, "store_dir", config.store_dir);
    read_string(payload, "schema_dir", config.schema_dir);
    if (auto it = payload.find("signature_limit"); it != payload.end()) {
        config.signature_limit = it->get<int>();
    }
    if (auto it = payload.find("view"); it != payload.end()) {
        auto mode = parse_view_mode(it->get<std::string>());
        if (!mode) {
            return std::unexpected(mode.error());
        }
        config.view_mode = *mode;
    }
    return config;
}

opentreasury::Result<ClientConfig> load_config(const std::string& path, const std::string& schema_dir)
{
    std::ifstream in(path);
    if (!in) {
        return std::unexpected(Error::make(errc::kIo, "Failed to open config file: " + path));
    }
    nlohmann::json payload;
    try {
        in >> payload;
    } catch (const nlohmann::json::parse_error& ex) {
        return std::unexpected(
            Error::make(errc::kParse, std::format("Failed to parse config file {}: {}", path, ex.what())));
    }
    return apply_config(default_config(), payload, schema_dir);
}

nlohmann::json to_json(const ClientConfig& config)
{
    return {
        { "schema_version",                                kConfigSchema},
        {        "cluster",                               config.cluster},
        {"memo_program_id",                       config.memo_program_id},
        {      "store_dir",                             config.store_dir},
        {     "schema_dir",                            config.schema_dir},
        {"signature_limit",                       config.signature_limit},
        {           "view", std::string(view_mode_name(config.view_mode))}
    };
}

}  // namespace opentreasury::config
