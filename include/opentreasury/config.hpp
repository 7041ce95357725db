#pragma once

/**
 * @file config.hpp
 * @brief Client configuration (config.v1 JSON file)
 */

#include "opentreasury/common.hpp"

#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace opentreasury::config {

struct ClientConfig
{
    std::string cluster;
    std::string memo_program_id;
    /// Base directory of the annotation store.
    std::string store_dir;
    std::string schema_dir;
    int signature_limit = 0;
    ViewMode view_mode = ViewMode::kInteractive;
};

[[nodiscard]] ClientConfig default_config();

/// "interactive" or "public" (read-only).
[[nodiscard]] opentreasury::Result<ViewMode> parse_view_mode(std::string_view text);
[[nodiscard]] std::string_view view_mode_name(ViewMode mode);

/**
 * Apply a config.v1 payload on top of @p base. Absent keys keep the base
 * values; schema_dir in the payload is honoured only for later lookups.
 */
[[nodiscard]] opentreasury::Result<ClientConfig> apply_config(const ClientConfig& base,
                                                              const nlohmann::json& payload,
                                                              const std::string& schema_dir);

/// Read @p path and apply it on top of default_config().
[[nodiscard]] opentreasury::Result<ClientConfig> load_config(const std::string& path,
                                                             const std::string& schema_dir);

[[nodiscard]] nlohmann::json to_json(const ClientConfig& config);

}  // namespace opentreasury::config
