#pragma once

/**
 * @file schema_validate.hpp
 * @brief JSON Schema validation utilities
 */

#include "opentreasury/common.hpp"

#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace opentreasury::common {

/**
 * Validate JSON against a JSON Schema file.
 *
 * "$ref" values of the form "opentreasury:schema/<name>" resolve to
 * "<name>.schema.json" next to @p schema_path.
 *
 * @param j JSON document to validate
 * @param schema_path Path to JSON Schema file
 * @return Empty on success, error on failure
 */
[[nodiscard]] opentreasury::VoidResult validate_json(const nlohmann::json& j,
                                                     const std::string& schema_path);

/**
 * @brief Path of "<schema_name>.schema.json" inside @p schema_dir
 */
[[nodiscard]] std::string schema_file(std::string_view schema_dir, std::string_view schema_name);

}  // namespace opentreasury::common
