#pragma once

/**
 * @file canonical_json.hpp
 * @brief Canonical JSON serialization for deterministic hashing
 *
 * Rules:
 * - UTF-8 encoding, non-ASCII characters emitted as-is
 * - Object keys in byte-wise lexicographic order at every depth
 * - Array order preserved
 * - Two-space indentation, one member per line, ": " after keys
 * - Numbers written the way ECMAScript Number.prototype.toString writes
 *   them: integral values without a fraction, otherwise the shortest
 *   round-trip digits, exponent form ("1e+21", "1e-7") outside [1e-6, 1e21)
 *
 * The layout matches what the first OpenTreasury exporter produced, so
 * digests anchored by earlier releases remain reproducible.
 */

#include "opentreasury/common.hpp"

#include <cstddef>
#include <string>

#include <nlohmann/json.hpp>

namespace opentreasury::canonical {

/// Nesting limit; deeper documents are rejected with errc::kNestingTooDeep.
constexpr std::size_t kMaxDepth = 256;

/// Indentation width of the canonical layout.
constexpr int kIndent = 2;

/**
 * Serialize JSON to canonical form
 * @param j JSON value
 * @return Canonical byte string; errc::kNestingTooDeep or errc::kInvalidUtf8 on failure
 */
[[nodiscard]] opentreasury::Result<std::string> canonicalize(const nlohmann::json& j);

/**
 * Compute SHA-256 hash of canonical JSON
 * @param j JSON value
 * @return 64 lowercase hex characters or error
 */
[[nodiscard]] opentreasury::Result<std::string> hash_canonical(const nlohmann::json& j);

/**
 * Sort JSON object keys recursively
 * @param j JSON value (modified in place)
 */
void sort_keys_recursive(nlohmann::json& j);

/**
 * Validate JSON for canonical form requirements
 * - Nesting no deeper than kMaxDepth
 * @param j JSON value
 * @return Empty on success, error on failure
 */
[[nodiscard]] opentreasury::VoidResult validate_for_canonical(const nlohmann::json& j);

}  // namespace opentreasury::canonical
