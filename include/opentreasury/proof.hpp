#pragma once

/**
 * @file proof.hpp
 * @brief Proof records: canonical document text and its digest
 */

#include "opentreasury/common.hpp"
#include "opentreasury/document.hpp"

#include <optional>
#include <string>

namespace opentreasury::proof {

/**
 * Ephemeral result of "generate proof".
 *
 * digest_hex covers the full canonical document, exportedAt included, so
 * two exports at different instants have different digests. content_digest
 * leaves exportedAt out and identifies the annotation content the record
 * was generated from.
 */
struct ProofRecord
{
    std::string canonical_json;
    std::string digest_hex;
    std::string content_digest;
    std::optional<std::string> anchor_tx_id;
};

/**
 * @brief Canonicalize @p doc and hash it
 * @return Record without anchor, or the canonicalization error
 */
[[nodiscard]] opentreasury::Result<ProofRecord> generate_proof(const document::OtmsDocument& doc);

/**
 * @brief Digest of the canonical document with the exportedAt member removed
 */
[[nodiscard]] opentreasury::Result<std::string> content_digest(const document::OtmsDocument& doc);

/**
 * True when @p record was generated from the same treasury, cluster and
 * annotation content as @p current. Stale records must not be anchored.
 */
[[nodiscard]] bool is_current(const ProofRecord& record, const document::OtmsDocument& current);

}  // namespace opentreasury::proof
