/**
 * @file proof.cpp
 * @brief Proof record generation
 */

#include "opentreasury/proof.hpp"

#include "opentreasury/canonical_json.hpp"

namespace opentreasury::proof {

opentreasury::Result<ProofRecord> generate_proof(const document::OtmsDocument& doc)
{
    auto canonical = canonical::canonicalize(document::to_json(doc));
    if (!canonical) {
        return std::unexpected(canonical.error());
    }
    auto content = content_digest(doc);
    if (!content) {
        return std::unexpected(content.error());
    }

    ProofRecord record;
    record.digest_hex = common::sha256(*canonical);
    record.canonical_json = std::move(*canonical);
    record.content_digest = std::move(*content);
    return record;
}

opentreasury::Result<std::string> content_digest(const document::OtmsDocument& doc)
{
    auto j = document::to_json(doc);
    j.erase("exportedAt");
    return canonical::hash_canonical(j);
}

bool is_current(const ProofRecord& record, const document::OtmsDocument& current)
{
    auto digest = content_digest(current);
    return digest && *digest == record.content_digest;
}

}  // namespace opentreasury::proof
