#pragma once

/**
 * @file document.hpp
 * @brief OTMS document: the exportable, hashable summary of an annotation set
 */

#include "opentreasury/annotation.hpp"
#include "opentreasury/common.hpp"

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace opentreasury::document {

struct OtmsEntry
{
    std::string signature;
    annotation::Label category = annotation::Label::kOther;
    std::string description;  ///< packed note, "" when absent
    std::string proof_url;    ///< "" when absent

    friend bool operator==(const OtmsEntry&, const OtmsEntry&) = default;
};

struct OtmsDocument
{
    int version = 1;
    std::string standard;
    std::string cluster;
    std::string treasury;
    std::string exported_at;
    std::vector<OtmsEntry> entries;

    friend bool operator==(const OtmsDocument&, const OtmsDocument&) = default;
};

/**
 * Build a document from the current annotation set.
 *
 * Entries follow the set's signature order, so equal content always yields
 * equal entry order. @p exported_at defaults to the current UTC time.
 */
[[nodiscard]] OtmsDocument build_document(std::string_view treasury,
                                          std::string_view cluster,
                                          const annotation::AnnotationSet& annotations);

[[nodiscard]] OtmsDocument build_document(std::string_view treasury,
                                          std::string_view cluster,
                                          const annotation::AnnotationSet& annotations,
                                          std::string exported_at);

[[nodiscard]] nlohmann::json to_json(const OtmsDocument& doc);

/**
 * @brief Strict conversion: every required key present with the right type,
 *        version 1 and standard "OTMS"
 */
[[nodiscard]] opentreasury::Result<OtmsDocument> document_from_json(const nlohmann::json& j);

/**
 * @brief Default export file name: "opentreasury-otms-<first 6 chars>.json"
 */
[[nodiscard]] std::string export_file_name(std::string_view treasury);

// ============================================================================
// Import
// ============================================================================

enum class ImportKind {
    kOtms,        ///< {"entries": [...]}
    kLegacyMeta   ///< {"meta": {signature: {label, note, proofUrl}}}
};

struct ImportedAnnotations
{
    ImportKind kind;
    annotation::AnnotationSet annotations;
    std::size_t skipped = 0;  ///< OTMS entries without a signature
};

/**
 * Read annotations back from an exported file.
 *
 * Accepts the legacy {"meta": ...} shape (checked first) and OTMS
 * documents. OTMS entries without a signature are skipped; an unknown or
 * missing category becomes Other. The payload is validated against
 * otms_legacy.v1 / otms_import.v1 in @p schema_dir.
 */
[[nodiscard]] opentreasury::Result<ImportedAnnotations> import_annotations(const nlohmann::json& payload,
                                                                          const std::string& schema_dir);

}  // namespace opentreasury::document
