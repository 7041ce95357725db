/**
 * @file document.cpp
 * @brief OTMS document building, JSON conversion and import
 */

#include "opentreasury/document.hpp"

#include "opentreasury/schema_validate.hpp"
#include "opentreasury/version.hpp"

#include <cstdint>
#include <format>

namespace opentreasury::document {

namespace {

using annotation::Label;

[[nodiscard]] opentreasury::Result<std::string> required_string(const nlohmann::json& j, const char* key)
{
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        return std::unexpected(Error::make(
            errc::kValidation, std::format("OTMS field '{}' must be a string", key)));
    }
    return it->get<std::string>();
}

[[nodiscard]] opentreasury::Result<OtmsEntry> entry_from_json(const nlohmann::json& j, std::size_t index)
{
    if (!j.is_object()) {
        return std::unexpected(Error::make(
            errc::kValidation, std::format("OTMS entry {} must be an object", index)));
    }
    OtmsEntry entry;
    for (auto [key, target] : {std::pair{"signature", &entry.signature},
                               std::pair{"description", &entry.description},
                               std::pair{"proofUrl", &entry.proof_url}}) {
        auto value = required_string(j, key);
        if (!value) {
            return std::unexpected(Error::make(
                value.error().code, std::format("{} (entry {})", value.error().message, index)));
        }
        *target = std::move(*value);
    }
    auto category = required_string(j, "category");
    if (!category) {
        return std::unexpected(category.error());
    }
    auto label = annotation::parse_label(*category);
    if (!label) {
        return std::unexpected(Error::make(
            label.error().code, std::format("{} (entry {})", label.error().message, index)));
    }
    entry.category = *label;
    return entry;
}

[[nodiscard]] std::string string_or_empty(const nlohmann::json& j, const char* key)
{
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        return {};
    }
    return it->get<std::string>();
}

[[nodiscard]] opentreasury::Result<ImportedAnnotations> import_otms_entries(const nlohmann::json& entries)
{
    ImportedAnnotations imported{.kind = ImportKind::kOtms, .annotations = {}, .skipped = 0};
    for (const auto& entry : entries) {
        const auto signature = std::string(common::trim(string_or_empty(entry, "signature")));
        if (signature.empty()) {
            ++imported.skipped;
            continue;
        }
        auto label = annotation::parse_label(string_or_empty(entry, "category"));

        annotation::Annotation value;
        value.label = label.value_or(Label::kOther);
        value.note = annotation::unpack_note(value.label, string_or_empty(entry, "description"));
        if (auto url = common::trim(string_or_empty(entry, "proofUrl")); !url.empty()) {
            if (!common::is_valid_http_url(url)) {
                return std::unexpected(Error::make(
                    errc::kValidation,
                    std::format("Entry {} has an invalid supporting link: {}", signature, url)));
            }
            value.proof_url = std::string(url);
        }
        imported.annotations.insert_or_assign(signature, std::move(value));
    }
    return imported;
}

}  // namespace

OtmsDocument build_document(std::string_view treasury,
                            std::string_view cluster,
                            const annotation::AnnotationSet& annotations)
{
    return build_document(treasury, cluster, annotations, common::current_time_iso8601());
}

OtmsDocument build_document(std::string_view treasury,
                            std::string_view cluster,
                            const annotation::AnnotationSet& annotations,
                            std::string exported_at)
{
    OtmsDocument doc;
    doc.version = kStandardVersion;
    doc.standard = kStandard;
    doc.cluster = std::string(cluster);
    doc.treasury = std::string(common::trim(treasury));
    doc.exported_at = std::move(exported_at);
    doc.entries.reserve(annotations.size());
    for (const auto& [signature, value] : annotations) {
        doc.entries.push_back(OtmsEntry{
            .signature = signature,
            .category = value.label,
            .description = annotation::pack_note(value.label, value.note).value_or(""),
            .proof_url = value.proof_url.value_or(""),
        });
    }
    return doc;
}

nlohmann::json to_json(const OtmsDocument& doc)
{
    nlohmann::json entries = nlohmann::json::array();
    for (const auto& entry : doc.entries) {
        entries.push_back({
            {  "signature",                                       entry.signature},
            {   "category", std::string(annotation::label_name(entry.category))},
            {"description",                                     entry.description},
            {   "proofUrl",                                       entry.proof_url}
        });
    }
    return nlohmann::json{
        {   "version",      doc.version},
        {  "standard",     doc.standard},
        {   "cluster",      doc.cluster},
        {  "treasury",     doc.treasury},
        {"exportedAt",  doc.exported_at},
        {   "entries", std::move(entries)}
    };
}

opentreasury::Result<OtmsDocument> document_from_json(const nlohmann::json& j)
{
    if (!j.is_object()) {
        return std::unexpected(Error::make(errc::kValidation, "OTMS document must be a JSON object"));
    }
    auto version = j.find("version");
    if (version == j.end() || !version->is_number_integer()) {
        return std::unexpected(Error::make(errc::kValidation, "OTMS field 'version' must be an integer"));
    }
    // Compared at full width; 2^32 + 1 must not read back as 1.
    const bool supported = version->is_number_unsigned()
                               ? version->get<std::uint64_t>() == static_cast<std::uint64_t>(kStandardVersion)
                               : version->get<std::int64_t>() == kStandardVersion;
    if (!supported) {
        return std::unexpected(
            Error::make(errc::kValidation, std::format("Unsupported OTMS version: {}", version->dump())));
    }

    OtmsDocument doc;
    doc.version = kStandardVersion;
    for (auto [key, target] : {std::pair{"standard", &doc.standard},
                               std::pair{"cluster", &doc.cluster},
                               std::pair{"treasury", &doc.treasury},
                               std::pair{"exportedAt", &doc.exported_at}}) {
        auto value = required_string(j, key);
        if (!value) {
            return std::unexpected(value.error());
        }
        *target = std::move(*value);
    }
    if (doc.standard != kStandard) {
        return std::unexpected(
            Error::make(errc::kValidation, std::format("Unsupported standard: '{}'", doc.standard)));
    }

    auto entries = j.find("entries");
    if (entries == j.end() || !entries->is_array()) {
        return std::unexpected(Error::make(errc::kValidation, "OTMS field 'entries' must be an array"));
    }
    doc.entries.reserve(entries->size());
    std::size_t index = 0;
    for (const auto& item : *entries) {
        auto entry = entry_from_json(item, index++);
        if (!entry) {
            return std::unexpected(entry.error());
        }
        doc.entries.push_back(std::move(*entry));
    }
    return doc;
}

std::string export_file_name(std::string_view treasury)
{
    return std::format("opentreasury-otms-{}.json", common::trim(treasury).substr(0, 6));
}

opentreasury::Result<ImportedAnnotations> import_annotations(const nlohmann::json& payload,
                                                             const std::string& schema_dir)
{
    if (payload.is_object() && payload.contains("meta") && payload.at("meta").is_object()) {
        if (auto result = common::validate_json(payload, common::schema_file(schema_dir, "otms_legacy.v1"));
            !result) {
            return std::unexpected(Error::make(
                result.error().code, "Legacy ledger file is invalid: " + result.error().message));
        }
        auto annotations = annotation::annotation_set_from_json(payload.at("meta"));
        if (!annotations) {
            return std::unexpected(annotations.error());
        }
        return ImportedAnnotations{.kind = ImportKind::kLegacyMeta,
                                   .annotations = std::move(*annotations),
                                   .skipped = 0};
    }

    if (payload.is_object() && payload.contains("entries") && payload.at("entries").is_array()) {
        if (auto result = common::validate_json(payload, common::schema_file(schema_dir, "otms_import.v1"));
            !result) {
            return std::unexpected(Error::make(
                result.error().code, "OTMS file is invalid: " + result.error().message));
        }
        return import_otms_entries(payload.at("entries"));
    }

    return std::unexpected(Error::make(
        errc::kValidation, "Invalid ledger file: expected an OTMS document or a legacy 'meta' mapping"));
}

}  // namespace opentreasury::document
