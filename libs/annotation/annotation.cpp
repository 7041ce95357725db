/**
 * @file annotation.cpp
 * @brief Annotation labels, note packing and JSON conversion
 */

#include "opentreasury/annotation.hpp"

#include <array>
#include <format>
#include <utility>

namespace opentreasury::annotation {

namespace {

constexpr std::array<std::pair<Label, std::string_view>, 5> kLabelNames = {{
    {Label::kDonation, "Donation"},
    {Label::kGrant, "Grant"},
    {Label::kOps, "Ops"},
    {Label::kMilestone, "Milestone"},
    {Label::kOther, "Other"},
}};

constexpr std::string_view kOtherPrefix = "Other";
constexpr std::string_view kPackSeparator = " | ";

[[nodiscard]] std::optional<std::string> non_empty(std::string_view text)
{
    auto trimmed = common::trim(text);
    if (trimmed.empty()) {
        return std::nullopt;
    }
    return std::string(trimmed);
}

[[nodiscard]] opentreasury::Result<std::optional<std::string>> optional_string(const nlohmann::json& j,
                                                                             const char* key)
{
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::optional<std::string>{};
    }
    if (!it->is_string()) {
        return std::unexpected(Error::make(
            errc::kValidation, std::format("Annotation field '{}' must be a string", key)));
    }
    return non_empty(it->get_ref<const std::string&>());
}

}  // namespace

std::string_view label_name(Label label)
{
    for (const auto& [value, name] : kLabelNames) {
        if (value == label) {
            return name;
        }
    }
    return "Other";
}

opentreasury::Result<Label> parse_label(std::string_view name)
{
    for (const auto& [value, label_text] : kLabelNames) {
        if (label_text == name) {
            return value;
        }
    }
    return std::unexpected(
        Error::make(errc::kValidation, std::format("Unknown annotation label: '{}'", name)));
}

opentreasury::Result<Annotation> make_annotation(const AnnotationInput& input)
{
    Annotation annotation;
    annotation.label = input.label;
    annotation.note.description = non_empty(input.description);
    if (input.label == Label::kOther) {
        annotation.note.custom_category = non_empty(input.custom_category);
    }

    annotation.proof_url = non_empty(input.proof_url);
    if (annotation.proof_url && !common::is_valid_http_url(*annotation.proof_url)) {
        return std::unexpected(
            Error::make(errc::kValidation, "Supporting link must be a valid http(s) URL"));
    }
    return annotation;
}

std::optional<std::string> pack_note(Label label, const Note& note)
{
    if (label != Label::kOther) {
        return note.description;
    }
    std::string base(kOtherPrefix);
    if (note.custom_category) {
        base += ": " + *note.custom_category;
    }
    if (note.description) {
        return base + std::string(kPackSeparator) + *note.description;
    }
    if (note.custom_category) {
        return base;
    }
    return std::nullopt;
}

Note unpack_note(Label label, std::string_view packed)
{
    Note note;
    const auto text = common::trim(packed);
    if (label != Label::kOther || !common::istarts_with(text, kOtherPrefix)) {
        note.description = non_empty(text);
        return note;
    }

    auto rest = text.substr(kOtherPrefix.size());
    std::string_view category_part;
    std::string_view description_part;
    if (rest.starts_with(':')) {
        rest.remove_prefix(1);
        const auto sep = rest.find(kPackSeparator);
        category_part = rest.substr(0, sep);
        if (sep != std::string_view::npos) {
            description_part = rest.substr(sep + kPackSeparator.size());
        }
    } else if (common::trim(rest).starts_with('|')) {
        description_part = common::trim(rest).substr(1);
    } else if (!common::trim(rest).empty()) {
        // "Otherwise ..." is plain prose, not a packed note.
        note.description = std::string(text);
        return note;
    }

    note.custom_category = non_empty(category_part);
    note.description = non_empty(description_part);
    return note;
}

nlohmann::json to_json(const Annotation& annotation)
{
    nlohmann::json j = {
        {"label", std::string(label_name(annotation.label))}
    };
    if (auto note = pack_note(annotation.label, annotation.note)) {
        j["note"] = *note;
    }
    if (annotation.proof_url) {
        j["proofUrl"] = *annotation.proof_url;
    }
    return j;
}

opentreasury::Result<Annotation> annotation_from_json(const nlohmann::json& j)
{
    if (!j.is_object()) {
        return std::unexpected(Error::make(errc::kValidation, "Annotation must be a JSON object"));
    }
    auto label_it = j.find("label");
    if (label_it == j.end() || !label_it->is_string()) {
        return std::unexpected(Error::make(errc::kValidation, "Annotation label is missing"));
    }
    auto label = parse_label(label_it->get_ref<const std::string&>());
    if (!label) {
        return std::unexpected(label.error());
    }

    auto note = optional_string(j, "note");
    if (!note) {
        return std::unexpected(note.error());
    }
    auto proof_url = optional_string(j, "proofUrl");
    if (!proof_url) {
        return std::unexpected(proof_url.error());
    }
    if (*proof_url && !common::is_valid_http_url(**proof_url)) {
        return std::unexpected(Error::make(
            errc::kValidation, "Supporting link must be a valid http(s) URL: " + **proof_url));
    }

    Annotation annotation;
    annotation.label = *label;
    if (*note) {
        annotation.note = unpack_note(*label, **note);
    }
    annotation.proof_url = std::move(*proof_url);
    return annotation;
}

nlohmann::json to_json(const AnnotationSet& annotations)
{
    nlohmann::json j = nlohmann::json::object();
    for (const auto& [signature, annotation] : annotations) {
        j[signature] = to_json(annotation);
    }
    return j;
}

opentreasury::Result<AnnotationSet> annotation_set_from_json(const nlohmann::json& j)
{
    if (!j.is_object()) {
        return std::unexpected(
            Error::make(errc::kValidation, "Annotation set must be a JSON object"));
    }
    AnnotationSet annotations;
    for (const auto& [signature, value] : j.items()) {
        if (common::trim(signature).empty()) {
            return std::unexpected(
                Error::make(errc::kValidation, "Annotation set contains an empty signature"));
        }
        auto annotation = annotation_from_json(value);
        if (!annotation) {
            return std::unexpected(Error::make(
                annotation.error().code,
                std::format("{} (signature {})", annotation.error().message, signature)));
        }
        annotations.emplace(signature, std::move(*annotation));
    }
    return annotations;
}

}  // namespace opentreasury::annotation
