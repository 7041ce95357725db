#pragma once

/**
 * @file annotation.hpp
 * @brief Transaction annotations: labels, notes and supporting links
 */

#include "opentreasury/common.hpp"

#include <map>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace opentreasury::annotation {

enum class Label {
    kDonation,
    kGrant,
    kOps,
    kMilestone,
    kOther
};

/// Wire name of a label ("Donation", "Grant", "Ops", "Milestone", "Other").
[[nodiscard]] std::string_view label_name(Label label);

/**
 * @brief Parse an exact wire name
 * @return Label, or errc::kValidation for unknown names
 */
[[nodiscard]] opentreasury::Result<Label> parse_label(std::string_view name);

/**
 * Free-text part of an annotation.
 *
 * custom_category is only kept for Label::kOther.
 */
struct Note
{
    std::optional<std::string> custom_category;
    std::optional<std::string> description;

    friend bool operator==(const Note&, const Note&) = default;
};

struct Annotation
{
    Label label = Label::kOther;
    Note note;
    std::optional<std::string> proof_url;

    friend bool operator==(const Annotation&, const Annotation&) = default;
};

/// Annotations keyed by transaction signature, iterated in signature order.
using AnnotationSet = std::map<std::string, Annotation>;

/**
 * Raw editor input, before trimming and validation.
 */
struct AnnotationInput
{
    Label label = Label::kDonation;
    std::string custom_category;
    std::string description;
    std::string proof_url;
};

/**
 * @brief Trim and validate editor input
 *
 * Empty fields become std::nullopt. A non-empty proof URL must be http(s),
 * otherwise errc::kValidation is returned.
 */
[[nodiscard]] opentreasury::Result<Annotation> make_annotation(const AnnotationInput& input);

/**
 * Pack a note into the single free-text field used by OTMS documents and
 * the legacy store format.
 *
 * Other + category X + description D -> "Other: X | D"; without D -> "Other: X";
 * without X -> "Other | D"; neither -> std::nullopt. Other labels pack to
 * the description.
 */
[[nodiscard]] std::optional<std::string> pack_note(Label label, const Note& note);

/**
 * @brief Inverse of pack_note for text read from documents or legacy files
 *
 * Text that does not carry the "Other" prefix is kept whole as the
 * description.
 */
[[nodiscard]] Note unpack_note(Label label, std::string_view packed);

/**
 * Store representation: {"label": ..., "note"?: packed, "proofUrl"?: ...}.
 */
[[nodiscard]] nlohmann::json to_json(const Annotation& annotation);

[[nodiscard]] opentreasury::Result<Annotation> annotation_from_json(const nlohmann::json& j);

[[nodiscard]] nlohmann::json to_json(const AnnotationSet& annotations);

[[nodiscard]] opentreasury::Result<AnnotationSet> annotation_set_from_json(const nlohmann::json& j);

}  // namespace opentreasury::annotation
