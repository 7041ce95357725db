#pragma once

/**
 * @file memo.hpp
 * @brief Anchor memo text: encode and decode
 *
 * Wire layout (UTF-8, '\n' separated):
 *
 *     OpenTreasury Proof (OTMS v1)
 *     Treasury: <treasury>
 *     Hash: <digest hex>
 *     Timestamp: <ISO-8601>
 *
 * Decoding locates fields by case-insensitive prefix, so reordered lines
 * and extra lines added by relays or explorers are tolerated.
 */

#include "opentreasury/common.hpp"

#include <string>
#include <string_view>

namespace opentreasury::memo {

struct AnchorMemo
{
    std::string label;          ///< header line, "" if absent
    std::string treasury;       ///< "" if absent
    std::string digest_hex;     ///< never empty
    std::string timestamp_iso;  ///< "" if absent

    friend bool operator==(const AnchorMemo&, const AnchorMemo&) = default;
};

/// "OpenTreasury Proof (OTMS v1)"
[[nodiscard]] std::string proof_label();

[[nodiscard]] std::string encode_memo(std::string_view treasury,
                                      std::string_view digest_hex,
                                      std::string_view timestamp_iso);

/**
 * @brief Parse memo text
 * @return AnchorMemo, or errc::kMissingHashLine when no non-empty "Hash:" line exists
 */
[[nodiscard]] opentreasury::Result<AnchorMemo> decode_memo(std::string_view text);

}  // namespace opentreasury::memo
