/**
 * @file memo.cpp
 * @brief Anchor memo encoding and prefix-based decoding
 */

#include "opentreasury/memo.hpp"

#include "opentreasury/version.hpp"

#include <format>
#include <optional>
#include <vector>

namespace opentreasury::memo {

namespace {

constexpr std::string_view kTreasuryField = "Treasury:";
constexpr std::string_view kHashField = "Hash:";
constexpr std::string_view kTimestampField = "Timestamp:";

[[nodiscard]] std::vector<std::string_view> split_lines(std::string_view text)
{
    std::vector<std::string_view> lines;
    while (true) {
        const auto newline = text.find('\n');
        auto line = text.substr(0, newline);
        if (line.ends_with('\r')) {
            line.remove_suffix(1);
        }
        lines.push_back(line);
        if (newline == std::string_view::npos) {
            break;
        }
        text.remove_prefix(newline + 1);
    }
    return lines;
}

/// Trimmed value of the first line starting with @p field, if any.
[[nodiscard]] std::optional<std::string_view> find_field(const std::vector<std::string_view>& lines,
                                                         std::string_view field)
{
    for (auto line : lines) {
        if (common::istarts_with(line, field)) {
            return common::trim(line.substr(field.size()));
        }
    }
    return std::nullopt;
}

}  // namespace

std::string proof_label()
{
    return std::format("{} Proof ({} v{})", kProtocolName, kStandard, kStandardVersion);
}

std::string encode_memo(std::string_view treasury,
                        std::string_view digest_hex,
                        std::string_view timestamp_iso)
{
    return std::format("{}\n{} {}\n{} {}\n{} {}",
                       proof_label(),
                       kTreasuryField,
                       common::trim(treasury),
                       kHashField,
                       digest_hex,
                       kTimestampField,
                       timestamp_iso);
}

opentreasury::Result<AnchorMemo> decode_memo(std::string_view text)
{
    const auto lines = split_lines(text);

    auto digest = find_field(lines, kHashField);
    if (!digest || digest->empty()) {
        return std::unexpected(
            Error::make(errc::kMissingHashLine, "Memo found but could not read Hash line"));
    }

    AnchorMemo memo;
    memo.digest_hex = std::string(*digest);
    memo.treasury = std::string(find_field(lines, kTreasuryField).value_or(""));
    memo.timestamp_iso = std::string(find_field(lines, kTimestampField).value_or(""));

    const auto header = std::format("{} Proof", kProtocolName);
    for (auto line : lines) {
        if (common::istarts_with(common::trim(line), header)) {
            memo.label = std::string(common::trim(line));
            break;
        }
    }
    return memo;
}

}  // namespace opentreasury::memo
