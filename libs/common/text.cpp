/**
 * @file text.cpp
 * @brief ASCII text helpers, URL and account id checks
 */

#include "opentreasury/common.hpp"

#include <algorithm>
#include <cctype>
#include <format>

namespace opentreasury {

VoidResult ensure_writable(ViewMode mode, std::string_view operation)
{
    if (mode == ViewMode::kReadOnly) {
        return std::unexpected(Error::make(
            errc::kReadOnly, std::format("{} is not available in read-only view", operation)));
    }
    return {};
}

}  // namespace opentreasury

namespace opentreasury::common {

namespace {

[[nodiscard]] bool is_space(char c)
{
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

[[nodiscard]] char lower(char c)
{
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

constexpr std::string_view kBase58Alphabet =
    "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

}  // namespace

std::string_view trim(std::string_view text)
{
    while (!text.empty() && is_space(text.front())) {
        text.remove_prefix(1);
    }
    while (!text.empty() && is_space(text.back())) {
        text.remove_suffix(1);
    }
    return text;
}

std::string to_lower_ascii(std::string_view text)
{
    std::string result(text);
    std::ranges::transform(result, result.begin(), lower);
    return result;
}

bool istarts_with(std::string_view text, std::string_view prefix)
{
    return text.size() >= prefix.size() && iequals(text.substr(0, prefix.size()), prefix);
}

bool iequals(std::string_view lhs, std::string_view rhs)
{
    return std::ranges::equal(lhs, rhs, [](char a, char b) { return lower(a) == lower(b); });
}

bool icontains(std::string_view haystack, std::string_view needle)
{
    if (needle.empty()) {
        return true;
    }
    return to_lower_ascii(haystack).find(to_lower_ascii(needle)) != std::string::npos;
}

bool is_valid_http_url(std::string_view value)
{
    std::string_view rest;
    if (istarts_with(value, "http://")) {
        rest = value.substr(7);
    } else if (istarts_with(value, "https://")) {
        rest = value.substr(8);
    } else {
        return false;
    }

    if (std::ranges::any_of(value, [](char c) {
            return is_space(c) || std::iscntrl(static_cast<unsigned char>(c)) != 0;
        })) {
        return false;
    }

    // Authority ends at the first path, query or fragment delimiter.
    const auto authority_end = rest.find_first_of("/?#");
    std::string_view authority = rest.substr(0, authority_end);
    if (const auto at = authority.rfind('@'); at != std::string_view::npos) {
        authority.remove_prefix(at + 1);
    }

    std::string_view host = authority;
    if (host.starts_with('[')) {
        const auto close = host.find(']');
        if (close == std::string_view::npos || close == 1) {
            return false;
        }
        return true;
    }
    if (const auto colon = host.rfind(':'); colon != std::string_view::npos) {
        const auto port = host.substr(colon + 1);
        if (!std::ranges::all_of(port, [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; })) {
            return false;
        }
        host = host.substr(0, colon);
    }
    return !host.empty();
}

bool is_valid_account_id(std::string_view value)
{
    if (value.size() < 32 || value.size() > 44) {
        return false;
    }
    return std::ranges::all_of(value, [](char c) {
        return kBase58Alphabet.find(c) != std::string_view::npos;
    });
}

}  // namespace opentreasury::common
