/**
 * @file canonical_json.cpp
 * @brief Canonical JSON serialization
 */

#include "opentreasury/canonical_json.hpp"

#include "opentreasury/common.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <format>
#include <string_view>
#include <vector>

namespace opentreasury::canonical {

namespace {

/// Largest magnitude an IEEE double holds exactly as an integer (2^53).
constexpr std::uint64_t kMaxExactInteger = std::uint64_t{1} << 53;

/// Decimal exponent window of the plain (non-exponential) number layout.
constexpr int kMaxPlainExponent = 21;
constexpr int kMinPlainExponent = -6;

opentreasury::VoidResult validate_node(const nlohmann::json& j, const std::string& path, std::size_t depth)
{
    if (depth > kMaxDepth) {
        return std::unexpected(Error::make(
            errc::kNestingTooDeep, std::format("JSON nesting exceeds {} levels at: {}", kMaxDepth, path)));
    }
    if (j.is_object()) {
        for (const auto& [key, val] : j.items()) {
            if (auto result = validate_node(val, path + "." + key, depth + 1); !result) {
                return result;
            }
        }
    } else if (j.is_array()) {
        std::size_t index = 0;
        for (const auto& elem : j) {
            if (auto result = validate_node(elem, std::format("{}[{}]", path, index), depth + 1);
                !result) {
                return result;
            }
            ++index;
        }
    }
    return {};
}

[[nodiscard]] std::vector<std::string> sorted_keys(const nlohmann::json& j)
{
    std::vector<std::string> keys;
    keys.reserve(j.size());
    for (const auto& [key, _] : j.items()) {
        keys.push_back(key);
    }
    // std::string comparison is byte-wise, independent of locale.
    std::ranges::sort(keys);
    return keys;
}

/**
 * @brief Shortest round-trip text of @p value in the ECMAScript Number layout
 *
 * Digits and exponent come from the shortest scientific form; the layout is
 * plain for decimal exponents in [-6, 21) and "<d>[.<ddd>]e<sign><exp>"
 * otherwise, without exponent padding. Non-finite values print as null.
 */
[[nodiscard]] std::string format_double(double value)
{
    if (!std::isfinite(value)) {
        return "null";
    }
    if (value == 0.0) {
        return "0";  // also -0
    }

    std::array<char, 64> buffer{};
    // 64 bytes always fit the shortest scientific form of a double.
    const auto written = std::to_chars(buffer.data(),
                                       buffer.data() + buffer.size(),
                                       std::abs(value),
                                       std::chars_format::scientific);
    const std::string_view scientific(buffer.data(), static_cast<std::size_t>(written.ptr - buffer.data()));
    const auto exp_pos = scientific.find('e');

    std::string digits;
    for (char c : scientific.substr(0, exp_pos)) {
        if (c != '.') {
            digits.push_back(c);
        }
    }
    int exponent = 0;
    const auto exp_text = scientific.substr(exp_pos + 1);
    const char* exp_begin = exp_text.data() + (exp_text.front() == '+' ? 1 : 0);
    (void)std::from_chars(exp_begin, exp_text.data() + exp_text.size(), exponent);

    const auto k = static_cast<int>(digits.size());
    const int n = exponent + 1;
    std::string out = value < 0 ? "-" : "";
    if (k <= n && n <= kMaxPlainExponent) {
        out += digits;
        out.append(static_cast<std::size_t>(n - k), '0');
    } else if (0 < n && n <= kMaxPlainExponent) {
        out += digits.substr(0, static_cast<std::size_t>(n));
        out += '.';
        out += digits.substr(static_cast<std::size_t>(n));
    } else if (kMinPlainExponent < n && n <= 0) {
        out += "0.";
        out.append(static_cast<std::size_t>(-n), '0');
        out += digits;
    } else {
        out += digits.front();
        if (k > 1) {
            out += '.';
            out += digits.substr(1);
        }
        out += std::format("e{}{}", n - 1 < 0 ? '-' : '+', std::abs(n - 1));
    }
    return out;
}

[[nodiscard]] std::string format_number(const nlohmann::json& j)
{
    if (j.is_number_unsigned()) {
        const auto value = j.get<std::uint64_t>();
        return value <= kMaxExactInteger ? std::to_string(value) : format_double(static_cast<double>(value));
    }
    if (j.is_number_integer()) {
        const auto value = j.get<std::int64_t>();
        const auto magnitude = value < 0 ? std::uint64_t(0) - static_cast<std::uint64_t>(value)
                                         : static_cast<std::uint64_t>(value);
        return magnitude <= kMaxExactInteger ? std::to_string(value)
                                             : format_double(static_cast<double>(value));
    }
    return format_double(j.get<double>());
}

/// Escaped string literal; throws nlohmann type_error on invalid UTF-8.
[[nodiscard]] std::string quote(const nlohmann::json& string_node)
{
    return string_node.dump(-1, ' ', false, nlohmann::json::error_handler_t::strict);
}

void write_indent(std::string& out, std::size_t depth)
{
    out.append(depth * static_cast<std::size_t>(kIndent), ' ');
}

void write_value(const nlohmann::json& j, std::size_t depth, std::string& out)
{
    if (j.is_object()) {
        if (j.empty()) {
            out += "{}";
            return;
        }
        out += "{\n";
        bool first = true;
        for (const auto& key : sorted_keys(j)) {
            if (!first) {
                out += ",\n";
            }
            first = false;
            write_indent(out, depth + 1);
            out += quote(nlohmann::json(key));
            out += ": ";
            write_value(j.at(key), depth + 1, out);
        }
        out += '\n';
        write_indent(out, depth);
        out += '}';
        return;
    }
    if (j.is_array()) {
        if (j.empty()) {
            out += "[]";
            return;
        }
        out += "[\n";
        bool first = true;
        for (const auto& elem : j) {
            if (!first) {
                out += ",\n";
            }
            first = false;
            write_indent(out, depth + 1);
            write_value(elem, depth + 1, out);
        }
        out += '\n';
        write_indent(out, depth);
        out += ']';
        return;
    }
    if (j.is_number()) {
        out += format_number(j);
        return;
    }
    if (j.is_string()) {
        out += quote(j);
        return;
    }
    // null, booleans; binary values are not produced by the parser.
    out += j.dump();
}

}  // namespace

opentreasury::Result<std::string> canonicalize(const nlohmann::json& j)
{
    if (auto result = validate_node(j, "$", 0); !result) {
        return std::unexpected(result.error());
    }

    std::string out;
    try {
        write_value(j, 0, out);
    } catch (const nlohmann::json::type_error& ex) {
        // Raised for strings that are not valid UTF-8.
        return std::unexpected(
            Error::make(errc::kInvalidUtf8, std::string("Cannot serialize JSON: ") + ex.what()));
    }
    return out;
}

opentreasury::Result<std::string> hash_canonical(const nlohmann::json& j)
{
    auto canonical = canonicalize(j);
    if (!canonical) {
        return std::unexpected(canonical.error());
    }
    return common::sha256(*canonical);
}

void sort_keys_recursive(nlohmann::json& j)
{
    if (j.is_object()) {
        nlohmann::json sorted = nlohmann::json::object();
        for (const auto& key : sorted_keys(j)) {
            sort_keys_recursive(j[key]);
            sorted[key] = std::move(j[key]);
        }
        j = std::move(sorted);
    } else if (j.is_array()) {
        for (auto& elem : j) {
            sort_keys_recursive(elem);
        }
    }
}

opentreasury::VoidResult validate_for_canonical(const nlohmann::json& j)
{
    return validate_node(j, "$", 0);
}

}  // namespace opentreasury::canonical
