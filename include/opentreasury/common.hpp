#pragma once

/**
 * @file common.hpp
 * @brief Common utilities: result types, hashing, text and time helpers
 */

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <utility>

namespace opentreasury {

/**
 * @brief Error information for Result types
 */
struct Error
{
    std::string code;     ///< Machine-readable error code (see errc)
    std::string message;  ///< Human-readable error message

    [[nodiscard]] static Error make(std::string code, std::string message)
    {
        return Error{.code = std::move(code), .message = std::move(message)};
    }
};

/**
 * @brief Result type using std::expected (C++23)
 * @tparam T Success value type
 */
template <typename T>
using Result = std::expected<T, Error>;

/**
 * @brief Result type for void success using std::expected (C++23)
 */
using VoidResult = std::expected<void, Error>;

/**
 * Error codes shared across modules.
 *
 * The first four are the broad categories (bad user input, malformed JSON,
 * collaborator failure, filesystem failure); the rest name specific refusals.
 */
namespace errc {

constexpr const char* kValidation = "ValidationError";
constexpr const char* kParse = "ParseError";
constexpr const char* kNetwork = "NetworkError";
constexpr const char* kIo = "IOError";
constexpr const char* kSchemaInvalid = "SchemaInvalid";
constexpr const char* kNotFound = "NotFound";
constexpr const char* kReadOnly = "ReadOnlyView";
constexpr const char* kNoSigner = "NoSigner";
constexpr const char* kNothingToAnchor = "NothingToAnchor";
constexpr const char* kUnsupportedWallet = "UnsupportedWallet";
constexpr const char* kStaleProof = "StaleProof";
constexpr const char* kMissingHashLine = "MissingHashLine";
constexpr const char* kNestingTooDeep = "NestingTooDeep";
constexpr const char* kInvalidUtf8 = "InvalidUtf8";

}  // namespace errc

/**
 * Whether the caller may mutate annotations or publish anchors.
 *
 * kReadOnly corresponds to the shared public view of a treasury.
 */
enum class ViewMode {
    kInteractive,
    kReadOnly
};

/**
 * @brief Fail with errc::kReadOnly when @p mode forbids @p operation
 */
[[nodiscard]] VoidResult ensure_writable(ViewMode mode, std::string_view operation);

}  // namespace opentreasury

namespace opentreasury::common {

// ============================================================================
// SHA-256 Hash
// ============================================================================

constexpr std::size_t kSha256DigestSize = 32;
constexpr std::size_t kSha256HexLength = kSha256DigestSize * 2;

using Sha256Digest = std::array<std::uint8_t, kSha256DigestSize>;

/**
 * @brief Incremental SHA-256 (FIPS 180-4)
 *
 * update() may be called any number of times; finish() pads the message and
 * returns the digest. The object must be reset() before it is reused.
 */
class Sha256
{
public:
    Sha256();

    void reset();
    void update(std::span<const std::uint8_t> data);
    void update(std::string_view data);

    [[nodiscard]] Sha256Digest finish();

private:
    void compress_block(const std::uint8_t* block);

    std::array<std::uint32_t, 8> m_state;
    std::array<std::uint8_t, 64> m_pending;
    std::size_t m_pending_len;
    std::uint64_t m_message_len;
};

/**
 * Compute SHA-256 hash of data
 * @param data Input bytes (UTF-8 text is hashed as-is)
 * @return Lowercase hex-encoded hash string (64 characters)
 */
[[nodiscard]] std::string sha256(std::string_view data);

/**
 * @brief Lowercase hex encoding of a digest
 */
[[nodiscard]] std::string to_hex(std::span<const std::uint8_t> bytes);

/**
 * @brief True when @p value is exactly 64 hex characters (either case)
 */
[[nodiscard]] bool is_sha256_hex(std::string_view value);

// ============================================================================
// Text helpers
// ============================================================================

/**
 * @brief Strip leading and trailing ASCII whitespace
 */
[[nodiscard]] std::string_view trim(std::string_view text);

[[nodiscard]] std::string to_lower_ascii(std::string_view text);

/**
 * @brief Case-insensitive (ASCII) prefix test
 */
[[nodiscard]] bool istarts_with(std::string_view text, std::string_view prefix);

/**
 * @brief Case-insensitive (ASCII) equality
 */
[[nodiscard]] bool iequals(std::string_view lhs, std::string_view rhs);

/**
 * @brief Case-insensitive (ASCII) substring test; an empty needle always matches
 */
[[nodiscard]] bool icontains(std::string_view haystack, std::string_view needle);

/**
 * Check that @p value is an absolute http:// or https:// URL with a host.
 */
[[nodiscard]] bool is_valid_http_url(std::string_view value);

/**
 * Check that @p value looks like a ledger account id: 32 to 44 base58
 * characters (no 0, O, I or l).
 */
[[nodiscard]] bool is_valid_account_id(std::string_view value);

// ============================================================================
// Time
// ============================================================================

/**
 * Format a time point as ISO-8601 UTC with millisecond precision,
 * e.g. "2024-05-01T12:00:00.000Z".
 */
[[nodiscard]] std::string format_iso8601(std::chrono::system_clock::time_point when);

/**
 * @brief format_iso8601(system_clock::now())
 */
[[nodiscard]] std::string current_time_iso8601();

}  // namespace opentreasury::common
