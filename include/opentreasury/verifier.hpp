#pragma once

/**
 * @file verifier.hpp
 * @brief Checking a published document against its on-ledger anchor
 */

#include "opentreasury/common.hpp"
#include "opentreasury/ledger.hpp"
#include "opentreasury/version.hpp"

#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace opentreasury::verifier {

enum class VerifyStatus {
    kMissingInput,
    kInvalidJson,
    kTransactionNotFound,
    kQueryFailed,
    kNoMemoInstruction,
    kUnreadableMemo,
    kMissingHashLine,
    kHashMismatch,
    kTreasuryMismatch,
    kVerified,
};

/// Last stage a verification reached.
enum class VerifyStage { kIdle, kFetching, kDecoding, kComparing, kDone };

[[nodiscard]] std::string_view status_name(VerifyStatus status);
[[nodiscard]] std::string_view stage_name(VerifyStage stage);

struct VerifyResult
{
    VerifyStatus status = VerifyStatus::kMissingInput;
    VerifyStage stage = VerifyStage::kIdle;
    std::string computed_hash;
    std::string memo_hash;
    std::string memo_treasury;
    std::string document_treasury;
    std::string memo_text;
    /// Query failure text for kQueryFailed, parse error for kInvalidJson.
    std::string message;

    /// Digest matched, with or without a treasury warning.
    [[nodiscard]] bool hash_matched() const
    {
        return status == VerifyStatus::kVerified || status == VerifyStatus::kTreasuryMismatch;
    }
};

/**
 * Memo text of a decoded memo instruction: @p parsed itself when it is a
 * string, otherwise its "memo" member when that is a string.
 */
[[nodiscard]] std::optional<std::string> extract_memo_text(const nlohmann::json& parsed);

/// sha256 hex of the canonical form of @p json_text.
[[nodiscard]] opentreasury::Result<std::string> compute_document_hash(std::string_view json_text);

/**
 * @brief Verifies documents against anchor transactions
 *
 * Stateless apart from the collaborators; verify() may be called from several
 * threads when the query service allows it.
 */
class Verifier
{
public:
    explicit Verifier(const ledger::LedgerQueryService& query,
                      std::string memo_program_id = kMemoProgramId);

    [[nodiscard]] VerifyResult verify(std::string_view transaction_id, std::string_view json_text) const;

private:
    const ledger::LedgerQueryService& m_query;
    std::string m_memo_program_id;
};

}  // namespace opentreasury::verifier
