/**
 * @file verifier.cpp
 * @brief Recompute a document digest and compare it with the anchored memo
 */

#include "opentreasury/verifier.hpp"

#include "opentreasury/canonical_json.hpp"
#include "opentreasury/memo.hpp"

#include <algorithm>
#include <utility>

namespace opentreasury::verifier {

namespace {

[[nodiscard]] opentreasury::Result<nlohmann::json> parse_document(std::string_view json_text)
{
    try {
        return nlohmann::json::parse(json_text);
    } catch (const nlohmann::json::parse_error& ex) {
        return std::unexpected(Error::make(errc::kParse, ex.what()));
    }
}

[[nodiscard]] std::string document_treasury(const nlohmann::json& document)
{
    if (!document.is_object()) {
        return {};
    }
    auto it = document.find("treasury");
    if (it == document.end() || !it->is_string()) {
        return {};
    }
    return std::string(common::trim(it->get_ref<const std::string&>()));
}

[[nodiscard]] VerifyResult finish(VerifyResult result, VerifyStatus status)
{
    result.status = status;
    return result;
}

}  // namespace

std::string_view status_name(VerifyStatus status)
{
    switch (status) {
        case VerifyStatus::kMissingInput:
            return "MissingInput";
        case VerifyStatus::kInvalidJson:
            return "InvalidJson";
        case VerifyStatus::kTransactionNotFound:
            return "TransactionNotFound";
        case VerifyStatus::kQueryFailed:
            return "QueryFailed";
        case VerifyStatus::kNoMemoInstruction:
            return "NoMemoInstruction";
        case VerifyStatus::kUnreadableMemo:
            return "UnreadableMemo";
        case VerifyStatus::kMissingHashLine:
            return "MissingHashLine";
        case VerifyStatus::kHashMismatch:
            return "HashMismatch";
        case VerifyStatus::kTreasuryMismatch:
            return "TreasuryMismatch";
        case VerifyStatus::kVerified:
            return "Verified";
    }
    return "Unknown";
}

std::string_view stage_name(VerifyStage stage)
{
    switch (stage) {
        case VerifyStage::kIdle:
            return "idle";
        case VerifyStage::kFetching:
            return "fetching";
        case VerifyStage::kDecoding:
            return "decoding";
        case VerifyStage::kComparing:
            return "comparing";
        case VerifyStage::kDone:
            return "done";
    }
    return "unknown";
}

std::optional<std::string> extract_memo_text(const nlohmann::json& parsed)
{
    if (parsed.is_string()) {
        return parsed.get<std::string>();
    }
    if (parsed.is_object()) {
        if (auto it = parsed.find("memo"); it != parsed.end() && it->is_string()) {
            return it->get<std::string>();
        }
    }
    return std::nullopt;
}

opentreasury::Result<std::string> compute_document_hash(std::string_view json_text)
{
    auto document = parse_document(json_text);
    if (!document) {
        return std::unexpected(document.error());
    }
    return canonical::hash_canonical(*document);
}

Verifier::Verifier(const ledger::LedgerQueryService& query, std::string memo_program_id)
    : m_query(query)
    , m_memo_program_id(std::move(memo_program_id))
{}

VerifyResult Verifier::verify(std::string_view transaction_id, std::string_view json_text) const
{
    VerifyResult result;
    const auto tx_id = common::trim(transaction_id);
    const auto text = common::trim(json_text);
    if (tx_id.empty() || text.empty()) {
        result.message = tx_id.empty() ? "Paste a tx signature first" : "Paste OTMS JSON first";
        return finish(std::move(result), VerifyStatus::kMissingInput);
    }

    auto document = parse_document(text);
    if (!document) {
        result.message = document.error().message;
        return finish(std::move(result), VerifyStatus::kInvalidJson);
    }
    auto computed = canonical::hash_canonical(*document);
    if (!computed) {
        result.message = computed.error().message;
        return finish(std::move(result), VerifyStatus::kInvalidJson);
    }
    result.computed_hash = std::move(*computed);
    result.document_treasury = document_treasury(*document);

    result.stage = VerifyStage::kFetching;
    auto transaction =
        ledger::call_guarded([&] { return m_query.get_transaction_details(std::string(tx_id)); });
    if (!transaction) {
        result.message = transaction.error().message;
        return finish(std::move(result), VerifyStatus::kQueryFailed);
    }
    if (!transaction->has_value()) {
        return finish(std::move(result), VerifyStatus::kTransactionNotFound);
    }

    result.stage = VerifyStage::kDecoding;
    const auto& instructions = (*transaction)->instructions;
    auto memo_ix = std::ranges::find(instructions, m_memo_program_id, &ledger::ParsedInstruction::program_id);
    if (memo_ix == instructions.end()) {
        return finish(std::move(result), VerifyStatus::kNoMemoInstruction);
    }
    auto memo_text = extract_memo_text(memo_ix->parsed);
    if (!memo_text || memo_text->empty()) {
        return finish(std::move(result), VerifyStatus::kUnreadableMemo);
    }
    result.memo_text = std::move(*memo_text);

    auto decoded = memo::decode_memo(result.memo_text);
    if (!decoded) {
        result.message = decoded.error().message;
        return finish(std::move(result), VerifyStatus::kMissingHashLine);
    }
    result.memo_hash = decoded->digest_hex;
    result.memo_treasury = decoded->treasury;

    result.stage = VerifyStage::kComparing;
    if (!common::iequals(result.memo_hash, result.computed_hash)) {
        return finish(std::move(result), VerifyStatus::kHashMismatch);
    }

    result.stage = VerifyStage::kDone;
    if (!result.document_treasury.empty() && !result.memo_treasury.empty()
        && result.document_treasury != result.memo_treasury) {
        return finish(std::move(result), VerifyStatus::kTreasuryMismatch);
    }
    return finish(std::move(result), VerifyStatus::kVerified);
}

}  // namespace opentreasury::verifier
