/**
 * @file anchor_writer.cpp
 * @brief Memo transaction construction and the sign / submit / confirm sequence
 */

#include "opentreasury/anchor.hpp"

#include "opentreasury/memo.hpp"
#include "opentreasury/version.hpp"

#include <format>
#include <type_traits>
#include <utility>

namespace opentreasury::anchor {

namespace {

[[nodiscard]] Error network_error(std::string_view step, const Error& cause)
{
    return Error::make(errc::kNetwork, std::format("{}: {}", step, cause.message));
}

/// Guarded collaborator call whose failure is reported as NetworkError tagged with @p step.
template <typename Fn>
auto call_collaborator(std::string_view step, Fn&& fn) -> std::invoke_result_t<Fn>
{
    auto result = ledger::call_guarded(std::forward<Fn>(fn));
    if (!result) {
        return std::unexpected(network_error(step, result.error()));
    }
    return result;
}

[[nodiscard]] opentreasury::Result<std::string> sign_and_send(ledger::SigningProvider& provider,
                                                              const ledger::Transaction& tx,
                                                              ledger::SubmissionService& submission)
{
    if (auto* direct = provider.direct_submitter()) {
        return call_collaborator("Wallet could not send the transaction",
                                 [&] { return direct->sign_and_submit(tx); });
    }
    if (auto* signer = provider.transaction_signer()) {
        auto signed_tx = call_collaborator("Wallet could not sign the transaction",
                                           [&] { return signer->sign(tx); });
        if (!signed_tx) {
            return std::unexpected(signed_tx.error());
        }
        return call_collaborator("Could not submit the transaction",
                                 [&] { return submission.submit(*signed_tx); });
    }
    return std::unexpected(
        Error::make(errc::kUnsupportedWallet, "Wallet does not support sending transactions"));
}

}  // namespace

ledger::Transaction build_memo_transaction(const std::string& fee_payer,
                                           const std::string& memo_text,
                                           const ledger::AnchorPoint& anchor)
{
    ledger::Instruction memo_ix;
    memo_ix.program_id = kMemoProgramId;
    memo_ix.data.assign(memo_text.begin(), memo_text.end());

    ledger::Transaction tx;
    tx.fee_payer = fee_payer;
    tx.recent_anchor = anchor.anchor_id;
    tx.instructions.push_back(std::move(memo_ix));
    return tx;
}

opentreasury::Result<AnchorReceipt> anchor_proof(const AnchorRequest& request,
                                                 ledger::SigningProvider& provider,
                                                 const ledger::LedgerQueryService& query,
                                                 ledger::SubmissionService& submission)
{
    if (auto writable = ensure_writable(request.mode, "Anchoring a proof"); !writable) {
        return std::unexpected(writable.error());
    }
    const auto identity = provider.identity();
    if (!identity || identity->empty()) {
        return std::unexpected(Error::make(errc::kNoSigner, "Connect your wallet first"));
    }
    const auto digest = common::trim(request.digest_hex);
    if (digest.empty()) {
        return std::unexpected(
            Error::make(errc::kNothingToAnchor, "Generate proof first (hash is empty)"));
    }
    if (!common::is_sha256_hex(digest)) {
        return std::unexpected(Error::make(
            errc::kValidation, std::format("Not a SHA-256 hex digest: '{}'", digest)));
    }

    const std::string memo_text =
        memo::encode_memo(request.treasury,
                          common::to_lower_ascii(digest),
                          request.timestamp_iso.value_or(common::current_time_iso8601()));

    auto anchor_point = call_collaborator("Could not fetch a recent blockhash",
                                          [&] { return query.get_recent_anchor_point(); });
    if (!anchor_point) {
        return std::unexpected(anchor_point.error());
    }

    const auto tx = build_memo_transaction(*identity, memo_text, *anchor_point);
    auto transaction_id = sign_and_send(provider, tx, submission);
    if (!transaction_id) {
        return std::unexpected(transaction_id.error());
    }

    if (auto confirmed = call_collaborator("Transaction was not confirmed",
                                           [&] {
                                               return submission.await_confirmation(*transaction_id,
                                                                                    *anchor_point);
                                           });
        !confirmed) {
        return std::unexpected(confirmed.error());
    }

    return AnchorReceipt{.transaction_id = std::move(*transaction_id),
                         .memo_text = memo_text,
                         .anchor_point = std::move(*anchor_point)};
}

opentreasury::Result<AnchorReceipt> anchor_proof_record(proof::ProofRecord& record,
                                                        const document::OtmsDocument& current,
                                                        ViewMode mode,
                                                        ledger::SigningProvider& provider,
                                                        const ledger::LedgerQueryService& query,
                                                        ledger::SubmissionService& submission)
{
    if (!record.digest_hex.empty() && !proof::is_current(record, current)) {
        return std::unexpected(Error::make(
            errc::kStaleProof, "Annotations changed since the proof was generated; generate it again"));
    }

    AnchorRequest request{.treasury = current.treasury,
                          .digest_hex = record.digest_hex,
                          .timestamp_iso = std::nullopt,
                          .mode = mode};
    auto receipt = anchor_proof(request, provider, query, submission);
    if (!receipt) {
        return std::unexpected(receipt.error());
    }
    record.anchor_tx_id = receipt->transaction_id;
    return receipt;
}

}  // namespace opentreasury::anchor
