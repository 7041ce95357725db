#pragma once

/**
 * @file anchor.hpp
 * @brief Publishing a proof digest as a memo transaction
 *
 * Anchoring costs a ledger fee and leaves a permanent public record. It runs
 * only on an explicit request and is never retried here: a second call
 * produces a second, visible anchor.
 */

#include "opentreasury/common.hpp"
#include "opentreasury/document.hpp"
#include "opentreasury/ledger.hpp"
#include "opentreasury/proof.hpp"

#include <optional>
#include <string>

namespace opentreasury::anchor {

struct AnchorRequest
{
    std::string treasury;
    std::string digest_hex;
    /// Memo timestamp; current UTC time when unset.
    std::optional<std::string> timestamp_iso;
    ViewMode mode = ViewMode::kInteractive;
};

struct AnchorReceipt
{
    std::string transaction_id;
    std::string memo_text;
    ledger::AnchorPoint anchor_point;
};

/**
 * @brief The single memo instruction transaction, without signature
 *
 * No account keys; payload is the UTF-8 memo text; @p fee_payer pays.
 */
[[nodiscard]] ledger::Transaction build_memo_transaction(const std::string& fee_payer,
                                                         const std::string& memo_text,
                                                         const ledger::AnchorPoint& anchor);

/**
 * Anchor a digest on the ledger.
 *
 * Order: fetch anchor point, sign (and submit), await confirmation. The
 * provider's direct submission is preferred over sign + SubmissionService.
 *
 * Errors: ReadOnlyView, NoSigner, NothingToAnchor, ValidationError (digest
 * not 64 hex chars), UnsupportedWallet, NetworkError (collaborator failure
 * or exception, original message kept).
 */
[[nodiscard]] opentreasury::Result<AnchorReceipt> anchor_proof(const AnchorRequest& request,
                                                               ledger::SigningProvider& provider,
                                                               const ledger::LedgerQueryService& query,
                                                               ledger::SubmissionService& submission);

/**
 * Anchor @p record after checking it still matches @p current.
 *
 * Returns StaleProof when the annotations changed since the record was
 * generated. record.anchor_tx_id is set only after confirmation.
 */
[[nodiscard]] opentreasury::Result<AnchorReceipt> anchor_proof_record(proof::ProofRecord& record,
                                                                      const document::OtmsDocument& current,
                                                                      ViewMode mode,
                                                                      ledger::SigningProvider& provider,
                                                                      const ledger::LedgerQueryService& query,
                                                                      ledger::SubmissionService& submission);

}  // namespace opentreasury::anchor
