#pragma once

/**
 * @file ledger.hpp
 * @brief Interfaces of the ledger collaborators and the transaction model
 *
 * Query, signing and submission are provided by the embedding application
 * (RPC client, wallet bridge). All calls are synchronous; callers that need
 * concurrency run them on their own threads.
 */

#include "opentreasury/common.hpp"

#include <cstdint>
#include <exception>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace opentreasury::ledger {

struct SignatureInfo
{
    std::string signature;
    std::uint64_t slot = 0;
    std::optional<std::int64_t> block_time;  ///< unix seconds
    std::optional<std::string> err;          ///< serialized error of a failed transaction
};

/// Recent blockhash plus the last block height at which it is accepted.
struct AnchorPoint
{
    std::string anchor_id;
    std::uint64_t expiry_height = 0;
};

/**
 * Instruction as returned by a "fully decoded" transaction query.
 *
 * parsed is whatever the node's decoder produced for the program: a plain
 * string for the memo program on most nodes, an object on others, null when
 * the program is unknown to the decoder.
 */
struct ParsedInstruction
{
    std::string program_id;
    nlohmann::json parsed;
};

struct ParsedTransaction
{
    std::string signature;
    std::vector<ParsedInstruction> instructions;
};

struct Instruction
{
    std::string program_id;
    std::vector<std::string> accounts;
    std::vector<std::uint8_t> data;
};

struct Transaction
{
    std::string fee_payer;
    std::string recent_anchor;
    std::vector<Instruction> instructions;
};

struct SignedTransaction
{
    std::vector<std::uint8_t> bytes;
};

class LedgerQueryService
{
public:
    virtual ~LedgerQueryService() = default;

    /// Balance in lamports.
    [[nodiscard]] virtual opentreasury::Result<std::uint64_t> get_balance(const std::string& account) const = 0;

    /// Newest first, at most @p limit entries.
    [[nodiscard]] virtual opentreasury::Result<std::vector<SignatureInfo>>
    get_recent_transaction_signatures(const std::string& account, int limit) const = 0;

    /// std::nullopt when the node does not know the transaction.
    [[nodiscard]] virtual opentreasury::Result<std::optional<ParsedTransaction>>
    get_transaction_details(const std::string& signature) const = 0;

    [[nodiscard]] virtual opentreasury::Result<AnchorPoint> get_recent_anchor_point() const = 0;
};

class SubmissionService
{
public:
    virtual ~SubmissionService() = default;

    [[nodiscard]] virtual opentreasury::Result<std::string> submit(const SignedTransaction& transaction) = 0;

    /// Blocks until the transaction is confirmed or @p anchor expires.
    [[nodiscard]] virtual opentreasury::VoidResult await_confirmation(const std::string& transaction_id,
                                                                      const AnchorPoint& anchor) = 0;
};

/// Wallet capability: sign and broadcast in one step.
class DirectSubmitter
{
public:
    virtual ~DirectSubmitter() = default;

    [[nodiscard]] virtual opentreasury::Result<std::string> sign_and_submit(const Transaction& transaction) = 0;
};

/// Wallet capability: sign only; the caller broadcasts.
class TransactionSigner
{
public:
    virtual ~TransactionSigner() = default;

    [[nodiscard]] virtual opentreasury::Result<SignedTransaction> sign(const Transaction& transaction) = 0;
};

/**
 * A wallet. Exposes at least one of the two capabilities; a null pointer
 * means the capability is absent.
 */
class SigningProvider
{
public:
    virtual ~SigningProvider() = default;

    /// Ask the wallet for an identity; returns the account id.
    [[nodiscard]] virtual opentreasury::Result<std::string> connect() = 0;

    /// Account id after a successful connect().
    [[nodiscard]] virtual std::optional<std::string> identity() const = 0;

    [[nodiscard]] virtual DirectSubmitter* direct_submitter() { return nullptr; }
    [[nodiscard]] virtual TransactionSigner* transaction_signer() { return nullptr; }
};

/**
 * Run one collaborator call. Collaborators report failures as error results,
 * but an embedding RPC client or wallet bridge may still throw; a thrown
 * std::exception becomes NetworkError carrying its message.
 */
template <typename Fn>
[[nodiscard]] auto call_guarded(Fn&& fn) -> std::invoke_result_t<Fn>
{
    try {
        return std::forward<Fn>(fn)();
    } catch (const std::exception& ex) {
        return std::unexpected(Error::make(errc::kNetwork, ex.what()));
    }
}

/**
 * Convert one entry of an RPC "getParsedTransaction" response
 * ({"transaction": {"message": {"instructions": [...]}}}) into a
 * ParsedTransaction. programId may be a string or {"$pubkey": "..."}.
 */
[[nodiscard]] opentreasury::Result<ParsedTransaction> parse_rpc_transaction(std::string signature,
                                                                           const nlohmann::json& response);

/**
 * Query service over a ledger_snapshot.v1 JSON file: balances, signatures,
 * parsed transactions and an anchor point captured from a node. Used for
 * offline verification and in tests.
 */
class SnapshotLedger final : public LedgerQueryService
{
public:
    [[nodiscard]] static opentreasury::Result<SnapshotLedger> load(const std::string& path,
                                                                   const std::string& schema_dir);
    [[nodiscard]] static opentreasury::Result<SnapshotLedger> from_json(const nlohmann::json& snapshot,
                                                                        const std::string& schema_dir);

    [[nodiscard]] opentreasury::Result<std::uint64_t> get_balance(const std::string& account) const override;
    [[nodiscard]] opentreasury::Result<std::vector<SignatureInfo>>
    get_recent_transaction_signatures(const std::string& account, int limit) const override;
    [[nodiscard]] opentreasury::Result<std::optional<ParsedTransaction>>
    get_transaction_details(const std::string& signature) const override;
    [[nodiscard]] opentreasury::Result<AnchorPoint> get_recent_anchor_point() const override;

private:
    explicit SnapshotLedger(nlohmann::json snapshot);

    nlohmann::json m_snapshot;
};

}  // namespace opentreasury::ledger
