/**
 * @file snapshot_ledger.cpp
 * @brief Ledger query service backed by a captured JSON snapshot
 */

#include "opentreasury/ledger.hpp"

#include "opentreasury/schema_validate.hpp"

#include <algorithm>
#include <format>
#include <fstream>
#include <utility>

namespace opentreasury::ledger {

namespace {

constexpr const char* kSnapshotSchema = "ledger_snapshot.v1";

[[nodiscard]] opentreasury::Result<std::string> program_id_of(const nlohmann::json& instruction)
{
    auto it = instruction.find("programId");
    if (it == instruction.end()) {
        return std::unexpected(Error::make(errc::kParse, "Instruction has no programId"));
    }
    if (it->is_string()) {
        return it->get<std::string>();
    }
    // Some client libraries serialize public keys as {"$pubkey": "..."}.
    if (it->is_object() && it->contains("$pubkey") && it->at("$pubkey").is_string()) {
        return it->at("$pubkey").get<std::string>();
    }
    return std::unexpected(Error::make(errc::kParse, "Instruction programId is not readable"));
}

}  // namespace

opentreasury::Result<ParsedTransaction> parse_rpc_transaction(std::string signature,
                                                              const nlohmann::json& response)
{
    const nlohmann::json::json_pointer pointer("/transaction/message/instructions");
    if (!response.is_object() || !response.contains(pointer) || !response.at(pointer).is_array()) {
        return std::unexpected(Error::make(
            errc::kParse, std::format("Transaction {} has no instruction list", signature)));
    }

    ParsedTransaction tx;
    tx.signature = std::move(signature);
    for (const auto& instruction : response.at(pointer)) {
        auto program_id = program_id_of(instruction);
        if (!program_id) {
            return std::unexpected(program_id.error());
        }
        tx.instructions.push_back(ParsedInstruction{
            .program_id = std::move(*program_id),
            .parsed = instruction.value("parsed", nlohmann::json()),
        });
    }
    return tx;
}

SnapshotLedger::SnapshotLedger(nlohmann::json snapshot)
    : m_snapshot(std::move(snapshot))
{}

opentreasury::Result<SnapshotLedger> SnapshotLedger::load(const std::string& path,
                                                          const std::string& schema_dir)
{
    std::ifstream in(path);
    if (!in) {
        return std::unexpected(Error::make(errc::kIo, "Failed to open ledger snapshot: " + path));
    }
    nlohmann::json snapshot;
    try {
        in >> snapshot;
    } catch (const nlohmann::json::parse_error& ex) {
        return std::unexpected(Error::make(
            errc::kParse, std::format("Failed to parse ledger snapshot {}: {}", path, ex.what())));
    }
    return from_json(snapshot, schema_dir);
}

opentreasury::Result<SnapshotLedger> SnapshotLedger::from_json(const nlohmann::json& snapshot,
                                                               const std::string& schema_dir)
{
    if (auto result = common::validate_json(snapshot, common::schema_file(schema_dir, kSnapshotSchema));
        !result) {
        return std::unexpected(Error::make(
            result.error().code, "Ledger snapshot failed schema validation: " + result.error().message));
    }
    return SnapshotLedger(snapshot);
}

opentreasury::Result<std::uint64_t> SnapshotLedger::get_balance(const std::string& account) const
{
    const auto& balances = m_snapshot.at("balances");
    if (auto it = balances.find(account); it != balances.end()) {
        return it->get<std::uint64_t>();
    }
    // Unfunded accounts report a zero balance.
    return std::uint64_t{0};
}

opentreasury::Result<std::vector<SignatureInfo>>
SnapshotLedger::get_recent_transaction_signatures(const std::string& account, int limit) const
{
    std::vector<SignatureInfo> result;
    const auto& by_account = m_snapshot.at("signatures");
    auto it = by_account.find(account);
    if (it == by_account.end()) {
        return result;
    }
    for (const auto& item : *it) {
        if (std::cmp_greater_equal(result.size(), std::max(limit, 0))) {
            break;
        }
        SignatureInfo info;
        info.signature = item.at("signature").get<std::string>();
        info.slot = item.at("slot").get<std::uint64_t>();
        if (auto block_time = item.find("blockTime"); block_time != item.end() && !block_time->is_null()) {
            info.block_time = block_time->get<std::int64_t>();
        }
        if (auto err = item.find("err"); err != item.end() && !err->is_null()) {
            info.err = err->is_string() ? err->get<std::string>() : err->dump();
        }
        result.push_back(std::move(info));
    }
    return result;
}

opentreasury::Result<std::optional<ParsedTransaction>>
SnapshotLedger::get_transaction_details(const std::string& signature) const
{
    const auto& transactions = m_snapshot.at("transactions");
    auto it = transactions.find(signature);
    if (it == transactions.end() || it->is_null()) {
        return std::optional<ParsedTransaction>{};
    }
    auto tx = parse_rpc_transaction(signature, *it);
    if (!tx) {
        return std::unexpected(tx.error());
    }
    return std::optional<ParsedTransaction>{std::move(*tx)};
}

opentreasury::Result<AnchorPoint> SnapshotLedger::get_recent_anchor_point() const
{
    auto it = m_snapshot.find("anchor_point");
    if (it == m_snapshot.end()) {
        return std::unexpected(
            Error::make(errc::kNetwork, "Ledger snapshot does not carry a recent blockhash"));
    }
    return AnchorPoint{
        .anchor_id = it->at("blockhash").get<std::string>(),
        .expiry_height = it->at("lastValidBlockHeight").get<std::uint64_t>(),
    };
}

}  // namespace opentreasury::ledger
