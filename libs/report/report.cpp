/**
 * @file report.cpp
 * @brief Report rendering and output
 */

#include "opentreasury/report.hpp"

#include "opentreasury/canonical_json.hpp"
#include "opentreasury/version.hpp"

#include <format>
#include <fstream>
#include <ostream>
#include <print>
#include <string_view>
#include <utility>

namespace opentreasury::report {

namespace {

[[nodiscard]] nlohmann::json tool_info()
{
    return {
        {    "name",        "opentreasury"},
        { "version", opentreasury::kVersion},
        {"build_id", opentreasury::kBuildId}
    };
}

[[nodiscard]] nlohmann::json report_header(std::string_view schema_version)
{
    return {
        {"schema_version",           std::string(schema_version)},
        {          "tool",                           tool_info()},
        {  "generated_at", common::current_time_iso8601()}
    };
}

void append_memo_text(std::vector<std::string>& lines, const std::string& memo_text)
{
    lines.emplace_back("");
    lines.emplace_back("Memo text:");
    for (std::string_view rest = memo_text;;) {
        const auto newline = rest.find('\n');
        lines.emplace_back(rest.substr(0, newline));
        if (newline == std::string_view::npos) {
            break;
        }
        rest.remove_prefix(newline + 1);
    }
}

[[nodiscard]] std::string verify_summary(const verifier::VerifyResult& result)
{
    using verifier::VerifyStatus;
    switch (result.status) {
        case VerifyStatus::kMissingInput:
            return result.message.empty() ? "Transaction signature and OTMS JSON are required"
                                          : result.message;
        case VerifyStatus::kInvalidJson:
            return "OTMS JSON is not valid JSON";
        case VerifyStatus::kTransactionNotFound:
            return "Could not fetch that transaction (wrong cluster or signature?)";
        case VerifyStatus::kQueryFailed:
            return std::format("Transaction query failed: {}", result.message);
        case VerifyStatus::kNoMemoInstruction:
            return "No Memo instruction found in this transaction";
        case VerifyStatus::kUnreadableMemo:
            return "Memo instruction found, but no readable memo text";
        case VerifyStatus::kMissingHashLine:
            return "Memo found but could not read Hash line";
        case VerifyStatus::kHashMismatch:
            return "Not verified";
        case VerifyStatus::kTreasuryMismatch:
            return "Hash verified but treasury mismatch";
        case VerifyStatus::kVerified:
            return "Verified: hash matches Memo";
    }
    return "Verification failed";
}

[[nodiscard]] std::vector<std::string> verify_lines(const verifier::VerifyResult& result,
                                                    const std::string& summary)
{
    using verifier::VerifyStatus;
    std::vector<std::string> lines;
    lines.push_back(summary);
    switch (result.status) {
        case VerifyStatus::kHashMismatch:
            lines.push_back(std::format("Computed hash: {}", result.computed_hash));
            lines.push_back(std::format("Memo hash: {}", result.memo_hash));
            append_memo_text(lines, result.memo_text);
            break;
        case VerifyStatus::kTreasuryMismatch:
            lines.push_back(std::format("JSON treasury: {}", result.document_treasury));
            lines.push_back(std::format("Memo treasury: {}", result.memo_treasury));
            append_memo_text(lines, result.memo_text);
            break;
        case VerifyStatus::kVerified:
            append_memo_text(lines, result.memo_text);
            break;
        case VerifyStatus::kMissingHashLine:
            append_memo_text(lines, result.memo_text);
            break;
        default:
            break;
    }
    return lines;
}

[[nodiscard]] opentreasury::VoidResult write_lines(std::ostream& out,
                                                   const std::vector<std::string>& lines)
{
    for (const auto& line : lines) {
        out << line << "\n";
    }
    if (!out) {
        return std::unexpected(Error::make(errc::kIo, "Failed to write report output"));
    }
    return {};
}

}  // namespace

ReportOutput verify_report(const verifier::VerifyResult& result, ReportFormat format)
{
    ReportOutput output;
    output.format = format;
    output.summary = verify_summary(result);

    if (format == ReportFormat::kJson) {
        nlohmann::json payload = report_header("verify_report.v1");
        payload["status"] = std::string(verifier::status_name(result.status));
        payload["stage"] = std::string(verifier::stage_name(result.stage));
        payload["verified"] = result.status == verifier::VerifyStatus::kVerified;
        payload["hash_matched"] = result.hash_matched();
        payload["summary"] = output.summary;
        if (!result.computed_hash.empty()) {
            payload["computed_hash"] = result.computed_hash;
        }
        if (!result.memo_hash.empty()) {
            payload["memo_hash"] = result.memo_hash;
        }
        if (!result.document_treasury.empty()) {
            payload["document_treasury"] = result.document_treasury;
        }
        if (!result.memo_treasury.empty()) {
            payload["memo_treasury"] = result.memo_treasury;
        }
        if (!result.memo_text.empty()) {
            payload["memo_text"] = result.memo_text;
        }
        if (!result.message.empty()) {
            payload["message"] = result.message;
        }
        output.json = std::move(payload);
    } else {
        output.text = verify_lines(result, output.summary);
    }
    return output;
}

ReportOutput proof_report(const proof::ProofRecord& record,
                          const document::OtmsDocument& doc,
                          ReportFormat format)
{
    ReportOutput output;
    output.format = format;
    output.summary = std::format("Proof of {} entries for {}", doc.entries.size(), doc.treasury);

    if (format == ReportFormat::kJson) {
        nlohmann::json payload = report_header("proof_report.v1");
        payload["treasury"] = doc.treasury;
        payload["cluster"] = doc.cluster;
        payload["exported_at"] = doc.exported_at;
        payload["entry_count"] = doc.entries.size();
        payload["hash"] = record.digest_hex;
        payload["content_digest"] = record.content_digest;
        if (record.anchor_tx_id) {
            payload["anchor_tx"] = *record.anchor_tx_id;
        }
        output.json = std::move(payload);
        return output;
    }

    output.text.push_back(output.summary);
    output.text.push_back(std::format("  cluster: {}", doc.cluster));
    output.text.push_back(std::format("  exported_at: {}", doc.exported_at));
    output.text.push_back(std::format("  hash: {}", record.digest_hex));
    output.text.push_back(std::format("  content_digest: {}", record.content_digest));
    if (record.anchor_tx_id) {
        output.text.push_back(std::format("  anchor_tx: {}", *record.anchor_tx_id));
    }
    return output;
}

ReportOutput overview_report(const overview::AccountOverview& overview, ReportFormat format)
{
    ReportOutput output;
    output.format = format;
    output.summary = std::format("{}: {:.4f} SOL, {} recent transactions",
                                 overview.treasury,
                                 overview.balance_sol,
                                 overview.transactions.size());

    if (format == ReportFormat::kJson) {
        nlohmann::json payload = report_header("overview_report.v1");
        payload["treasury"] = overview.treasury;
        payload["lamports"] = overview.lamports;
        nlohmann::json transactions = nlohmann::json::array();
        for (const auto& tx : overview.transactions) {
            nlohmann::json item = {
                {"signature", tx.signature},
                {     "slot",      tx.slot}
            };
            if (tx.block_time) {
                item["block_time"] = *tx.block_time;
            }
            if (tx.err) {
                item["err"] = *tx.err;
            }
            transactions.push_back(std::move(item));
        }
        payload["transactions"] = std::move(transactions);
        output.json = std::move(payload);
        return output;
    }

    output.text.push_back(output.summary);
    for (const auto& tx : overview.transactions) {
        std::string line = std::format("  {} slot={}", tx.signature, tx.slot);
        if (tx.block_time) {
            line += std::format(" time={}", *tx.block_time);
        }
        line += tx.err ? " status=failed" : " status=ok";
        output.text.push_back(std::move(line));
    }
    return output;
}

opentreasury::VoidResult write_report(const ReportOutput& output,
                                      const std::optional<std::filesystem::path>& output_path)
{
    std::vector<std::string> lines;
    if (output.format == ReportFormat::kJson) {
        // Report payloads carry integers only (lamports, not SOL).
        auto canonical = canonical::canonicalize(output.json);
        if (!canonical) {
            return std::unexpected(canonical.error());
        }
        lines.push_back(std::move(*canonical));
    } else {
        lines = output.text;
    }

    if (!output_path) {
        for (const auto& line : lines) {
            std::println("{}", line);
        }
        return {};
    }

    std::ofstream out(*output_path);
    if (!out) {
        return std::unexpected(
            Error::make(errc::kIo, "Failed to open output file: " + output_path->string()));
    }
    return write_lines(out, lines);
}

}  // namespace opentreasury::report
