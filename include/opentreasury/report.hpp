#pragma once

/**
 * @file report.hpp
 * @brief Text and JSON renderings of verification, proof and overview results
 */

#include "opentreasury/common.hpp"
#include "opentreasury/document.hpp"
#include "opentreasury/overview.hpp"
#include "opentreasury/proof.hpp"
#include "opentreasury/verifier.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace opentreasury::report {

enum class ReportFormat { kText, kJson };

struct ReportOutput
{
    ReportFormat format;
    std::string summary;
    nlohmann::json json;
    std::vector<std::string> text;
};

[[nodiscard]] ReportOutput verify_report(const verifier::VerifyResult& result, ReportFormat format);

[[nodiscard]] ReportOutput proof_report(const proof::ProofRecord& record,
                                        const document::OtmsDocument& doc,
                                        ReportFormat format);

[[nodiscard]] ReportOutput overview_report(const overview::AccountOverview& overview,
                                           ReportFormat format);

/// Text lines or canonical JSON to @p output_path, or to stdout when unset.
[[nodiscard]] opentreasury::VoidResult write_report(const ReportOutput& output,
                                                    const std::optional<std::filesystem::path>& output_path);

}  // namespace opentreasury::report
