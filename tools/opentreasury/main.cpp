/**
 * @file main.cpp
 * @brief OpenTreasury CLI entry point
 *
 * Commands:
 *   label     - Save an annotation for a transaction
 *   clear     - Remove the annotation of a transaction
 *   list      - List (and search) annotations of a treasury
 *   import    - Replace annotations from an OTMS or legacy file
 *   export    - Write the OTMS document of a treasury
 *   proof     - Generate the proof digest of a treasury
 *   memo      - Print or decode an anchor memo
 *   verify    - Verify a document against its anchor transaction
 *   overview  - Show balance and recent transactions of a treasury
 *   version   - Show version information
 */

#include "opentreasury/require_cpp23.hpp"

#include "opentreasury/annotation.hpp"
#include "opentreasury/annotation_store.hpp"
#include "opentreasury/canonical_json.hpp"
#include "opentreasury/common.hpp"
#include "opentreasury/config.hpp"
#include "opentreasury/document.hpp"
#include "opentreasury/ledger.hpp"
#include "opentreasury/memo.hpp"
#include "opentreasury/overview.hpp"
#include "opentreasury/proof.hpp"
#include "opentreasury/report.hpp"
#include "opentreasury/schema_validate.hpp"
#include "opentreasury/verifier.hpp"
#include "opentreasury/version.hpp"

#include <array>
#include <charconv>
#include <exception>
#include <filesystem>
#include <format>
#include <fstream>
#include <memory>
#include <optional>
#include <print>
#include <ranges>
#include <span>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace {

using opentreasury::report::ReportFormat;

void print_version()
{
    std::println("opentreasury {} ({})", opentreasury::kVersion, opentreasury::kBuildId);
    std::println("  standard: {} v{}", opentreasury::kStandard, opentreasury::kStandardVersion);
    std::println("  memo program: {}", opentreasury::kMemoProgramId);
}

void print_help()
{
    std::print(R"(OpenTreasury - public, verifiable treasury annotations

Usage: opentreasury <command> [options]

Commands:
  label       Save an annotation for a transaction
  clear       Remove the annotation of a transaction
  list        List (and search) annotations of a treasury
  import      Replace annotations from an OTMS or legacy file
  export      Write the OTMS document of a treasury
  proof       Generate the proof digest of a treasury
  memo        Print or decode an anchor memo
  verify      Verify a document against its anchor transaction
  overview    Show balance and recent transactions of a treasury
  version     Show version information

Global Options:
  --help, -h            Show this help message
  --version, -v         Show version information
  --config FILE         Client configuration (config.v1)
  --schema-dir DIR      Path to schema directory (default: ./schemas)
  --store DIR           Annotation store directory (default: ./.opentreasury)
  --cluster NAME        Cluster written into documents (default: devnet)
  --view MODE           interactive | public (public is read-only)

Run 'opentreasury <command> --help' for command-specific options.
)");
}

void print_label_help()
{
    std::print(R"(Usage: opentreasury label [options]

Save an annotation for a transaction

Options:
  --treasury ADDR        Treasury account (required)
  --signature SIG        Transaction signature (required)
  --label NAME           Donation | Grant | Ops | Milestone | Other (default: Donation)
  --category TEXT        Sub-category, used with --label Other
  --note TEXT            Free-form description
  --proof-url URL        Supporting http(s) link
  --help, -h             Show this help
)");
}

void print_clear_help()
{
    std::print(R"(Usage: opentreasury clear [options]

Remove the annotation of a transaction

Options:
  --treasury ADDR        Treasury account (required)
  --signature SIG        Transaction signature (required)
  --help, -h             Show this help
)");
}

void print_list_help()
{
    std::print(R"(Usage: opentreasury list [options]

List annotations of a treasury

Options:
  --treasury ADDR        Treasury account (required)
  --search TEXT          Case-insensitive filter over signature, label, note and link
  --help, -h             Show this help
)");
}

void print_import_help()
{
    std::print(R"(Usage: opentreasury import [options]

Replace the annotations of a treasury with the contents of a file

Options:
  --treasury ADDR        Treasury account (required)
  --input FILE           OTMS document or legacy {{"meta": ...}} file (required)
  --help, -h             Show this help
)");
}

void print_export_help()
{
    std::print(R"(Usage: opentreasury export [options]

Write the OTMS document of a treasury as canonical JSON

Options:
  --treasury ADDR        Treasury account (required)
  --output FILE, -o      Output file (default: opentreasury-otms-<prefix>.json)
  --help, -h             Show this help
)");
}

void print_proof_help()
{
    std::print(R"(Usage: opentreasury proof [options]

Generate the OTMS document and its SHA-256 proof digest

Options:
  --treasury ADDR        Treasury account (required)
  --document FILE        Also write the hashed document to FILE
  --format text|json     Output format (default: text)
  --out FILE             Report output file (default: stdout)
  --help, -h             Show this help
)");
}

void print_memo_help()
{
    std::print(R"(Usage: opentreasury memo [options]

Print the anchor memo for a digest, or decode a memo

Options:
  --treasury ADDR        Treasury account (required unless --decode)
  --hash HEX             SHA-256 digest (required unless --decode)
  --timestamp ISO        Memo timestamp (default: now)
  --decode FILE          Decode the memo text in FILE instead
  --help, -h             Show this help
)");
}

void print_verify_help()
{
    std::print(R"(Usage: opentreasury verify [options]

Verify a published OTMS document against its anchor transaction

Options:
  --tx SIG               Anchor transaction signature (required)
  --document FILE        OTMS JSON document (required)
  --ledger-snapshot FILE Ledger snapshot (ledger_snapshot.v1) to query (required)
  --format text|json     Output format (default: text)
  --out FILE             Report output file (default: stdout)
  --help, -h             Show this help

Exit status: 0 verified, 3 verified with treasury mismatch, 2 not verified.
)");
}

void print_overview_help()
{
    std::print(R"(Usage: opentreasury overview [options]

Show balance and recent transactions of a treasury

Options:
  --treasury ADDR        Treasury account (required)
  --ledger-snapshot FILE Ledger snapshot (ledger_snapshot.v1) to query (required)
  --limit N              Number of signatures (default: 50)
  --format text|json     Output format (default: text)
  --out FILE             Report output file (default: stdout)
  --help, -h             Show this help
)");
}

struct CliOptions
{
    // Global
    std::optional<std::string> config_path;
    std::optional<std::string> schema_dir;
    std::optional<std::string> store_dir;
    std::optional<std::string> cluster;
    std::optional<std::string> view;
    // Per command
    std::string treasury;
    std::string signature;
    std::string label;
    std::string category;
    std::string note;
    std::string proof_url;
    std::string input;
    std::string search;
    std::string digest;
    std::string timestamp;
    std::string transaction;
    std::string document;
    std::string ledger_snapshot;
    std::string decode;
    std::optional<std::string> output;
    std::optional<int> limit;
    ReportFormat format = ReportFormat::kText;
    bool show_help = false;
};

struct StringOption
{
    std::string_view name;
    std::string CliOptions::* field;
};

struct OptionalOption
{
    std::string_view name;
    std::optional<std::string> CliOptions::* field;
};

constexpr std::array kStringOptions = {
    StringOption{"--treasury", &CliOptions::treasury},
    StringOption{"--signature", &CliOptions::signature},
    StringOption{"--label", &CliOptions::label},
    StringOption{"--category", &CliOptions::category},
    StringOption{"--note", &CliOptions::note},
    StringOption{"--proof-url", &CliOptions::proof_url},
    StringOption{"--input", &CliOptions::input},
    StringOption{"--search", &CliOptions::search},
    StringOption{"--hash", &CliOptions::digest},
    StringOption{"--timestamp", &CliOptions::timestamp},
    StringOption{"--tx", &CliOptions::transaction},
    StringOption{"--document", &CliOptions::document},
    StringOption{"--ledger-snapshot", &CliOptions::ledger_snapshot},
    StringOption{"--decode", &CliOptions::decode},
};

constexpr std::array kOptionalOptions = {
    OptionalOption{"--config", &CliOptions::config_path},
    OptionalOption{"--schema-dir", &CliOptions::schema_dir},
    OptionalOption{"--store", &CliOptions::store_dir},
    OptionalOption{"--cluster", &CliOptions::cluster},
    OptionalOption{"--view", &CliOptions::view},
    OptionalOption{"--output", &CliOptions::output},
    OptionalOption{"-o", &CliOptions::output},
    OptionalOption{"--out", &CliOptions::output},
};

// CLI parsing signature is stable.
// NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
[[nodiscard]] auto read_option_value(std::span<char*> args,
                                     std::size_t index,
                                     std::string_view option) -> opentreasury::Result<std::string>
{
    const std::size_t value_index = index + 1;
    if (value_index >= args.size() || args[value_index] == nullptr) {
        return std::unexpected(opentreasury::Error::make(
            "MissingArgument", std::string("Missing value for option: ") + std::string(option)));
    }
    return std::string(args[value_index]);
}

[[nodiscard]] opentreasury::Result<int> parse_limit_value(std::string_view value)
{
    int parsed = 0;
    const char* begin = value.data();
    const char* end = value.data() + value.size();
    auto [ptr, ec] = std::from_chars(begin, end, parsed);
    if (ec != std::errc{} || ptr != end || parsed <= 0) {
        return std::unexpected(opentreasury::Error::make(
            "InvalidArgument", std::string("Invalid --limit value: ") + std::string(value)));
    }
    return parsed;
}

[[nodiscard]] opentreasury::Result<ReportFormat> parse_format_value(std::string_view value)
{
    if (value == "text") {
        return ReportFormat::kText;
    }
    if (value == "json") {
        return ReportFormat::kJson;
    }
    return std::unexpected(opentreasury::Error::make(
        "InvalidArgument", std::string("Invalid --format value: ") + std::string(value)));
}

[[nodiscard]] auto set_option(std::string_view arg,
                              // CLI parsing signature is stable.
                              // NOLINTNEXTLINE(bugprone-easily-swappable-parameters)
                              std::span<char*> args,
                              std::size_t idx,
                              CliOptions& options) -> opentreasury::Result<bool>
{
    for (const auto& option : kStringOptions) {
        if (arg == option.name) {
            auto value = read_option_value(args, idx, arg);
            if (!value) {
                return std::unexpected(value.error());
            }
            options.*option.field = std::move(*value);
            return true;
        }
    }
    for (const auto& option : kOptionalOptions) {
        if (arg == option.name) {
            auto value = read_option_value(args, idx, arg);
            if (!value) {
                return std::unexpected(value.error());
            }
            options.*option.field = std::move(*value);
            return true;
        }
    }
    if (arg == "--limit") {
        auto value = read_option_value(args, idx, arg);
        if (!value) {
            return std::unexpected(value.error());
        }
        auto parsed = parse_limit_value(*value);
        if (!parsed) {
            return std::unexpected(parsed.error());
        }
        options.limit = *parsed;
        return true;
    }
    if (arg == "--format") {
        auto value = read_option_value(args, idx, arg);
        if (!value) {
            return std::unexpected(value.error());
        }
        auto parsed = parse_format_value(*value);
        if (!parsed) {
            return std::unexpected(parsed.error());
        }
        options.format = *parsed;
        return true;
    }
    return false;
}

[[nodiscard]] opentreasury::Result<CliOptions> parse_args(std::span<char*> args)
{
    CliOptions options;
    bool skip_next = false;
    for (auto [i, arg_ptr] : std::views::enumerate(args)) {
        if (skip_next) {
            skip_next = false;
            continue;
        }
        if (arg_ptr == nullptr) {
            continue;
        }
        const auto idx = static_cast<std::size_t>(i);
        std::string_view arg(arg_ptr);
        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
            continue;
        }
        auto consumed = set_option(arg, args, idx, options);
        if (!consumed) {
            return std::unexpected(consumed.error());
        }
        if (!*consumed) {
            return std::unexpected(
                opentreasury::Error::make("InvalidArgument", std::format("Unknown option: {}", arg)));
        }
        skip_next = true;
    }
    return options;
}

/// Defaults, then --config, then command-line overrides.
[[nodiscard]] opentreasury::Result<opentreasury::config::ClientConfig>
resolve_config(const CliOptions& options)
{
    namespace config = opentreasury::config;
    const std::string schema_dir = options.schema_dir.value_or("schemas");

    auto resolved = config::default_config();
    if (options.config_path) {
        auto loaded = config::load_config(*options.config_path, schema_dir);
        if (!loaded) {
            return std::unexpected(loaded.error());
        }
        resolved = std::move(*loaded);
    }
    if (options.schema_dir) {
        resolved.schema_dir = *options.schema_dir;
    }
    if (options.store_dir) {
        resolved.store_dir = *options.store_dir;
    }
    if (options.cluster) {
        resolved.cluster = *options.cluster;
    }
    if (options.view) {
        auto mode = config::parse_view_mode(*options.view);
        if (!mode) {
            return std::unexpected(mode.error());
        }
        resolved.view_mode = *mode;
    }
    if (options.limit) {
        resolved.signature_limit = *options.limit;
    }
    return resolved;
}

[[nodiscard]] opentreasury::Result<std::string> read_text_file(const std::filesystem::path& path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::unexpected(
            opentreasury::Error::make(opentreasury::errc::kIo, "Failed to open file: " + path.string()));
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (!in && !in.eof()) {
        return std::unexpected(
            opentreasury::Error::make(opentreasury::errc::kIo, "Failed to read file: " + path.string()));
    }
    return buffer.str();
}

[[nodiscard]] opentreasury::Result<nlohmann::json> read_json_file(const std::filesystem::path& path)
{
    auto text = read_text_file(path);
    if (!text) {
        return std::unexpected(text.error());
    }
    try {
        return nlohmann::json::parse(*text);
    } catch (const nlohmann::json::parse_error& ex) {
        return std::unexpected(opentreasury::Error::make(
            opentreasury::errc::kParse, "Failed to parse JSON file: " + path.string() + ": " + ex.what()));
    }
}

[[nodiscard]] opentreasury::VoidResult write_text_file(const std::filesystem::path& path,
                                                       const std::string& text)
{
    std::ofstream out(path, std::ios::binary);
    if (!out) {
        return std::unexpected(
            opentreasury::Error::make(opentreasury::errc::kIo, "Failed to open output file: " + path.string()));
    }
    out << text;
    if (!out) {
        return std::unexpected(
            opentreasury::Error::make(opentreasury::errc::kIo, "Failed to write output file: " + path.string()));
    }
    return {};
}

[[nodiscard]] std::optional<std::filesystem::path> output_path(const CliOptions& options)
{
    return options.output ? std::optional<std::filesystem::path>(*options.output) : std::nullopt;
}

/// Ledger of the requested treasury, loaded from the configured store.
struct LedgerSession
{
    opentreasury::config::ClientConfig config;
    opentreasury::annotation::FileAnnotationStore store;
    opentreasury::annotation::AnnotationLedger ledger;

    LedgerSession(opentreasury::config::ClientConfig cfg, const std::string& treasury)
        : config(std::move(cfg))
        , store(config.store_dir, config.schema_dir)
        , ledger(store, treasury, config.view_mode)
    {}
};

[[nodiscard]] opentreasury::Result<std::unique_ptr<LedgerSession>> open_ledger(const CliOptions& options)
{
    auto cfg = resolve_config(options);
    if (!cfg) {
        return std::unexpected(cfg.error());
    }
    if (!opentreasury::common::is_valid_account_id(opentreasury::common::trim(options.treasury))) {
        return std::unexpected(opentreasury::Error::make(
            opentreasury::errc::kValidation, std::format("Invalid treasury address: '{}'", options.treasury)));
    }
    auto session = std::make_unique<LedgerSession>(std::move(*cfg), options.treasury);
    if (auto loaded = session->ledger.load(); !loaded) {
        return std::unexpected(loaded.error());
    }
    return session;
}

int report_error(std::string_view command, const opentreasury::Error& error)
{
    std::println(stderr, "Error: {} failed: [{}] {}", command, error.code, error.message);
    return 1;
}

int run_label(const CliOptions& options)
{
    auto session = open_ledger(options);
    if (!session) {
        return report_error("label", session.error());
    }
    opentreasury::annotation::AnnotationInput input;
    if (!options.label.empty()) {
        auto label = opentreasury::annotation::parse_label(options.label);
        if (!label) {
            return report_error("label", label.error());
        }
        input.label = *label;
    }
    input.custom_category = options.category;
    input.description = options.note;
    input.proof_url = options.proof_url;

    if (auto saved = (*session)->ledger.save(options.signature, input); !saved) {
        return report_error("label", saved.error());
    }
    std::println("[label] {} -> {}", options.signature, opentreasury::annotation::label_name(input.label));
    std::println("  store: {}", (*session)->store.path_for_account((*session)->ledger.treasury()));
    return 0;
}

int run_clear(const CliOptions& options)
{
    auto session = open_ledger(options);
    if (!session) {
        return report_error("clear", session.error());
    }
    if (auto cleared = (*session)->ledger.clear(options.signature); !cleared) {
        return report_error("clear", cleared.error());
    }
    std::println("[clear] {}", options.signature);
    return 0;
}

int run_list(const CliOptions& options)
{
    auto session = open_ledger(options);
    if (!session) {
        return report_error("list", session.error());
    }
    const auto matches = (*session)->ledger.search(options.search);
    std::println("[list] {} of {} annotations", matches.size(), (*session)->ledger.annotations().size());
    for (const auto& [signature, value] : matches) {
        std::string line = std::format("  {} {}", signature, opentreasury::annotation::label_name(value.label));
        if (auto note = opentreasury::annotation::pack_note(value.label, value.note)) {
            line += std::format(" \"{}\"", *note);
        }
        if (value.proof_url) {
            line += std::format(" <{}>", *value.proof_url);
        }
        std::println("{}", line);
    }
    return 0;
}

int run_import(const CliOptions& options)
{
    auto session = open_ledger(options);
    if (!session) {
        return report_error("import", session.error());
    }
    auto payload = read_json_file(options.input);
    if (!payload) {
        return report_error("import", payload.error());
    }
    auto imported = opentreasury::document::import_annotations(*payload, (*session)->config.schema_dir);
    if (!imported) {
        return report_error("import", imported.error());
    }
    const auto count = imported->annotations.size();
    if (auto replaced = (*session)->ledger.replace_all(std::move(imported->annotations)); !replaced) {
        return report_error("import", replaced.error());
    }
    std::println("[import] {} annotations ({})",
                 count,
                 imported->kind == opentreasury::document::ImportKind::kOtms ? "OTMS" : "legacy meta");
    if (imported->skipped > 0) {
        std::println("  skipped: {} entries without signature", imported->skipped);
    }
    return 0;
}

[[nodiscard]] opentreasury::document::OtmsDocument current_document(const LedgerSession& session)
{
    return opentreasury::document::build_document(session.ledger.treasury(),
                                                  session.config.cluster,
                                                  session.ledger.annotations());
}

int run_export(const CliOptions& options)
{
    auto session = open_ledger(options);
    if (!session) {
        return report_error("export", session.error());
    }
    const auto doc = current_document(**session);
    const auto payload = opentreasury::document::to_json(doc);
    if (auto valid = opentreasury::common::validate_json(
            payload, opentreasury::common::schema_file((*session)->config.schema_dir, "otms.v1"));
        !valid) {
        return report_error("export", valid.error());
    }
    auto canonical = opentreasury::canonical::canonicalize(payload);
    if (!canonical) {
        return report_error("export", canonical.error());
    }
    const std::string path = options.output.value_or(opentreasury::document::export_file_name(doc.treasury));
    if (auto written = write_text_file(path, *canonical); !written) {
        return report_error("export", written.error());
    }
    std::println("[export] {} entries", doc.entries.size());
    std::println("  output: {}", path);
    return 0;
}

int run_proof(const CliOptions& options)
{
    auto session = open_ledger(options);
    if (!session) {
        return report_error("proof", session.error());
    }
    const auto doc = current_document(**session);
    auto record = opentreasury::proof::generate_proof(doc);
    if (!record) {
        return report_error("proof", record.error());
    }
    if (!options.document.empty()) {
        // The hashed bytes, so the document can be published as-is.
        if (auto written = write_text_file(options.document, record->canonical_json); !written) {
            return report_error("proof", written.error());
        }
    }
    auto output = opentreasury::report::proof_report(*record, doc, options.format);
    if (auto written = opentreasury::report::write_report(output, output_path(options)); !written) {
        return report_error("proof", written.error());
    }
    return 0;
}

int run_memo(const CliOptions& options)
{
    if (!options.decode.empty()) {
        auto text = read_text_file(options.decode);
        if (!text) {
            return report_error("memo", text.error());
        }
        auto memo = opentreasury::memo::decode_memo(*text);
        if (!memo) {
            return report_error("memo", memo.error());
        }
        std::println("[memo] {}", memo->label.empty() ? "(no label)" : memo->label);
        std::println("  treasury: {}", memo->treasury);
        std::println("  hash: {}", memo->digest_hex);
        std::println("  timestamp: {}", memo->timestamp_iso);
        return 0;
    }

    if (!opentreasury::common::is_sha256_hex(opentreasury::common::trim(options.digest))) {
        return report_error("memo",
                            opentreasury::Error::make(opentreasury::errc::kValidation,
                                                      "--hash must be a 64 character hex digest"));
    }
    const std::string timestamp =
        options.timestamp.empty() ? opentreasury::common::current_time_iso8601() : options.timestamp;
    std::println("{}",
                 opentreasury::memo::encode_memo(options.treasury,
                                                 opentreasury::common::to_lower_ascii(
                                                     opentreasury::common::trim(options.digest)),
                                                 timestamp));
    return 0;
}

int run_verify(const CliOptions& options)
{
    auto cfg = resolve_config(options);
    if (!cfg) {
        return report_error("verify", cfg.error());
    }
    auto ledger = opentreasury::ledger::SnapshotLedger::load(options.ledger_snapshot, cfg->schema_dir);
    if (!ledger) {
        return report_error("verify", ledger.error());
    }
    auto document_text = read_text_file(options.document);
    if (!document_text) {
        return report_error("verify", document_text.error());
    }

    const opentreasury::verifier::Verifier verifier(*ledger, cfg->memo_program_id);
    const auto result = verifier.verify(options.transaction, *document_text);

    auto output = opentreasury::report::verify_report(result, options.format);
    if (auto written = opentreasury::report::write_report(output, output_path(options)); !written) {
        return report_error("verify", written.error());
    }
    if (options.output) {
        std::println("[verify] {}", output.summary);
    }
    switch (result.status) {
        case opentreasury::verifier::VerifyStatus::kVerified:
            return 0;
        case opentreasury::verifier::VerifyStatus::kTreasuryMismatch:
            return 3;
        default:
            return 2;
    }
}

int run_overview(const CliOptions& options)
{
    auto cfg = resolve_config(options);
    if (!cfg) {
        return report_error("overview", cfg.error());
    }
    auto ledger = opentreasury::ledger::SnapshotLedger::load(options.ledger_snapshot, cfg->schema_dir);
    if (!ledger) {
        return report_error("overview", ledger.error());
    }

    opentreasury::overview::OverviewLoader loader;
    auto ticket = loader.begin(options.treasury);
    if (!ticket) {
        return report_error("overview", ticket.error());
    }
    auto committed = loader.fetch(*ticket, *ledger, cfg->signature_limit);
    if (!committed) {
        return report_error("overview", committed.error());
    }
    auto current = loader.current();
    if (!*committed || !current) {
        return report_error("overview",
                            opentreasury::Error::make(opentreasury::errc::kNotFound,
                                                      "Overview load was superseded"));
    }
    auto output = opentreasury::report::overview_report(*current, options.format);
    if (auto written = opentreasury::report::write_report(output, output_path(options)); !written) {
        return report_error("overview", written.error());
    }
    return 0;
}

using HelpFn = void (*)();
using RunFn = int (*)(const CliOptions&);

struct Command
{
    std::string_view name;
    HelpFn help;
    RunFn run;
    /// Options that must be non-empty, checked after --help.
    std::array<std::pair<std::string_view, std::string CliOptions::*>, 3> required;
};

constexpr std::array kCommands = {
    Command{"label",
            print_label_help,
            run_label,
            {{{"--treasury", &CliOptions::treasury}, {"--signature", &CliOptions::signature}, {}}}},
    Command{"clear",
            print_clear_help,
            run_clear,
            {{{"--treasury", &CliOptions::treasury}, {"--signature", &CliOptions::signature}, {}}}},
    Command{"list", print_list_help, run_list, {{{"--treasury", &CliOptions::treasury}, {}, {}}}},
    Command{"import",
            print_import_help,
            run_import,
            {{{"--treasury", &CliOptions::treasury}, {"--input", &CliOptions::input}, {}}}},
    Command{"export", print_export_help, run_export, {{{"--treasury", &CliOptions::treasury}, {}, {}}}},
    Command{"proof", print_proof_help, run_proof, {{{"--treasury", &CliOptions::treasury}, {}, {}}}},
    Command{"memo", print_memo_help, run_memo, {{{}, {}, {}}}},
    Command{"verify",
            print_verify_help,
            run_verify,
            {{{"--tx", &CliOptions::transaction},
              {"--document", &CliOptions::document},
              {"--ledger-snapshot", &CliOptions::ledger_snapshot}}}},
    Command{"overview",
            print_overview_help,
            run_overview,
            {{{"--treasury", &CliOptions::treasury}, {"--ledger-snapshot", &CliOptions::ledger_snapshot}, {}}}},
};

int run_command(const Command& command, int argc, char** argv)
{
    auto args = std::span<char*>(argv, static_cast<std::size_t>(argc));
    auto options = parse_args(args);
    if (!options) {
        std::println(stderr, "Error: {}", options.error().message);
        return 1;
    }
    if (options->show_help) {
        command.help();
        return 0;
    }
    for (const auto& [name, field] : command.required) {
        if (field != nullptr && ((*options).*field).empty()) {
            std::println(stderr, "Error: {} is required", name);
            command.help();
            return 1;
        }
    }
    if (command.name == "memo" && options->decode.empty()
        && (options->treasury.empty() || options->digest.empty())) {
        std::println(stderr, "Error: --treasury and --hash are required unless --decode is given");
        command.help();
        return 1;
    }
    return command.run(*options);
}

[[nodiscard]] int run_cli(int argc, char** argv)
{
    try {
        if (argc < 2) {
            print_help();
            return 1;
        }

        std::string_view cmd = argv[1];

        if (cmd == "--help" || cmd == "-h") {
            print_help();
            return 0;
        }
        if (cmd == "--version" || cmd == "-v" || cmd == "version") {
            print_version();
            return 0;
        }

        for (const auto& command : kCommands) {
            if (command.name == cmd) {
                return run_command(command, argc - 2, argv + 2);
            }
        }

        std::println(stderr, "Unknown command: {}", cmd);
        print_help();
        return 1;
    } catch (const std::exception& ex) {
        try {
            std::println(stderr, "Error: {}", ex.what());
        } catch (...) {
            std::terminate();
        }
        return 1;
    }
}

}  // namespace

int main(int argc, char** argv)
{
    return run_cli(argc, argv);
}
