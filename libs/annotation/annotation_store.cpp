/**
 * @file annotation_store.cpp
 * @brief File-backed and in-memory annotation stores, annotation ledger
 */

#include "opentreasury/annotation_store.hpp"

#include "opentreasury/canonical_json.hpp"
#include "opentreasury/schema_validate.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <format>
#include <fstream>
#include <iterator>
#include <system_error>

namespace opentreasury::annotation {

namespace {

namespace fs = std::filesystem;

constexpr const char* kSchemaVersion = "annotations.v1";
constexpr std::size_t kMaxStoreKeyLength = 128;

opentreasury::VoidResult write_file_atomically(const fs::path& path, const std::string& content)
{
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        return std::unexpected(Error::make(
            errc::kIo, std::format("Failed to create {}: {}", path.parent_path().string(), ec.message())));
    }

    fs::path tmp_path = path;
    tmp_path += ".tmp";
    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return std::unexpected(
                Error::make(errc::kIo, "Failed to open file for write: " + tmp_path.string()));
        }
        out << content;
        if (!out) {
            return std::unexpected(Error::make(errc::kIo, "Failed to write file: " + tmp_path.string()));
        }
    }
    fs::rename(tmp_path, path, ec);
    if (ec) {
        std::error_code cleanup_ec;
        fs::remove(tmp_path, cleanup_ec);
        return std::unexpected(Error::make(
            errc::kIo, std::format("Failed to replace {}: {}", path.string(), ec.message())));
    }
    return {};
}

opentreasury::Result<nlohmann::json> read_json_file(const fs::path& path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return std::unexpected(Error::make(errc::kIo, "Failed to open file for read: " + path.string()));
    }
    std::string content{std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
    try {
        return nlohmann::json::parse(content);
    } catch (const nlohmann::json::parse_error& ex) {
        return std::unexpected(Error::make(
            errc::kParse, std::format("Failed to parse JSON from {}: {}", path.string(), ex.what())));
    }
}

}  // namespace

opentreasury::VoidResult validate_store_key(std::string_view account)
{
    const bool valid_chars = std::ranges::all_of(account, [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '-' || c == '_';
    });
    if (account.empty() || account.size() > kMaxStoreKeyLength || !valid_chars) {
        return std::unexpected(
            Error::make(errc::kValidation, std::format("Invalid treasury id: '{}'", account)));
    }
    return {};
}

// ----------------------------------------------------------------------------
// FileAnnotationStore
// ----------------------------------------------------------------------------

FileAnnotationStore::FileAnnotationStore(std::string base_dir, std::string schema_dir)
    : m_base_dir(std::move(base_dir))
    , m_schema_dir(std::move(schema_dir))
{}

std::string FileAnnotationStore::path_for_account(const std::string& account) const
{
    return (fs::path(m_base_dir) / "labels" / (account + ".json")).string();
}

std::string FileAnnotationStore::schema_path() const
{
    return common::schema_file(m_schema_dir, kSchemaVersion);
}

opentreasury::Result<AnnotationSet> FileAnnotationStore::get(const std::string& account) const
{
    if (auto result = validate_store_key(account); !result) {
        return std::unexpected(result.error());
    }
    const fs::path path = path_for_account(account);
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        if (ec) {
            return std::unexpected(Error::make(
                errc::kIo, std::format("Failed to stat {}: {}", path.string(), ec.message())));
        }
        return AnnotationSet{};
    }

    auto payload = read_json_file(path);
    if (!payload) {
        return std::unexpected(payload.error());
    }
    if (auto result = common::validate_json(*payload, schema_path()); !result) {
        return std::unexpected(Error::make(
            result.error().code, "Stored annotations failed schema validation: " + result.error().message));
    }
    if (payload->at("treasury").get<std::string>() != account) {
        return std::unexpected(Error::make(
            errc::kValidation, std::format("Annotation file {} belongs to another treasury", path.string())));
    }
    return annotation_set_from_json(payload->at("annotations"));
}

opentreasury::VoidResult FileAnnotationStore::put(const std::string& account,
                                                  const AnnotationSet& annotations)
{
    if (auto result = validate_store_key(account); !result) {
        return result;
    }

    nlohmann::json payload = {
        {"schema_version", kSchemaVersion},
        {      "treasury",        account},
        {   "annotations", to_json(annotations)}
    };
    if (auto result = common::validate_json(payload, schema_path()); !result) {
        return std::unexpected(Error::make(
            result.error().code, "Annotations failed schema validation: " + result.error().message));
    }

    auto canonical = canonical::canonicalize(payload);
    if (!canonical) {
        return std::unexpected(canonical.error());
    }
    return write_file_atomically(path_for_account(account), *canonical + "\n");
}

// ----------------------------------------------------------------------------
// MemoryAnnotationStore
// ----------------------------------------------------------------------------

opentreasury::Result<AnnotationSet> MemoryAnnotationStore::get(const std::string& account) const
{
    std::scoped_lock lock(m_mutex);
    if (auto it = m_sets.find(account); it != m_sets.end()) {
        return it->second;
    }
    return AnnotationSet{};
}

opentreasury::VoidResult MemoryAnnotationStore::put(const std::string& account,
                                                    const AnnotationSet& annotations)
{
    if (auto result = validate_store_key(account); !result) {
        return result;
    }
    std::scoped_lock lock(m_mutex);
    m_sets[account] = annotations;
    return {};
}

// ----------------------------------------------------------------------------
// AnnotationLedger
// ----------------------------------------------------------------------------

AnnotationLedger::AnnotationLedger(AnnotationStore& store, std::string treasury, ViewMode mode)
    : m_store(store)
    , m_treasury(common::trim(treasury))
    , m_mode(mode)
{}

opentreasury::VoidResult AnnotationLedger::load()
{
    auto loaded = m_store.get(m_treasury);
    if (!loaded) {
        return std::unexpected(loaded.error());
    }
    m_annotations = std::move(*loaded);
    ++m_revision;
    return {};
}

opentreasury::VoidResult AnnotationLedger::save(const std::string& signature,
                                                const AnnotationInput& input)
{
    if (auto writable = ensure_writable(m_mode, "Saving an annotation"); !writable) {
        return writable;
    }
    const auto key = common::trim(signature);
    if (key.empty()) {
        return std::unexpected(Error::make(errc::kValidation, "Select a transaction first"));
    }
    auto annotation = make_annotation(input);
    if (!annotation) {
        return std::unexpected(annotation.error());
    }

    AnnotationSet next = m_annotations;
    next.insert_or_assign(std::string(key), std::move(*annotation));
    return commit(std::move(next));
}

opentreasury::VoidResult AnnotationLedger::clear(const std::string& signature)
{
    if (auto writable = ensure_writable(m_mode, "Removing an annotation"); !writable) {
        return writable;
    }
    AnnotationSet next = m_annotations;
    if (next.erase(std::string(common::trim(signature))) == 0) {
        return std::unexpected(
            Error::make(errc::kNotFound, "No annotation for transaction " + signature));
    }
    return commit(std::move(next));
}

opentreasury::VoidResult AnnotationLedger::replace_all(AnnotationSet annotations)
{
    if (auto writable = ensure_writable(m_mode, "Importing annotations"); !writable) {
        return writable;
    }
    return commit(std::move(annotations));
}

std::vector<std::pair<std::string, Annotation>> AnnotationLedger::search(std::string_view query) const
{
    const auto needle = common::trim(query);
    std::vector<std::pair<std::string, Annotation>> rows;
    for (const auto& [signature, annotation] : m_annotations) {
        const auto note = pack_note(annotation.label, annotation.note).value_or("");
        if (common::icontains(signature, needle) || common::icontains(label_name(annotation.label), needle)
            || common::icontains(note, needle)
            || common::icontains(annotation.proof_url.value_or(""), needle)) {
            rows.emplace_back(signature, annotation);
        }
    }
    return rows;
}

opentreasury::VoidResult AnnotationLedger::commit(AnnotationSet next)
{
    if (auto result = m_store.put(m_treasury, next); !result) {
        return result;
    }
    m_annotations = std::move(next);
    ++m_revision;
    return {};
}

}  // namespace opentreasury::annotation
