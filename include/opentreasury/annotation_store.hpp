#pragma once

/**
 * @file annotation_store.hpp
 * @brief Per-treasury annotation persistence and the editing ledger on top of it
 */

#include "opentreasury/annotation.hpp"
#include "opentreasury/common.hpp"

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace opentreasury::annotation {

/**
 * Key-value store: account id -> AnnotationSet.
 *
 * put() replaces the whole set for the account.
 */
class AnnotationStore
{
public:
    virtual ~AnnotationStore() = default;

    /// Missing accounts yield an empty set, not an error.
    [[nodiscard]] virtual opentreasury::Result<AnnotationSet> get(const std::string& account) const = 0;
    [[nodiscard]] virtual opentreasury::VoidResult put(const std::string& account,
                                                       const AnnotationSet& annotations) = 0;
};

/**
 * @brief Accounts usable as store keys: 1-128 characters of [A-Za-z0-9_-]
 */
[[nodiscard]] opentreasury::VoidResult validate_store_key(std::string_view account);

/**
 * JSON files under <base_dir>/labels/<account>.json, written in canonical
 * form and validated against annotations.v1 on both write and read.
 */
class FileAnnotationStore final : public AnnotationStore
{
public:
    explicit FileAnnotationStore(std::string base_dir, std::string schema_dir = "schemas");

    [[nodiscard]] opentreasury::Result<AnnotationSet> get(const std::string& account) const override;
    [[nodiscard]] opentreasury::VoidResult put(const std::string& account,
                                               const AnnotationSet& annotations) override;

    [[nodiscard]] std::string path_for_account(const std::string& account) const;

private:
    std::string m_base_dir;
    std::string m_schema_dir;

    [[nodiscard]] std::string schema_path() const;
};

class MemoryAnnotationStore final : public AnnotationStore
{
public:
    [[nodiscard]] opentreasury::Result<AnnotationSet> get(const std::string& account) const override;
    [[nodiscard]] opentreasury::VoidResult put(const std::string& account,
                                               const AnnotationSet& annotations) override;

private:
    mutable std::mutex m_mutex;
    std::map<std::string, AnnotationSet> m_sets;
};

/**
 * Editing operations for one treasury.
 *
 * Every mutation goes through the store first and only then updates the
 * in-memory copy, so a failed write leaves both unchanged. revision()
 * increases on every successful mutation.
 */
class AnnotationLedger
{
public:
    AnnotationLedger(AnnotationStore& store, std::string treasury, ViewMode mode);

    /// Load the treasury's annotations from the store.
    [[nodiscard]] opentreasury::VoidResult load();

    [[nodiscard]] opentreasury::VoidResult save(const std::string& signature,
                                                const AnnotationInput& input);
    [[nodiscard]] opentreasury::VoidResult clear(const std::string& signature);
    [[nodiscard]] opentreasury::VoidResult replace_all(AnnotationSet annotations);

    /**
     * Case-insensitive substring search over signature, label name, packed
     * note and proof URL. An empty query returns everything.
     */
    [[nodiscard]] std::vector<std::pair<std::string, Annotation>> search(std::string_view query) const;

    [[nodiscard]] const AnnotationSet& annotations() const { return m_annotations; }
    [[nodiscard]] const std::string& treasury() const { return m_treasury; }
    [[nodiscard]] ViewMode view_mode() const { return m_mode; }
    [[nodiscard]] std::uint64_t revision() const { return m_revision; }

private:
    [[nodiscard]] opentreasury::VoidResult commit(AnnotationSet next);

    AnnotationStore& m_store;
    std::string m_treasury;
    ViewMode m_mode;
    AnnotationSet m_annotations;
    std::uint64_t m_revision = 0;
};

}  // namespace opentreasury::annotation
