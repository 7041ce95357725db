/**
 * @file schema_validate.cpp
 * @brief JSON Schema validation using valijson
 *
 * Parsed schemas are cached per path: the annotation store validates on
 * every load and verification may run on several threads at once.
 */

#include "opentreasury/schema_validate.hpp"

#include <filesystem>
#include <format>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

#include <valijson/adapters/nlohmann_json_adapter.hpp>
#include <valijson/schema.hpp>
#include <valijson/schema_parser.hpp>
#include <valijson/validator.hpp>

namespace opentreasury::common {

namespace {

namespace fs = std::filesystem;

constexpr std::string_view kSchemaUriPrefix = "opentreasury:schema/";

/// valijson understands draft-07 "definitions"; our schemas are written with "$defs".
void rewrite_defs(nlohmann::json& node)
{
    if (node.is_array()) {
        for (auto& item : node) {
            rewrite_defs(item);
        }
        return;
    }
    if (!node.is_object()) {
        return;
    }
    if (auto defs = node.find("$defs"); defs != node.end() && !node.contains("definitions")) {
        node["definitions"] = *defs;
        node.erase("$defs");
    }
    for (auto& [key, value] : node.items()) {
        if (key == "$ref" && value.is_string()) {
            // Covers local ("#/$defs/x") and cross-file ("<uri>#/$defs/x") refs.
            constexpr std::string_view kDefsFragment = "#/$defs/";
            auto ref = value.get<std::string>();
            if (auto pos = ref.find(kDefsFragment); pos != std::string::npos) {
                value = ref.substr(0, pos) + "#/definitions/" + ref.substr(pos + kDefsFragment.size());
            }
            continue;
        }
        rewrite_defs(value);
    }
}

opentreasury::Result<nlohmann::json> load_schema_document(const fs::path& path)
{
    std::ifstream in(path);
    if (!in) {
        return std::unexpected(
            Error::make("SchemaFileOpenFailed", "Failed to open schema file: " + path.string()));
    }
    nlohmann::json doc;
    try {
        in >> doc;
    } catch (const nlohmann::json::exception& ex) {
        return std::unexpected(Error::make(
            "SchemaParseFailed", std::format("Failed to parse schema {}: {}", path.string(), ex.what())));
    }
    rewrite_defs(doc);
    return doc;
}

/**
 * A compiled schema together with every document it references, since
 * valijson keeps pointers into the referenced documents.
 */
struct CompiledSchema
{
    nlohmann::json root;
    std::vector<std::unique_ptr<nlohmann::json>> referenced;
    valijson::Schema schema;
};

opentreasury::Result<std::shared_ptr<const CompiledSchema>> compile(const fs::path& path)
{
    auto root = load_schema_document(path);
    if (!root) {
        return std::unexpected(root.error());
    }

    auto compiled = std::make_shared<CompiledSchema>();
    compiled->root = std::move(*root);

    const fs::path base_dir = path.parent_path();
    auto* referenced = &compiled->referenced;
    const auto fetch_doc = [base_dir, referenced](const std::string& uri) -> const nlohmann::json* {
        if (!uri.starts_with(kSchemaUriPrefix)) {
            return nullptr;
        }
        const auto name = uri.substr(kSchemaUriPrefix.size());
        auto doc = load_schema_document(base_dir / (name + ".schema.json"));
        if (!doc) {
            return nullptr;
        }
        referenced->push_back(std::make_unique<nlohmann::json>(std::move(*doc)));
        return referenced->back().get();
    };
    const auto free_doc = [](const nlohmann::json*) {};

    try {
        valijson::SchemaParser parser;
        valijson::adapters::NlohmannJsonAdapter adapter(compiled->root);
        parser.populateSchema(adapter, compiled->schema, fetch_doc, free_doc);
    } catch (const std::exception& ex) {
        return std::unexpected(Error::make(
            "SchemaBuildFailed", std::format("Failed to build schema {}: {}", path.string(), ex.what())));
    }
    return std::shared_ptr<const CompiledSchema>(std::move(compiled));
}

class SchemaCache
{
public:
    opentreasury::Result<std::shared_ptr<const CompiledSchema>> get(const std::string& path)
    {
        std::scoped_lock lock(m_mutex);
        if (auto it = m_schemas.find(path); it != m_schemas.end()) {
            return it->second;
        }
        auto compiled = compile(path);
        if (!compiled) {
            return std::unexpected(compiled.error());
        }
        m_schemas.emplace(path, *compiled);
        return *compiled;
    }

private:
    std::mutex m_mutex;
    std::map<std::string, std::shared_ptr<const CompiledSchema>> m_schemas;
};

SchemaCache& schema_cache()
{
    static SchemaCache cache;
    return cache;
}

std::string describe_errors(valijson::ValidationResults& results)
{
    std::string text;
    valijson::ValidationResults::Error error;
    while (results.popError(error)) {
        std::string pointer;
        for (const auto& part : error.context) {
            // context starts with "<root>"
            if (part != "<root>") {
                pointer += "/" + part;
            }
        }
        if (!text.empty()) {
            text += '\n';
        }
        text += std::format("{}: {}", pointer.empty() ? "/" : pointer, error.description);
    }
    return text.empty() ? std::string("Schema validation failed.") : text;
}

}  // namespace

std::string schema_file(std::string_view schema_dir, std::string_view schema_name)
{
    return (fs::path(schema_dir) / (std::string(schema_name) + ".schema.json")).string();
}

opentreasury::VoidResult validate_json(const nlohmann::json& j, const std::string& schema_path)
{
    auto compiled = schema_cache().get(schema_path);
    if (!compiled) {
        return std::unexpected(compiled.error());
    }

    valijson::Validator validator;
    valijson::ValidationResults results;
    valijson::adapters::NlohmannJsonAdapter target(j);
    if (!validator.validate((*compiled)->schema, target, &results)) {
        return std::unexpected(Error::make(errc::kSchemaInvalid, describe_errors(results)));
    }
    return {};
}

}  // namespace opentreasury::common
