#include "bootstrap/definition_source.hpp"
#include "core/json.hpp"
#include "core/utils.hpp"

#include <toml++/toml.hpp>

#include <filesystem>
#include <format>
#include <fstream>

using namespace std::string_literals;

namespace dpgw {

namespace {

std::optional<std::string> read_definition_file(const std::string& path, std::string_view kind) {
    if (path.empty()) {
        return std::nullopt;
    }
    if (!std::filesystem::exists(path)) {
        utils::log::info(std::format("Definitions: {} '{}' not found, skipping", kind, path));
        return std::nullopt;
    }
    std::ifstream file(path);
    if (!file.is_open()) {
        utils::log::warn(std::format("Definitions: cannot open {} '{}'", kind, path));
        return std::nullopt;
    }
    return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
}

std::optional<KpiDefinition> kpi_from_toml(const toml::table* tbl) {
    if (!tbl) return std::nullopt;
    KpiDefinition kpi;
    kpi.name = (*tbl)["name"].value_or(""s);
    kpi.expression = (*tbl)["expression"].value_or(""s);
    kpi.description = (*tbl)["description"].value_or(""s);
    if (kpi.name.empty() && kpi.expression.empty()) return std::nullopt;
    return kpi;
}

std::optional<KpiDefinition> kpi_from_json(const JsonValue& node) {
    if (!node.is_object()) return std::nullopt;
    KpiDefinition kpi;
    kpi.name = node.string_or("name", "");
    kpi.expression = node.string_or("expression", "");
    kpi.description = node.string_or("description", "");
    if (kpi.name.empty() && kpi.expression.empty()) return std::nullopt;
    return kpi;
}

} // anonymous namespace

// ============================================================================
// ContractFileSource (TOML)
// ============================================================================

std::optional<DefinitionSet> ContractFileSource::parse(
    const std::string& toml_content, const std::string& origin) {

    toml::table root;
    try {
        root = toml::parse(toml_content);
    } catch (const toml::parse_error& e) {
        utils::log::error(std::format("Definitions: contract {} is not valid TOML: {}",
            origin, std::string(e.description())));
        return std::nullopt;
    }

    std::vector<DataProductDefinition> products;
    if (const auto* arr = root["data_products"].as_array()) {
        for (const auto& elem : *arr) {
            const auto* p = elem.as_table();
            if (!p) continue;
            DataProductDefinition product;
            product.id = (*p)["id"].value_or(""s);
            product.primary_table_or_view = (*p)["primary"].value_or(""s);
            product.description = (*p)["description"].value_or(""s);
            product.governance_level = (*p)["governance_level"].value_or("department"s);
            product.kpi_definition = kpi_from_toml((*p)["kpi"].as_table());
            products.push_back(std::move(product));
        }
    }

    std::vector<ViewDefinition> views;
    if (const auto* arr = root["views"].as_array()) {
        for (const auto& elem : *arr) {
            const auto* v = elem.as_table();
            if (!v) continue;
            views.push_back(ViewDefinition{
                (*v)["name"].value_or(""s),
                (*v)["sql"].value_or(""s),
                (*v)["data_product"].value_or(""s)});
        }
    }

    return make_definition_set(origin, std::move(products), std::move(views));
}

std::optional<DefinitionSet> ContractFileSource::load() const {
    const auto content = read_definition_file(path_, "contract");
    if (!content) return std::nullopt;
    return parse(*content, name());
}

// ============================================================================
// RegistryFileSource (JSON)
// ============================================================================

std::optional<DefinitionSet> RegistryFileSource::parse(
    const std::string& json_content, const std::string& origin) {

    JsonValue root;
    try {
        root = JsonValue::parse(json_content);
    } catch (const JsonValue::parse_error& e) {
        utils::log::error(std::format("Definitions: registry {}: {}", origin, e.what()));
        return std::nullopt;
    }
    if (!root.is_object()) {
        utils::log::error(std::format("Definitions: registry {} must be a JSON object", origin));
        return std::nullopt;
    }

    std::vector<DataProductDefinition> products;
    for (const auto& p : root["data_products"].elements()) {
        DataProductDefinition product;
        product.id = p.string_or("id", "");
        product.primary_table_or_view = p.string_or("primary_table", "");
        product.description = p.string_or("description", "");
        product.governance_level = p.string_or("governance_level", "department");
        product.kpi_definition = kpi_from_json(p["kpi_definition"]);
        products.push_back(std::move(product));
    }

    std::vector<ViewDefinition> views;
    for (const auto& v : root["views"].elements()) {
        views.push_back(ViewDefinition{
            v.string_or("name", ""),
            v.string_or("sql", ""),
            v.string_or("data_product_id", "")});
    }

    return make_definition_set(origin, std::move(products), std::move(views));
}

std::optional<DefinitionSet> RegistryFileSource::load() const {
    const auto content = read_definition_file(path_, "registry");
    if (!content) return std::nullopt;
    return parse(*content, name());
}

// ============================================================================
// DefaultDefinitionSource
// ============================================================================

std::optional<DefinitionSet> DefaultDefinitionSource::load() const {
    std::vector<DataProductDefinition> products;

    DataProductDefinition transactions;
    transactions.id = "financial_transactions_data";
    transactions.primary_table_or_view = "FinancialTransactions";
    transactions.description = "Financial transactions";
    products.push_back(std::move(transactions));

    DataProductDefinition documents;
    documents.id = "accounting_documents_data";
    documents.primary_table_or_view = "AccountingDocuments";
    documents.description = "Accounting documents";
    products.push_back(std::move(documents));

    return make_definition_set(name(), std::move(products), {});
}

} // namespace dpgw
