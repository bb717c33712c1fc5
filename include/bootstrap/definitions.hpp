#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace dpgw {

// ============================================================================
// Declarative definitions (data products, KPIs, views)
// ============================================================================

struct KpiDefinition {
    std::string name;
    std::string expression;
    std::string description;
};

struct DataProductDefinition {
    std::string id;
    std::string primary_table_or_view;
    std::string description;
    std::string governance_level = "department";
    std::optional<KpiDefinition> kpi_definition;
};

struct ViewDefinition {
    std::string name;
    std::string backing_sql;
    std::string source_data_product_id;
};

/**
 * @brief One consistent snapshot of everything the gateway serves
 *
 * Replaced as a whole on reload, never patched in place.
 */
struct DefinitionSet {
    std::vector<DataProductDefinition> data_products;
    std::vector<ViewDefinition> views;
    std::string origin;               // which source produced it

    [[nodiscard]] bool empty() const { return data_products.empty() && views.empty(); }

    /** @brief Exact id lookup; nullptr when absent */
    [[nodiscard]] const DataProductDefinition* find_product(std::string_view id) const;
};

/**
 * @brief Validate raw records into a DefinitionSet
 *
 * Products without id or primary table and views without name or SQL are
 * dropped with a warning. View names are unique case-insensitively; the first
 * declaration wins.
 */
[[nodiscard]] DefinitionSet make_definition_set(
    std::string origin,
    std::vector<DataProductDefinition> products,
    std::vector<ViewDefinition> views);

} // namespace dpgw
