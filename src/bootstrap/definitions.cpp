#include "bootstrap/definitions.hpp"
#include "core/utils.hpp"

#include <format>
#include <unordered_set>

namespace dpgw {

const DataProductDefinition* DefinitionSet::find_product(std::string_view id) const {
    for (const auto& product : data_products) {
        if (product.id == id) {
            return &product;
        }
    }
    return nullptr;
}

DefinitionSet make_definition_set(
    std::string origin,
    std::vector<DataProductDefinition> products,
    std::vector<ViewDefinition> views) {

    DefinitionSet set;
    set.origin = std::move(origin);

    std::unordered_set<std::string> product_ids;
    for (auto& product : products) {
        if (product.id.empty() || product.primary_table_or_view.empty()) {
            utils::log::warn(std::format(
                "Definitions ({}): dropping data product '{}' without id or primary table",
                set.origin, product.id));
            continue;
        }
        if (!product_ids.insert(product.id).second) {
            utils::log::warn(std::format(
                "Definitions ({}): duplicate data product '{}' ignored", set.origin, product.id));
            continue;
        }
        if (product.governance_level.empty()) {
            product.governance_level = "department";
        }
        set.data_products.push_back(std::move(product));
    }

    std::unordered_set<std::string> view_names;
    for (auto& view : views) {
        if (view.name.empty() || utils::trim(view.backing_sql).empty()) {
            utils::log::warn(std::format(
                "Definitions ({}): dropping view '{}' without name or SQL", set.origin, view.name));
            continue;
        }
        if (!view_names.insert(utils::to_lower(view.name)).second) {
            utils::log::warn(std::format(
                "Definitions ({}): view '{}' already declared (names are case-insensitive), ignored",
                set.origin, view.name));
            continue;
        }
        set.views.push_back(std::move(view));
    }

    return set;
}

} // namespace dpgw
