#pragma once

#include "bootstrap/definitions.hpp"

#include <optional>
#include <string>

namespace dpgw {

/**
 * @brief One link in the definition resolution chain
 *
 * load() returns nullopt when the source is absent or unreadable; problems
 * are logged, never thrown.
 */
class IDefinitionSource {
public:
    virtual ~IDefinitionSource() = default;

    [[nodiscard]] virtual std::string name() const = 0;
    [[nodiscard]] virtual std::optional<DefinitionSet> load() const = 0;
};

/**
 * @brief TOML data contract
 *
 *   [[data_products]]
 *   id = "fi_star_schema"
 *   primary = "FI_Star_View"
 *   governance_level = "department"
 *   [data_products.kpi]
 *   name = "Total Revenue"
 *   expression = "SUM(\"Transaction Value Amount\")"
 *
 *   [[views]]
 *   name = "FI_Star_View"
 *   sql = "SELECT ..."
 *   data_product = "fi_star_schema"
 */
class ContractFileSource : public IDefinitionSource {
public:
    explicit ContractFileSource(std::string path) : path_(std::move(path)) {}

    [[nodiscard]] std::string name() const override { return "contract:" + path_; }
    [[nodiscard]] std::optional<DefinitionSet> load() const override;

    /** @brief Parse contract text; nullopt on syntax errors */
    [[nodiscard]] static std::optional<DefinitionSet> parse(
        const std::string& toml_content, const std::string& origin);

private:
    std::string path_;
};

/**
 * @brief JSON registry
 *
 *   {"data_products": [{"id", "primary_table", "description", "governance_level",
 *                       "kpi_definition": {"name", "expression", "description"}}],
 *    "views": [{"name", "sql", "data_product_id"}]}
 */
class RegistryFileSource : public IDefinitionSource {
public:
    explicit RegistryFileSource(std::string path) : path_(std::move(path)) {}

    [[nodiscard]] std::string name() const override { return "registry:" + path_; }
    [[nodiscard]] std::optional<DefinitionSet> load() const override;

    [[nodiscard]] static std::optional<DefinitionSet> parse(
        const std::string& json_content, const std::string& origin);

private:
    std::string path_;
};

/**
 * @brief Built-in minimal data products; never fails
 */
class DefaultDefinitionSource : public IDefinitionSource {
public:
    [[nodiscard]] std::string name() const override { return "defaults"; }
    [[nodiscard]] std::optional<DefinitionSet> load() const override;
};

} // namespace dpgw
