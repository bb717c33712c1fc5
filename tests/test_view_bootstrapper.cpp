#include <catch2/catch_test_macros.hpp>
#include "bootstrap/view_bootstrapper.hpp"
#include "mocks/mock_backend_adapter.hpp"

#include <filesystem>
#include <fstream>

using namespace dpgw;
using namespace dpgw::testing;

namespace {

const char* kContract = R"(
[[data_products]]
id = "fi_star_schema"
primary = "FI_Star_View"
description = "Finance star view"

[data_products.kpi]
name = "Total Revenue"
expression = 'SUM("Transaction Value Amount")'

[[data_products]]
id = "no_primary"

[[views]]
name = "FI_Star_View"
sql = "SELECT * FROM FinancialTransactions"
data_product = "fi_star_schema"

[[views]]
name = "fi_star_view"
sql = "SELECT 1"
)";

const char* kRegistry = R"({
  "data_products": [
    {"id": "sales", "primary_table": "SalesView", "governance_level": "executive",
     "kpi_definition": {"name": "Units", "expression": "SUM(units)"}}
  ],
  "views": [
    {"name": "SalesView", "sql": "SELECT 1 AS units", "data_product_id": "sales"},
    {"name": "", "sql": "SELECT 2"}
  ]
})";

class TempFile {
public:
    TempFile(const std::string& name, const std::string& content)
        : path_(std::filesystem::temp_directory_path() / name) {
        std::ofstream out(path_);
        out << content;
    }
    ~TempFile() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }
    [[nodiscard]] std::string path() const { return path_.string(); }

private:
    std::filesystem::path path_;
};

} // anonymous namespace

// ============================================================================
// Definition parsing
// ============================================================================

TEST_CASE("ContractFileSource: parse products, KPI and views", "[bootstrap]") {
    const auto set = ContractFileSource::parse(kContract, "contract:test");
    REQUIRE(set);
    CHECK(set->origin == "contract:test");

    // "no_primary" is dropped
    REQUIRE(set->data_products.size() == 1);
    const auto* product = set->find_product("fi_star_schema");
    REQUIRE(product);
    CHECK(product->primary_table_or_view == "FI_Star_View");
    CHECK(product->governance_level == "department");
    REQUIRE(product->kpi_definition);
    CHECK(product->kpi_definition->expression == R"(SUM("Transaction Value Amount"))");

    // Second declaration differs only by case: first wins
    REQUIRE(set->views.size() == 1);
    CHECK(set->views[0].backing_sql == "SELECT * FROM FinancialTransactions");
    CHECK(set->views[0].source_data_product_id == "fi_star_schema");
}

TEST_CASE("ContractFileSource: invalid TOML yields nullopt", "[bootstrap]") {
    CHECK_FALSE(ContractFileSource::parse("[[data_products]\nid = ", "contract:bad"));
}

TEST_CASE("RegistryFileSource: parse JSON registry", "[bootstrap]") {
    const auto set = RegistryFileSource::parse(kRegistry, "registry:test");
    REQUIRE(set);
    REQUIRE(set->data_products.size() == 1);
    CHECK(set->data_products[0].governance_level == "executive");
    REQUIRE(set->data_products[0].kpi_definition);
    CHECK(set->data_products[0].kpi_definition->name == "Units");
    REQUIRE(set->views.size() == 1);
    CHECK(set->views[0].name == "SalesView");

    CHECK_FALSE(RegistryFileSource::parse("{not json", "registry:bad"));
    CHECK_FALSE(RegistryFileSource::parse("[1, 2]", "registry:array"));
}

TEST_CASE("DefinitionSet: find_product is exact", "[bootstrap]") {
    const auto set = RegistryFileSource::parse(kRegistry, "registry:test");
    REQUIRE(set);
    CHECK(set->find_product("sales") != nullptr);
    CHECK(set->find_product("Sales") == nullptr);
    CHECK(set->find_product("") == nullptr);
}

TEST_CASE("make_definition_set: duplicate product ids keep the first", "[bootstrap]") {
    std::vector<DataProductDefinition> products(2);
    products[0].id = "p";
    products[0].primary_table_or_view = "first";
    products[1].id = "p";
    products[1].primary_table_or_view = "second";
    products[1].governance_level = "";

    const auto set = make_definition_set("test", std::move(products), {});
    REQUIRE(set.data_products.size() == 1);
    CHECK(set.data_products[0].primary_table_or_view == "first");
}

// ============================================================================
// Resolution chain
// ============================================================================

TEST_CASE("ViewBootstrapper: contract wins over registry", "[bootstrap]") {
    TempFile contract("dpgw_test_contract.toml", kContract);
    TempFile registry("dpgw_test_registry.json", kRegistry);

    RegistryConfig cfg;
    cfg.contract_path = contract.path();
    cfg.registry_path = registry.path();
    const auto set = ViewBootstrapper::from_config(cfg, {}).resolve();

    CHECK(set.origin == "contract:" + contract.path());
    CHECK(set.find_product("fi_star_schema") != nullptr);
    CHECK(set.find_product("sales") == nullptr);
}

TEST_CASE("ViewBootstrapper: missing contract falls through to registry", "[bootstrap]") {
    TempFile registry("dpgw_test_registry_only.json", kRegistry);

    RegistryConfig cfg;
    cfg.contract_path = "/nonexistent/contract.toml";
    cfg.registry_path = registry.path();
    const auto set = ViewBootstrapper::from_config(cfg, {}).resolve();

    CHECK(set.origin == "registry:" + registry.path());
    CHECK(set.find_product("sales") != nullptr);
}

TEST_CASE("ViewBootstrapper: empty contract falls through", "[bootstrap]") {
    TempFile contract("dpgw_test_empty_contract.toml", "# nothing declared\n");
    TempFile registry("dpgw_test_registry_after_empty.json", kRegistry);

    RegistryConfig cfg;
    cfg.contract_path = contract.path();
    cfg.registry_path = registry.path();
    CHECK(ViewBootstrapper::from_config(cfg, {}).resolve().find_product("sales") != nullptr);
}

TEST_CASE("ViewBootstrapper: nothing configured gives defaults", "[bootstrap]") {
    const auto set = ViewBootstrapper::from_config(RegistryConfig{}, {}).resolve();
    CHECK(set.origin == "defaults");
    CHECK(set.find_product("financial_transactions_data") != nullptr);
    CHECK(set.find_product("accounting_documents_data") != nullptr);
    CHECK(set.views.empty());
}

TEST_CASE("ViewBootstrapper: chain without defaults still resolves", "[bootstrap]") {
    std::vector<std::unique_ptr<IDefinitionSource>> chain;
    chain.push_back(std::make_unique<ContractFileSource>("/nonexistent/contract.toml"));
    const ViewBootstrapper bootstrapper(std::move(chain), {});
    CHECK(bootstrapper.resolve().origin == "defaults");
}

// ============================================================================
// Materialization
// ============================================================================

TEST_CASE("ViewBootstrapper: materialize creates views and fallbacks", "[bootstrap]") {
    MockBackendAdapter adapter;
    REQUIRE(adapter.connect({}));

    const auto definitions = *ContractFileSource::parse(kContract, "contract:test");
    const ViewBootstrapper bootstrapper({}, {{"FI_Star_View", "fi_sales_by_customer_type_view"}, {}});

    const auto report = bootstrapper.materialize(adapter, definitions, "tx-boot");
    CHECK(report.views_created == std::vector<std::string>{"FI_Star_View"});
    CHECK(report.failed_views.empty());

    // FI_Star_View exists (case-insensitive check), only the other one needs a fallback
    CHECK(adapter.fallback_requests() == std::vector<std::string>{"fi_sales_by_customer_type_view"});
    REQUIRE(report.fallback_results.size() == 1);
    CHECK(report.fallback_results.at("fi_sales_by_customer_type_view"));
    CHECK(report.complete());
}

TEST_CASE("ViewBootstrapper: a failing view does not stop the others", "[bootstrap]") {
    MockBackendAdapter adapter;
    REQUIRE(adapter.connect({}));
    adapter.set_failing_view("broken_view");

    auto definitions = make_definition_set("test", {}, {
        {"broken_view", "SELECT * FROM missing", ""},
        {"good_view", "SELECT 1", ""}});

    const ViewBootstrapper bootstrapper({}, {{"broken_view"}, {}});
    const auto report = bootstrapper.materialize(adapter, definitions, "tx");

    CHECK(report.views_created == std::vector<std::string>{"good_view"});
    CHECK(report.failed_views == std::vector<std::string>{"broken_view"});
    CHECK_FALSE(report.complete());
    CHECK(adapter.check_view_exists("good_view"));
}

TEST_CASE("ViewBootstrapper: run registers sources before views", "[bootstrap]") {
    MockBackendAdapter adapter;
    REQUIRE(adapter.connect({}));

    std::vector<std::unique_ptr<IDefinitionSource>> chain;
    chain.push_back(std::make_unique<DefaultDefinitionSource>());
    ViewBootstrapper::Config config;
    config.data_sources = {{"csv", "/data/tx.csv", "FinancialTransactions", ','}};
    const ViewBootstrapper bootstrapper(std::move(chain), config);

    const auto result = bootstrapper.run(adapter, "tx");
    CHECK(result.definitions.origin == "defaults");
    CHECK(adapter.registered_sources() == std::vector<std::string>{"FinancialTransactions"});
    CHECK(result.report.failed_sources.empty());
    CHECK(result.report.fallback_results.empty());
}
