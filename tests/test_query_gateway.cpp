#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "db/embedded/sqlite_adapter.hpp"
#include "gateway/query_gateway.hpp"
#include "mocks/mock_backend_adapter.hpp"

#include <chrono>
#include <thread>

using namespace dpgw;
using namespace dpgw::testing;
using namespace std::chrono_literals;

namespace {

/**
 * @brief Serves a fixed definition set
 */
class StaticDefinitionSource : public IDefinitionSource {
public:
    explicit StaticDefinitionSource(DefinitionSet set) : set_(std::move(set)) {}
    [[nodiscard]] std::string name() const override { return "static"; }
    [[nodiscard]] std::optional<DefinitionSet> load() const override { return set_; }

private:
    DefinitionSet set_;
};

DefinitionSet finance_definitions() {
    DataProductDefinition product;
    product.id = "fi_star_schema";
    product.primary_table_or_view = "FI_Star_View";
    product.governance_level = "executive";
    return make_definition_set("static", {product},
        {{"FI_Star_View", "SELECT 1 AS \"Transaction Value Amount\"", "fi_star_schema"}});
}

std::unique_ptr<ViewBootstrapper> static_bootstrapper(std::vector<std::string> required_views = {}) {
    std::vector<std::unique_ptr<IDefinitionSource>> chain;
    chain.push_back(std::make_unique<StaticDefinitionSource>(finance_definitions()));
    return std::make_unique<ViewBootstrapper>(std::move(chain),
        ViewBootstrapper::Config{std::move(required_views), {}});
}

GatewayConfig test_config() {
    GatewayConfig config;
    config.backend.type = "mock";
    config.gateway.query_timeout = 5000ms;
    config.principals = {{"cfo_001", "CFO", "executive", {"Finance: Profitability Analysis"}}};
    return config;
}

struct Fixture {
    std::shared_ptr<MockBackendAdapter> adapter = std::make_shared<MockBackendAdapter>("mock");
    std::unique_ptr<QueryGateway> gateway;

    explicit Fixture(GatewayConfig config = test_config()) {
        gateway = std::make_unique<QueryGateway>(std::move(config), adapter, static_bootstrapper());
        REQUIRE(gateway->initialize());
    }
};

QueryRequest sql_request(std::string sql) {
    QueryRequest request;
    request.sql = std::move(sql);
    return request;
}

DataProductRequest product_request(std::string product_id, std::string sql) {
    DataProductRequest request;
    request.product_id = std::move(product_id);
    request.sql = std::move(sql);
    return request;
}

} // anonymous namespace

// ============================================================================
// Lifecycle
// ============================================================================

TEST_CASE("QueryGateway: requests before initialize are usage errors", "[gateway]") {
    auto adapter = std::make_shared<MockBackendAdapter>();
    QueryGateway gateway(test_config(), adapter, static_bootstrapper());

    CHECK(gateway.state() == GatewayState::UNINITIALIZED);
    CHECK_THROWS_AS(gateway.execute(sql_request("SELECT 1")), UsageError);
    CHECK_THROWS_AS(gateway.get_data_product(product_request("fi_star_schema", "SELECT 1")), UsageError);
    CHECK(adapter->execute_count() == 0);
}

TEST_CASE("QueryGateway: initialize connects and bootstraps", "[gateway]") {
    Fixture f;
    CHECK(f.gateway->state() == GatewayState::READY);
    CHECK(f.adapter->is_connected());
    CHECK(f.adapter->check_view_exists("FI_Star_View"));
    CHECK(f.gateway->definitions().find_product("fi_star_schema") != nullptr);
    CHECK(f.gateway->last_bootstrap().views_created.size() == 1);

    // Second initialize is a no-op
    CHECK(f.gateway->initialize());
    CHECK(f.adapter->connect_count() == 1);
}

TEST_CASE("QueryGateway: initialize fails when the backend cannot connect", "[gateway]") {
    auto adapter = std::make_shared<MockBackendAdapter>();
    adapter->set_connect_succeeds(false);
    QueryGateway gateway(test_config(), adapter, static_bootstrapper());

    CHECK_FALSE(gateway.initialize());
    CHECK(gateway.state() == GatewayState::UNINITIALIZED);
}

TEST_CASE("QueryGateway: unknown backend type", "[gateway]") {
    auto config = test_config();
    config.backend.type = "oracle";
    QueryGateway gateway(std::move(config), BackendFactory::with_builtin_backends());

    CHECK_FALSE(gateway.initialize());
    CHECK(gateway.state() == GatewayState::UNINITIALIZED);
}

TEST_CASE("QueryGateway: close and reload", "[gateway]") {
    Fixture f;

    f.gateway->close();
    CHECK(f.gateway->state() == GatewayState::CLOSED);
    CHECK_FALSE(f.adapter->is_connected());
    CHECK(f.adapter->interrupt_count() == 1);
    f.gateway->close();   // idempotent
    CHECK(f.adapter->interrupt_count() == 1);
    CHECK_THROWS_AS(f.gateway->execute(sql_request("SELECT 1")), UsageError);
    CHECK_FALSE(f.gateway->initialize());

    REQUIRE(f.gateway->reload());
    CHECK(f.gateway->state() == GatewayState::READY);
    CHECK(f.adapter->is_connected());
    CHECK(f.gateway->execute(sql_request("SELECT 1")).is_success());
}

TEST_CASE("QueryGateway: reload from CLOSED fails when reconnect fails", "[gateway]") {
    Fixture f;
    f.gateway->close();
    f.adapter->set_connect_succeeds(false);

    CHECK_FALSE(f.gateway->reload());
    CHECK(f.gateway->state() == GatewayState::CLOSED);
}

TEST_CASE("QueryGateway: backend_metadata includes gateway state", "[gateway]") {
    Fixture f;
    const auto meta = f.gateway->backend_metadata();
    CHECK(meta.at("gateway_state") == "READY");
    CHECK(meta.at("database_type") == "mock");
}

// ============================================================================
// Execution
// ============================================================================

TEST_CASE("QueryGateway: successful execution", "[gateway]") {
    Fixture f;
    f.adapter->set_result(QueryResult::ok({"region", "total"}, {
        {std::string("EU"), 10.0},
        {std::string("US"), 20.0}}));

    auto request = sql_request("  SELECT region, total FROM sales  ");
    request.transaction_id = "tx-fixed";
    const auto env = f.gateway->execute(std::move(request));

    REQUIRE(env.is_success());
    CHECK(env.transaction_id == "tx-fixed");
    CHECK_FALSE(env.request_id.empty());
    CHECK(env.columns == std::vector<std::string>{"region", "total"});
    CHECK(env.row_count == 2);
    CHECK(env.error_code == ErrorCode::NONE);
    CHECK(env.query_time_ms >= 0.0);
    CHECK(env.metadata.at("source") == "data_product_gateway");
    CHECK(env.metadata.at("backend") == "mock");
    CHECK(f.adapter->executed_sql().back() == "SELECT region, total FROM sales");
}

TEST_CASE("QueryGateway: writes never reach the backend", "[gateway]") {
    Fixture f;

    for (const auto* sql : {"DELETE FROM accounts",
                            "DROP TABLE FinancialTransactions",
                            "SELECT 1; DELETE FROM accounts",
                            "UPDATE t SET x = 1"}) {
        const auto env = f.gateway->execute(sql_request(sql));
        CHECK_FALSE(env.is_success());
        CHECK(env.error_code == ErrorCode::SQL_VALIDATION_ERROR);
        REQUIRE(env.error_message);
        CHECK(env.error_message->find("only select statements") != std::string::npos);
        CHECK(env.rows.empty());
    }
    CHECK(f.adapter->execute_count() == 0);
}

TEST_CASE("QueryGateway: validation can be disabled", "[gateway]") {
    auto config = test_config();
    config.security.validate_sql = false;
    Fixture f(config);

    CHECK(f.gateway->execute(sql_request("PRAGMA table_info(x)")).is_success());
    CHECK(f.adapter->execute_count() == 1);
}

TEST_CASE("QueryGateway: empty SQL is an invalid request", "[gateway]") {
    Fixture f;
    const auto env = f.gateway->execute(sql_request("   "));
    CHECK(env.error_code == ErrorCode::INVALID_REQUEST);
    CHECK(f.adapter->execute_count() == 0);
}

TEST_CASE("QueryGateway: timeout cancels the request and returns promptly", "[gateway]") {
    Fixture f;
    f.adapter->set_delay(10s);

    auto request = sql_request("SELECT * FROM slow_view");
    request.timeout = 100ms;

    const auto start = std::chrono::steady_clock::now();
    const auto env = f.gateway->execute(std::move(request));
    const auto elapsed = std::chrono::steady_clock::now() - start;

    CHECK(env.error_code == ErrorCode::QUERY_TIMEOUT);
    CHECK(env.status == "error");
    CHECK(elapsed < 5s);

    // The worker notices its stop token after the caller has returned
    for (int i = 0; i < 200 && f.adapter->cancel_count() == 0; ++i) {
        std::this_thread::sleep_for(10ms);
    }
    CHECK(f.adapter->cancel_count() == 1);
    CHECK(f.adapter->interrupt_count() == 0);
}

TEST_CASE("QueryGateway: a timeout leaves concurrent requests running", "[gateway]") {
    Fixture f;
    f.adapter->set_delay(400ms);

    auto patient = sql_request("SELECT * FROM slow_view");
    patient.timeout = 5000ms;
    auto pending = f.gateway->execute_async(std::move(patient));

    auto hasty = sql_request("SELECT * FROM slow_view");
    hasty.timeout = 50ms;
    const auto timed_out = f.gateway->execute(std::move(hasty));
    CHECK(timed_out.error_code == ErrorCode::QUERY_TIMEOUT);

    const auto finished = pending.get();
    CHECK(finished.is_success());
    CHECK(finished.row_count == 1);
    CHECK(f.adapter->interrupt_count() == 0);
}

TEST_CASE("QueryGateway: a timeout on SQLite spares the query holding the handle", "[gateway][sqlite]") {
    auto adapter = std::make_shared<SqliteAdapter>();
    QueryGateway gateway(test_config(), adapter, static_bootstrapper());
    REQUIRE(gateway.initialize());

    auto patient = sql_request(
        "WITH RECURSIVE c(x) AS (SELECT 1 UNION ALL SELECT x + 1 FROM c WHERE x < 2000000) "
        "SELECT count(*) AS n FROM c");
    patient.timeout = 60000ms;
    auto pending = gateway.execute_async(std::move(patient));
    std::this_thread::sleep_for(50ms);

    auto hasty = sql_request(
        "WITH RECURSIVE c(x) AS (SELECT 1 UNION ALL SELECT x + 1 FROM c) SELECT count(*) FROM c");
    hasty.timeout = 100ms;
    const auto timed_out = gateway.execute(std::move(hasty));
    CHECK(timed_out.error_code == ErrorCode::QUERY_TIMEOUT);

    const auto finished = pending.get();
    REQUIRE(finished.is_success());
    REQUIRE(finished.row_count == 1);
    CHECK(std::get<int64_t>(finished.rows[0][0]) == 2000000);

    gateway.close();
}

TEST_CASE("QueryGateway: backend errors are classified", "[gateway]") {
    Fixture f;

    SECTION("Missing table needs data correction") {
        f.adapter->set_result(QueryResult::error("no such table: revenue"));
        auto request = sql_request("SELECT * FROM revenue");
        request.transaction_id = "tx-err";
        const auto env = f.gateway->execute(std::move(request));

        CHECK(env.error_code == ErrorCode::SQL_EXECUTION_ERROR);
        CHECK(env.human_action_required);
        CHECK(env.human_action_type == "data_correction");
        CHECK(env.human_action_context.at("sql") == "SELECT * FROM revenue");
        CHECK(env.human_action_context.at("transaction_id") == "tx-err");
    }

    SECTION("Generic failure") {
        f.adapter->set_result(QueryResult::error("division by zero"));
        const auto env = f.gateway->execute(sql_request("SELECT 1 / 0"));
        CHECK(env.error_code == ErrorCode::SQL_EXECUTION_ERROR);
        CHECK_FALSE(env.human_action_required);
    }
}

TEST_CASE("QueryGateway: malformed backend result is an internal error", "[gateway]") {
    Fixture f;
    auto bad = QueryResult::ok({"a", "b"}, {{int64_t{1}}});
    f.adapter->set_result(bad);

    const auto env = f.gateway->execute(sql_request("SELECT a, b FROM t"));
    CHECK(env.error_code == ErrorCode::INTERNAL_ERROR);
    CHECK(env.rows.empty());
}

TEST_CASE("QueryGateway: reconnects once when the backend dropped", "[gateway]") {
    Fixture f;
    f.adapter->disconnect();

    CHECK(f.gateway->execute(sql_request("SELECT 1")).is_success());
    CHECK(f.adapter->connect_count() == 2);

    f.adapter->disconnect();
    f.adapter->set_connect_succeeds(false);
    const auto env = f.gateway->execute(sql_request("SELECT 1"));
    CHECK(env.error_code == ErrorCode::CONNECTION_ERROR);
}

TEST_CASE("QueryGateway: principal annotation", "[gateway]") {
    Fixture f;

    auto request = sql_request("SELECT 1");
    request.principal_id = "cfo_001";
    request.principal_context = {{"department", "Finance"}};
    const auto env = f.gateway->execute(std::move(request));

    REQUIRE(env.is_success());
    CHECK(env.metadata.at("principal_id") == "cfo_001");
    CHECK(env.metadata.at("role") == "CFO");
    CHECK(env.metadata.at("governance_level") == "executive");
    CHECK(env.metadata.at("principal.department") == "Finance");

    // Unknown principal: annotation only, execution unaffected
    auto anonymous = sql_request("SELECT 1");
    anonymous.principal_id = "ghost";
    const auto env2 = f.gateway->execute(std::move(anonymous));
    CHECK(env2.is_success());
    CHECK(env2.metadata.at("governance_level") == "department");
    CHECK_FALSE(env2.metadata.contains("role"));
}

TEST_CASE("QueryGateway: concurrent execute_async", "[gateway]") {
    Fixture f;
    std::vector<std::future<ResponseEnvelope>> futures;
    for (int i = 0; i < 8; ++i) {
        futures.push_back(f.gateway->execute_async(sql_request("SELECT 1")));
    }
    for (auto& fut : futures) {
        CHECK(fut.get().is_success());
    }
    CHECK(f.adapter->execute_count() == 8);
}

// ============================================================================
// Data products
// ============================================================================

TEST_CASE("QueryGateway: data product with generated SQL is normalized", "[gateway][data_product]") {
    Fixture f;

    auto request = product_request("fi_star_schema",
        "```sql\nSELECT \"Transaction Value Amount\" FROM FI_Star_View;\n```");
    const auto env = f.gateway->get_data_product(std::move(request));

    REQUIRE(env.is_success());
    CHECK(env.product_id == "fi_star_schema");
    CHECK(env.metadata.at("governance_level") == "executive");
    CHECK(f.adapter->executed_sql().back() == "SELECT \"Transaction Value Amount\" FROM FI_Star_View");
}

TEST_CASE("QueryGateway: data product request validation", "[gateway][data_product]") {
    Fixture f;

    CHECK(f.gateway->get_data_product(product_request("", "SELECT 1")).error_code == ErrorCode::INVALID_REQUEST);
    CHECK(f.gateway->get_data_product(product_request("fi_star_schema", "")).error_code == ErrorCode::INVALID_REQUEST);
    CHECK(f.gateway->get_data_product(product_request("fi_star_schema", "```sql\n```")).error_code
          == ErrorCode::INVALID_REQUEST);

    const auto env = f.gateway->get_data_product(product_request("fi_star_schema", "DELETE FROM FI_Star_View"));
    CHECK(env.error_code == ErrorCode::SQL_VALIDATION_ERROR);
    CHECK(env.product_id == "fi_star_schema");
    CHECK(f.adapter->execute_count() == 0);
}

TEST_CASE("QueryGateway: unregistered product still runs generated SQL", "[gateway][data_product]") {
    Fixture f;
    const auto env = f.gateway->get_data_product(product_request("adhoc_product", "SELECT 1"));
    CHECK(env.is_success());
    CHECK(env.product_id == "adhoc_product");
    CHECK(env.metadata.at("governance_level") == "department");
}

TEST_CASE("QueryGateway: limit marks the result truncated", "[gateway][data_product]") {
    Fixture f;
    f.adapter->set_result(QueryResult::ok({"x"}, {{int64_t{1}}, {int64_t{2}}}));

    auto request = product_request("fi_star_schema", "SELECT x FROM FI_Star_View LIMIT 2");
    request.limit = 2;
    CHECK(f.gateway->get_data_product(request).truncated);

    request.limit = 10;
    CHECK_FALSE(f.gateway->get_data_product(request).truncated);
}

TEST_CASE("QueryGateway: custom SQL disabled", "[gateway][data_product]") {
    auto config = test_config();
    config.security.allow_custom_sql = false;
    Fixture f(config);

    SECTION("Ad hoc SQL is refused") {
        const auto env = f.gateway->execute(sql_request("SELECT 1"));
        CHECK(env.error_code == ErrorCode::CUSTOM_SQL_NOT_ALLOWED);
        CHECK(f.adapter->execute_count() == 0);
    }

    SECTION("Registered product uses the registry query") {
        auto request = product_request("fi_star_schema", "SELECT secret FROM elsewhere");
        request.limit = 25;
        const auto env = f.gateway->get_data_product(std::move(request));
        CHECK(env.is_success());
        CHECK(f.adapter->executed_sql().back() == "SELECT * FROM \"FI_Star_View\" LIMIT 25");
    }

    SECTION("Unknown product is not found") {
        const auto env = f.gateway->get_data_product(product_request("unknown", "SELECT 1"));
        CHECK(env.error_code == ErrorCode::DATA_PRODUCT_NOT_FOUND);
        CHECK(env.product_id == "unknown");
        CHECK(f.adapter->execute_count() == 0);
    }
}

// ============================================================================
// End to end on the embedded engine
// ============================================================================

TEST_CASE("QueryGateway: finance star view over CSV on SQLite", "[gateway][sqlite]") {
    const std::string root = DPGW_SOURCE_DIR;

    GatewayConfig config;
    config.backend.type = "sqlite";
    config.registry.contract_path = root + "/config/contracts/fi_star_schema.toml";
    config.registry.required_views = {"FI_Star_View", "fi_sales_by_customer_type_view"};
    config.data_sources = {{"csv", root + "/config/data/financial_transactions.csv", "FinancialTransactions", ','}};

    auto gateway = std::make_shared<QueryGateway>(std::move(config), BackendFactory::with_builtin_backends());
    REQUIRE(gateway->initialize());

    const auto report = gateway->last_bootstrap();
    CHECK(report.failed_sources.empty());
    CHECK(report.failed_views.empty());
    CHECK(report.fallback_results.size() == 1);
    CHECK(report.complete());

    SECTION("KPI aggregate") {
        const auto env = gateway->execute(sql_request(
            R"(SELECT SUM("Transaction Value Amount") AS "Total Transaction Value" FROM FI_Star_View)"));
        REQUIRE(env.is_success());
        REQUIRE(env.row_count == 1);
        CHECK(env.columns == std::vector<std::string>{"Total Transaction Value"});
        CHECK_THAT(std::get<double>(env.rows[0][0]), Catch::Matchers::WithinAbs(500.0, 1e-9));
    }

    SECTION("Data product with JSON-wrapped generated SQL") {
        const auto env = gateway->get_data_product(product_request("fi_star_schema",
            R"({"sql": "SELECT \"Transaction ID\", \"Account ID\" FROM FI_Star_View ORDER BY \"Transaction ID\""})"));
        REQUIRE(env.is_success());
        CHECK(env.row_count == 3);
        CHECK(env.columns == std::vector<std::string>{"Transaction ID", "Account ID"});
        CHECK(std::get<std::string>(env.rows[0][0]) == "FT-0001");
    }

    SECTION("Fallback view is queryable") {
        const auto env = gateway->execute(sql_request("SELECT count(*) FROM fi_sales_by_customer_type_view"));
        REQUIRE(env.is_success());
        CHECK(std::get<int64_t>(env.rows[0][0]) == 100);
    }

    SECTION("Missing column asks for data correction") {
        const auto env = gateway->execute(sql_request("SELECT Revenue FROM FI_Star_View"));
        CHECK(env.error_code == ErrorCode::SQL_EXECUTION_ERROR);
        CHECK(env.human_action_required);
    }

    SECTION("Reload keeps serving") {
        REQUIRE(gateway->reload());
        const auto env = gateway->execute(sql_request("SELECT count(*) FROM FinancialTransactions"));
        REQUIRE(env.is_success());
        CHECK(std::get<int64_t>(env.rows[0][0]) == 3);
    }

    gateway->close();
}
