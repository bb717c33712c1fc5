#include <catch2/catch_test_macros.hpp>
#include "db/embedded/sqlite_adapter.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <future>
#include <stop_token>
#include <thread>

using namespace dpgw;
using namespace std::chrono_literals;

namespace {

std::shared_ptr<SqliteAdapter> connected_adapter(BackendOptions options = {}) {
    auto adapter = std::make_shared<SqliteAdapter>(options);
    REQUIRE(adapter->connect(ConnectionParams{}));
    return adapter;
}

std::string write_temp_csv(const std::string& name, const std::string& content) {
    const auto path = std::filesystem::temp_directory_path() / name;
    std::ofstream out(path);
    out << content;
    return path.string();
}

constexpr const char* kEndlessQuery =
    "WITH RECURSIVE c(x) AS (SELECT 1 UNION ALL SELECT x + 1 FROM c) SELECT count(*) FROM c";

constexpr const char* kTwoMillionRows =
    "WITH RECURSIVE c(x) AS (SELECT 1 UNION ALL SELECT x + 1 FROM c WHERE x < 2000000) "
    "SELECT count(*) FROM c";

} // anonymous namespace

TEST_CASE("SqliteAdapter: lifecycle", "[sqlite]") {
    SqliteAdapter adapter;
    CHECK(adapter.type() == "sqlite");
    CHECK_FALSE(adapter.is_connected());

    REQUIRE(adapter.connect(ConnectionParams{}));
    CHECK(adapter.is_connected());
    CHECK(adapter.connect(ConnectionParams{}));   // already connected

    CHECK(adapter.disconnect());
    CHECK_FALSE(adapter.is_connected());
    CHECK(adapter.disconnect());                  // idempotent
}

TEST_CASE("SqliteAdapter: operations while disconnected throw UsageError", "[sqlite]") {
    SqliteAdapter adapter;
    CHECK_THROWS_AS(adapter.execute_query("SELECT 1"), UsageError);
    CHECK_THROWS_AS(adapter.create_view("v", "SELECT 1"), UsageError);
    CHECK_THROWS_AS(adapter.list_views(), UsageError);

    // Valid in any state
    CHECK(adapter.validate_sql("SELECT 1").valid);
    CHECK(adapter.get_metadata().at("status") == "disconnected");
    adapter.interrupt();
}

TEST_CASE("SqliteAdapter: result keeps column order and cell types", "[sqlite]") {
    auto adapter = connected_adapter();
    auto result = adapter->execute_query(
        "SELECT 3 AS zeta, 'text' AS alpha, 1.5 AS mid, NULL AS nothing");

    REQUIRE(result.success);
    CHECK(result.columns == std::vector<std::string>{"zeta", "alpha", "mid", "nothing"});
    REQUIRE(result.row_count == 1);
    CHECK(result.is_well_formed());

    const auto& row = result.rows[0];
    CHECK(std::get<int64_t>(row[0]) == 3);
    CHECK(std::get<std::string>(row[1]) == "text");
    CHECK(std::get<double>(row[2]) == 1.5);
    CHECK(is_null(row[3]));
    CHECK(result.status() == ResultStatus::ROWS);
}

TEST_CASE("SqliteAdapter: empty result still has columns", "[sqlite]") {
    auto adapter = connected_adapter();
    auto result = adapter->execute_query("SELECT 1 AS a, 2 AS b WHERE 1 = 0");
    REQUIRE(result.success);
    CHECK(result.columns.size() == 2);
    CHECK(result.row_count == 0);
    CHECK(result.status() == ResultStatus::EMPTY);
}

TEST_CASE("SqliteAdapter: engine errors come back as results", "[sqlite]") {
    auto adapter = connected_adapter();

    auto result = adapter->execute_query("SELECT * FROM no_such_table");
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("no such table") != std::string::npos);
    CHECK(result.status() == ResultStatus::ERROR);

    result = adapter->execute_query("SELECT 1; SELECT 2");
    CHECK_FALSE(result.success);
}

TEST_CASE("SqliteAdapter: named parameters", "[sqlite]") {
    auto adapter = connected_adapter();
    auto result = adapter->execute_query(
        "SELECT :amount * 2 AS doubled, @label AS label",
        {{"amount", int64_t{21}}, {"label", std::string("x")}, {"unused", true}});
    REQUIRE(result.success);
    CHECK(std::get<int64_t>(result.rows[0][0]) == 42);
    CHECK(std::get<std::string>(result.rows[0][1]) == "x");
}

TEST_CASE("SqliteAdapter: max_result_rows truncates", "[sqlite]") {
    BackendOptions options;
    options.max_result_rows = 5;
    auto adapter = connected_adapter(options);

    auto result = adapter->execute_query(
        "WITH RECURSIVE c(x) AS (SELECT 1 UNION ALL SELECT x + 1 FROM c WHERE x < 20) SELECT x FROM c");
    REQUIRE(result.success);
    CHECK(result.row_count == 5);
    CHECK(result.truncated);
}

TEST_CASE("SqliteAdapter: create_view replaces case-insensitively", "[sqlite]") {
    auto adapter = connected_adapter();

    REQUIRE(adapter->create_view("Sales_View", "SELECT 1 AS v"));
    REQUIRE(adapter->create_view("sales_view", "SELECT 2 AS v"));

    const auto views = adapter->list_views();
    REQUIRE(views.size() == 1);
    CHECK(adapter->check_view_exists("SALES_VIEW"));

    auto result = adapter->execute_query("SELECT v FROM Sales_View");
    REQUIRE(result.success);
    CHECK(std::get<int64_t>(result.rows[0][0]) == 2);

    // replace = false leaves the existing definition alone
    CHECK_FALSE(adapter->create_view("SALES_VIEW", "SELECT 3 AS v", false));
    result = adapter->execute_query("SELECT v FROM sales_view");
    CHECK(std::get<int64_t>(result.rows[0][0]) == 2);
}

TEST_CASE("SqliteAdapter: a view over a table returns the table's result", "[sqlite]") {
    auto adapter = connected_adapter();
    const auto path = write_temp_csv("dpgw_test_view_roundtrip.csv",
        "id,region,amount,note\n1,EMEA,10.5,first\n2,APAC,,\n3,AMER,7,third\n");
    REQUIRE(adapter->register_data_source({"csv", path, "t", ','}));
    std::filesystem::remove(path);

    REQUIRE(adapter->create_view("V", "SELECT * FROM t"));

    const auto direct = adapter->execute_query("SELECT * FROM t");
    const auto through_view = adapter->execute_query("SELECT * FROM V");
    REQUIRE(direct.success);
    REQUIRE(through_view.success);

    CHECK(direct.columns == std::vector<std::string>{"id", "region", "amount", "note"});
    CHECK(through_view.columns == direct.columns);
    CHECK(through_view.row_count == 3);
    CHECK(through_view.rows == direct.rows);
}

TEST_CASE("SqliteAdapter: replacing a view may change its columns", "[sqlite]") {
    auto adapter = connected_adapter();
    REQUIRE(adapter->create_fallback_views({"Revenue_View"}).at("Revenue_View"));

    REQUIRE(adapter->create_view("Revenue_View", "SELECT 'EMEA' AS region, 12.5 AS revenue"));
    const auto result = adapter->execute_query("SELECT * FROM Revenue_View");
    REQUIRE(result.success);
    CHECK(result.columns == std::vector<std::string>{"region", "revenue"});
    CHECK(result.row_count == 1);
}

TEST_CASE("SqliteAdapter: invalid view SQL fails without side effects", "[sqlite]") {
    auto adapter = connected_adapter();
    REQUIRE(adapter->create_view("keep_me", "SELECT 1 AS v"));

    CHECK_FALSE(adapter->create_view("keep_me", "SELEC nonsense"));
    CHECK(adapter->check_view_exists("keep_me"));
    CHECK(adapter->execute_query("SELECT v FROM keep_me").success);
}

TEST_CASE("SqliteAdapter: CSV ingestion", "[sqlite]") {
    auto adapter = connected_adapter();

    SECTION("Delimiter detected from the header line") {
        const auto path = write_temp_csv("dpgw_test_semicolon.csv",
            "id;name;amount\n1;alpha;10.5\n2;beta;20\n3;gamma;\n");
        REQUIRE(adapter->register_data_source({"csv", path, "Items", std::nullopt}));

        auto result = adapter->execute_query("SELECT id, name, amount FROM Items ORDER BY id");
        REQUIRE(result.success);
        REQUIRE(result.row_count == 3);
        CHECK(std::get<int64_t>(result.rows[0][0]) == 1);
        CHECK(std::get<std::string>(result.rows[1][1]) == "beta");
        CHECK(std::get<double>(result.rows[1][2]) == 20.0);
        CHECK(is_null(result.rows[2][2]));
        std::filesystem::remove(path);
    }

    SECTION("Re-registering replaces the table") {
        const auto path = write_temp_csv("dpgw_test_replace.csv", "x\n1\n2\n");
        REQUIRE(adapter->register_data_source({"csv", path, "T", ','}));
        REQUIRE(adapter->register_data_source({"csv", path, "T", ','}));
        auto result = adapter->execute_query("SELECT count(*) FROM T");
        REQUIRE(result.success);
        CHECK(std::get<int64_t>(result.rows[0][0]) == 2);
        std::filesystem::remove(path);
    }

    SECTION("Missing file and unsupported type") {
        CHECK_FALSE(adapter->register_data_source({"csv", "/nonexistent/file.csv", "Nope", std::nullopt}));
        CHECK_FALSE(adapter->register_data_source({"parquet", "/data/x.parquet", "X", std::nullopt}));
    }
}

TEST_CASE("SqliteAdapter: detect_delimiter", "[sqlite]") {
    CHECK(SqliteAdapter::detect_delimiter("a,b,c") == ',');
    CHECK(SqliteAdapter::detect_delimiter("a;b;c") == ';');
    CHECK(SqliteAdapter::detect_delimiter("a\tb\tc") == '\t');
    CHECK(SqliteAdapter::detect_delimiter("a|b|c") == '|');
    CHECK(SqliteAdapter::detect_delimiter("single") == ',');
}

TEST_CASE("SqliteAdapter: fallback views", "[sqlite]") {
    auto adapter = connected_adapter();

    const auto results = adapter->create_fallback_views({"fi_sales_by_customer_type_view", "custom_missing"});
    REQUIRE(results.size() == 2);
    CHECK(results.at("fi_sales_by_customer_type_view"));
    CHECK(results.at("custom_missing"));

    auto generic = adapter->execute_query("SELECT * FROM custom_missing");
    REQUIRE(generic.success);
    CHECK(generic.columns == std::vector<std::string>{"row_id", "label", "value"});
    CHECK(generic.row_count == 100);

    // Same rows on a second connection
    auto other = connected_adapter();
    REQUIRE(other->create_fallback_views({"custom_missing"}).at("custom_missing"));
    auto again = other->execute_query("SELECT * FROM custom_missing");
    REQUIRE(again.success);
    CHECK(again.rows == generic.rows);
}

TEST_CASE("SqliteAdapter: interrupt cancels a running query", "[sqlite]") {
    auto adapter = connected_adapter();

    auto future = std::async(std::launch::async, [adapter] {
        return adapter->execute_query(
            "WITH RECURSIVE c(x) AS (SELECT 1 UNION ALL SELECT x + 1 FROM c) SELECT count(*) FROM c");
    });

    // An interrupt that lands before the statement starts is a no-op, so keep nudging
    for (int i = 0; i < 200 && future.wait_for(50ms) != std::future_status::ready; ++i) {
        adapter->interrupt();
    }
    REQUIRE(future.wait_for(0ms) == std::future_status::ready);

    const auto result = future.get();
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("interrupt") != std::string::npos);

    // Connection stays usable
    CHECK(adapter->execute_query("SELECT 1").success);
}

TEST_CASE("SqliteAdapter: stop token cancels the running call", "[sqlite]") {
    auto adapter = connected_adapter();
    std::stop_source cancel;

    auto future = std::async(std::launch::async, [adapter, token = cancel.get_token()] {
        return adapter->execute_query(kEndlessQuery, {}, "tx-endless", token);
    });
    std::this_thread::sleep_for(50ms);
    cancel.request_stop();

    if (future.wait_for(10s) != std::future_status::ready) {
        adapter->interrupt();
    }
    REQUIRE(future.wait_for(0ms) == std::future_status::ready);

    const auto result = future.get();
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("interrupt") != std::string::npos);
    CHECK(adapter->execute_query("SELECT 1").success);
}

TEST_CASE("SqliteAdapter: cancelling one call leaves other callers' statements alone", "[sqlite]") {
    auto adapter = connected_adapter();

    auto holder = std::async(std::launch::async, [adapter] {
        return adapter->execute_query(kTwoMillionRows, {}, "tx-holder");
    });
    std::this_thread::sleep_for(50ms);

    // Either queued behind the holder or, if it won the lock, endless until stopped
    std::stop_source cancel;
    auto waiter = std::async(std::launch::async, [adapter, token = cancel.get_token()] {
        return adapter->execute_query(kEndlessQuery, {}, "tx-waiter", token);
    });
    std::this_thread::sleep_for(20ms);
    cancel.request_stop();

    if (waiter.wait_for(30s) != std::future_status::ready) {
        adapter->interrupt();
    }
    REQUIRE(waiter.wait_for(0ms) == std::future_status::ready);

    const auto held = holder.get();
    REQUIRE(held.success);
    CHECK(std::get<int64_t>(held.rows[0][0]) == 2000000);

    const auto cancelled = waiter.get();
    CHECK_FALSE(cancelled.success);
    CHECK(cancelled.error_message.find("interrupt") != std::string::npos);
}

TEST_CASE("SqliteAdapter: a call cancelled before it starts never runs", "[sqlite]") {
    auto adapter = connected_adapter();
    std::stop_source cancel;
    cancel.request_stop();

    const auto result = adapter->execute_query("SELECT 1", {}, "tx-late", cancel.get_token());
    CHECK_FALSE(result.success);
    CHECK(result.error_message.find("interrupted") != std::string::npos);
}

TEST_CASE("SqliteAdapter: metadata", "[sqlite]") {
    auto adapter = connected_adapter();
    REQUIRE(adapter->create_view("v1", "SELECT 1"));

    const auto meta = adapter->get_metadata();
    CHECK(meta.at("database_type") == "sqlite");
    CHECK(meta.at("status") == "connected");
    CHECK(meta.at("view_count") == "1");
    CHECK_FALSE(meta.at("version").empty());
}
