#include <catch2/catch_test_macros.hpp>
#include "gateway/sql_normalizer.hpp"

using namespace dpgw;

namespace {

std::string normalized(std::string_view raw) {
    auto r = SqlNormalizer::normalize(raw);
    REQUIRE(r.is_ok());
    return r.value();
}

} // anonymous namespace

TEST_CASE("SqlNormalizer: plain SQL passes through trimmed", "[sql_normalizer]") {
    CHECK(normalized("  SELECT * FROM t  ") == "SELECT * FROM t");
}

TEST_CASE("SqlNormalizer: trailing separators are removed", "[sql_normalizer]") {
    CHECK(normalized("SELECT * FROM t;") == "SELECT * FROM t");
    CHECK(normalized("SELECT * FROM t ,; \n") == "SELECT * FROM t");
}

TEST_CASE("SqlNormalizer: markdown fences", "[sql_normalizer]") {
    SECTION("With language tag") {
        CHECK(normalized("```sql\nSELECT 1\n```") == "SELECT 1");
    }
    SECTION("Without language tag") {
        CHECK(normalized("```\nSELECT 2\n```") == "SELECT 2");
    }
    SECTION("Surrounded by prose") {
        CHECK(normalized("Here you go:\n```sql\nSELECT 3;\n```\nEnjoy") == "SELECT 3");
    }
}

TEST_CASE("SqlNormalizer: SQL wrapped in a JSON object", "[sql_normalizer]") {
    SECTION("Well-formed with sql key") {
        CHECK(normalized(R"({"sql": "SELECT * FROM FI_Star_View"})") == "SELECT * FROM FI_Star_View");
    }
    SECTION("Well-formed with query key and escaped quotes") {
        CHECK(normalized(R"({"query": "SELECT \"Account ID\" FROM t"})") == R"(SELECT "Account ID" FROM t)");
    }
    SECTION("Truncated object") {
        CHECK(normalized(R"({"sql": "SELECT * FROM t LIMIT 5)") == "SELECT * FROM t LIMIT 5");
    }
    SECTION("Trailing JSON debris") {
        CHECK(normalized(R"({"sql": "SELECT 1"}, "extra": 1)") == "SELECT 1");
    }
}

TEST_CASE("SqlNormalizer: surrounding quotes only when a statement is inside", "[sql_normalizer]") {
    CHECK(normalized(R"("SELECT 1")") == "SELECT 1");
    CHECK(normalized("'with t as (select 1) select * from t'") == "with t as (select 1) select * from t");
    // Not a statement: left alone
    CHECK(normalized(R"("Account ID")") == R"("Account ID")");
}

TEST_CASE("SqlNormalizer: literal escape sequences", "[sql_normalizer]") {
    CHECK(normalized(R"(SELECT a,\n b\tFROM t)") == "SELECT a,  b FROM t");
    CHECK(normalized(R"(SELECT \"Region\" FROM t WHERE x = \'EU\')") == R"(SELECT "Region" FROM t WHERE x = 'EU')");
}

TEST_CASE("SqlNormalizer: quoted identifiers survive", "[sql_normalizer]") {
    const std::string sql = R"(SELECT SUM("Transaction Value Amount") FROM "FI_Star_View")";
    CHECK(normalized(sql) == sql);
}

TEST_CASE("SqlNormalizer: empty after normalization is an error", "[sql_normalizer]") {
    for (const auto* raw : {"", "   ", ";", "```sql\n```", ",;,"}) {
        auto r = SqlNormalizer::normalize(raw);
        CHECK(r.is_error());
        CHECK(r.error_category() == ErrorCategory::VALIDATION_ERROR);
    }
}

TEST_CASE("SqlNormalizer: extract_from_json without a sql key", "[sql_normalizer]") {
    CHECK(SqlNormalizer::extract_from_json(R"({"text": "hello"})").empty());
    CHECK(SqlNormalizer::extract_from_json("no json here").empty());
}
