#include "db/fallback_view_generator.hpp"
#include "core/utils.hpp"

#include <cstdint>
#include <format>
#include <random>
#include <type_traits>
#include <variant>

namespace dpgw {

namespace {

constexpr const char* kSalesByCustomerType = "fi_sales_by_customer_type_view";
constexpr const char* kFinancialTransactions = "fi_financial_transactions_view";
constexpr const char* kCustomerTransactions = "fi_customer_transactions_view";

// FNV-1a: stable across platforms, unlike std::hash
uint32_t seed_for(const std::string& name) {
    uint32_t hash = 2166136261u;
    for (const char c : name) {
        hash ^= static_cast<uint8_t>(c);
        hash *= 16777619u;
    }
    return hash;
}

// Cents-precision amount in [min, min + span)
double amount(std::mt19937& rng, uint32_t min, uint32_t span) {
    const uint32_t cents = rng() % (span * 100);
    return static_cast<double>(min) + static_cast<double>(cents) / 100.0;
}

std::string render_literal(const CellValue& cell) {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            return "NULL";
        } else if constexpr (std::is_same_v<T, bool>) {
            return v ? "1" : "0";
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return std::to_string(v);
        } else if constexpr (std::is_same_v<T, double>) {
            // Always carry a decimal point so engines infer a floating type
            return std::format("{:.2f}", v);
        } else {
            return utils::quote_literal(v);
        }
    }, cell);
}

} // anonymous namespace

FallbackViewGenerator::FallbackViewGenerator() : FallbackViewGenerator(Config{}) {}

FallbackViewGenerator::FallbackViewGenerator(Config config)
    : config_(std::move(config)) {}

bool FallbackViewGenerator::has_template(const std::string& view_name) {
    const auto lower = utils::to_lower(view_name);
    return lower == kSalesByCustomerType
        || lower == kFinancialTransactions
        || lower == kCustomerTransactions;
}

std::string FallbackViewGenerator::iso_date_before_anchor(int days) const {
    const std::chrono::sys_days day =
        std::chrono::sys_days{config_.anchor_date} - std::chrono::days{days};
    const std::chrono::year_month_day ymd{day};
    return std::format("{:04d}-{:02d}-{:02d}",
                       static_cast<int>(ymd.year()),
                       static_cast<unsigned>(ymd.month()),
                       static_cast<unsigned>(ymd.day()));
}

FallbackViewGenerator::GeneratedView FallbackViewGenerator::generate(
    const std::string& view_name) const {

    GeneratedView view;
    view.name = view_name;
    std::mt19937 rng(seed_for(utils::to_lower(view_name)));
    const size_t count = config_.rows_per_view;
    view.rows.reserve(count);

    const auto lower = utils::to_lower(view_name);

    if (lower == kSalesByCustomerType) {
        view.columns = {
            {"customertypeid", GenericColumnType::TEXT},
            {"value", GenericColumnType::REAL},
            {"date", GenericColumnType::DATE},
        };
        for (size_t i = 0; i < count; ++i) {
            Row row;
            row.emplace_back(std::format("Type {}", rng() % 5 + 1));
            row.emplace_back(amount(rng, 0, 10000));
            row.emplace_back(iso_date_before_anchor(static_cast<int>(rng() % 730)));
            view.rows.push_back(std::move(row));
        }
    } else if (lower == kFinancialTransactions) {
        view.columns = {
            {"transaction_id", GenericColumnType::TEXT},
            {"transaction_date", GenericColumnType::DATE},
            {"account_id", GenericColumnType::TEXT},
            {"value", GenericColumnType::REAL},
            {"type", GenericColumnType::TEXT},
        };
        for (size_t i = 0; i < count; ++i) {
            Row row;
            row.emplace_back(std::format("TX{}", i));
            row.emplace_back(iso_date_before_anchor(static_cast<int>(rng() % 365)));
            row.emplace_back(std::format("Account{}", rng() % 10 + 1));
            row.emplace_back(amount(rng, 5000, 20000));
            row.emplace_back(std::string(rng() % 2 == 0 ? "Debit" : "Credit"));
            view.rows.push_back(std::move(row));
        }
    } else if (lower == kCustomerTransactions) {
        view.columns = {
            {"transaction_id", GenericColumnType::TEXT},
            {"customer_id", GenericColumnType::TEXT},
            {"transaction_date", GenericColumnType::DATE},
            {"amount", GenericColumnType::REAL},
            {"customer_type", GenericColumnType::TEXT},
        };
        for (size_t i = 0; i < count; ++i) {
            Row row;
            row.emplace_back(std::format("TX{}", i));
            row.emplace_back(std::format("CUST{}", rng() % 100 + 1));
            row.emplace_back(iso_date_before_anchor(static_cast<int>(rng() % 365)));
            row.emplace_back(amount(rng, 1000, 10000));
            row.emplace_back(std::format("Type {}", rng() % 5 + 1));
            view.rows.push_back(std::move(row));
        }
    } else {
        view.columns = {
            {"row_id", GenericColumnType::INTEGER},
            {"label", GenericColumnType::TEXT},
            {"value", GenericColumnType::REAL},
        };
        for (size_t i = 0; i < count; ++i) {
            Row row;
            row.emplace_back(static_cast<int64_t>(i + 1));
            row.emplace_back(std::format("{}_{}", view_name, i + 1));
            row.emplace_back(amount(rng, 0, 1000));
            view.rows.push_back(std::move(row));
        }
    }

    return view;
}

std::string FallbackViewGenerator::render_select(const GeneratedView& view) {
    std::string sql;
    bool first = true;
    for (const auto& row : view.rows) {
        sql += first ? "SELECT " : " UNION ALL SELECT ";
        for (size_t c = 0; c < row.size(); ++c) {
            if (c > 0) sql += ", ";
            sql += render_literal(row[c]);
            if (first) {
                sql += " AS ";
                sql += utils::quote_identifier(view.columns[c].name);
            }
        }
        first = false;
    }

    // Zero rows still needs the column shape
    if (first) {
        sql = "SELECT ";
        for (size_t c = 0; c < view.columns.size(); ++c) {
            if (c > 0) sql += ", ";
            sql += "NULL AS " + utils::quote_identifier(view.columns[c].name);
        }
        sql += " WHERE 1 = 0";
    }
    return sql;
}

std::string FallbackViewGenerator::view_sql(const std::string& view_name) const {
    return render_select(generate(view_name));
}

} // namespace dpgw
