#pragma once

#include "core/cell_value.hpp"
#include "core/column_type.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace dpgw {

/**
 * @brief Deterministic placeholder data for views whose sources are missing
 *
 * Rows are produced in-process from a generator seeded by the view name and
 * rendered as a dialect-free "SELECT ... UNION ALL SELECT ..." body, so the
 * same name yields identical rows on every engine and every run.
 *
 * Known templates: fi_sales_by_customer_type_view,
 * fi_financial_transactions_view, fi_customer_transactions_view. Any other
 * name gets the generic (row_id, label, value) shape.
 */
class FallbackViewGenerator {
public:
    struct Config {
        size_t rows_per_view = 100;
        std::chrono::year_month_day anchor_date{
            std::chrono::year{2025}, std::chrono::month{6}, std::chrono::day{30}};
    };

    struct ColumnSpec {
        std::string name;
        GenericColumnType type = GenericColumnType::TEXT;
    };

    struct GeneratedView {
        std::string name;
        std::vector<ColumnSpec> columns;
        std::vector<Row> rows;
    };

    FallbackViewGenerator();
    explicit FallbackViewGenerator(Config config);

    /** @brief Build the rows for a view name */
    [[nodiscard]] GeneratedView generate(const std::string& view_name) const;

    /** @brief Render generated rows as a portable SELECT body */
    [[nodiscard]] static std::string render_select(const GeneratedView& view);

    /** @brief generate() + render_select() */
    [[nodiscard]] std::string view_sql(const std::string& view_name) const;

    /** @brief True when the name has a dedicated template (not the generic shape) */
    [[nodiscard]] static bool has_template(const std::string& view_name);

private:
    [[nodiscard]] std::string iso_date_before_anchor(int days) const;

    Config config_;
};

} // namespace dpgw
