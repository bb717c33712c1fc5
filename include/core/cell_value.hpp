#pragma once

#include <cstdint>
#include <cstddef>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace dpgw {

/**
 * @brief One result cell in the canonical tabular shape
 *
 * Every engine's native representation collapses into these five
 * alternatives. Dates and timestamps travel as ISO-8601 text.
 */
using CellValue = std::variant<std::nullptr_t, bool, int64_t, double, std::string>;

using Row = std::vector<CellValue>;

/** @brief Named query parameters (bound as :name / @name by the engine) */
using QueryParameters = std::map<std::string, CellValue>;

[[nodiscard]] inline bool is_null(const CellValue& v) {
    return std::holds_alternative<std::nullptr_t>(v);
}

/**
 * @brief Render a cell as plain text (NULL renders as empty string)
 */
[[nodiscard]] std::string cell_to_string(const CellValue& v);

/**
 * @brief Render a cell as a JSON value (number, bool, null or quoted string)
 */
[[nodiscard]] std::string cell_to_json(const CellValue& v);

} // namespace dpgw
