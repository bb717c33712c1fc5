#include "core/cell_value.hpp"
#include "core/utils.hpp"

#include <cmath>
#include <format>
#include <type_traits>
#include <variant>

namespace dpgw {

std::string cell_to_string(const CellValue& v) {
    return std::visit([](const auto& value) -> std::string {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            return "";
        } else if constexpr (std::is_same_v<T, bool>) {
            return utils::booltostr(value);
        } else if constexpr (std::is_same_v<T, std::string>) {
            return value;
        } else {
            return std::format("{}", value);
        }
    }, v);
}

std::string cell_to_json(const CellValue& v) {
    return std::visit([](const auto& value) -> std::string {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            return "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            return utils::booltostr(value);
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return std::format("{}", value);
        } else if constexpr (std::is_same_v<T, double>) {
            // JSON has no NaN/Infinity
            if (!std::isfinite(value)) return "null";
            return std::format("{}", value);
        } else {
            return std::format("\"{}\"", utils::escape_json(value));
        }
    }, v);
}

} // namespace dpgw
