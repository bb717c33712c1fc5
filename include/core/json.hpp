#pragma once

#include "core/utils.hpp"

#include <glaze/glaze.hpp>

#include <cmath>
#include <cstdint>
#include <format>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace dpgw {

/**
 * @brief Read-only DOM over glz::json_t
 *
 * Used wherever the gateway consumes JSON it did not produce: registry files,
 * service-account credentials, BigQuery REST responses, HTTP request bodies.
 * Missing keys and type mismatches yield a null JsonValue instead of throwing,
 * so callers can chain lookups and test once at the end.
 */
class JsonValue {
public:
    using array_t = glz::json_t::array_t;
    using object_t = glz::json_t::object_t;

    struct parse_error : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    JsonValue() = default;
    JsonValue(glz::json_t v) : data_(std::move(v)) {}

    [[nodiscard]] static JsonValue parse(std::string_view json_str) {
        glz::json_t result;
        const std::string buffer(json_str);
        auto ec = glz::read_json(result, buffer);
        if (ec) {
            throw parse_error(std::string("JSON parse error: ") + glz::format_error(ec, buffer));
        }
        return JsonValue(std::move(result));
    }

    // ===== Type Checks =====

    [[nodiscard]] bool is_null() const { return data_.is_null(); }
    [[nodiscard]] bool is_object() const { return data_.is_object(); }
    [[nodiscard]] bool is_array() const { return data_.is_array(); }
    [[nodiscard]] bool is_string() const { return data_.is_string(); }
    [[nodiscard]] bool is_number() const { return data_.is_number(); }
    [[nodiscard]] bool is_boolean() const { return data_.is_boolean(); }

    [[nodiscard]] bool is_integer() const {
        if (!data_.is_number()) return false;
        const double d = data_.get<double>();
        return std::isfinite(d) && d == std::floor(d);
    }

    [[nodiscard]] bool contains(std::string_view key) const {
        if (!data_.is_object()) return false;
        const auto& obj = data_.get_object();
        return obj.find(std::string(key)) != obj.end();
    }

    [[nodiscard]] size_t size() const {
        if (data_.is_array()) return data_.get_array().size();
        if (data_.is_object()) return data_.get_object().size();
        return 0;
    }

    // ===== Element Access (returns copy, null when absent) =====

    [[nodiscard]] JsonValue operator[](std::string_view key) const {
        if (!data_.is_object()) return {};
        const auto& obj = data_.get_object();
        const auto it = obj.find(std::string(key));
        if (it != obj.end()) return JsonValue(it->second);
        return {};
    }

    [[nodiscard]] JsonValue operator[](size_t idx) const {
        if (!data_.is_array()) return {};
        const auto& arr = data_.get_array();
        if (idx < arr.size()) return JsonValue(arr[idx]);
        return {};
    }

    /** @brief Array elements (empty for non-arrays) */
    [[nodiscard]] std::vector<JsonValue> elements() const {
        std::vector<JsonValue> out;
        if (!data_.is_array()) return out;
        const auto& arr = data_.get_array();
        out.reserve(arr.size());
        for (const auto& elem : arr) {
            out.emplace_back(elem);
        }
        return out;
    }

    /** @brief Object members in key order (empty for non-objects) */
    [[nodiscard]] std::vector<std::pair<std::string, JsonValue>> items() const {
        std::vector<std::pair<std::string, JsonValue>> out;
        if (!data_.is_object()) return out;
        for (const auto& [key, val] : data_.get_object()) {
            out.emplace_back(key, JsonValue(val));
        }
        return out;
    }

    // ===== Value Extraction =====

    template <typename T>
    [[nodiscard]] T get() const {
        if constexpr (std::is_same_v<T, std::string>) {
            return data_.get<std::string>();
        } else if constexpr (std::is_same_v<T, bool>) {
            return data_.get<bool>();
        } else if constexpr (std::is_floating_point_v<T>) {
            return static_cast<T>(data_.get<double>());
        } else if constexpr (std::is_integral_v<T>) {
            // json_t stores every number as double
            return static_cast<T>(data_.get<double>());
        } else {
            static_assert(!sizeof(T), "Unsupported type for JsonValue::get<T>()");
        }
    }

    /** @brief String member or default when absent / not a string */
    [[nodiscard]] std::string string_or(std::string_view key, std::string default_value) const {
        const auto node = (*this)[key];
        return node.is_string() ? node.get<std::string>() : std::move(default_value);
    }

    /** @brief Integer member or default; numeric strings are accepted (BigQuery sends int64 as text) */
    [[nodiscard]] int64_t int_or(std::string_view key, int64_t default_value) const {
        const auto node = (*this)[key];
        if (node.is_number()) return node.get<int64_t>();
        if (node.is_string()) {
            try {
                return std::stoll(node.get<std::string>());
            } catch (const std::exception&) {
                return default_value;
            }
        }
        return default_value;
    }

    [[nodiscard]] bool bool_or(std::string_view key, bool default_value) const {
        const auto node = (*this)[key];
        return node.is_boolean() ? node.get<bool>() : default_value;
    }

    [[nodiscard]] std::optional<std::string> optional_string(std::string_view key) const {
        const auto node = (*this)[key];
        if (node.is_string()) return node.get<std::string>();
        return std::nullopt;
    }

    /** @brief Compact JSON text (used to carry nested values as a text cell) */
    [[nodiscard]] std::string dump() const {
        if (is_null()) return "null";
        if (is_boolean()) return get<bool>() ? "true" : "false";
        if (is_string()) return "\"" + utils::escape_json(get<std::string>()) + "\"";
        if (is_number()) {
            const double d = get<double>();
            if (!std::isfinite(d)) return "null";
            return is_integer() ? std::to_string(static_cast<int64_t>(d)) : std::format("{}", d);
        }
        std::string out;
        if (is_array()) {
            out += '[';
            bool first = true;
            for (const auto& elem : elements()) {
                if (!first) out += ',';
                out += elem.dump();
                first = false;
            }
            out += ']';
            return out;
        }
        out += '{';
        bool first = true;
        for (const auto& [key, val] : items()) {
            if (!first) out += ',';
            out += "\"" + utils::escape_json(key) + "\":" + val.dump();
            first = false;
        }
        out += '}';
        return out;
    }

    [[nodiscard]] const glz::json_t& raw() const { return data_; }

private:
    glz::json_t data_{};
};

} // namespace dpgw
