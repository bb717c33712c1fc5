#include "gateway/sql_normalizer.hpp"
#include "core/json.hpp"
#include "core/utils.hpp"

#include <array>
#include <cctype>

namespace dpgw {

namespace {

std::string replace_all(std::string text, std::string_view from, std::string_view to) {
    size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
    return text;
}

bool starts_with_read_keyword(std::string_view text) {
    const auto upper = utils::to_upper(text.substr(0, 6));
    return upper.starts_with("SELECT") || upper.starts_with("WITH");
}

constexpr std::array<std::string_view, 2> kSqlKeys = {"sql", "query"};

} // anonymous namespace

std::string SqlNormalizer::strip_markdown_fences(std::string_view text) {
    const auto open = text.find("```");
    if (open == std::string_view::npos) {
        return std::string(text);
    }

    size_t body_start = open + 3;
    const auto newline = text.find('\n', body_start);
    if (newline != std::string_view::npos) {
        // ```sql\n ... : skip the language tag line
        const auto tag = text.substr(body_start, newline - body_start);
        bool is_tag = true;
        for (const char c : tag) {
            if (!std::isalnum(static_cast<unsigned char>(c)) && c != ' ' && c != '\r') is_tag = false;
        }
        if (is_tag) body_start = newline + 1;
    } else if (utils::to_lower(text.substr(body_start, 4)) == "sql ") {
        body_start += 4;
    }

    const auto close = text.find("```", body_start);
    const auto body = close == std::string_view::npos
        ? text.substr(body_start)
        : text.substr(body_start, close - body_start);
    return utils::trim(body);
}

std::string SqlNormalizer::extract_from_json(std::string_view text) {
    const auto open = text.find('{');
    if (open == std::string_view::npos) {
        return {};
    }

    const auto close = text.rfind('}');
    if (close != std::string_view::npos && close > open) {
        try {
            const auto doc = JsonValue::parse(text.substr(open, close - open + 1));
            for (const auto key : kSqlKeys) {
                if (auto sql = doc.optional_string(key)) return *sql;
            }
        } catch (const JsonValue::parse_error&) {
            // Malformed: scan for the quoted value below
        }
    }

    for (const auto key : kSqlKeys) {
        const std::string quoted_key = "\"" + std::string(key) + "\"";
        const auto key_pos = text.find(quoted_key);
        if (key_pos == std::string_view::npos) continue;

        const auto colon = text.find(':', key_pos + quoted_key.size());
        if (colon == std::string_view::npos) continue;
        size_t value_start = colon + 1;
        while (value_start < text.size() && std::isspace(static_cast<unsigned char>(text[value_start]))) {
            ++value_start;
        }
        if (value_start >= text.size() || text[value_start] != '"') continue;

        const auto value_end = utils::find_unescaped_quote(text, value_start + 1);
        if (value_end == std::string_view::npos) {
            // Truncated: keep the remainder, later steps trim the debris
            return std::string(text.substr(value_start + 1));
        }
        return utils::unescape_json(text.substr(value_start + 1, value_end - value_start - 1));
    }
    return {};
}

Result<std::string> SqlNormalizer::normalize(std::string_view raw) {
    std::string sql = utils::trim(raw);
    sql = strip_markdown_fences(sql);

    const bool json_fragment = !sql.empty() && sql.front() == '{';
    if (json_fragment) {
        auto extracted = extract_from_json(sql);
        if (!extracted.empty()) {
            sql = utils::trim(extracted);
        }

        bool stripped = true;
        while (stripped) {
            stripped = false;
            sql = utils::trim(sql);
            if (sql.ends_with("\"}") || sql.ends_with("\",")) {
                sql.resize(sql.size() - 2);
                stripped = true;
            }
        }
    }

    if (sql.size() >= 2 && sql.front() == sql.back() && (sql.front() == '"' || sql.front() == '\'')) {
        auto inner = utils::trim(std::string_view(sql).substr(1, sql.size() - 2));
        if (starts_with_read_keyword(inner)) {
            sql = std::move(inner);
        }
    }

    sql = replace_all(std::move(sql), "\\\"", "\"");
    sql = replace_all(std::move(sql), "\\'", "'");

    sql = replace_all(std::move(sql), "\\n", " ");
    sql = replace_all(std::move(sql), "\\t", " ");
    sql = replace_all(std::move(sql), "\\r", " ");

    while (!sql.empty() && (sql.back() == ',' || sql.back() == ';' ||
                            std::isspace(static_cast<unsigned char>(sql.back())))) {
        sql.pop_back();
    }
    sql = utils::trim(sql);

    if (sql.empty()) {
        return Result<std::string>::error(ErrorCategory::VALIDATION_ERROR, "SQL is empty after normalization");
    }
    return Result<std::string>::ok(std::move(sql));
}

} // namespace dpgw
