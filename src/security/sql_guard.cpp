#include "security/sql_guard.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cctype>
#include <format>

namespace dpgw {

namespace {

constexpr std::string_view kOnlySelect = "only select statements are allowed";

std::regex build_deny_pattern(const std::vector<std::string>& keywords) {
    if (keywords.empty()) {
        return std::regex();
    }
    std::string alternation;
    for (const auto& kw : keywords) {
        if (!alternation.empty()) alternation += '|';
        alternation += utils::to_lower(kw);
    }
    return std::regex("\\b(" + alternation + ")\\b",
                      std::regex::ECMAScript | std::regex::icase | std::regex::optimize);
}

bool has_second_statement(std::string_view masked) {
    const auto semi = masked.find(';');
    if (semi == std::string_view::npos) return false;
    const auto rest = masked.substr(semi + 1);
    return std::any_of(rest.begin(), rest.end(), [](char c) {
        return !std::isspace(static_cast<unsigned char>(c)) && c != ';';
    });
}

} // anonymous namespace

ReadOnlySqlGuard::ReadOnlySqlGuard(Config config)
    : config_(std::move(config)),
      deny_pattern_(build_deny_pattern(config_.denied_keywords)) {}

// ============================================================================
// Presets
// ============================================================================

ReadOnlySqlGuard ReadOnlySqlGuard::embedded() {
    return ReadOnlySqlGuard(Config{
        {"SELECT", "WITH"},
        {"create", "drop", "alter", "truncate", "insert", "update", "delete",
         "merge", "grant", "revoke", "begin", "commit", "rollback", "call",
         "exec", "attach", "detach", "pragma", "vacuum", "replace\\s+into"},
        MatchMode::WORD_BOUNDARY});
}

ReadOnlySqlGuard ReadOnlySqlGuard::warehouse() {
    return ReadOnlySqlGuard(Config{
        {"SELECT", "WITH"},
        {"insert", "update", "delete", "merge", "create", "alter", "drop", "truncate"},
        MatchMode::WORD_BOUNDARY});
}

ReadOnlySqlGuard ReadOnlySqlGuard::relational() {
    return ReadOnlySqlGuard(Config{
        {},
        {"drop", "truncate", "delete", "update", "insert", "alter", "create",
         "grant", "revoke", "merge", "copy", "call", "execute", "set", "vacuum"},
        MatchMode::WORD_BOUNDARY});
}

// ============================================================================
// Text preparation
// ============================================================================

std::string ReadOnlySqlGuard::mask_comments_and_literals(std::string_view sql) {
    std::string out;
    out.reserve(sql.size());

    const size_t n = sql.size();
    size_t i = 0;
    while (i < n) {
        const char c = sql[i];

        if (c == '-' && i + 1 < n && sql[i + 1] == '-') {
            const auto eol = sql.find('\n', i + 2);
            i = (eol == std::string_view::npos) ? n : eol + 1;
            out += ' ';
            continue;
        }

        if (c == '/' && i + 1 < n && sql[i + 1] == '*') {
            const auto end = sql.find("*/", i + 2);
            i = (end == std::string_view::npos) ? n : end + 2;
            out += ' ';
            continue;
        }

        if (c == '\'' || c == '"' || c == '`') {
            const char quote = c;
            out += quote;
            ++i;
            while (i < n) {
                if (sql[i] == quote) {
                    // Doubled quote is an escaped quote inside the literal
                    if (i + 1 < n && sql[i + 1] == quote) {
                        out += "  ";
                        i += 2;
                        continue;
                    }
                    break;
                }
                out += ' ';
                ++i;
            }
            if (i < n) {
                out += quote;
                ++i;
            }
            continue;
        }

        out += c;
        ++i;
    }
    return out;
}

std::string ReadOnlySqlGuard::leading_keyword(std::string_view masked_sql) {
    size_t i = 0;
    while (i < masked_sql.size() &&
           (std::isspace(static_cast<unsigned char>(masked_sql[i])) || masked_sql[i] == '(')) {
        ++i;
    }
    const size_t start = i;
    while (i < masked_sql.size() &&
           (std::isalpha(static_cast<unsigned char>(masked_sql[i])) || masked_sql[i] == '_')) {
        ++i;
    }
    if (i == start) return "UNKNOWN";
    return utils::to_upper(masked_sql.substr(start, i - start));
}

// ============================================================================
// Validation
// ============================================================================

std::string ReadOnlySqlGuard::find_denied_keyword(const std::string& masked) const {
    if (config_.denied_keywords.empty()) return {};

    if (config_.match == MatchMode::WORD_BOUNDARY) {
        std::smatch match;
        if (std::regex_search(masked, match, deny_pattern_)) {
            return utils::to_upper(match[1].str());
        }
        return {};
    }

    const std::string lower = utils::to_lower(masked);
    for (const auto& kw : config_.denied_keywords) {
        if (lower.find(utils::to_lower(kw)) != std::string::npos) {
            return utils::to_upper(kw);
        }
    }
    return {};
}

ValidationResult ReadOnlySqlGuard::validate(std::string_view sql) const {
    const std::string masked = mask_comments_and_literals(sql);
    if (utils::trim(masked).empty()) {
        return ValidationResult::reject("UNKNOWN", "empty SQL statement");
    }

    const std::string type = leading_keyword(masked);

    if (has_second_statement(masked)) {
        return ValidationResult::reject(type,
            std::format("{}: multiple statements are not allowed", kOnlySelect));
    }

    if (!config_.allowed_leading.empty()) {
        const bool allowed = std::any_of(
            config_.allowed_leading.begin(), config_.allowed_leading.end(),
            [&type](const std::string& kw) { return utils::to_upper(kw) == type; });
        if (!allowed) {
            return ValidationResult::reject(type,
                std::format("{} (got {})", kOnlySelect, type));
        }
    }

    const std::string denied = find_denied_keyword(masked);
    if (!denied.empty()) {
        return ValidationResult::reject(type,
            std::format("{} (found {})", kOnlySelect, denied));
    }

    return ValidationResult::ok(type);
}

} // namespace dpgw
