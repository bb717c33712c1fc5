#pragma once

#include <cstdint>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace dpgw {

/**
 * @brief Outcome of a read-only policy check
 *
 * statement_type is the uppercase leading keyword ("SELECT", "DELETE", ...)
 * or "UNKNOWN" when the text does not start with one.
 */
struct ValidationResult {
    bool valid = false;
    std::string error_message;
    std::string statement_type;

    static ValidationResult ok(std::string type) {
        ValidationResult r;
        r.valid = true;
        r.statement_type = std::move(type);
        return r;
    }

    static ValidationResult reject(std::string type, std::string message) {
        ValidationResult r;
        r.valid = false;
        r.statement_type = std::move(type);
        r.error_message = std::move(message);
        return r;
    }
};

enum class MatchMode : uint8_t { WORD_BOUNDARY, SUBSTRING };

/**
 * @brief Read-only SQL policy (leading keyword allowlist + keyword denylist)
 *
 * Before matching, comments are removed and the contents of '...', "..." and
 * `...` are blanked, so a quoted identifier such as "Last Update" or a string
 * literal never trips the denylist. More than one statement is always rejected.
 *
 * Each backend adapter picks a preset:
 *   embedded()   - must start with SELECT/WITH, regex word-boundary denylist
 *   warehouse()  - must start with SELECT/WITH, DDL/DML denylist
 *   relational() - denylist only (the pooled adapter also serves config reads)
 *
 * Thread-safe: validate() is const and the compiled pattern is immutable.
 */
class ReadOnlySqlGuard {
public:
    struct Config {
        std::vector<std::string> allowed_leading;   // empty = any leading keyword
        std::vector<std::string> denied_keywords;   // regex fragments under WORD_BOUNDARY
        MatchMode match = MatchMode::WORD_BOUNDARY;
    };

    explicit ReadOnlySqlGuard(Config config);

    [[nodiscard]] ValidationResult validate(std::string_view sql) const;

    [[nodiscard]] const Config& config() const { return config_; }

    [[nodiscard]] static ReadOnlySqlGuard embedded();
    [[nodiscard]] static ReadOnlySqlGuard warehouse();
    [[nodiscard]] static ReadOnlySqlGuard relational();

    /**
     * @brief Remove comments and blank quoted text, preserving the quote marks
     */
    [[nodiscard]] static std::string mask_comments_and_literals(std::string_view sql);

    /**
     * @brief First keyword of masked SQL, uppercased (leading '(' skipped)
     */
    [[nodiscard]] static std::string leading_keyword(std::string_view masked_sql);

private:
    [[nodiscard]] std::string find_denied_keyword(const std::string& masked) const;

    Config config_;
    std::regex deny_pattern_;
};

} // namespace dpgw
