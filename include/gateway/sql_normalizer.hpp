#pragma once

#include "core/error.hpp"

#include <string>
#include <string_view>

namespace dpgw {

/**
 * @brief Cleans SQL text produced by an upstream generator
 *
 * The input may be wrapped in markdown fences, embedded in (possibly
 * truncated) JSON such as {"sql": "..."}, quoted, or carry escaped quotes and
 * literal "\n" sequences. Steps, in order:
 *
 *  1. trim
 *  2. strip ``` fences
 *  3. pull "sql" / "query" out of a JSON object (falls back to scanning for
 *     the quoted value when the JSON is malformed)
 *  4. drop trailing ", and "} artifacts (JSON fragments only)
 *  5. remove surrounding quotes when the inner text starts with SELECT/WITH
 *  6. unescape \" and \'
 *  7. literal \n \t \r -> space
 *  8. strip trailing commas and semicolons
 */
class SqlNormalizer {
public:
    /** @return Clean SQL, or VALIDATION_ERROR when nothing is left */
    [[nodiscard]] static Result<std::string> normalize(std::string_view raw);

    [[nodiscard]] static std::string strip_markdown_fences(std::string_view text);

    /**
     * @brief Extract the "sql" or "query" member of a JSON fragment
     * @return Empty when the text does not carry either key
     */
    [[nodiscard]] static std::string extract_from_json(std::string_view text);
};

} // namespace dpgw
