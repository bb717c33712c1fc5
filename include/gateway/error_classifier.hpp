#pragma once

#include "core/types.hpp"

#include <string>
#include <string_view>

namespace dpgw {

/**
 * @brief Outcome of classifying a backend-native error message
 */
struct ErrorClassification {
    ErrorCode code = ErrorCode::SQL_EXECUTION_ERROR;
    bool human_action_required = false;
    std::string human_action_type;    // "data_correction" when set
};

/**
 * @brief Map a backend error message onto the envelope taxonomy
 *
 * Matching is case-insensitive substring search, in this order:
 * data-correction (missing table/column, bad cast, permissions) ->
 * connection failure -> cancellation/timeout -> SQL_EXECUTION_ERROR.
 */
[[nodiscard]] ErrorClassification classify_backend_error(std::string_view message);

} // namespace dpgw
