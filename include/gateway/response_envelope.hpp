#pragma once

#include "core/types.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace dpgw {

/**
 * @brief Uniform reply for every gateway operation
 *
 * Error envelopes never carry columns or rows; success envelopes always carry
 * columns consistent with row_count.
 */
struct ResponseEnvelope {
    std::string status = "success";   // "success" | "error"
    std::string request_id;
    std::string message;
    std::string transaction_id;

    std::vector<std::string> columns;
    std::vector<Row> rows;
    size_t row_count = 0;
    double query_time_ms = 0.0;
    bool truncated = false;

    ErrorCode error_code = ErrorCode::NONE;
    std::optional<std::string> error_message;

    bool human_action_required = false;
    std::optional<std::string> human_action_type;
    std::map<std::string, std::string> human_action_context;

    std::map<std::string, std::string> metadata;
    std::optional<std::string> product_id;

    [[nodiscard]] bool is_success() const { return status == "success"; }

    static ResponseEnvelope success(QueryResult result,
                                    std::string transaction_id,
                                    std::string request_id);

    static ResponseEnvelope failure(ErrorCode code,
                                    std::string error_message,
                                    std::string transaction_id,
                                    std::string request_id);

    /** @brief Serialize to the wire JSON object */
    [[nodiscard]] std::string to_json() const;
};

} // namespace dpgw
