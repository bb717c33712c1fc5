#include "gateway/response_envelope.hpp"
#include "core/utils.hpp"

#include <format>

namespace dpgw {

namespace {

std::string json_string(std::string_view s) {
    return std::format("\"{}\"", utils::escape_json(s));
}

std::string json_optional(const std::optional<std::string>& s) {
    return s ? json_string(*s) : "null";
}

std::string json_object(const std::map<std::string, std::string>& entries) {
    std::string out = "{";
    bool first = true;
    for (const auto& [key, value] : entries) {
        if (!first) out += ',';
        out += json_string(key);
        out += ':';
        out += json_string(value);
        first = false;
    }
    out += '}';
    return out;
}

} // anonymous namespace

ResponseEnvelope ResponseEnvelope::success(QueryResult result,
                                           std::string transaction_id,
                                           std::string request_id) {
    ResponseEnvelope env;
    env.status = "success";
    env.transaction_id = std::move(transaction_id);
    env.request_id = std::move(request_id);
    env.columns = std::move(result.columns);
    env.rows = std::move(result.rows);
    env.row_count = env.rows.size();
    env.truncated = result.truncated;
    env.message = env.row_count == 0
        ? "Query executed successfully, no rows returned"
        : std::format("Query executed successfully, {} row(s) returned", env.row_count);
    return env;
}

ResponseEnvelope ResponseEnvelope::failure(ErrorCode code,
                                           std::string error_message,
                                           std::string transaction_id,
                                           std::string request_id) {
    ResponseEnvelope env;
    env.status = "error";
    env.transaction_id = std::move(transaction_id);
    env.request_id = std::move(request_id);
    env.error_code = code;
    env.message = error_message;
    env.error_message = std::move(error_message);
    return env;
}

std::string ResponseEnvelope::to_json() const {
    std::string out;
    out.reserve(256 + rows.size() * columns.size() * 16);

    out += "{\"status\":" + json_string(status);
    out += ",\"request_id\":" + json_string(request_id);
    out += ",\"message\":" + json_string(message);
    out += ",\"transaction_id\":" + json_string(transaction_id);

    out += ",\"columns\":[";
    for (size_t i = 0; i < columns.size(); ++i) {
        if (i > 0) out += ',';
        out += json_string(columns[i]);
    }
    out += "],\"rows\":[";
    for (size_t r = 0; r < rows.size(); ++r) {
        if (r > 0) out += ',';
        out += '[';
        for (size_t c = 0; c < rows[r].size(); ++c) {
            if (c > 0) out += ',';
            out += cell_to_json(rows[r][c]);
        }
        out += ']';
    }
    out += ']';

    out += std::format(",\"row_count\":{},\"query_time_ms\":{:.3f},\"truncated\":{}",
                       row_count, query_time_ms, utils::booltostr(truncated));

    out += ",\"error_code\":";
    out += error_code == ErrorCode::NONE ? "null" : json_string(error_code_to_string(error_code));
    out += ",\"error_message\":" + json_optional(error_message);

    out += std::format(",\"human_action_required\":{}", utils::booltostr(human_action_required));
    out += ",\"human_action_type\":" + json_optional(human_action_type);
    out += ",\"human_action_context\":" + json_object(human_action_context);
    out += ",\"metadata\":" + json_object(metadata);
    out += ",\"product_id\":" + json_optional(product_id);
    out += '}';
    return out;
}

} // namespace dpgw
