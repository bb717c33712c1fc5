#pragma once

#include "core/cell_value.hpp"
#include "core/column_type.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace dpgw {

// ============================================================================
// Error Codes (wire-stable strings in the response envelope)
// ============================================================================

enum class ErrorCode {
    NONE,
    SQL_VALIDATION_ERROR,
    SQL_EXECUTION_ERROR,
    QUERY_TIMEOUT,
    CONNECTION_ERROR,
    INVALID_REQUEST,
    CUSTOM_SQL_NOT_ALLOWED,
    DATA_PRODUCT_NOT_FOUND,
    DATA_PRODUCT_RETRIEVAL_ERROR,
    INTERNAL_ERROR
};

[[nodiscard]] inline const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE:                         return "";
        case ErrorCode::SQL_VALIDATION_ERROR:         return "SQL_VALIDATION_ERROR";
        case ErrorCode::SQL_EXECUTION_ERROR:          return "SQL_EXECUTION_ERROR";
        case ErrorCode::QUERY_TIMEOUT:                return "QUERY_TIMEOUT";
        case ErrorCode::CONNECTION_ERROR:             return "CONNECTION_ERROR";
        case ErrorCode::INVALID_REQUEST:              return "INVALID_REQUEST";
        case ErrorCode::CUSTOM_SQL_NOT_ALLOWED:       return "CUSTOM_SQL_NOT_ALLOWED";
        case ErrorCode::DATA_PRODUCT_NOT_FOUND:       return "DATA_PRODUCT_NOT_FOUND";
        case ErrorCode::DATA_PRODUCT_RETRIEVAL_ERROR: return "DATA_PRODUCT_RETRIEVAL_ERROR";
        case ErrorCode::INTERNAL_ERROR:               return "INTERNAL_ERROR";
        default:                                      return "INTERNAL_ERROR";
    }
}

// ============================================================================
// Query Result (canonical tabular shape shared by every adapter)
// ============================================================================

/**
 * @brief Tri-state outcome of a backend call
 */
enum class ResultStatus {
    ROWS,    // success with at least one row
    EMPTY,   // success, columns only
    ERROR
};

/**
 * @brief Canonical query result
 *
 * Invariant on success: row_count == rows.size() and every row has exactly
 * columns.size() cells. Adapters never throw for engine failures; they return
 * success == false with the native message in error_message.
 */
struct QueryResult {
    bool success = false;
    std::string error_message;

    std::vector<std::string> columns;
    std::vector<ColumnTypeInfo> column_types;
    std::vector<Row> rows;
    size_t row_count = 0;

    std::chrono::microseconds elapsed{0};
    bool truncated = false;

    static QueryResult ok(std::vector<std::string> columns, std::vector<Row> rows) {
        QueryResult r;
        r.success = true;
        r.columns = std::move(columns);
        r.rows = std::move(rows);
        r.row_count = r.rows.size();
        return r;
    }

    static QueryResult error(std::string message) {
        QueryResult r;
        r.success = false;
        r.error_message = std::move(message);
        return r;
    }

    [[nodiscard]] ResultStatus status() const {
        if (!success) return ResultStatus::ERROR;
        return rows.empty() ? ResultStatus::EMPTY : ResultStatus::ROWS;
    }

    /** @brief Check the row_count / row-width invariant */
    [[nodiscard]] bool is_well_formed() const {
        if (row_count != rows.size()) return false;
        for (const auto& row : rows) {
            if (row.size() != columns.size()) return false;
        }
        return true;
    }
};

// ============================================================================
// Requests
// ============================================================================

/**
 * @brief A single SQL execution request
 *
 * principal_id / principal_context are pass-through annotation only; they
 * never change what SQL runs.
 */
struct QueryRequest {
    std::string transaction_id;                        // assigned if empty
    std::string request_id;                            // assigned if empty
    std::string sql;
    QueryParameters parameters;
    std::optional<std::string> principal_id;
    std::map<std::string, std::string> principal_context;
    std::optional<std::chrono::milliseconds> timeout;  // default from config
};

/**
 * @brief Request for a governed data product
 *
 * sql is produced upstream by a non-deterministic generator and is treated as
 * untrusted, possibly malformed text.
 */
struct DataProductRequest {
    std::string transaction_id;
    std::string request_id;
    std::string product_id;
    std::string sql;
    std::optional<size_t> limit;
    std::optional<std::string> principal_id;
    std::map<std::string, std::string> principal_context;
    std::optional<std::chrono::milliseconds> timeout;
};

} // namespace dpgw
