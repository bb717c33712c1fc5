#pragma once

#include "core/column_type.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace dpgw {

/**
 * @brief Result set from one statement on a pooled connection
 *
 * Owns the data (copied out of the native result handle). Cells stay textual
 * here; the adapter decodes them with the column type map.
 */
struct DbResultSet {
    bool success = false;
    std::string error_message;

    std::vector<std::string> column_names;
    std::vector<ColumnTypeInfo> column_types;
    std::vector<std::vector<std::optional<std::string>>> rows;   // nullopt = SQL NULL

    uint64_t affected_rows = 0;
    bool has_rows = false;
};

/**
 * @brief Abstract database connection
 *
 * Wraps a single native connection handle. Not thread-safe except for
 * cancel(), which may be called from any thread while execute() runs.
 */
class IDbConnection {
public:
    virtual ~IDbConnection() = default;

    [[nodiscard]] virtual DbResultSet execute(const std::string& sql) = 0;

    /**
     * @brief Execute with positional text parameters ($1, $2, ...)
     * @param params nullopt binds SQL NULL
     */
    [[nodiscard]] virtual DbResultSet execute_params(
        const std::string& sql,
        const std::vector<std::optional<std::string>>& params) = 0;

    [[nodiscard]] virtual bool is_healthy(const std::string& health_check_query) = 0;

    [[nodiscard]] virtual bool is_connected() const = 0;

    /**
     * @brief Set the server-side statement timeout for subsequent queries
     * @param timeout_ms 0 disables the timeout
     */
    virtual bool set_query_timeout(uint32_t timeout_ms) = 0;

    /** @brief Ask the server to cancel the statement currently running */
    virtual bool cancel() = 0;

    /** @brief Server version string, empty when unknown */
    [[nodiscard]] virtual std::string server_version() const = 0;

    virtual void close() = 0;
};

} // namespace dpgw
