#pragma once

#include "core/error.hpp"
#include "core/types.hpp"
#include "security/sql_guard.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace dpgw {

/**
 * @brief Everything an adapter may need to open its connection
 *
 * One flat struct for all engines; each adapter reads only its own fields.
 */
struct ConnectionParams {
    // Embedded
    std::string path = ":memory:";
    bool read_only = false;

    // Pooled relational
    std::string dsn;                   // takes precedence over host/port/...
    std::string host = "localhost";
    uint16_t port = 5432;
    std::string user;
    std::string password;
    std::string database;
    std::string sslmode = "prefer";
    size_t min_pool_size = 1;
    size_t max_pool_size = 10;
    std::chrono::milliseconds pool_acquire_timeout{5000};

    // Cloud warehouse
    std::string project;
    std::string dataset;
    std::string location = "US";
    std::string credentials_file;
    std::string access_token;
    std::string api_endpoint = "https://bigquery.googleapis.com";
};

/**
 * @brief Construction-time limits shared by all adapters
 */
struct BackendOptions {
    size_t max_result_rows = 10000;
    std::chrono::milliseconds statement_timeout{30000};
};

/**
 * @brief A file the embedded engine should ingest as a table
 */
struct DataSourceInfo {
    std::string type;                  // "csv"
    std::string path;
    std::string table_name;
    std::optional<char> delimiter;     // auto-detected when absent
};

/**
 * @brief Uniform contract over every storage engine
 *
 * State machine: Disconnected -> Connected -> Disconnected.
 *
 * Engine failures are reported through QueryResult::success / bool returns and
 * never thrown. Calling an operation that needs a connection while
 * disconnected throws UsageError. validate_sql(), get_metadata() and
 * interrupt() are valid in any state.
 *
 * Cancellation is per call: a stop request on the token handed to
 * execute_query() reaches only the statement that call runs, never work
 * issued by other callers.
 */
class IBackendAdapter {
public:
    virtual ~IBackendAdapter() = default;

    /** @brief Engine key ("sqlite", "postgresql", "bigquery") */
    [[nodiscard]] virtual std::string type() const = 0;

    // ========================================================================
    // Lifecycle
    // ========================================================================

    /**
     * @brief Open the backend connection
     * @return false on failure (logged), never throws for recoverable errors
     */
    virtual bool connect(const ConnectionParams& params) = 0;

    /** @brief Release the connection; idempotent */
    virtual bool disconnect() = 0;

    [[nodiscard]] virtual bool is_connected() const = 0;

    // ========================================================================
    // Queries
    // ========================================================================

    /**
     * @brief Execute exactly one statement
     * @param sql Statement text
     * @param parameters Named parameters (:name / @name)
     * @param transaction_id Correlation id for logging
     * @param cancel Stopping it aborts this call only. A call stopped before
     *        it reaches the engine is skipped; one stopped mid-statement is
     *        interrupted. Either way it returns an "interrupted" error.
     */
    [[nodiscard]] virtual QueryResult execute_query(
        const std::string& sql,
        const QueryParameters& parameters = {},
        const std::string& transaction_id = "",
        std::stop_token cancel = {}) = 0;

    /** @brief Engine-local read-only policy; usable before connect() */
    [[nodiscard]] virtual ValidationResult validate_sql(const std::string& sql) const = 0;

    /**
     * @brief Cancel every statement in flight on this adapter
     *
     * Used on shutdown. Called from a thread other than the ones executing;
     * each interrupted call returns an error result.
     */
    virtual void interrupt() {}

    // ========================================================================
    // Views and sources
    // ========================================================================

    /**
     * @brief Idempotent view upsert
     * @param replace When false an existing view is left alone and false returned
     * @return false when unsupported or on failure
     */
    virtual bool create_view(const std::string& name,
                             const std::string& sql,
                             bool replace = true) = 0;

    [[nodiscard]] virtual std::vector<std::string> list_views() = 0;

    /** @brief Case-insensitive existence check */
    [[nodiscard]] virtual bool check_view_exists(const std::string& name) = 0;

    /** @brief Ingest a file-backed source; false for engines that do not ingest */
    virtual bool register_data_source(const DataSourceInfo& source) = 0;

    /** @brief Materialize deterministic placeholder views, one flag per name */
    virtual std::map<std::string, bool> create_fallback_views(
        const std::vector<std::string>& view_names) = 0;

    // ========================================================================
    // Introspection
    // ========================================================================

    [[nodiscard]] virtual std::map<std::string, std::string> get_metadata() = 0;

protected:
    void require_connected(const char* operation) const {
        if (!is_connected()) {
            throw UsageError(type() + " adapter: " + operation + " called while disconnected");
        }
    }
};

} // namespace dpgw
