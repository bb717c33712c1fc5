#pragma once

#include "core/error.hpp"
#include "db/backend_adapter.hpp"
#include "db/fallback_view_generator.hpp"
#include "db/generic_connection_pool.hpp"
#include "db/record_store.hpp"
#include "security/sql_guard.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace dpgw {

/**
 * @brief SQL text with its positional ($n) parameter values
 */
struct PgStatement {
    std::string sql;
    std::vector<CellValue> params;
};

/**
 * @brief Pooled relational adapter over libpq
 *
 * Queries run concurrently up to the pool's max_connections. Named parameters
 * (:name, @name) are rewritten to $n and bound through PQexecParams.
 * Also serves as the IRecordStore for key-addressed upserts.
 */
class PgAdapter : public IBackendAdapter, public IRecordStore {
public:
    /**
     * @param factory Connection factory; PgConnectionFactory when null
     */
    explicit PgAdapter(BackendOptions options = {},
                       std::shared_ptr<IConnectionFactory> factory = nullptr);
    ~PgAdapter() override;

    PgAdapter(const PgAdapter&) = delete;
    PgAdapter& operator=(const PgAdapter&) = delete;

    [[nodiscard]] std::string type() const override { return "postgresql"; }

    bool connect(const ConnectionParams& params) override;
    bool disconnect() override;
    [[nodiscard]] bool is_connected() const override;

    [[nodiscard]] QueryResult execute_query(
        const std::string& sql,
        const QueryParameters& parameters = {},
        const std::string& transaction_id = "",
        std::stop_token cancel = {}) override;

    [[nodiscard]] ValidationResult validate_sql(const std::string& sql) const override;

    void interrupt() override;

    bool create_view(const std::string& name, const std::string& sql, bool replace = true) override;
    [[nodiscard]] std::vector<std::string> list_views() override;
    [[nodiscard]] bool check_view_exists(const std::string& name) override;
    bool register_data_source(const DataSourceInfo& source) override;
    std::map<std::string, bool> create_fallback_views(
        const std::vector<std::string>& view_names) override;

    [[nodiscard]] std::map<std::string, std::string> get_metadata() override;

    // ---- IRecordStore ----

    QueryResult upsert_record(
        const std::string& table,
        const HybridRecord& record,
        const std::vector<std::string>& key_fields,
        const std::string& transaction_id = "") override;

    [[nodiscard]] QueryResult get_record(
        const std::string& table,
        const std::string& key_field,
        const CellValue& key_value,
        const std::string& transaction_id = "") override;

    [[nodiscard]] QueryResult fetch_records(
        const std::string& table,
        const std::map<std::string, CellValue>& filters,
        std::optional<size_t> limit = std::nullopt,
        const std::string& transaction_id = "") override;

    QueryResult delete_record(
        const std::string& table,
        const std::string& key_field,
        const CellValue& key_value,
        const std::string& transaction_id = "") override;

    // ---- SQL builders (pure, no connection needed) ----

    /** @brief libpq conninfo from dsn or host/port/user/password/database/sslmode */
    [[nodiscard]] static std::string build_conninfo(const ConnectionParams& params);

    /**
     * @brief Rewrite :name / @name to $n, skipping literals, quoted identifiers,
     *        comments and :: casts
     * @return error when the SQL references a name missing from parameters
     */
    [[nodiscard]] static Result<PgStatement> rewrite_named_parameters(
        const std::string& sql, const QueryParameters& parameters);

    [[nodiscard]] static Result<PgStatement> build_upsert(
        const std::string& table,
        const HybridRecord& record,
        const std::vector<std::string>& key_fields);

    [[nodiscard]] static PgStatement build_select(
        const std::string& table,
        const std::map<std::string, CellValue>& filters,
        std::optional<size_t> limit);

    [[nodiscard]] static PgStatement build_delete(
        const std::string& table, const std::string& key_field, const CellValue& key_value);

    /** @brief Quote "schema.table" part by part */
    [[nodiscard]] static std::string quote_qualified_name(const std::string& name);

private:
    [[nodiscard]] std::shared_ptr<GenericConnectionPool> current_pool() const;
    /**
     * @brief Run one statement on a leased connection
     *
     * A stop request on cancel sends PQcancel to that connection only.
     */
    [[nodiscard]] QueryResult run(const PgStatement& statement,
                                  const std::string& transaction_id,
                                  std::stop_token cancel = {});

    /** @brief BEGIN, each statement, COMMIT on one connection; ROLLBACK on the first failure */
    [[nodiscard]] QueryResult run_transaction(const std::vector<std::string>& statements,
                                              const std::string& transaction_id);

    BackendOptions options_;
    ReadOnlySqlGuard guard_;
    FallbackViewGenerator fallback_;
    std::shared_ptr<IConnectionFactory> factory_;

    mutable std::mutex mutex_;
    std::shared_ptr<GenericConnectionPool> pool_;
    std::chrono::milliseconds acquire_timeout_{5000};
    std::string endpoint_;
    std::string server_version_;
};

} // namespace dpgw
