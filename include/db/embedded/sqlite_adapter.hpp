#pragma once

#include "db/backend_adapter.hpp"
#include "db/fallback_view_generator.hpp"
#include "security/sql_guard.hpp"

#include <atomic>
#include <mutex>
#include <string>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

namespace dpgw {

/**
 * @brief Embedded single-connection adapter over SQLite 3
 *
 * One sqlite3 handle guarded by one mutex: every call serializes. CSV files
 * registered as data sources are ingested into real tables, and declared
 * views are created on top of them.
 *
 * interrupt() takes a separate lock so it can reach the handle while a query
 * holds the main mutex; it stops every statement and is used on shutdown.
 * A stop request on execute_query()'s token is checked by a progress handler
 * that is installed only while that call owns the handle, and a call
 * cancelled while still queued is dropped when it gets the lock.
 */
class SqliteAdapter : public IBackendAdapter {
public:
    explicit SqliteAdapter(BackendOptions options = {});
    ~SqliteAdapter() override;

    SqliteAdapter(const SqliteAdapter&) = delete;
    SqliteAdapter& operator=(const SqliteAdapter&) = delete;

    [[nodiscard]] std::string type() const override { return "sqlite"; }

    bool connect(const ConnectionParams& params) override;
    bool disconnect() override;
    [[nodiscard]] bool is_connected() const override { return connected_.load(); }

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

    /**
     * @brief Pick the delimiter from the first line of a file
     * @return the most frequent of ',', ';', '\t', '|' (',' when none appear)
     */
    [[nodiscard]] static char detect_delimiter(const std::string& first_line);

private:
    // All *_locked helpers expect mutex_ to be held
    [[nodiscard]] QueryResult execute_locked(const std::string& sql, const QueryParameters& parameters);
    bool exec_locked(const std::string& sql, std::string& error);
    [[nodiscard]] std::vector<std::string> view_variants_locked(const std::string& name);
    bool create_view_locked(const std::string& name, const std::string& sql, bool replace);
    bool ingest_csv_locked(const DataSourceInfo& source);
    [[nodiscard]] int64_t count_objects_locked(const char* object_type);

    bool bind_parameters(sqlite3_stmt* stmt, const QueryParameters& parameters, std::string& error);

    BackendOptions options_;
    ReadOnlySqlGuard guard_;
    FallbackViewGenerator fallback_;

    std::mutex mutex_;
    std::mutex interrupt_mutex_;
    sqlite3* db_ = nullptr;
    std::string path_;
    std::atomic<bool> connected_{false};
};

} // namespace dpgw
