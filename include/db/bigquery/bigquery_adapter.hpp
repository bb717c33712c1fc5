#pragma once

#include "db/backend_adapter.hpp"
#include "db/bigquery/warehouse_client.hpp"
#include "security/sql_guard.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <string>

namespace dpgw {

/**
 * @brief Cloud warehouse adapter (BigQuery)
 *
 * Stateless REST behind IWarehouseClient; each query runs on its own worker
 * (std::async) and the reply is converted to the canonical shape. Curated
 * views are managed in the warehouse itself, so view creation, file ingestion
 * and fallback views are reported as unsupported.
 */
class BigQueryAdapter : public IBackendAdapter {
public:
    /**
     * @param client Warehouse client; BigQueryRestClient when null
     */
    explicit BigQueryAdapter(BackendOptions options = {},
                             std::shared_ptr<IWarehouseClient> client = nullptr);
    ~BigQueryAdapter() override;

    [[nodiscard]] std::string type() const override { return "bigquery"; }

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
     * @brief Convert schema.fields / rows[].f[].v into the canonical shape
     *
     * INT64 -> int64, FLOAT64/NUMERIC -> double, BOOL -> bool, JSON null ->
     * null, nested RECORD/REPEATED values -> compact JSON text, anything else
     * stays text.
     */
    [[nodiscard]] static QueryResult convert_reply(const WarehouseReply& reply);

private:
    [[nodiscard]] std::string views_table() const;

    BackendOptions options_;
    ReadOnlySqlGuard guard_;
    std::shared_ptr<IWarehouseClient> client_;

    mutable std::mutex mutex_;
    std::string project_;
    std::string dataset_;
    std::string location_;
    std::atomic<bool> connected_{false};
};

} // namespace dpgw
