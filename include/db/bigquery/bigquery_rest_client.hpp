#pragma once

#include "db/bigquery/access_token_provider.hpp"
#include "db/bigquery/warehouse_client.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>

namespace dpgw {

/**
 * @brief BigQuery v2 REST client (jobs.insert + getQueryResults polling)
 *
 * Every query becomes a job with a client-chosen id, so an interrupt can
 * cancel it with jobs.cancel even while another thread is polling it.
 */
class BigQueryRestClient : public IWarehouseClient {
public:
    struct Config {
        std::chrono::milliseconds http_timeout{30000};
        std::chrono::milliseconds poll_wait{10000};     // server-side wait per poll
        size_t page_size = 10000;
    };

    BigQueryRestClient();
    explicit BigQueryRestClient(Config config);
    ~BigQueryRestClient() override;

    bool open(const ConnectionParams& params) override;
    [[nodiscard]] WarehouseReply run_query(const WarehouseQuery& query) override;
    void cancel_all() override;
    void close() override;

    /**
     * @brief jobs.insert request body
     * @param job_id Client-generated job id
     */
    [[nodiscard]] static std::string build_job_request(
        const WarehouseQuery& query,
        const std::string& project,
        const std::string& dataset,
        const std::string& location,
        const std::string& job_id);

    /** @brief One NAMED query parameter as BigQuery JSON */
    [[nodiscard]] static std::string parameter_json(const std::string& name, const CellValue& value);

    /** @brief First message of a job "errors"/"errorResult"; empty when none */
    [[nodiscard]] static std::string extract_error(const JsonValue& doc);

private:
    struct Binding {
        std::string project;
        std::string dataset;
        std::string location;
        std::string endpoint;
    };

    struct HttpReply {
        bool ok = false;
        int status = 0;
        std::string body;
        std::string error;
    };

    [[nodiscard]] HttpReply post(const std::string& path, const std::string& body);
    [[nodiscard]] HttpReply get(const std::string& path);
    [[nodiscard]] std::optional<Binding> binding() const;
    [[nodiscard]] bool is_cancelled(const std::string& job_id) const;
    void finish_job(const std::string& job_id);
    void cancel_job(const std::string& job_id);
    void post_cancel(const Binding& bind, const std::string& job_id);

    Config config_;

    mutable std::mutex mutex_;
    std::optional<Binding> binding_;
    std::shared_ptr<AccessTokenProvider> tokens_;
    std::set<std::string> running_jobs_;
    std::set<std::string> cancelled_jobs_;
};

} // namespace dpgw
