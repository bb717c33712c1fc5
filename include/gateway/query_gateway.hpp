#pragma once

#include "bootstrap/view_bootstrapper.hpp"
#include "config/config_types.hpp"
#include "core/types.hpp"
#include "db/backend_factory.hpp"
#include "gateway/principal_provider.hpp"
#include "gateway/response_envelope.hpp"

#include <chrono>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>

namespace dpgw {

enum class GatewayState {
    UNINITIALIZED,
    INITIALIZING,
    READY,
    CLOSED
};

[[nodiscard]] const char* gateway_state_to_string(GatewayState state);

/**
 * @brief Single entry point for SQL execution and data product retrieval
 *
 * Lifecycle: UNINITIALIZED -> INITIALIZING -> READY -> CLOSED, and
 * reload() takes READY or CLOSED back through INITIALIZING.
 *
 * Every request gets a transaction id, goes through the read-only guard
 * before the backend sees it, and runs under a hard wall-clock bound. On
 * expiry that request's stop token is triggered, which cancels its statement
 * and nothing else, and the caller gets QUERY_TIMEOUT immediately. The worker
 * thread holds its own reference to the adapter and may finish in the
 * background; close() interrupts whatever is still running.
 *
 * Thread-safety: execute()/get_data_product() take a shared lock;
 * initialize()/reload()/close() take it exclusively, so a reload waits for
 * in-flight requests and blocks new ones until it is done.
 *
 * The only exception that escapes execute()/get_data_product() is
 * UsageError, thrown when called outside READY.
 */
class QueryGateway {
public:
    /**
     * @param config Parsed configuration
     * @param factory Used by initialize() to build the adapter for [backend] type
     */
    QueryGateway(GatewayConfig config, BackendFactory factory);

    /**
     * @brief Use a pre-built (not yet connected) adapter
     * @param bootstrapper Replaces the config-driven definition chain when set
     */
    QueryGateway(GatewayConfig config,
                 std::shared_ptr<IBackendAdapter> adapter,
                 std::unique_ptr<ViewBootstrapper> bootstrapper = nullptr);

    ~QueryGateway();

    QueryGateway(const QueryGateway&) = delete;
    QueryGateway& operator=(const QueryGateway&) = delete;

    /**
     * @brief Create + connect the backend, then bootstrap views
     * @return false when the backend type is unknown or cannot connect
     */
    bool initialize();

    [[nodiscard]] ResponseEnvelope execute(QueryRequest request);

    [[nodiscard]] std::future<ResponseEnvelope> execute_async(QueryRequest request);

    [[nodiscard]] ResponseEnvelope get_data_product(DataProductRequest request);

    /**
     * @brief Re-resolve definitions and re-materialize views
     *
     * Reconnects first when the gateway was closed.
     */
    bool reload();

    /** @brief Disconnect the backend; idempotent */
    void close();

    [[nodiscard]] GatewayState state() const;
    [[nodiscard]] DefinitionSet definitions() const;
    [[nodiscard]] BootstrapReport last_bootstrap() const;
    [[nodiscard]] std::map<std::string, std::string> backend_metadata() const;
    [[nodiscard]] const GatewayConfig& config() const { return config_; }

private:
    struct Invocation {
        std::string sql;
        QueryParameters parameters;
        std::string transaction_id;
        std::string request_id;
        std::chrono::milliseconds timeout;
        std::optional<std::string> principal_id;
        std::map<std::string, std::string> principal_context;
        const DataProductDefinition* product = nullptr;
    };

    void require_ready(const char* operation) const;

    // Callers hold mutex_ (shared)
    ResponseEnvelope run_locked(const Invocation& call);
    bool ensure_connected(const std::string& transaction_id);
    void annotate(ResponseEnvelope& envelope, const Invocation& call) const;

    // Callers hold mutex_ (exclusive)
    void bootstrap_locked(const std::string& transaction_id);

    /**
     * @brief Run on a detached worker; nullopt when the deadline passed
     */
    static std::optional<QueryResult> execute_with_deadline(
        std::shared_ptr<IBackendAdapter> adapter,
        const Invocation& call);

    GatewayConfig config_;
    BackendFactory factory_;
    std::unique_ptr<ViewBootstrapper> bootstrapper_;
    std::unique_ptr<IPrincipalProvider> principals_;

    mutable std::shared_mutex mutex_;
    GatewayState state_ = GatewayState::UNINITIALIZED;
    std::shared_ptr<IBackendAdapter> adapter_;
    DefinitionSet definitions_;
    BootstrapReport last_report_;

    std::mutex reconnect_mutex_;
};

} // namespace dpgw
