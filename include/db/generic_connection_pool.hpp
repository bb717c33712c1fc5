#pragma once

#include "db/iconnection_factory.hpp"
#include "db/iconnection_pool.hpp"
#include "db/pooled_connection.hpp"

#include <atomic>
#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <semaphore>
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace dpgw {

/**
 * @brief Database-agnostic bounded connection pool
 *
 * - max_connections enforced with a counting_semaphore
 * - min_connections opened up front, the rest lazily
 * - connections idle longer than idle_timeout are health-checked on acquire
 * - connections older than max_lifetime are replaced on acquire
 * - checked-out connections are tracked so cancel_active() can reach them
 *
 * The pool must outlive every PooledConnection it hands out.
 */
class GenericConnectionPool : public IConnectionPool {
public:
    GenericConnectionPool(
        std::string name,
        PoolConfig config,
        std::shared_ptr<IConnectionFactory> factory);

    ~GenericConnectionPool() override;

    GenericConnectionPool(const GenericConnectionPool&) = delete;
    GenericConnectionPool& operator=(const GenericConnectionPool&) = delete;

    [[nodiscard]] std::unique_ptr<PooledConnection> acquire(
        std::chrono::milliseconds timeout = std::chrono::milliseconds{5000}) override;

    [[nodiscard]] PoolStats get_stats() const override;

    size_t cancel_active() override;

    void drain() override;

    [[nodiscard]] const std::string& name() const override { return name_; }

private:
    struct ConnectionTimes {
        std::chrono::steady_clock::time_point created;
        std::chrono::steady_clock::time_point last_used;
    };

    [[nodiscard]] std::unique_ptr<IDbConnection> create_connection();
    void discard_connection(std::unique_ptr<IDbConnection> conn);
    void return_connection(std::unique_ptr<IDbConnection> conn, bool reusable);

    std::string name_;
    PoolConfig config_;
    std::shared_ptr<IConnectionFactory> factory_;

    mutable std::mutex mutex_;
    std::deque<std::unique_ptr<IDbConnection>> idle_connections_;
    std::unordered_set<IDbConnection*> active_connections_;
    std::unordered_map<IDbConnection*, ConnectionTimes> times_;

    std::counting_semaphore<> semaphore_;

    std::atomic<size_t> total_connections_{0};
    std::atomic<size_t> total_acquires_{0};
    std::atomic<size_t> failed_acquires_{0};
    std::atomic<size_t> health_check_failures_{0};
    std::atomic<size_t> connections_recycled_{0};

    std::atomic<bool> shutdown_{false};
};

} // namespace dpgw
