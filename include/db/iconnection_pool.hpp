#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace dpgw {

class PooledConnection;

struct PoolConfig {
    std::string connection_string;
    size_t min_connections = 1;
    size_t max_connections = 10;
    std::chrono::milliseconds idle_timeout{300000};
    std::string health_check_query{"SELECT 1"};
    std::chrono::seconds max_lifetime{3600};  // 0 = disabled
};

struct PoolStats {
    size_t total_connections = 0;
    size_t idle_connections = 0;
    size_t active_connections = 0;
    size_t total_acquires = 0;
    size_t failed_acquires = 0;
    size_t health_check_failures = 0;
    size_t connections_recycled = 0;
};

class IConnectionPool {
public:
    virtual ~IConnectionPool() = default;

    /**
     * @brief Acquire a connection (blocking up to timeout)
     * @return RAII handle, nullptr on timeout or connect failure
     */
    [[nodiscard]] virtual std::unique_ptr<PooledConnection> acquire(
        std::chrono::milliseconds timeout = std::chrono::milliseconds{5000}) = 0;

    [[nodiscard]] virtual PoolStats get_stats() const = 0;

    /** @brief Cancel the running statement on every checked-out connection */
    virtual size_t cancel_active() = 0;

    /** @brief Close idle connections and refuse further acquires */
    virtual void drain() = 0;

    [[nodiscard]] virtual const std::string& name() const = 0;
};

} // namespace dpgw
