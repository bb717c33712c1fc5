#include "db/generic_connection_pool.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <format>

namespace dpgw {

GenericConnectionPool::GenericConnectionPool(
    std::string name,
    PoolConfig config,
    std::shared_ptr<IConnectionFactory> factory)
    : name_(std::move(name)),
      config_(std::move(config)),
      factory_(std::move(factory)),
      semaphore_(static_cast<std::ptrdiff_t>(std::max<size_t>(config_.max_connections, 1))) {

    const size_t warm = std::min(config_.min_connections, config_.max_connections);
    for (size_t i = 0; i < warm; ++i) {
        auto conn = create_connection();
        if (!conn) {
            utils::log::warn(std::format("Pool '{}': failed to open connection {} of {} during warm-up",
                name_, i + 1, warm));
            continue;
        }
        const auto now = std::chrono::steady_clock::now();
        std::lock_guard<std::mutex> lock(mutex_);
        times_[conn.get()] = {now, now};
        idle_connections_.emplace_back(std::move(conn));
    }

    utils::log::info(std::format("Pool '{}' initialized: {} connections (min={}, max={})",
        name_, total_connections_.load(), config_.min_connections, config_.max_connections));
}

GenericConnectionPool::~GenericConnectionPool() {
    drain();
}

std::unique_ptr<IDbConnection> GenericConnectionPool::create_connection() {
    auto conn = factory_->create(config_.connection_string);
    if (conn) {
        total_connections_.fetch_add(1, std::memory_order_relaxed);
    }
    return conn;
}

void GenericConnectionPool::discard_connection(std::unique_ptr<IDbConnection> conn) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        times_.erase(conn.get());
        active_connections_.erase(conn.get());
    }
    conn->close();
    total_connections_.fetch_sub(1, std::memory_order_relaxed);
}

std::unique_ptr<PooledConnection> GenericConnectionPool::acquire(std::chrono::milliseconds timeout) {
    if (shutdown_.load(std::memory_order_acquire)) {
        return nullptr;
    }

    if (!semaphore_.try_acquire_for(timeout)) {
        failed_acquires_.fetch_add(1, std::memory_order_relaxed);
        utils::log::warn(std::format("Pool '{}': acquire timed out after {}ms", name_, timeout.count()));
        return nullptr;
    }

    // drain() may have run while we waited on the semaphore
    if (shutdown_.load(std::memory_order_acquire)) {
        semaphore_.release();
        return nullptr;
    }

    total_acquires_.fetch_add(1, std::memory_order_relaxed);

    std::unique_ptr<IDbConnection> conn;
    ConnectionTimes times{};
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!idle_connections_.empty()) {
            conn = std::move(idle_connections_.front());
            idle_connections_.pop_front();
            times = times_[conn.get()];
        }
    }

    const auto now = std::chrono::steady_clock::now();
    bool replace = false;

    if (conn && config_.max_lifetime.count() > 0 && now - times.created > config_.max_lifetime) {
        connections_recycled_.fetch_add(1, std::memory_order_relaxed);
        replace = true;
    } else if (conn && now - times.last_used > config_.idle_timeout &&
               !conn->is_healthy(config_.health_check_query)) {
        health_check_failures_.fetch_add(1, std::memory_order_relaxed);
        replace = true;
    }

    if (replace) {
        discard_connection(std::move(conn));
    }

    if (!conn) {
        conn = create_connection();
        if (!conn) {
            semaphore_.release();
            failed_acquires_.fetch_add(1, std::memory_order_relaxed);
            return nullptr;
        }
        times = {now, now};
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        times_[conn.get()] = times;
        active_connections_.insert(conn.get());
    }

    return std::make_unique<PooledConnection>(
        std::move(conn),
        [this](std::unique_ptr<IDbConnection> c, bool reusable) {
            return_connection(std::move(c), reusable);
        });
}

void GenericConnectionPool::return_connection(std::unique_ptr<IDbConnection> conn, bool reusable) {
    if (!conn) {
        return;
    }

    if (!reusable || shutdown_.load(std::memory_order_acquire)) {
        discard_connection(std::move(conn));
        semaphore_.release();
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        active_connections_.erase(conn.get());
        times_[conn.get()].last_used = std::chrono::steady_clock::now();
        idle_connections_.emplace_back(std::move(conn));
    }
    semaphore_.release();
}

size_t GenericConnectionPool::cancel_active() {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t cancelled = 0;
    for (auto* conn : active_connections_) {
        if (conn->cancel()) {
            ++cancelled;
        }
    }
    if (cancelled > 0) {
        utils::log::info(std::format("Pool '{}': cancel sent to {} active connection(s)", name_, cancelled));
    }
    return cancelled;
}

PoolStats GenericConnectionPool::get_stats() const {
    std::lock_guard<std::mutex> lock(mutex_);

    PoolStats stats;
    stats.total_connections = total_connections_.load(std::memory_order_relaxed);
    stats.idle_connections = idle_connections_.size();
    stats.active_connections = active_connections_.size();
    stats.total_acquires = total_acquires_.load(std::memory_order_relaxed);
    stats.failed_acquires = failed_acquires_.load(std::memory_order_relaxed);
    stats.health_check_failures = health_check_failures_.load(std::memory_order_relaxed);
    stats.connections_recycled = connections_recycled_.load(std::memory_order_relaxed);
    return stats;
}

void GenericConnectionPool::drain() {
    if (shutdown_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }

    std::deque<std::unique_ptr<IDbConnection>> idle;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        idle.swap(idle_connections_);
        for (const auto& conn : idle) {
            times_.erase(conn.get());
        }
    }

    for (auto& conn : idle) {
        conn->close();
        total_connections_.fetch_sub(1, std::memory_order_relaxed);
    }

    // Checked-out connections are closed by return_connection()
    utils::log::info(std::format("Pool '{}' drained ({} idle connections closed)", name_, idle.size()));
}

} // namespace dpgw
