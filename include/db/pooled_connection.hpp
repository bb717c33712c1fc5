#pragma once

#include "db/idb_connection.hpp"

#include <functional>
#include <memory>

namespace dpgw {

/**
 * @brief RAII handle that returns its connection to the pool on destruction
 *
 * A handle marked with discard() is closed by the pool instead of being
 * reused (e.g. after the server dropped the session). Move-only.
 */
class PooledConnection {
public:
    using ReturnFunc = std::function<void(std::unique_ptr<IDbConnection>, bool reusable)>;

    PooledConnection(std::unique_ptr<IDbConnection> conn, ReturnFunc return_fn);
    ~PooledConnection();

    PooledConnection(PooledConnection&& other) noexcept;
    PooledConnection& operator=(PooledConnection&& other) noexcept;

    PooledConnection(const PooledConnection&) = delete;
    PooledConnection& operator=(const PooledConnection&) = delete;

    IDbConnection* get() const { return conn_.get(); }
    IDbConnection* operator->() const { return conn_.get(); }

    bool is_valid() const { return conn_ != nullptr && conn_->is_connected(); }

    /** @brief Do not put this connection back into the idle set */
    void discard() { reusable_ = false; }

private:
    void give_back();

    std::unique_ptr<IDbConnection> conn_;
    ReturnFunc return_fn_;
    bool reusable_ = true;
};

} // namespace dpgw
