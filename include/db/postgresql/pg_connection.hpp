#pragma once

#include "db/iconnection_factory.hpp"
#include "db/idb_connection.hpp"

#include <libpq-fe.h>

#include <optional>
#include <string>
#include <vector>

namespace dpgw {

/**
 * @brief libpq connection implementing IDbConnection
 *
 * Owns the PGconn* and a PGcancel* obtained at construction, so cancel() can
 * be issued from another thread while a statement runs.
 */
class PgConnection : public IDbConnection {
public:
    /** @brief Takes ownership of conn */
    explicit PgConnection(PGconn* conn);
    ~PgConnection() override;

    PgConnection(const PgConnection&) = delete;
    PgConnection& operator=(const PgConnection&) = delete;

    DbResultSet execute(const std::string& sql) override;
    DbResultSet execute_params(
        const std::string& sql,
        const std::vector<std::optional<std::string>>& params) override;
    bool is_healthy(const std::string& health_check_query) override;
    bool is_connected() const override;
    bool set_query_timeout(uint32_t timeout_ms) override;
    bool cancel() override;
    std::string server_version() const override;
    void close() override;

private:
    DbResultSet consume_result(PGresult* res);

    PGconn* conn_;
    PGcancel* cancel_;
};

/**
 * @brief Opens PgConnection instances with PQconnectdb
 */
class PgConnectionFactory : public IConnectionFactory {
public:
    std::unique_ptr<IDbConnection> create(const std::string& connection_string) override;
};

} // namespace dpgw
