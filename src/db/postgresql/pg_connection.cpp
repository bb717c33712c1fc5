#include "db/postgresql/pg_connection.hpp"
#include "core/utils.hpp"

#include <array>
#include <cstring>
#include <format>
#include <memory>

namespace dpgw {

namespace {

struct ResultDeleter {
    void operator()(PGresult* res) const { PQclear(res); }
};
using ResultPtr = std::unique_ptr<PGresult, ResultDeleter>;

std::string trimmed_error(PGconn* conn) {
    return utils::trim(PQerrorMessage(conn));
}

} // anonymous namespace

// ============================================================================
// PgConnection
// ============================================================================

PgConnection::PgConnection(PGconn* conn)
    : conn_(conn),
      cancel_(conn ? PQgetCancel(conn) : nullptr) {}

PgConnection::~PgConnection() {
    close();
}

DbResultSet PgConnection::execute(const std::string& sql) {
    if (!conn_) {
        DbResultSet r;
        r.error_message = "connection is closed";
        return r;
    }
    return consume_result(PQexec(conn_, sql.c_str()));
}

DbResultSet PgConnection::execute_params(
    const std::string& sql,
    const std::vector<std::optional<std::string>>& params) {

    if (!conn_) {
        DbResultSet r;
        r.error_message = "connection is closed";
        return r;
    }

    std::vector<const char*> values;
    values.reserve(params.size());
    for (const auto& p : params) {
        values.push_back(p ? p->c_str() : nullptr);
    }

    // Null paramTypes lets the server infer each type; all values are text
    return consume_result(PQexecParams(
        conn_, sql.c_str(), static_cast<int>(values.size()),
        nullptr, values.data(), nullptr, nullptr, 0));
}

DbResultSet PgConnection::consume_result(PGresult* raw) {
    ResultPtr res(raw);
    DbResultSet result;

    if (!res) {
        result.error_message = trimmed_error(conn_);
        return result;
    }

    const ExecStatusType status = PQresultStatus(res.get());

    if (status == PGRES_COMMAND_OK) {
        result.success = true;
        const char* affected = PQcmdTuples(res.get());
        if (affected && std::strlen(affected) > 0) {
            result.affected_rows = utils::try_parse_int<uint64_t>(affected).value_or(0);
        }
        return result;
    }

    if (status != PGRES_TUPLES_OK) {
        const char* msg = PQresultErrorMessage(res.get());
        result.error_message = utils::trim(msg && *msg ? msg : PQerrorMessage(conn_));
        return result;
    }

    result.success = true;
    result.has_rows = true;

    const int ncols = PQnfields(res.get());
    result.column_names.reserve(static_cast<size_t>(ncols));
    result.column_types.reserve(static_cast<size_t>(ncols));
    for (int c = 0; c < ncols; ++c) {
        result.column_names.emplace_back(PQfname(res.get(), c));
        const auto oid = static_cast<uint32_t>(PQftype(res.get(), c));
        const auto generic = pg_oid_to_generic(oid);
        result.column_types.emplace_back(generic, oid, generic_column_type_to_string(generic));
    }

    const int nrows = PQntuples(res.get());
    result.rows.reserve(static_cast<size_t>(nrows));
    for (int r = 0; r < nrows; ++r) {
        std::vector<std::optional<std::string>> row;
        row.reserve(static_cast<size_t>(ncols));
        for (int c = 0; c < ncols; ++c) {
            if (PQgetisnull(res.get(), r, c)) {
                row.emplace_back(std::nullopt);
            } else {
                row.emplace_back(std::string(PQgetvalue(res.get(), r, c),
                                             static_cast<size_t>(PQgetlength(res.get(), r, c))));
            }
        }
        result.rows.push_back(std::move(row));
    }

    return result;
}

bool PgConnection::is_healthy(const std::string& health_check_query) {
    if (!is_connected()) {
        return false;
    }
    ResultPtr res(PQexec(conn_, health_check_query.c_str()));
    if (!res) {
        return false;
    }
    const ExecStatusType status = PQresultStatus(res.get());
    return status == PGRES_TUPLES_OK || status == PGRES_COMMAND_OK;
}

bool PgConnection::is_connected() const {
    return conn_ != nullptr && PQstatus(conn_) == CONNECTION_OK;
}

bool PgConnection::set_query_timeout(uint32_t timeout_ms) {
    if (!conn_) {
        return false;
    }
    ResultPtr res(PQexec(conn_, std::format("SET statement_timeout = {}", timeout_ms).c_str()));
    return res && PQresultStatus(res.get()) == PGRES_COMMAND_OK;
}

bool PgConnection::cancel() {
    if (!cancel_) {
        return false;
    }
    std::array<char, 256> errbuf{};
    if (PQcancel(cancel_, errbuf.data(), static_cast<int>(errbuf.size())) == 0) {
        utils::log::warn(std::format("PostgreSQL: cancel request failed: {}", errbuf.data()));
        return false;
    }
    return true;
}

std::string PgConnection::server_version() const {
    if (!conn_) {
        return {};
    }
    const char* version = PQparameterStatus(conn_, "server_version");
    return version ? version : "";
}

void PgConnection::close() {
    if (cancel_) {
        PQfreeCancel(cancel_);
        cancel_ = nullptr;
    }
    if (conn_) {
        PQfinish(conn_);
        conn_ = nullptr;
    }
}

// ============================================================================
// PgConnectionFactory
// ============================================================================

std::unique_ptr<IDbConnection> PgConnectionFactory::create(const std::string& connection_string) {
    PGconn* conn = PQconnectdb(connection_string.c_str());
    if (!conn) {
        utils::log::error("PostgreSQL: failed to allocate PGconn");
        return nullptr;
    }

    if (PQstatus(conn) != CONNECTION_OK) {
        utils::log::error(std::format("PostgreSQL: connection failed: {}", trimmed_error(conn)));
        PQfinish(conn);
        return nullptr;
    }

    return std::make_unique<PgConnection>(conn);
}

} // namespace dpgw
