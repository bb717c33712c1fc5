#include "db/postgresql/pg_adapter.hpp"
#include "db/postgresql/pg_connection.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <type_traits>
#include <variant>

namespace dpgw {

namespace {

std::optional<std::string> cell_to_param(const CellValue& value) {
    return std::visit([](const auto& v) -> std::optional<std::string> {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            return std::nullopt;
        } else if constexpr (std::is_same_v<T, bool>) {
            return std::string(v ? "true" : "false");
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return std::to_string(v);
        } else if constexpr (std::is_same_v<T, double>) {
            return std::format("{}", v);
        } else {
            return v;
        }
    }, value);
}

// conninfo values: single-quoted, backslash and quote escaped
std::string conninfo_value(std::string_view value) {
    std::string out = "'";
    for (const char c : value) {
        if (c == '\'' || c == '\\') out += '\\';
        out += c;
    }
    out += '\'';
    return out;
}

bool is_ident_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool is_ident_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

} // anonymous namespace

PgAdapter::PgAdapter(BackendOptions options, std::shared_ptr<IConnectionFactory> factory)
    : options_(std::move(options)),
      guard_(ReadOnlySqlGuard::relational()),
      factory_(factory ? std::move(factory) : std::make_shared<PgConnectionFactory>()) {}

PgAdapter::~PgAdapter() {
    disconnect();
}

// ============================================================================
// SQL builders
// ============================================================================

std::string PgAdapter::build_conninfo(const ConnectionParams& params) {
    if (!params.dsn.empty()) {
        return params.dsn;
    }

    std::string conninfo = std::format("host={} port={}",
        conninfo_value(params.host), params.port);
    if (!params.database.empty()) conninfo += " dbname=" + conninfo_value(params.database);
    if (!params.user.empty()) conninfo += " user=" + conninfo_value(params.user);
    if (!params.password.empty()) conninfo += " password=" + conninfo_value(params.password);
    if (!params.sslmode.empty()) conninfo += " sslmode=" + conninfo_value(params.sslmode);
    conninfo += " application_name='data_product_gateway'";
    return conninfo;
}

std::string PgAdapter::quote_qualified_name(const std::string& name) {
    std::string out;
    for (const auto& part : utils::split(name, '.')) {
        if (!out.empty()) out += '.';
        out += utils::quote_identifier(part);
    }
    return out;
}

Result<PgStatement> PgAdapter::rewrite_named_parameters(
    const std::string& sql, const QueryParameters& parameters) {

    PgStatement out;
    out.sql.reserve(sql.size());
    std::map<std::string, size_t> positions;

    const size_t n = sql.size();
    size_t i = 0;
    while (i < n) {
        const char c = sql[i];

        // Quoted text and comments pass through untouched
        if (c == '\'' || c == '"') {
            const size_t start = i++;
            while (i < n) {
                if (sql[i] == c) {
                    if (i + 1 < n && sql[i + 1] == c) { i += 2; continue; }
                    ++i;
                    break;
                }
                ++i;
            }
            out.sql.append(sql, start, i - start);
            continue;
        }
        if (c == '-' && i + 1 < n && sql[i + 1] == '-') {
            const auto eol = sql.find('\n', i);
            const size_t end = eol == std::string::npos ? n : eol;
            out.sql.append(sql, i, end - i);
            i = end;
            continue;
        }
        if (c == '/' && i + 1 < n && sql[i + 1] == '*') {
            const auto close = sql.find("*/", i + 2);
            const size_t end = close == std::string::npos ? n : close + 2;
            out.sql.append(sql, i, end - i);
            i = end;
            continue;
        }

        // :: cast
        if (c == ':' && i + 1 < n && sql[i + 1] == ':') {
            out.sql += "::";
            i += 2;
            continue;
        }

        if ((c == ':' || c == '@') && i + 1 < n && is_ident_start(sql[i + 1])) {
            size_t end = i + 1;
            while (end < n && is_ident_char(sql[end])) ++end;
            const std::string name = sql.substr(i + 1, end - i - 1);

            const auto param = parameters.find(name);
            if (param == parameters.end()) {
                return Result<PgStatement>::error(ErrorCategory::VALIDATION_ERROR,
                    std::format("missing value for parameter {}{}", c, name));
            }

            auto [pos, inserted] = positions.try_emplace(name, out.params.size() + 1);
            if (inserted) {
                out.params.push_back(param->second);
            }
            out.sql += std::format("${}", pos->second);
            i = end;
            continue;
        }

        out.sql += c;
        ++i;
    }

    return Result<PgStatement>::ok(std::move(out));
}

Result<PgStatement> PgAdapter::build_upsert(
    const std::string& table,
    const HybridRecord& record,
    const std::vector<std::string>& key_fields) {

    if (key_fields.empty()) {
        return Result<PgStatement>::error(ErrorCategory::VALIDATION_ERROR,
            "upsert requires at least one key field");
    }
    for (const auto& key : key_fields) {
        if (!record.columns.contains(key)) {
            return Result<PgStatement>::error(ErrorCategory::VALIDATION_ERROR,
                std::format("key field '{}' missing from record", key));
        }
    }

    PgStatement stmt;
    std::vector<std::string> names;
    std::vector<std::string> values;
    for (const auto& [column, value] : record.columns) {
        names.push_back(utils::quote_identifier(column));
        stmt.params.push_back(value);
        values.push_back(std::format("${}", stmt.params.size()));
    }
    if (record.payload_json) {
        names.push_back(utils::quote_identifier(record.payload_column));
        stmt.params.emplace_back(*record.payload_json);
        values.push_back(std::format("${}::jsonb", stmt.params.size()));
    }

    std::vector<std::string> conflict;
    for (const auto& key : key_fields) {
        conflict.push_back(utils::quote_identifier(key));
    }

    std::vector<std::string> updates;
    for (const auto& [column, value] : record.columns) {
        if (std::find(key_fields.begin(), key_fields.end(), column) != key_fields.end()) continue;
        const auto quoted = utils::quote_identifier(column);
        updates.push_back(std::format("{} = EXCLUDED.{}", quoted, quoted));
    }
    if (record.payload_json) {
        const auto quoted = utils::quote_identifier(record.payload_column);
        updates.push_back(std::format("{} = EXCLUDED.{}", quoted, quoted));
    }

    stmt.sql = std::format("INSERT INTO {} ({}) VALUES ({}) ON CONFLICT ({}) ",
        quote_qualified_name(table), utils::join(names, ", "), utils::join(values, ", "),
        utils::join(conflict, ", "));
    if (updates.empty()) {
        stmt.sql += "DO NOTHING";
    } else {
        stmt.sql += "DO UPDATE SET " + utils::join(updates, ", ");
    }
    stmt.sql += " RETURNING *";

    return Result<PgStatement>::ok(std::move(stmt));
}

PgStatement PgAdapter::build_select(
    const std::string& table,
    const std::map<std::string, CellValue>& filters,
    std::optional<size_t> limit) {

    PgStatement stmt;
    stmt.sql = "SELECT * FROM " + quote_qualified_name(table);

    std::vector<std::string> predicates;
    for (const auto& [column, value] : filters) {
        if (is_null(value)) {
            predicates.push_back(utils::quote_identifier(column) + " IS NULL");
            continue;
        }
        stmt.params.push_back(value);
        predicates.push_back(std::format("{} = ${}", utils::quote_identifier(column), stmt.params.size()));
    }
    if (!predicates.empty()) {
        stmt.sql += " WHERE " + utils::join(predicates, " AND ");
    }
    if (limit) {
        stmt.sql += std::format(" LIMIT {}", *limit);
    }
    return stmt;
}

PgStatement PgAdapter::build_delete(
    const std::string& table, const std::string& key_field, const CellValue& key_value) {

    const auto key = utils::quote_identifier(key_field);
    return PgStatement{
        std::format("DELETE FROM {} WHERE {} = $1 RETURNING {}", quote_qualified_name(table), key, key),
        {key_value}};
}

// ============================================================================
// Lifecycle
// ============================================================================

bool PgAdapter::connect(const ConnectionParams& params) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pool_) {
        return true;
    }

    PoolConfig config;
    config.connection_string = build_conninfo(params);
    config.min_connections = std::max<size_t>(params.min_pool_size, 1);
    config.max_connections = std::max(params.max_pool_size, config.min_connections);

    auto pool = std::make_shared<GenericConnectionPool>("postgresql", config, factory_);

    std::string version;
    {
        auto conn = pool->acquire(params.pool_acquire_timeout);
        if (!conn || !(*conn)->is_healthy(config.health_check_query)) {
            utils::log::error("PostgreSQL: no healthy connection could be established");
            if (conn) conn->discard();
            conn.reset();
            pool->drain();
            return false;
        }
        version = (*conn)->server_version();
    }

    pool_ = std::move(pool);
    acquire_timeout_ = params.pool_acquire_timeout;
    endpoint_ = params.dsn.empty()
        ? std::format("{}:{}/{}", params.host, params.port, params.database)
        : "dsn";
    server_version_ = version;
    utils::log::info(std::format("PostgreSQL: connected to {} (server {}, pool {}..{})",
        endpoint_, server_version_, config.min_connections, config.max_connections));
    return true;
}

bool PgAdapter::disconnect() {
    std::shared_ptr<GenericConnectionPool> pool;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pool.swap(pool_);
    }
    if (pool) {
        pool->drain();
        utils::log::info(std::format("PostgreSQL: disconnected from {}", endpoint_));
    }
    return true;
}

bool PgAdapter::is_connected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pool_ != nullptr;
}

std::shared_ptr<GenericConnectionPool> PgAdapter::current_pool() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pool_;
}

void PgAdapter::interrupt() {
    if (auto pool = current_pool()) {
        pool->cancel_active();
    }
}

// ============================================================================
// Queries
// ============================================================================

ValidationResult PgAdapter::validate_sql(const std::string& sql) const {
    return guard_.validate(sql);
}

QueryResult PgAdapter::run(const PgStatement& statement,
                           const std::string& transaction_id,
                           std::stop_token cancel) {
    utils::Timer timer;

    // Holding our own reference keeps the pool alive past a concurrent disconnect()
    auto pool = current_pool();
    if (!pool) {
        return QueryResult::error("PostgreSQL adapter not connected");
    }

    auto conn = pool->acquire(acquire_timeout_);
    if (!conn) {
        return QueryResult::error(std::format("failed to acquire connection from pool '{}'", pool->name()));
    }
    IDbConnection* db = conn->get();

    if (cancel.stop_requested()) {
        utils::log::warn(std::format("[TXN:{}] PostgreSQL: query cancelled before it started", transaction_id));
        return QueryResult::error("interrupted: query cancelled before it started");
    }

    if (options_.statement_timeout.count() > 0 &&
        !db->set_query_timeout(static_cast<uint32_t>(options_.statement_timeout.count()))) {
        utils::log::warn(std::format("[TXN:{}] PostgreSQL: could not set statement_timeout", transaction_id));
    }

    // Destroyed before conn goes back to the pool
    std::stop_callback on_cancel(cancel, [db, &transaction_id] {
        utils::log::info(std::format("[TXN:{}] PostgreSQL: cancelling statement", transaction_id));
        db->cancel();
    });

    std::vector<std::optional<std::string>> params;
    params.reserve(statement.params.size());
    for (const auto& p : statement.params) {
        params.push_back(cell_to_param(p));
    }

    utils::log::debug(std::format("[TXN:{}] PostgreSQL executing: {}", transaction_id, statement.sql));
    DbResultSet rs = db->execute_params(statement.sql, params);
    if (!rs.success) {
        if (!db->is_connected()) {
            conn->discard();
        }
        utils::log::warn(std::format("[TXN:{}] PostgreSQL query failed: {}", transaction_id, rs.error_message));
        return QueryResult::error(rs.error_message);
    }

    QueryResult result;
    result.success = true;
    result.columns = std::move(rs.column_names);
    result.column_types = std::move(rs.column_types);

    const size_t keep = std::min(rs.rows.size(), options_.max_result_rows);
    result.truncated = rs.rows.size() > keep;
    result.rows.reserve(keep);
    for (size_t r = 0; r < keep; ++r) {
        Row row;
        row.reserve(result.columns.size());
        for (size_t c = 0; c < rs.rows[r].size(); ++c) {
            const auto& cell = rs.rows[r][c];
            if (!cell) {
                row.emplace_back(nullptr);
            } else {
                row.push_back(decode_text_cell(*cell, result.column_types[c].generic_type));
            }
        }
        result.rows.push_back(std::move(row));
    }
    result.row_count = result.rows.size();
    result.elapsed = timer.elapsed_us();

    utils::log::debug(std::format("[TXN:{}] PostgreSQL returned {} rows in {}us{}",
        transaction_id, result.row_count, result.elapsed.count(), result.truncated ? " (truncated)" : ""));
    return result;
}

QueryResult PgAdapter::execute_query(
    const std::string& sql,
    const QueryParameters& parameters,
    const std::string& transaction_id,
    std::stop_token cancel) {

    require_connected("execute_query");

    auto rewritten = rewrite_named_parameters(sql, parameters);
    if (rewritten.is_error()) {
        return QueryResult::error(rewritten.error_message());
    }
    return run(rewritten.value(), transaction_id, std::move(cancel));
}

QueryResult PgAdapter::run_transaction(const std::vector<std::string>& statements,
                                       const std::string& transaction_id) {
    auto pool = current_pool();
    if (!pool) {
        return QueryResult::error("PostgreSQL adapter not connected");
    }

    auto conn = pool->acquire(acquire_timeout_);
    if (!conn) {
        return QueryResult::error(std::format("failed to acquire connection from pool '{}'", pool->name()));
    }
    IDbConnection* db = conn->get();

    if (options_.statement_timeout.count() > 0 &&
        !db->set_query_timeout(static_cast<uint32_t>(options_.statement_timeout.count()))) {
        utils::log::warn(std::format("[TXN:{}] PostgreSQL: could not set statement_timeout", transaction_id));
    }

    auto roll_back = [&](const std::string& sql, const DbResultSet& rs) {
        utils::log::warn(std::format("[TXN:{}] PostgreSQL: transaction aborted at '{}': {}",
            transaction_id, sql, rs.error_message));
        if (db->is_connected()) {
            const auto rollback = db->execute("ROLLBACK");
            if (!rollback.success) {
                utils::log::warn(std::format("[TXN:{}] PostgreSQL: ROLLBACK failed: {}",
                    transaction_id, rollback.error_message));
                conn->discard();
            }
        } else {
            conn->discard();
        }
        return QueryResult::error(rs.error_message);
    };

    if (const auto begin = db->execute("BEGIN"); !begin.success) {
        return roll_back("BEGIN", begin);
    }
    for (const auto& sql : statements) {
        utils::log::debug(std::format("[TXN:{}] PostgreSQL executing: {}", transaction_id, sql));
        if (const auto rs = db->execute(sql); !rs.success) {
            return roll_back(sql, rs);
        }
    }
    if (const auto commit = db->execute("COMMIT"); !commit.success) {
        return roll_back("COMMIT", commit);
    }

    QueryResult result;
    result.success = true;
    return result;
}

// ============================================================================
// Views
// ============================================================================

bool PgAdapter::create_view(const std::string& name, const std::string& sql, bool replace) {
    require_connected("create_view");

    if (!replace && check_view_exists(name)) {
        utils::log::info(std::format("PostgreSQL: view '{}' exists, replace disabled", name));
        return false;
    }

    // CREATE OR REPLACE VIEW cannot drop, rename or reorder columns
    const auto qualified = quote_qualified_name(name);
    const auto result = run_transaction({
        std::format("DROP VIEW IF EXISTS {}", qualified),
        std::format("CREATE VIEW {} AS {}", qualified, sql)}, "");
    if (!result.success) {
        utils::log::error(std::format("PostgreSQL: failed to create view '{}': {}", name, result.error_message));
        return false;
    }
    utils::log::info(std::format("PostgreSQL: created view '{}'", name));
    return true;
}

std::vector<std::string> PgAdapter::list_views() {
    require_connected("list_views");

    const auto result = run(PgStatement{
        "SELECT table_name FROM information_schema.views "
        "WHERE table_schema = current_schema() ORDER BY table_name", {}}, "");

    std::vector<std::string> names;
    if (!result.success) {
        utils::log::error(std::format("PostgreSQL: list_views failed: {}", result.error_message));
        return names;
    }
    for (const auto& row : result.rows) {
        names.push_back(cell_to_string(row[0]));
    }
    return names;
}

bool PgAdapter::check_view_exists(const std::string& name) {
    require_connected("check_view_exists");

    const auto result = run(PgStatement{
        "SELECT 1 FROM information_schema.views "
        "WHERE table_schema = current_schema() AND lower(table_name) = lower($1)",
        {name}}, "");
    return result.success && result.row_count > 0;
}

bool PgAdapter::register_data_source(const DataSourceInfo& source) {
    utils::log::warn(std::format("PostgreSQL: register_data_source('{}') is not supported; "
                                 "load data with the server's own tooling", source.table_name));
    return false;
}

std::map<std::string, bool> PgAdapter::create_fallback_views(const std::vector<std::string>& view_names) {
    require_connected("create_fallback_views");

    std::map<std::string, bool> results;
    for (const auto& name : view_names) {
        utils::log::info(std::format("PostgreSQL: creating fallback view '{}'", name));
        results[name] = create_view(name, fallback_.view_sql(name), true);
    }
    return results;
}

// ============================================================================
// Record store
// ============================================================================

QueryResult PgAdapter::upsert_record(
    const std::string& table,
    const HybridRecord& record,
    const std::vector<std::string>& key_fields,
    const std::string& transaction_id) {

    require_connected("upsert_record");
    auto stmt = build_upsert(table, record, key_fields);
    if (stmt.is_error()) {
        utils::log::warn(std::format("[TXN:{}] upsert into {} rejected: {}",
            transaction_id, table, stmt.error_message()));
        return QueryResult::error(stmt.error_message());
    }
    return run(stmt.value(), transaction_id);
}

QueryResult PgAdapter::get_record(
    const std::string& table,
    const std::string& key_field,
    const CellValue& key_value,
    const std::string& transaction_id) {

    require_connected("get_record");
    return run(build_select(table, {{key_field, key_value}}, 1), transaction_id);
}

QueryResult PgAdapter::fetch_records(
    const std::string& table,
    const std::map<std::string, CellValue>& filters,
    std::optional<size_t> limit,
    const std::string& transaction_id) {

    require_connected("fetch_records");
    return run(build_select(table, filters, limit), transaction_id);
}

QueryResult PgAdapter::delete_record(
    const std::string& table,
    const std::string& key_field,
    const CellValue& key_value,
    const std::string& transaction_id) {

    require_connected("delete_record");
    return run(build_delete(table, key_field, key_value), transaction_id);
}

// ============================================================================
// Metadata
// ============================================================================

std::map<std::string, std::string> PgAdapter::get_metadata() {
    std::map<std::string, std::string> meta;
    meta["database_type"] = "postgresql";

    auto pool = current_pool();
    if (!pool) {
        meta["status"] = "disconnected";
        return meta;
    }

    const auto stats = pool->get_stats();
    meta["status"] = "connected";
    {
        std::lock_guard<std::mutex> lock(mutex_);
        meta["server_version"] = server_version_;
        meta["endpoint"] = endpoint_;
    }
    meta["pool_total"] = std::to_string(stats.total_connections);
    meta["pool_idle"] = std::to_string(stats.idle_connections);
    meta["pool_active"] = std::to_string(stats.active_connections);
    meta["pool_failed_acquires"] = std::to_string(stats.failed_acquires);
    return meta;
}

} // namespace dpgw
