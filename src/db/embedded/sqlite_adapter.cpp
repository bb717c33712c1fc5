#include "db/embedded/sqlite_adapter.hpp"
#include "core/utils.hpp"

#include <rapidcsv.h>
#include <sqlite3.h>

#include <algorithm>
#include <array>
#include <format>
#include <fstream>
#include <memory>
#include <type_traits>
#include <variant>

namespace dpgw {

namespace {

struct StmtDeleter {
    void operator()(sqlite3_stmt* stmt) const { sqlite3_finalize(stmt); }
};
using StmtPtr = std::unique_ptr<sqlite3_stmt, StmtDeleter>;

// SQLite affinity rules (datatype3.html, section 3.1)
GenericColumnType decltype_to_generic(const char* decl) {
    if (decl == nullptr) return GenericColumnType::UNKNOWN;
    const std::string upper = utils::to_upper(decl);
    if (upper.find("INT") != std::string::npos) return GenericColumnType::BIGINT;
    if (upper.find("CHAR") != std::string::npos ||
        upper.find("CLOB") != std::string::npos ||
        upper.find("TEXT") != std::string::npos) return GenericColumnType::TEXT;
    if (upper.find("BLOB") != std::string::npos) return GenericColumnType::BLOB;
    if (upper.find("REAL") != std::string::npos ||
        upper.find("FLOA") != std::string::npos ||
        upper.find("DOUB") != std::string::npos) return GenericColumnType::DOUBLE_PRECISION;
    if (upper.find("BOOL") != std::string::npos) return GenericColumnType::BOOLEAN;
    if (upper == "DATE") return GenericColumnType::DATE;
    if (upper.find("TIMESTAMP") != std::string::npos ||
        upper == "DATETIME") return GenericColumnType::TIMESTAMP;
    return GenericColumnType::NUMERIC;
}

CellValue read_cell(sqlite3_stmt* stmt, int col) {
    switch (sqlite3_column_type(stmt, col)) {
        case SQLITE_INTEGER:
            return static_cast<int64_t>(sqlite3_column_int64(stmt, col));
        case SQLITE_FLOAT:
            return sqlite3_column_double(stmt, col);
        case SQLITE_TEXT: {
            const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
            return std::string(text, static_cast<size_t>(sqlite3_column_bytes(stmt, col)));
        }
        case SQLITE_BLOB: {
            const auto* blob = static_cast<const char*>(sqlite3_column_blob(stmt, col));
            const auto size = static_cast<size_t>(sqlite3_column_bytes(stmt, col));
            return blob ? std::string(blob, size) : std::string();
        }
        default:
            return nullptr;
    }
}

int bind_cell(sqlite3_stmt* stmt, int idx, const CellValue& value) {
    return std::visit([stmt, idx](const auto& v) -> int {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            return sqlite3_bind_null(stmt, idx);
        } else if constexpr (std::is_same_v<T, bool>) {
            return sqlite3_bind_int(stmt, idx, v ? 1 : 0);
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return sqlite3_bind_int64(stmt, idx, static_cast<sqlite3_int64>(v));
        } else if constexpr (std::is_same_v<T, double>) {
            return sqlite3_bind_double(stmt, idx, v);
        } else {
            return sqlite3_bind_text(stmt, idx, v.c_str(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
        }
    }, value);
}

enum class CsvAffinity { INTEGER, REAL, TEXT };

CsvAffinity infer_affinity(const std::vector<std::string>& values) {
    bool all_int = true;
    bool all_real = true;
    bool any_value = false;
    for (const auto& v : values) {
        if (v.empty()) continue;
        any_value = true;
        if (all_int && !utils::try_parse_int<int64_t>(v)) all_int = false;
        if (all_real && !utils::try_parse_double(v)) all_real = false;
        if (!all_int && !all_real) break;
    }
    if (!any_value) return CsvAffinity::TEXT;
    if (all_int) return CsvAffinity::INTEGER;
    if (all_real) return CsvAffinity::REAL;
    return CsvAffinity::TEXT;
}

const char* affinity_to_sql(CsvAffinity affinity) {
    switch (affinity) {
        case CsvAffinity::INTEGER: return "INTEGER";
        case CsvAffinity::REAL:    return "REAL";
        default:                   return "TEXT";
    }
}

// ============================================================================
// Per-call cancellation
// ============================================================================

constexpr int kCancelCheckInstructions = 1000;

int stop_requested_handler(void* token) {
    return static_cast<const std::stop_token*>(token)->stop_requested() ? 1 : 0;
}

/**
 * @brief Aborts the running statement once the call's stop token fires
 *
 * A non-zero progress handler return fails the step with SQLITE_INTERRUPT.
 */
class CancelProgressHandler {
public:
    CancelProgressHandler(sqlite3* db, const std::stop_token& token)
        : db_(token.stop_possible() ? db : nullptr) {
        if (db_ != nullptr) {
            sqlite3_progress_handler(db_, kCancelCheckInstructions, &stop_requested_handler,
                                     const_cast<std::stop_token*>(&token));
        }
    }

    ~CancelProgressHandler() {
        if (db_ != nullptr) {
            sqlite3_progress_handler(db_, 0, nullptr, nullptr);
        }
    }

    CancelProgressHandler(const CancelProgressHandler&) = delete;
    CancelProgressHandler& operator=(const CancelProgressHandler&) = delete;

private:
    sqlite3* db_;
};

} // anonymous namespace

SqliteAdapter::SqliteAdapter(BackendOptions options)
    : options_(std::move(options)),
      guard_(ReadOnlySqlGuard::embedded()) {}

SqliteAdapter::~SqliteAdapter() {
    disconnect();
}

// ============================================================================
// Lifecycle
// ============================================================================

bool SqliteAdapter::connect(const ConnectionParams& params) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (connected_.load()) {
        return true;
    }

    const int flags = params.read_only
        ? SQLITE_OPEN_READONLY
        : (SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);

    sqlite3* handle = nullptr;
    const int rc = sqlite3_open_v2(params.path.c_str(), &handle, flags | SQLITE_OPEN_FULLMUTEX, nullptr);
    if (rc != SQLITE_OK) {
        const std::string error = handle ? sqlite3_errmsg(handle) : sqlite3_errstr(rc);
        sqlite3_close(handle);
        utils::log::error(std::format("SQLite: failed to open '{}': {}", params.path, error));
        return false;
    }

    {
        std::lock_guard<std::mutex> ilock(interrupt_mutex_);
        db_ = handle;
    }
    path_ = params.path;
    connected_.store(true);
    utils::log::info(std::format("SQLite: connected to '{}' (sqlite {}){}",
        path_, sqlite3_libversion(), params.read_only ? " read-only" : ""));
    return true;
}

bool SqliteAdapter::disconnect() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!connected_.load()) {
        return true;
    }

    sqlite3* handle = nullptr;
    {
        std::lock_guard<std::mutex> ilock(interrupt_mutex_);
        handle = db_;
        db_ = nullptr;
    }
    connected_.store(false);

    const int rc = sqlite3_close_v2(handle);
    if (rc != SQLITE_OK) {
        utils::log::warn(std::format("SQLite: close returned {}", sqlite3_errstr(rc)));
    }
    utils::log::info(std::format("SQLite: disconnected from '{}'", path_));
    return true;
}

void SqliteAdapter::interrupt() {
    std::lock_guard<std::mutex> ilock(interrupt_mutex_);
    if (db_ != nullptr) {
        sqlite3_interrupt(db_);
    }
}

// ============================================================================
// Queries
// ============================================================================

ValidationResult SqliteAdapter::validate_sql(const std::string& sql) const {
    return guard_.validate(sql);
}

QueryResult SqliteAdapter::execute_query(
    const std::string& sql,
    const QueryParameters& parameters,
    const std::string& transaction_id,
    std::stop_token cancel) {

    std::lock_guard<std::mutex> lock(mutex_);
    require_connected("execute_query");

    if (cancel.stop_requested()) {
        utils::log::warn(std::format("[TXN:{}] SQLite: query cancelled while queued, not started", transaction_id));
        return QueryResult::error("interrupted: query cancelled before it started");
    }

    utils::log::debug(std::format("[TXN:{}] SQLite executing: {}", transaction_id, sql));
    QueryResult result;
    {
        // Installed under mutex_, so it only ever sees this call's statement
        CancelProgressHandler on_cancel(db_, cancel);
        result = execute_locked(sql, parameters);
    }
    if (!result.success) {
        utils::log::warn(std::format("[TXN:{}] SQLite query failed: {}", transaction_id, result.error_message));
    } else {
        utils::log::debug(std::format("[TXN:{}] SQLite returned {} rows in {}us{}",
            transaction_id, result.row_count, result.elapsed.count(),
            result.truncated ? " (truncated)" : ""));
    }
    return result;
}

bool SqliteAdapter::bind_parameters(sqlite3_stmt* stmt,
                                    const QueryParameters& parameters,
                                    std::string& error) {
    static constexpr std::array<char, 3> kPrefixes = {':', '@', '$'};

    for (const auto& [name, value] : parameters) {
        int idx = 0;
        if (!name.empty() && std::find(kPrefixes.begin(), kPrefixes.end(), name.front()) != kPrefixes.end()) {
            idx = sqlite3_bind_parameter_index(stmt, name.c_str());
        } else {
            for (const char prefix : kPrefixes) {
                idx = sqlite3_bind_parameter_index(stmt, (prefix + name).c_str());
                if (idx > 0) break;
            }
        }
        if (idx == 0) {
            utils::log::debug(std::format("SQLite: parameter '{}' not referenced by statement", name));
            continue;
        }
        if (bind_cell(stmt, idx, value) != SQLITE_OK) {
            error = std::format("failed to bind parameter '{}': {}", name, sqlite3_errmsg(db_));
            return false;
        }
    }
    return true;
}

QueryResult SqliteAdapter::execute_locked(const std::string& sql, const QueryParameters& parameters) {
    utils::Timer timer;

    sqlite3_stmt* raw = nullptr;
    const char* tail = nullptr;
    const int prc = sqlite3_prepare_v2(db_, sql.c_str(), static_cast<int>(sql.size()), &raw, &tail);
    StmtPtr stmt(raw);
    if (prc != SQLITE_OK) {
        return QueryResult::error(sqlite3_errmsg(db_));
    }
    if (!stmt) {
        return QueryResult::error("empty SQL statement");
    }
    if (tail != nullptr &&
        !utils::trim(ReadOnlySqlGuard::mask_comments_and_literals(tail)).empty()) {
        return QueryResult::error("multiple statements are not supported");
    }

    std::string bind_error;
    if (!bind_parameters(stmt.get(), parameters, bind_error)) {
        return QueryResult::error(bind_error);
    }

    QueryResult result;
    const int ncols = sqlite3_column_count(stmt.get());
    result.columns.reserve(static_cast<size_t>(ncols));
    result.column_types.reserve(static_cast<size_t>(ncols));
    for (int c = 0; c < ncols; ++c) {
        const char* name = sqlite3_column_name(stmt.get(), c);
        const char* decl = sqlite3_column_decltype(stmt.get(), c);
        result.columns.emplace_back(name ? name : "");
        result.column_types.emplace_back(decltype_to_generic(decl), 0, decl ? decl : "");
    }

    while (true) {
        const int rc = sqlite3_step(stmt.get());
        if (rc == SQLITE_DONE) break;
        if (rc != SQLITE_ROW) {
            return QueryResult::error(sqlite3_errmsg(db_));
        }
        if (result.rows.size() >= options_.max_result_rows) {
            result.truncated = true;
            break;
        }
        Row row;
        row.reserve(static_cast<size_t>(ncols));
        for (int c = 0; c < ncols; ++c) {
            row.push_back(read_cell(stmt.get(), c));
        }
        result.rows.push_back(std::move(row));
    }

    result.success = true;
    result.row_count = result.rows.size();
    result.elapsed = timer.elapsed_us();
    return result;
}

bool SqliteAdapter::exec_locked(const std::string& sql, std::string& error) {
    char* errmsg = nullptr;
    const int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errmsg);
    if (rc != SQLITE_OK) {
        error = errmsg ? errmsg : sqlite3_errstr(rc);
        sqlite3_free(errmsg);
        return false;
    }
    return true;
}

// ============================================================================
// Views
// ============================================================================

std::vector<std::string> SqliteAdapter::view_variants_locked(const std::string& name) {
    auto result = execute_locked(
        "SELECT name FROM sqlite_master WHERE type = 'view' AND lower(name) = lower(:name)",
        {{"name", name}});

    std::vector<std::string> names;
    if (!result.success) {
        utils::log::warn(std::format("SQLite: view lookup for '{}' failed: {}", name, result.error_message));
        return names;
    }
    for (const auto& row : result.rows) {
        names.push_back(cell_to_string(row[0]));
    }
    return names;
}

bool SqliteAdapter::create_view_locked(const std::string& name, const std::string& sql, bool replace) {
    const auto variants = view_variants_locked(name);
    if (!replace && !variants.empty()) {
        utils::log::info(std::format("SQLite: view '{}' exists, replace disabled", name));
        return false;
    }

    std::string error;
    if (!exec_locked("BEGIN", error)) {
        utils::log::error(std::format("SQLite: cannot begin view transaction: {}", error));
        return false;
    }

    bool ok = true;
    for (const auto& existing : variants) {
        if (!exec_locked("DROP VIEW IF EXISTS " + utils::quote_identifier(existing), error)) {
            ok = false;
            break;
        }
    }
    if (ok) {
        ok = exec_locked(std::format("CREATE VIEW {} AS {}", utils::quote_identifier(name), sql), error);
    }

    if (!ok) {
        std::string rollback_error;
        if (!exec_locked("ROLLBACK", rollback_error)) {
            utils::log::error(std::format("SQLite: rollback failed: {}", rollback_error));
        }
        utils::log::error(std::format("SQLite: failed to create view '{}': {}", name, error));
        return false;
    }

    if (!exec_locked("COMMIT", error)) {
        utils::log::error(std::format("SQLite: commit of view '{}' failed: {}", name, error));
        return false;
    }
    utils::log::info(std::format("SQLite: created view '{}'", name));
    return true;
}

bool SqliteAdapter::create_view(const std::string& name, const std::string& sql, bool replace) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_connected("create_view");
    return create_view_locked(name, sql, replace);
}

std::vector<std::string> SqliteAdapter::list_views() {
    std::lock_guard<std::mutex> lock(mutex_);
    require_connected("list_views");

    auto result = execute_locked(
        "SELECT name FROM sqlite_master WHERE type = 'view' ORDER BY name", {});
    std::vector<std::string> names;
    if (!result.success) {
        utils::log::error(std::format("SQLite: list_views failed: {}", result.error_message));
        return names;
    }
    names.reserve(result.rows.size());
    for (const auto& row : result.rows) {
        names.push_back(cell_to_string(row[0]));
    }
    return names;
}

bool SqliteAdapter::check_view_exists(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_connected("check_view_exists");
    return !view_variants_locked(name).empty();
}

std::map<std::string, bool> SqliteAdapter::create_fallback_views(
    const std::vector<std::string>& view_names) {

    std::lock_guard<std::mutex> lock(mutex_);
    require_connected("create_fallback_views");

    std::map<std::string, bool> results;
    for (const auto& name : view_names) {
        if (!FallbackViewGenerator::has_template(name)) {
            utils::log::warn(std::format("SQLite: no fallback template for '{}', using generic shape", name));
        } else {
            utils::log::info(std::format("SQLite: creating fallback view '{}'", name));
        }
        results[name] = create_view_locked(name, fallback_.view_sql(name), true);
    }
    return results;
}

// ============================================================================
// Data sources (CSV ingestion)
// ============================================================================

char SqliteAdapter::detect_delimiter(const std::string& first_line) {
    static constexpr std::array<char, 4> kCandidates = {',', ';', '\t', '|'};

    char best = ',';
    long best_count = 0;
    for (const char candidate : kCandidates) {
        const long count = std::count(first_line.begin(), first_line.end(), candidate);
        if (count > best_count) {
            best = candidate;
            best_count = count;
        }
    }
    return best;
}

bool SqliteAdapter::register_data_source(const DataSourceInfo& source) {
    std::lock_guard<std::mutex> lock(mutex_);
    require_connected("register_data_source");

    if (utils::to_lower(source.type) != "csv") {
        utils::log::warn(std::format("SQLite: unsupported data source type '{}' for '{}'",
                                     source.type, source.table_name));
        return false;
    }
    if (source.table_name.empty()) {
        utils::log::error(std::format("SQLite: data source '{}' has no table name", source.path));
        return false;
    }
    return ingest_csv_locked(source);
}

bool SqliteAdapter::ingest_csv_locked(const DataSourceInfo& source) {
    char delimiter = ',';
    if (source.delimiter) {
        delimiter = *source.delimiter;
    } else {
        std::ifstream in(source.path);
        std::string first_line;
        if (!in || !std::getline(in, first_line)) {
            utils::log::error(std::format("SQLite: cannot read CSV '{}'", source.path));
            return false;
        }
        delimiter = detect_delimiter(first_line);
    }

    std::vector<std::string> columns;
    std::vector<std::vector<std::string>> cells;   // column-major
    size_t row_count = 0;
    try {
        rapidcsv::Document doc(source.path,
                               rapidcsv::LabelParams(0, -1),
                               rapidcsv::SeparatorParams(delimiter, true));
        columns = doc.GetColumnNames();
        row_count = doc.GetRowCount();
        cells.reserve(columns.size());
        for (size_t c = 0; c < columns.size(); ++c) {
            cells.push_back(doc.GetColumn<std::string>(c));
        }
    } catch (const std::exception& e) {
        utils::log::error(std::format("SQLite: failed to parse CSV '{}': {}", source.path, e.what()));
        return false;
    }

    if (columns.empty()) {
        utils::log::error(std::format("SQLite: CSV '{}' has no header", source.path));
        return false;
    }

    std::vector<CsvAffinity> affinities;
    affinities.reserve(columns.size());
    std::string column_defs;
    std::string placeholders;
    for (size_t c = 0; c < columns.size(); ++c) {
        affinities.push_back(infer_affinity(cells[c]));
        if (c > 0) {
            column_defs += ", ";
            placeholders += ", ";
        }
        column_defs += std::format("{} {}", utils::quote_identifier(utils::trim(columns[c])),
                                   affinity_to_sql(affinities.back()));
        placeholders += '?';
    }

    const std::string table = utils::quote_identifier(source.table_name);
    std::string error;
    if (!exec_locked("BEGIN", error)) {
        utils::log::error(std::format("SQLite: cannot begin ingestion of '{}': {}", source.path, error));
        return false;
    }

    auto fail = [&](const std::string& message) {
        std::string rollback_error;
        if (!exec_locked("ROLLBACK", rollback_error)) {
            utils::log::error(std::format("SQLite: rollback failed: {}", rollback_error));
        }
        utils::log::error(std::format("SQLite: ingestion of '{}' into {} failed: {}",
                                      source.path, table, message));
        return false;
    };

    if (!exec_locked("DROP TABLE IF EXISTS " + table, error) ||
        !exec_locked(std::format("CREATE TABLE {} ({})", table, column_defs), error)) {
        return fail(error);
    }

    sqlite3_stmt* raw = nullptr;
    const std::string insert_sql = std::format("INSERT INTO {} VALUES ({})", table, placeholders);
    if (sqlite3_prepare_v2(db_, insert_sql.c_str(), -1, &raw, nullptr) != SQLITE_OK) {
        StmtPtr guard(raw);
        return fail(sqlite3_errmsg(db_));
    }
    StmtPtr insert(raw);

    for (size_t r = 0; r < row_count; ++r) {
        for (size_t c = 0; c < columns.size(); ++c) {
            const std::string& text = r < cells[c].size() ? cells[c][r] : std::string();
            CellValue value = nullptr;
            if (!text.empty()) {
                switch (affinities[c]) {
                    case CsvAffinity::INTEGER:
                        value = *utils::try_parse_int<int64_t>(text);
                        break;
                    case CsvAffinity::REAL:
                        value = *utils::try_parse_double(text);
                        break;
                    case CsvAffinity::TEXT:
                        value = text;
                        break;
                }
            }
            if (bind_cell(insert.get(), static_cast<int>(c + 1), value) != SQLITE_OK) {
                return fail(sqlite3_errmsg(db_));
            }
        }
        if (sqlite3_step(insert.get()) != SQLITE_DONE) {
            return fail(sqlite3_errmsg(db_));
        }
        sqlite3_reset(insert.get());
        sqlite3_clear_bindings(insert.get());
    }
    insert.reset();

    if (!exec_locked("COMMIT", error)) {
        return fail(error);
    }
    utils::log::info(std::format("SQLite: ingested {} rows from '{}' into {} (delimiter '{}')",
        row_count, source.path, table, delimiter == '\t' ? std::string("\\t") : std::string(1, delimiter)));
    return true;
}

// ============================================================================
// Metadata
// ============================================================================

int64_t SqliteAdapter::count_objects_locked(const char* object_type) {
    auto result = execute_locked(
        "SELECT count(*) FROM sqlite_master WHERE type = :type", {{"type", std::string(object_type)}});
    if (!result.success || result.rows.empty()) return 0;
    const auto* count = std::get_if<int64_t>(&result.rows[0][0]);
    return count ? *count : 0;
}

std::map<std::string, std::string> SqliteAdapter::get_metadata() {
    std::lock_guard<std::mutex> lock(mutex_);

    std::map<std::string, std::string> meta;
    meta["database_type"] = "sqlite";
    meta["version"] = sqlite3_libversion();
    meta["path"] = path_;
    meta["max_result_rows"] = std::to_string(options_.max_result_rows);

    if (!connected_.load()) {
        meta["status"] = "disconnected";
        return meta;
    }
    meta["status"] = "connected";
    meta["table_count"] = std::to_string(count_objects_locked("table"));
    meta["view_count"] = std::to_string(count_objects_locked("view"));
    return meta;
}

} // namespace dpgw
