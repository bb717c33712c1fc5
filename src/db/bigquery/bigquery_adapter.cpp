#include "db/bigquery/bigquery_adapter.hpp"
#include "db/bigquery/bigquery_rest_client.hpp"
#include "core/utils.hpp"

#include <format>
#include <future>

namespace dpgw {

BigQueryAdapter::BigQueryAdapter(BackendOptions options, std::shared_ptr<IWarehouseClient> client)
    : options_(std::move(options)),
      guard_(ReadOnlySqlGuard::warehouse()),
      client_(client ? std::move(client) : std::make_shared<BigQueryRestClient>()) {}

BigQueryAdapter::~BigQueryAdapter() {
    disconnect();
}

// ============================================================================
// Lifecycle
// ============================================================================

bool BigQueryAdapter::connect(const ConnectionParams& params) {
    if (connected_.load()) {
        return true;
    }
    if (!client_->open(params)) {
        utils::log::error(std::format("BigQuery: connect to {}.{} failed", params.project, params.dataset));
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        project_ = params.project;
        dataset_ = params.dataset;
        location_ = params.location;
    }
    connected_.store(true);
    return true;
}

bool BigQueryAdapter::disconnect() {
    if (!connected_.exchange(false)) {
        return true;
    }
    client_->close();
    utils::log::info("BigQuery: disconnected");
    return true;
}

void BigQueryAdapter::interrupt() {
    if (connected_.load()) {
        client_->cancel_all();
    }
}

// ============================================================================
// Queries
// ============================================================================

ValidationResult BigQueryAdapter::validate_sql(const std::string& sql) const {
    return guard_.validate(sql);
}

QueryResult BigQueryAdapter::convert_reply(const WarehouseReply& reply) {
    if (!reply.success) {
        return QueryResult::error(reply.error_message);
    }

    QueryResult result;
    result.success = true;
    result.truncated = reply.truncated;

    const auto fields = reply.schema["fields"].elements();
    std::vector<GenericColumnType> types;
    types.reserve(fields.size());
    for (const auto& field : fields) {
        const auto type_name = field.string_or("type", "STRING");
        const bool repeated = field.string_or("mode", "") == "REPEATED";
        const auto generic = repeated ? GenericColumnType::JSON : bigquery_type_to_generic(type_name);
        result.columns.push_back(field.string_or("name", ""));
        result.column_types.emplace_back(generic, 0, type_name);
        types.push_back(generic);
    }

    result.rows.reserve(reply.rows.size());
    for (const auto& raw_row : reply.rows) {
        const auto cells = raw_row["f"].elements();
        Row row;
        row.reserve(fields.size());
        for (size_t c = 0; c < fields.size(); ++c) {
            const auto value = c < cells.size() ? cells[c]["v"] : JsonValue();
            if (value.is_null()) {
                row.emplace_back(nullptr);
            } else if (value.is_string()) {
                row.push_back(decode_text_cell(value.get<std::string>(), types[c]));
            } else {
                row.emplace_back(value.dump());
            }
        }
        result.rows.push_back(std::move(row));
    }
    result.row_count = result.rows.size();
    return result;
}

QueryResult BigQueryAdapter::execute_query(
    const std::string& sql,
    const QueryParameters& parameters,
    const std::string& transaction_id,
    std::stop_token cancel) {

    require_connected("execute_query");

    utils::Timer timer;
    WarehouseQuery query{sql, parameters, options_.max_result_rows, transaction_id, std::move(cancel)};

    // The REST round trips block; keep them off the caller's thread
    auto client = client_;
    auto pending = std::async(std::launch::async, [client, query = std::move(query)]() {
        return client->run_query(query);
    });

    WarehouseReply reply;
    try {
        reply = pending.get();
    } catch (const std::exception& e) {
        reply.success = false;
        reply.error_message = std::format("warehouse worker failed: {}", e.what());
    }

    auto result = convert_reply(reply);
    result.elapsed = timer.elapsed_us();
    if (!result.success) {
        utils::log::warn(std::format("[TXN:{}] BigQuery query failed: {}", transaction_id, result.error_message));
    } else {
        utils::log::debug(std::format("[TXN:{}] BigQuery job {} returned {} rows in {}us",
            transaction_id, reply.job_id, result.row_count, result.elapsed.count()));
    }
    return result;
}

// ============================================================================
// Views
// ============================================================================

std::string BigQueryAdapter::views_table() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::format("`{}.{}.INFORMATION_SCHEMA.VIEWS`", project_, dataset_);
}

bool BigQueryAdapter::create_view(const std::string& name, const std::string& /*sql*/, bool /*replace*/) {
    utils::log::warn(std::format(
        "BigQuery: create_view('{}') not supported; curated views are managed in the warehouse", name));
    return false;
}

std::vector<std::string> BigQueryAdapter::list_views() {
    const auto result = execute_query(
        std::format("SELECT table_name FROM {} ORDER BY table_name", views_table()));

    std::vector<std::string> names;
    if (!result.success) {
        utils::log::error(std::format("BigQuery: list_views failed: {}", result.error_message));
        return names;
    }
    for (const auto& row : result.rows) {
        names.push_back(cell_to_string(row[0]));
    }
    return names;
}

bool BigQueryAdapter::check_view_exists(const std::string& name) {
    const auto result = execute_query(
        std::format("SELECT table_name FROM {} WHERE LOWER(table_name) = LOWER(@name)", views_table()),
        {{"name", name}});
    return result.success && result.row_count > 0;
}

bool BigQueryAdapter::register_data_source(const DataSourceInfo& source) {
    utils::log::warn(std::format(
        "BigQuery: register_data_source('{}') not supported; load data into the warehouse directly",
        source.table_name));
    return false;
}

std::map<std::string, bool> BigQueryAdapter::create_fallback_views(const std::vector<std::string>& view_names) {
    utils::log::warn("BigQuery: fallback views not supported; curated views are managed in the warehouse");
    std::map<std::string, bool> results;
    for (const auto& name : view_names) {
        results[name] = false;
    }
    return results;
}

// ============================================================================
// Metadata
// ============================================================================

std::map<std::string, std::string> BigQueryAdapter::get_metadata() {
    std::map<std::string, std::string> meta;
    meta["database_type"] = "bigquery";
    meta["status"] = connected_.load() ? "connected" : "disconnected";
    std::lock_guard<std::mutex> lock(mutex_);
    meta["project"] = project_;
    meta["dataset"] = dataset_;
    meta["location"] = location_;
    return meta;
}

} // namespace dpgw
