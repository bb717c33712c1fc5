#pragma once

#include "core/cell_value.hpp"
#include "core/json.hpp"
#include "db/backend_adapter.hpp"

#include <stop_token>
#include <string>
#include <vector>

namespace dpgw {

/**
 * @brief One query submitted to the warehouse
 */
struct WarehouseQuery {
    std::string sql;
    QueryParameters parameters;
    size_t max_rows = 10000;
    std::string transaction_id;
    std::stop_token cancel;            // stops this query's job only
};

/**
 * @brief Raw warehouse answer, still in the service's JSON shape
 *
 * schema is the "schema" object ({"fields":[{"name","type"}...]}); rows holds
 * the "rows" entries ({"f":[{"v":...}]}) accumulated across result pages.
 */
struct WarehouseReply {
    bool success = false;
    std::string error_message;
    JsonValue schema;
    std::vector<JsonValue> rows;
    bool truncated = false;
    std::string job_id;
};

/**
 * @brief Blocking client for a cloud warehouse
 *
 * The adapter owns exactly one client. run_query() may be called from several
 * threads at once. A stop request on WarehouseQuery::cancel cancels that
 * query's job; cancel_all() stops every job currently in flight.
 */
class IWarehouseClient {
public:
    virtual ~IWarehouseClient() = default;

    /**
     * @brief Bind to project/dataset and obtain credentials
     * @return false when credentials cannot be obtained (logged)
     */
    virtual bool open(const ConnectionParams& params) = 0;

    [[nodiscard]] virtual WarehouseReply run_query(const WarehouseQuery& query) = 0;

    virtual void cancel_all() = 0;

    virtual void close() = 0;
};

} // namespace dpgw
