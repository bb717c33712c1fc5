#pragma once

#include "config/config_types.hpp"
#include "core/error.hpp"
#include "core/types.hpp"
#include "gateway/response_envelope.hpp"

#include <memory>
#include <string>

// Forward-declare httplib types (avoids pulling in massive header-only library)
namespace httplib {
struct Request;
struct Response;
class Server;
}

namespace dpgw {

class QueryGateway;

/**
 * @brief HTTP front end for a QueryGateway
 *
 *   POST /api/v1/query                 {sql, transaction_id?, principal_id?, timeout_ms?,
 *                                       parameters?, principal_context?}
 *   POST /api/v1/data-products/<id>    {sql, limit?, transaction_id?, principal_id?,
 *                                       timeout_ms?, principal_context?}
 *   GET  /health
 *   POST /admin/reload                 Authorization: Bearer <admin_token>
 *
 * Every reply body is a ResponseEnvelope (health/reload use small status
 * objects). Malformed bodies produce INVALID_REQUEST envelopes.
 */
class GatewayHttpServer {
public:
    GatewayHttpServer(std::shared_ptr<QueryGateway> gateway, ServerConfig config);
    ~GatewayHttpServer();

    GatewayHttpServer(const GatewayHttpServer&) = delete;
    GatewayHttpServer& operator=(const GatewayHttpServer&) = delete;

    /** @brief Bind and serve; blocks until stop() */
    void start();
    void stop();

    /** @brief Parse a /api/v1/query body */
    [[nodiscard]] static Result<QueryRequest> parse_query_request(const std::string& body);

    /** @brief Parse a /api/v1/data-products/<id> body */
    [[nodiscard]] static Result<DataProductRequest> parse_data_product_request(
        const std::string& product_id, const std::string& body);

    /** @brief HTTP status code for an envelope */
    [[nodiscard]] static int http_status_for(const ResponseEnvelope& envelope);

private:
    void register_routes(httplib::Server& svr);

    void handle_query(const httplib::Request& req, httplib::Response& res);
    void handle_data_product(const httplib::Request& req, httplib::Response& res);
    void handle_health(const httplib::Request& req, httplib::Response& res);
    void handle_reload(const httplib::Request& req, httplib::Response& res);

    static void send_envelope(const ResponseEnvelope& envelope, httplib::Response& res);

    std::shared_ptr<QueryGateway> gateway_;
    const ServerConfig config_;
    std::unique_ptr<httplib::Server> server_;
};

} // namespace dpgw
