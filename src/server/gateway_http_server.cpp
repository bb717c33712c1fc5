#include "server/gateway_http_server.hpp"
#include "server/http_constants.hpp"
#include "gateway/query_gateway.hpp"
#include "core/json.hpp"
#include "core/utils.hpp"

#include <httplib.h>
#include <openssl/crypto.h>

#include <format>

namespace dpgw {

namespace {

bool constant_time_equals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) {
        volatile unsigned char dummy = 0;
        for (size_t i = 0; i < b.size(); ++i) dummy |= b[i];
        (void)dummy;
        return false;
    }
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

bool require_admin(std::string_view admin_token,
                   const httplib::Request& req, httplib::Response& res) {
    if (admin_token.empty()) {
        res.status = httplib::StatusCode::Forbidden_403;
        res.set_content(R"({"success":false,"error":"admin endpoints are disabled"})", http::kJsonContentType);
        return false;
    }
    const auto auth = req.get_header_value(http::kAuthorizationHeader);
    if (auth.size() <= http::kBearerPrefix.size() ||
        std::string_view(auth).substr(0, http::kBearerPrefix.size()) != http::kBearerPrefix ||
        !constant_time_equals(std::string_view(auth).substr(http::kBearerPrefix.size()), admin_token)) {
        res.status = httplib::StatusCode::Unauthorized_401;
        res.set_content(R"({"success":false,"error":"Unauthorized"})", http::kJsonContentType);
        return false;
    }
    return true;
}

std::optional<CellValue> json_to_cell(const JsonValue& node) {
    if (node.is_null()) return CellValue{nullptr};
    if (node.is_boolean()) return CellValue{node.get<bool>()};
    if (node.is_integer()) return CellValue{node.get<int64_t>()};
    if (node.is_number()) return CellValue{node.get<double>()};
    if (node.is_string()) return CellValue{node.get<std::string>()};
    return std::nullopt;
}

struct CommonFields {
    std::string transaction_id;
    std::optional<std::string> principal_id;
    std::map<std::string, std::string> principal_context;
    std::optional<std::chrono::milliseconds> timeout;
};

// Fields shared by both request kinds; error text when malformed
std::optional<std::string> read_common(const JsonValue& doc, CommonFields& out) {
    out.transaction_id = doc.string_or("transaction_id", "");
    out.principal_id = doc.optional_string("principal_id");

    if (doc.contains("timeout_ms")) {
        const auto node = doc["timeout_ms"];
        if (!node.is_integer() || node.get<int64_t>() <= 0) {
            return "timeout_ms must be a positive integer";
        }
        out.timeout = std::chrono::milliseconds(node.get<int64_t>());
    }

    const auto context = doc["principal_context"];
    if (!context.is_null()) {
        if (!context.is_object()) return "principal_context must be an object";
        for (const auto& [key, value] : context.items()) {
            if (value.is_string()) {
                out.principal_context[key] = value.get<std::string>();
            } else {
                out.principal_context[key] = value.dump();
            }
        }
    }
    return std::nullopt;
}

} // anonymous namespace

GatewayHttpServer::GatewayHttpServer(std::shared_ptr<QueryGateway> gateway, ServerConfig config)
    : gateway_(std::move(gateway)), config_(std::move(config)) {}

GatewayHttpServer::~GatewayHttpServer() {
    stop();
}

// ============================================================================
// Request parsing
// ============================================================================

Result<QueryRequest> GatewayHttpServer::parse_query_request(const std::string& body) {
    JsonValue doc;
    try {
        doc = JsonValue::parse(body);
    } catch (const JsonValue::parse_error& e) {
        return Result<QueryRequest>::error(ErrorCategory::VALIDATION_ERROR, e.what());
    }
    if (!doc.is_object()) {
        return Result<QueryRequest>::error(ErrorCategory::VALIDATION_ERROR, "request body must be a JSON object");
    }

    QueryRequest request;
    const auto sql = doc.optional_string("sql");
    if (!sql) {
        return Result<QueryRequest>::error(ErrorCategory::VALIDATION_ERROR, "missing required string field: sql");
    }
    request.sql = *sql;

    CommonFields common;
    if (auto err = read_common(doc, common)) {
        return Result<QueryRequest>::error(ErrorCategory::VALIDATION_ERROR, *err);
    }
    request.transaction_id = std::move(common.transaction_id);
    request.principal_id = std::move(common.principal_id);
    request.principal_context = std::move(common.principal_context);
    request.timeout = common.timeout;

    const auto params = doc["parameters"];
    if (!params.is_null()) {
        if (!params.is_object()) {
            return Result<QueryRequest>::error(ErrorCategory::VALIDATION_ERROR, "parameters must be an object");
        }
        for (const auto& [name, value] : params.items()) {
            auto cell = json_to_cell(value);
            if (!cell) {
                return Result<QueryRequest>::error(ErrorCategory::VALIDATION_ERROR,
                    std::format("parameter '{}' must be a scalar", name));
            }
            request.parameters[name] = std::move(*cell);
        }
    }
    return Result<QueryRequest>::ok(std::move(request));
}

Result<DataProductRequest> GatewayHttpServer::parse_data_product_request(
    const std::string& product_id, const std::string& body) {

    JsonValue doc;
    try {
        doc = JsonValue::parse(body.empty() ? "{}" : body);
    } catch (const JsonValue::parse_error& e) {
        return Result<DataProductRequest>::error(ErrorCategory::VALIDATION_ERROR, e.what());
    }
    if (!doc.is_object()) {
        return Result<DataProductRequest>::error(ErrorCategory::VALIDATION_ERROR,
            "request body must be a JSON object");
    }

    DataProductRequest request;
    request.product_id = product_id;
    request.sql = doc.string_or("sql", "");

    if (doc.contains("limit")) {
        const auto limit = doc["limit"];
        if (!limit.is_integer() || limit.get<int64_t>() <= 0) {
            return Result<DataProductRequest>::error(ErrorCategory::VALIDATION_ERROR,
                "limit must be a positive integer");
        }
        request.limit = static_cast<size_t>(limit.get<int64_t>());
    }

    CommonFields common;
    if (auto err = read_common(doc, common)) {
        return Result<DataProductRequest>::error(ErrorCategory::VALIDATION_ERROR, *err);
    }
    request.transaction_id = std::move(common.transaction_id);
    request.principal_id = std::move(common.principal_id);
    request.principal_context = std::move(common.principal_context);
    request.timeout = common.timeout;
    return Result<DataProductRequest>::ok(std::move(request));
}

int GatewayHttpServer::http_status_for(const ResponseEnvelope& envelope) {
    switch (envelope.error_code) {
        case ErrorCode::NONE:                    return httplib::StatusCode::OK_200;
        case ErrorCode::INVALID_REQUEST:
        case ErrorCode::SQL_VALIDATION_ERROR:    return httplib::StatusCode::BadRequest_400;
        case ErrorCode::CUSTOM_SQL_NOT_ALLOWED:  return httplib::StatusCode::Forbidden_403;
        case ErrorCode::DATA_PRODUCT_NOT_FOUND:  return httplib::StatusCode::NotFound_404;
        case ErrorCode::SQL_EXECUTION_ERROR:     return httplib::StatusCode::UnprocessableContent_422;
        case ErrorCode::CONNECTION_ERROR:        return httplib::StatusCode::ServiceUnavailable_503;
        case ErrorCode::QUERY_TIMEOUT:           return httplib::StatusCode::GatewayTimeout_504;
        default:                                 return httplib::StatusCode::InternalServerError_500;
    }
}

// ============================================================================
// Handlers
// ============================================================================

void GatewayHttpServer::send_envelope(const ResponseEnvelope& envelope, httplib::Response& res) {
    res.status = http_status_for(envelope);
    res.set_content(envelope.to_json(), http::kJsonContentType);
}

void GatewayHttpServer::handle_query(const httplib::Request& req, httplib::Response& res) {
    auto parsed = parse_query_request(req.body);
    if (parsed.is_error()) {
        send_envelope(ResponseEnvelope::failure(ErrorCode::INVALID_REQUEST, parsed.error_message(),
            utils::generate_uuid(), utils::generate_uuid()), res);
        return;
    }

    const auto transaction_id = parsed.value().transaction_id;
    try {
        send_envelope(gateway_->execute(std::move(parsed.value())), res);
    } catch (const UsageError& e) {
        send_envelope(ResponseEnvelope::failure(ErrorCode::CONNECTION_ERROR, e.what(),
            transaction_id, ""), res);
    }
}

void GatewayHttpServer::handle_data_product(const httplib::Request& req, httplib::Response& res) {
    const std::string product_id = req.matches.size() > 1 ? std::string(req.matches[1]) : "";
    auto parsed = parse_data_product_request(product_id, req.body);
    if (parsed.is_error()) {
        auto envelope = ResponseEnvelope::failure(ErrorCode::INVALID_REQUEST, parsed.error_message(),
            utils::generate_uuid(), utils::generate_uuid());
        envelope.product_id = product_id;
        send_envelope(envelope, res);
        return;
    }

    const auto transaction_id = parsed.value().transaction_id;
    try {
        send_envelope(gateway_->get_data_product(std::move(parsed.value())), res);
    } catch (const UsageError& e) {
        auto envelope = ResponseEnvelope::failure(ErrorCode::CONNECTION_ERROR, e.what(), transaction_id, "");
        envelope.product_id = product_id;
        send_envelope(envelope, res);
    }
}

void GatewayHttpServer::handle_health(const httplib::Request& /*req*/, httplib::Response& res) {
    const auto state = gateway_->state();
    const auto meta = gateway_->backend_metadata();
    const auto backend_status = meta.contains("status") ? meta.at("status") : "unknown";

    const bool healthy = state == GatewayState::READY && backend_status == "connected";
    res.status = healthy ? httplib::StatusCode::OK_200 : httplib::StatusCode::ServiceUnavailable_503;

    std::string body = std::format(R"({{"status":"{}","state":"{}","backend":{{)",
        healthy ? "healthy" : "unhealthy", gateway_state_to_string(state));
    bool first = true;
    for (const auto& [key, value] : meta) {
        if (!first) body += ',';
        body += std::format(R"("{}":"{}")", utils::escape_json(key), utils::escape_json(value));
        first = false;
    }
    body += "}}";
    res.set_content(body, http::kJsonContentType);
}

void GatewayHttpServer::handle_reload(const httplib::Request& req, httplib::Response& res) {
    if (!require_admin(config_.admin_token, req, res)) {
        return;
    }

    const bool ok = gateway_->reload();
    const auto report = gateway_->last_bootstrap();
    res.status = ok ? httplib::StatusCode::OK_200 : httplib::StatusCode::InternalServerError_500;
    res.set_content(std::format(
        R"({{"success":{},"origin":"{}","views_created":{},"views_failed":{},"fallback_views":{}}})",
        utils::booltostr(ok), utils::escape_json(report.origin), report.views_created.size(),
        report.failed_views.size(), report.fallback_results.size()), http::kJsonContentType);
}

// ============================================================================
// start(): creates server, registers routes, listens
// ============================================================================

void GatewayHttpServer::register_routes(httplib::Server& svr) {
    svr.Post(http::kQueryRoute, [this](const httplib::Request& req, httplib::Response& res) {
        handle_query(req, res);
    });
    svr.Post(http::kDataProductRoute, [this](const httplib::Request& req, httplib::Response& res) {
        handle_data_product(req, res);
    });
    svr.Get(http::kHealthRoute, [this](const httplib::Request& req, httplib::Response& res) {
        handle_health(req, res);
    });
    svr.Post(http::kReloadRoute, [this](const httplib::Request& req, httplib::Response& res) {
        handle_reload(req, res);
    });
}

void GatewayHttpServer::start() {
    server_ = std::make_unique<httplib::Server>();
    auto& svr = *server_;

    const size_t pool_size = config_.thread_pool_size;
    svr.new_task_queue = [pool_size] {
        return new httplib::ThreadPool(pool_size);
    };

    register_routes(svr);

    utils::log::info(std::format("Starting Data Product Gateway on {}:{} ({} threads)",
        config_.host, config_.port, pool_size));

    if (!svr.listen(config_.host, config_.port)) {
        throw std::runtime_error(std::format("Failed to bind HTTP server to {}:{}", config_.host, config_.port));
    }
}

void GatewayHttpServer::stop() {
    if (server_ && server_->is_running()) {
        server_->stop();
        utils::log::info("Server stopped");
    }
}

} // namespace dpgw
