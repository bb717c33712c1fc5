#include "db/bigquery/bigquery_rest_client.hpp"
#include "core/utils.hpp"

#include <httplib.h>

#include <cctype>
#include <cstdlib>
#include <format>
#include <type_traits>
#include <variant>
#include <vector>

namespace dpgw {

namespace {

constexpr const char* kApiRoot = "/bigquery/v2/projects/";

std::string percent_encode(std::string_view value) {
    static constexpr char kHex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(value.size());
    for (const char c : value) {
        const auto u = static_cast<unsigned char>(c);
        if (std::isalnum(u) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += c;
        } else {
            out += '%';
            out += kHex[u >> 4];
            out += kHex[u & 0x0F];
        }
    }
    return out;
}

} // anonymous namespace

BigQueryRestClient::BigQueryRestClient() : BigQueryRestClient(Config{}) {}

BigQueryRestClient::BigQueryRestClient(Config config)
    : config_(std::move(config)) {}

BigQueryRestClient::~BigQueryRestClient() {
    close();
}

// ============================================================================
// Request building
// ============================================================================

std::string BigQueryRestClient::parameter_json(const std::string& name, const CellValue& value) {
    return std::visit([&name](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        std::string type;
        std::string literal;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            return std::format(R"({{"name":"{}","parameterType":{{"type":"STRING"}},"parameterValue":{{}}}})",
                               utils::escape_json(name));
        } else if constexpr (std::is_same_v<T, bool>) {
            type = "BOOL";
            literal = v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int64_t>) {
            type = "INT64";
            literal = std::to_string(v);
        } else if constexpr (std::is_same_v<T, double>) {
            type = "FLOAT64";
            literal = std::format("{}", v);
        } else {
            type = "STRING";
            literal = v;
        }
        return std::format(R"({{"name":"{}","parameterType":{{"type":"{}"}},"parameterValue":{{"value":"{}"}}}})",
                           utils::escape_json(name), type, utils::escape_json(literal));
    }, value);
}

std::string BigQueryRestClient::build_job_request(
    const WarehouseQuery& query,
    const std::string& project,
    const std::string& dataset,
    const std::string& location,
    const std::string& job_id) {

    std::string params;
    for (const auto& [name, value] : query.parameters) {
        if (!params.empty()) params += ',';
        params += parameter_json(name, value);
    }

    return std::format(
        R"({{"jobReference":{{"projectId":"{0}","jobId":"{1}","location":"{2}"}},)"
        R"("configuration":{{"query":{{"query":"{3}","useLegacySql":false,)"
        R"("defaultDataset":{{"projectId":"{0}","datasetId":"{4}"}},)"
        R"("parameterMode":"NAMED","queryParameters":[{5}]}}}}}})",
        utils::escape_json(project), utils::escape_json(job_id), utils::escape_json(location),
        utils::escape_json(query.sql), utils::escape_json(dataset), params);
}

std::string BigQueryRestClient::extract_error(const JsonValue& doc) {
    if (auto msg = doc["error"].optional_string("message")) {
        return *msg;
    }
    if (auto msg = doc["status"]["errorResult"].optional_string("message")) {
        return *msg;
    }
    const auto errors = doc["errors"];
    if (errors.is_array() && errors.size() > 0) {
        return errors[0].string_or("message", "unknown warehouse error");
    }
    return {};
}

// ============================================================================
// HTTP
// ============================================================================

std::optional<BigQueryRestClient::Binding> BigQueryRestClient::binding() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return binding_;
}

BigQueryRestClient::HttpReply BigQueryRestClient::post(const std::string& path, const std::string& body) {
    HttpReply reply;
    std::shared_ptr<AccessTokenProvider> tokens;
    std::string endpoint;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        tokens = tokens_;
        endpoint = binding_ ? binding_->endpoint : "";
    }
    if (!tokens || endpoint.empty()) {
        reply.error = "warehouse client is not open";
        return reply;
    }
    const auto token = tokens->token();
    if (!token) {
        reply.error = "could not obtain an access token";
        return reply;
    }

    httplib::Client cli(endpoint);
    cli.set_connection_timeout(config_.http_timeout);
    cli.set_read_timeout(config_.http_timeout);
    cli.set_bearer_token_auth(*token);

    const auto res = cli.Post(path, body, "application/json");
    if (!res) {
        reply.error = std::format("HTTP request failed: {}", httplib::to_string(res.error()));
        return reply;
    }
    reply.status = res->status;
    reply.body = res->body;
    reply.ok = res->status >= 200 && res->status < 300;
    return reply;
}

BigQueryRestClient::HttpReply BigQueryRestClient::get(const std::string& path) {
    HttpReply reply;
    std::shared_ptr<AccessTokenProvider> tokens;
    std::string endpoint;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        tokens = tokens_;
        endpoint = binding_ ? binding_->endpoint : "";
    }
    if (!tokens || endpoint.empty()) {
        reply.error = "warehouse client is not open";
        return reply;
    }
    const auto token = tokens->token();
    if (!token) {
        reply.error = "could not obtain an access token";
        return reply;
    }

    httplib::Client cli(endpoint);
    cli.set_connection_timeout(config_.http_timeout);
    // The server holds the poll open for up to poll_wait
    cli.set_read_timeout(config_.http_timeout + config_.poll_wait);
    cli.set_bearer_token_auth(*token);

    const auto res = cli.Get(path);
    if (!res) {
        reply.error = std::format("HTTP request failed: {}", httplib::to_string(res.error()));
        return reply;
    }
    reply.status = res->status;
    reply.body = res->body;
    reply.ok = res->status >= 200 && res->status < 300;
    return reply;
}

// ============================================================================
// Lifecycle
// ============================================================================

bool BigQueryRestClient::open(const ConnectionParams& params) {
    if (params.project.empty() || params.dataset.empty()) {
        utils::log::error("BigQuery: both project and dataset are required");
        return false;
    }

    std::shared_ptr<AccessTokenProvider> tokens;
    if (!params.access_token.empty()) {
        tokens = AccessTokenProvider::from_static_token(params.access_token);
    } else {
        std::string path = params.credentials_file;
        if (path.empty()) {
            if (const char* env = std::getenv("GOOGLE_APPLICATION_CREDENTIALS")) {
                path = env;
            }
        }
        if (path.empty()) {
            utils::log::error("BigQuery: no access_token, credentials_file or GOOGLE_APPLICATION_CREDENTIALS");
            return false;
        }
        auto account = AccessTokenProvider::load_service_account(path);
        if (!account) {
            return false;
        }
        tokens = AccessTokenProvider::from_service_account(std::move(*account));
    }

    if (!tokens->token()) {
        utils::log::error("BigQuery: unable to obtain an access token");
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    tokens_ = std::move(tokens);
    binding_ = Binding{params.project, params.dataset, params.location, params.api_endpoint};
    utils::log::info(std::format("BigQuery: bound to {}.{} ({})", params.project, params.dataset, params.location));
    return true;
}

void BigQueryRestClient::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    binding_.reset();
    tokens_.reset();
    running_jobs_.clear();
    cancelled_jobs_.clear();
}

// ============================================================================
// Jobs
// ============================================================================

bool BigQueryRestClient::is_cancelled(const std::string& job_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_jobs_.contains(job_id);
}

void BigQueryRestClient::finish_job(const std::string& job_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    running_jobs_.erase(job_id);
    cancelled_jobs_.erase(job_id);
}

WarehouseReply BigQueryRestClient::run_query(const WarehouseQuery& query) {
    WarehouseReply reply;
    const auto bind = binding();
    if (!bind) {
        reply.error_message = "warehouse client is not open";
        return reply;
    }

    reply.job_id = "dpgw_" + utils::generate_uuid();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_jobs_.insert(reply.job_id);
    }

    auto fail = [this, &reply](std::string message) {
        finish_job(reply.job_id);
        reply.success = false;
        reply.error_message = std::move(message);
        return reply;
    };

    const auto parse_error_body = [](const HttpReply& http) {
        if (!http.error.empty()) return http.error;
        try {
            const auto msg = extract_error(JsonValue::parse(http.body));
            if (!msg.empty()) return std::format("HTTP {}: {}", http.status, msg);
        } catch (const JsonValue::parse_error&) {
            // Non-JSON error body: report it raw below
        }
        return std::format("HTTP {}: {}", http.status, http.body);
    };

    utils::log::debug(std::format("[TXN:{}] BigQuery job {} submitting: {}",
                                  query.transaction_id, reply.job_id, query.sql));

    if (query.cancel.stop_requested()) {
        return fail(std::format("query interrupted: job {} cancelled before submission", reply.job_id));
    }

    const auto insert = post(std::format("{}{}/jobs", kApiRoot, percent_encode(bind->project)),
                             build_job_request(query, bind->project, bind->dataset, bind->location, reply.job_id));
    if (!insert.ok) {
        return fail(parse_error_body(insert));
    }

    // Runs immediately if the stop arrived while the insert was in flight
    std::stop_callback on_cancel(query.cancel, [this, job_id = reply.job_id] { cancel_job(job_id); });

    try {
        if (const auto msg = extract_error(JsonValue::parse(insert.body)); !msg.empty()) {
            return fail(msg);
        }

        std::optional<std::string> page_token;
        while (true) {
            if (is_cancelled(reply.job_id)) {
                return fail(std::format("query interrupted: job {} cancelled", reply.job_id));
            }

            std::string path = std::format("{}{}/queries/{}?location={}&timeoutMs={}&maxResults={}",
                kApiRoot, percent_encode(bind->project), percent_encode(reply.job_id),
                percent_encode(bind->location), config_.poll_wait.count(), config_.page_size);
            if (page_token) {
                path += "&pageToken=" + percent_encode(*page_token);
            }

            const auto page = get(path);
            if (!page.ok) {
                return fail(parse_error_body(page));
            }

            const auto doc = JsonValue::parse(page.body);
            if (const auto msg = extract_error(doc); !msg.empty()) {
                return fail(msg);
            }
            if (!doc.bool_or("jobComplete", false)) {
                continue;
            }

            if (reply.schema.is_null()) {
                reply.schema = doc["schema"];
            }
            for (auto& row : doc["rows"].elements()) {
                if (reply.rows.size() >= query.max_rows) {
                    reply.truncated = true;
                    break;
                }
                reply.rows.push_back(std::move(row));
            }

            page_token = doc.optional_string("pageToken");
            if (!page_token || reply.truncated) {
                break;
            }
        }
    } catch (const JsonValue::parse_error& e) {
        return fail(std::format("malformed warehouse response: {}", e.what()));
    }

    finish_job(reply.job_id);
    reply.success = true;
    return reply;
}

void BigQueryRestClient::cancel_job(const std::string& job_id) {
    std::optional<Binding> bind;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_jobs_.contains(job_id)) return;
        cancelled_jobs_.insert(job_id);
        bind = binding_;
    }
    if (bind) {
        post_cancel(*bind, job_id);
    }
}

void BigQueryRestClient::cancel_all() {
    std::vector<std::string> jobs;
    std::optional<Binding> bind;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        jobs.assign(running_jobs_.begin(), running_jobs_.end());
        cancelled_jobs_.insert(running_jobs_.begin(), running_jobs_.end());
        bind = binding_;
    }
    if (!bind) return;

    for (const auto& job_id : jobs) {
        post_cancel(*bind, job_id);
    }
}

void BigQueryRestClient::post_cancel(const Binding& bind, const std::string& job_id) {
    const auto res = post(std::format("{}{}/jobs/{}/cancel?location={}", kApiRoot,
                                      percent_encode(bind.project), percent_encode(job_id),
                                      percent_encode(bind.location)), "");
    if (res.ok) {
        utils::log::info(std::format("BigQuery: cancel requested for job {}", job_id));
    } else {
        utils::log::warn(std::format("BigQuery: cancel of job {} failed: {}",
                                     job_id, res.error.empty() ? res.body : res.error));
    }
}

} // namespace dpgw
