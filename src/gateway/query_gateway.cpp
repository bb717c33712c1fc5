#include "gateway/query_gateway.hpp"
#include "gateway/error_classifier.hpp"
#include "gateway/sql_normalizer.hpp"
#include "core/utils.hpp"

#include <format>
#include <stop_token>
#include <thread>

namespace dpgw {

const char* gateway_state_to_string(GatewayState state) {
    switch (state) {
        case GatewayState::UNINITIALIZED: return "UNINITIALIZED";
        case GatewayState::INITIALIZING:  return "INITIALIZING";
        case GatewayState::READY:         return "READY";
        case GatewayState::CLOSED:        return "CLOSED";
        default:                          return "UNKNOWN";
    }
}

QueryGateway::QueryGateway(GatewayConfig config, BackendFactory factory)
    : config_(std::move(config)),
      factory_(std::move(factory)),
      bootstrapper_(std::make_unique<ViewBootstrapper>(
          ViewBootstrapper::from_config(config_.registry, config_.data_sources))),
      principals_(std::make_unique<StaticPrincipalProvider>(config_.principals)) {}

QueryGateway::QueryGateway(GatewayConfig config,
                           std::shared_ptr<IBackendAdapter> adapter,
                           std::unique_ptr<ViewBootstrapper> bootstrapper)
    : config_(std::move(config)),
      bootstrapper_(bootstrapper
          ? std::move(bootstrapper)
          : std::make_unique<ViewBootstrapper>(
                ViewBootstrapper::from_config(config_.registry, config_.data_sources))),
      principals_(std::make_unique<StaticPrincipalProvider>(config_.principals)),
      adapter_(std::move(adapter)) {}

QueryGateway::~QueryGateway() {
    close();
}

// ============================================================================
// Lifecycle
// ============================================================================

bool QueryGateway::initialize() {
    std::unique_lock lock(mutex_);
    if (state_ == GatewayState::READY) {
        return true;
    }
    if (state_ != GatewayState::UNINITIALIZED) {
        utils::log::error(std::format("Gateway: initialize() called in state {}; use reload()",
            gateway_state_to_string(state_)));
        return false;
    }

    const std::string tx = utils::generate_uuid();
    state_ = GatewayState::INITIALIZING;
    utils::log::info(std::format("[TXN:{}] Gateway: initializing '{}' backend", tx, config_.backend.type));

    if (!adapter_) {
        try {
            adapter_ = factory_.create(config_.backend.type, config_.backend.options);
        } catch (const std::invalid_argument& e) {
            utils::log::error(std::format("[TXN:{}] Gateway: {}", tx, e.what()));
            state_ = GatewayState::UNINITIALIZED;
            return false;
        }
    }

    if (!adapter_->connect(config_.backend.connection)) {
        utils::log::error(std::format("[TXN:{}] Gateway: cannot connect to '{}' backend",
            tx, adapter_->type()));
        state_ = GatewayState::UNINITIALIZED;
        return false;
    }

    bootstrap_locked(tx);
    state_ = GatewayState::READY;
    utils::log::info(std::format("[TXN:{}] Gateway: ready ({} data products, {} views from {})",
        tx, definitions_.data_products.size(), definitions_.views.size(), definitions_.origin));
    return true;
}

void QueryGateway::bootstrap_locked(const std::string& transaction_id) {
    try {
        auto result = bootstrapper_->run(*adapter_, transaction_id);
        definitions_ = std::move(result.definitions);
        last_report_ = std::move(result.report);
    } catch (const std::exception& e) {
        // Serve the definitions even when the backend rejected the bootstrap
        utils::log::error(std::format("[TXN:{}] Gateway: view bootstrap failed: {}", transaction_id, e.what()));
        definitions_ = bootstrapper_->resolve();
        last_report_ = BootstrapReport{};
        last_report_.origin = definitions_.origin;
    }
}

bool QueryGateway::reload() {
    std::unique_lock lock(mutex_);
    if (state_ != GatewayState::READY && state_ != GatewayState::CLOSED) {
        utils::log::error(std::format("Gateway: reload() called in state {}; initialize() first",
            gateway_state_to_string(state_)));
        return false;
    }

    const std::string tx = utils::generate_uuid();
    const auto previous = state_;
    state_ = GatewayState::INITIALIZING;
    utils::log::info(std::format("[TXN:{}] Gateway: reloading (was {})", tx, gateway_state_to_string(previous)));

    if (!adapter_->is_connected() && !adapter_->connect(config_.backend.connection)) {
        utils::log::error(std::format("[TXN:{}] Gateway: reload could not reconnect '{}' backend",
            tx, adapter_->type()));
        state_ = GatewayState::CLOSED;
        return false;
    }

    bootstrap_locked(tx);
    state_ = GatewayState::READY;
    utils::log::info(std::format("[TXN:{}] Gateway: reload complete ({} views created, {} failed)",
        tx, last_report_.views_created.size(), last_report_.failed_views.size()));
    return true;
}

void QueryGateway::close() {
    std::unique_lock lock(mutex_);
    if (state_ == GatewayState::CLOSED) {
        return;
    }
    if (adapter_ && adapter_->is_connected()) {
        // Workers left behind by timed-out requests may still hold the backend
        adapter_->interrupt();
        adapter_->disconnect();
    }
    state_ = GatewayState::CLOSED;
    utils::log::info("Gateway: closed");
}

GatewayState QueryGateway::state() const {
    std::shared_lock lock(mutex_);
    return state_;
}

DefinitionSet QueryGateway::definitions() const {
    std::shared_lock lock(mutex_);
    return definitions_;
}

BootstrapReport QueryGateway::last_bootstrap() const {
    std::shared_lock lock(mutex_);
    return last_report_;
}

std::map<std::string, std::string> QueryGateway::backend_metadata() const {
    std::shared_lock lock(mutex_);
    std::map<std::string, std::string> meta;
    if (adapter_) {
        meta = adapter_->get_metadata();
    } else {
        meta["status"] = "uninitialized";
        meta["database_type"] = config_.backend.type;
    }
    meta["gateway_state"] = gateway_state_to_string(state_);
    return meta;
}

void QueryGateway::require_ready(const char* operation) const {
    if (state_ != GatewayState::READY) {
        throw UsageError(std::format("QueryGateway::{} called in state {}",
            operation, gateway_state_to_string(state_)));
    }
}

// ============================================================================
// Execution core
// ============================================================================

std::optional<QueryResult> QueryGateway::execute_with_deadline(
    std::shared_ptr<IBackendAdapter> adapter,
    const Invocation& call) {

    auto promise = std::make_shared<std::promise<QueryResult>>();
    auto future = promise->get_future();
    std::stop_source cancel;

    std::thread([adapter, promise, token = cancel.get_token(),
                 sql = call.sql, params = call.parameters, tx = call.transaction_id]() {
        try {
            promise->set_value(adapter->execute_query(sql, params, tx, token));
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
    }).detach();

    if (future.wait_for(call.timeout) == std::future_status::timeout) {
        utils::log::warn(std::format("[TXN:{}] Gateway: deadline of {}ms passed, cancelling the query",
            call.transaction_id, call.timeout.count()));
        cancel.request_stop();
        return std::nullopt;
    }
    return future.get();
}

bool QueryGateway::ensure_connected(const std::string& transaction_id) {
    if (adapter_->is_connected()) {
        return true;
    }
    std::lock_guard<std::mutex> guard(reconnect_mutex_);
    if (adapter_->is_connected()) {
        return true;
    }
    utils::log::warn(std::format("[TXN:{}] Gateway: backend disconnected, reconnecting once", transaction_id));
    return adapter_->connect(config_.backend.connection);
}

ResponseEnvelope QueryGateway::run_locked(const Invocation& call) {
    utils::Timer timer;
    ResponseEnvelope envelope;

    try {
        if (config_.security.validate_sql) {
            const auto validation = adapter_->validate_sql(call.sql);
            if (!validation.valid) {
                utils::log::warn(std::format("[TXN:{}] Gateway: rejected {} statement: {} | SQL: {}",
                    call.transaction_id, validation.statement_type, validation.error_message, call.sql));
                envelope = ResponseEnvelope::failure(ErrorCode::SQL_VALIDATION_ERROR,
                    validation.error_message, call.transaction_id, call.request_id);
                envelope.query_time_ms = static_cast<double>(timer.elapsed_us().count()) / 1000.0;
                annotate(envelope, call);
                return envelope;
            }
        }

        if (!ensure_connected(call.transaction_id)) {
            envelope = ResponseEnvelope::failure(ErrorCode::CONNECTION_ERROR,
                std::format("{} backend is not connected", adapter_->type()),
                call.transaction_id, call.request_id);
        } else {
            utils::log::info(std::format("[TXN:{}] Gateway: executing on {}: {}",
                call.transaction_id, adapter_->type(), call.sql));

            auto result = execute_with_deadline(adapter_, call);
            if (!result) {
                envelope = ResponseEnvelope::failure(ErrorCode::QUERY_TIMEOUT,
                    std::format("query exceeded the {}ms timeout and was interrupted", call.timeout.count()),
                    call.transaction_id, call.request_id);
            } else if (result->status() == ResultStatus::ERROR) {
                const auto classification = classify_backend_error(result->error_message);
                utils::log::warn(std::format("[TXN:{}] Gateway: backend error ({}): {} | SQL: {}",
                    call.transaction_id, error_code_to_string(classification.code),
                    result->error_message, call.sql));
                envelope = ResponseEnvelope::failure(classification.code, result->error_message,
                    call.transaction_id, call.request_id);
                if (classification.human_action_required) {
                    envelope.human_action_required = true;
                    envelope.human_action_type = classification.human_action_type;
                    envelope.human_action_context = {
                        {"sql", call.sql},
                        {"message", result->error_message},
                        {"transaction_id", call.transaction_id}
                    };
                }
            } else if (!result->is_well_formed()) {
                utils::log::error(std::format("[TXN:{}] Gateway: {} backend returned a malformed result "
                    "(row_count={}, rows={}, columns={})", call.transaction_id, adapter_->type(),
                    result->row_count, result->rows.size(), result->columns.size()));
                envelope = ResponseEnvelope::failure(ErrorCode::INTERNAL_ERROR,
                    "backend returned rows inconsistent with its columns",
                    call.transaction_id, call.request_id);
            } else {
                envelope = ResponseEnvelope::success(std::move(*result), call.transaction_id, call.request_id);
            }
        }
    } catch (const UsageError& e) {
        // Backend dropped its connection underneath us
        utils::log::error(std::format("[TXN:{}] Gateway: {}", call.transaction_id, e.what()));
        envelope = ResponseEnvelope::failure(ErrorCode::CONNECTION_ERROR, e.what(),
            call.transaction_id, call.request_id);
    } catch (const std::exception& e) {
        utils::log::error(std::format("[TXN:{}] Gateway: unexpected failure: {}", call.transaction_id, e.what()));
        envelope = ResponseEnvelope::failure(ErrorCode::INTERNAL_ERROR,
            std::format("internal error: {}", e.what()), call.transaction_id, call.request_id);
    }

    envelope.query_time_ms = static_cast<double>(timer.elapsed_us().count()) / 1000.0;
    annotate(envelope, call);
    utils::log::info(std::format("[TXN:{}] Gateway: {} in {:.1f}ms, {} row(s){}",
        call.transaction_id, envelope.status, envelope.query_time_ms, envelope.row_count,
        envelope.error_code == ErrorCode::NONE ? "" : std::format(" [{}]", error_code_to_string(envelope.error_code))));
    return envelope;
}

void QueryGateway::annotate(ResponseEnvelope& envelope, const Invocation& call) const {
    envelope.metadata["source"] = config_.gateway.source_name;
    if (adapter_) {
        envelope.metadata["backend"] = adapter_->type();
    }

    std::optional<PrincipalProfile> principal;
    if (call.principal_id) {
        envelope.metadata["principal_id"] = *call.principal_id;
        principal = principals_->find(*call.principal_id);
        if (principal && !principal->role.empty()) {
            envelope.metadata["role"] = principal->role;
        }
    }

    std::string governance = "department";
    if (call.product && !call.product->governance_level.empty()) {
        governance = call.product->governance_level;
    } else if (principal && !principal->governance_level.empty()) {
        governance = principal->governance_level;
    }
    envelope.metadata["governance_level"] = governance;

    for (const auto& [key, value] : call.principal_context) {
        envelope.metadata["principal." + key] = value;
    }
}

// ============================================================================
// Public operations
// ============================================================================

ResponseEnvelope QueryGateway::execute(QueryRequest request) {
    if (request.transaction_id.empty()) request.transaction_id = utils::generate_uuid();
    if (request.request_id.empty()) request.request_id = utils::generate_uuid();

    std::shared_lock lock(mutex_);
    require_ready("execute");

    utils::log::debug(std::format("[TXN:{}] Gateway: execute request {} principal={} SQL: {}",
        request.transaction_id, request.request_id, request.principal_id.value_or("-"), request.sql));

    Invocation call{
        utils::trim(request.sql),
        std::move(request.parameters),
        request.transaction_id,
        request.request_id,
        request.timeout.value_or(config_.gateway.query_timeout),
        std::move(request.principal_id),
        std::move(request.principal_context),
        nullptr
    };

    if (call.sql.empty()) {
        auto envelope = ResponseEnvelope::failure(ErrorCode::INVALID_REQUEST,
            "SQL must not be empty", call.transaction_id, call.request_id);
        annotate(envelope, call);
        return envelope;
    }
    if (!config_.security.allow_custom_sql) {
        utils::log::warn(std::format("[TXN:{}] Gateway: custom SQL disabled, request refused", call.transaction_id));
        auto envelope = ResponseEnvelope::failure(ErrorCode::CUSTOM_SQL_NOT_ALLOWED,
            "custom SQL execution is disabled", call.transaction_id, call.request_id);
        annotate(envelope, call);
        return envelope;
    }

    return run_locked(call);
}

std::future<ResponseEnvelope> QueryGateway::execute_async(QueryRequest request) {
    return std::async(std::launch::async, [this, request = std::move(request)]() mutable {
        return execute(std::move(request));
    });
}

ResponseEnvelope QueryGateway::get_data_product(DataProductRequest request) {
    if (request.transaction_id.empty()) request.transaction_id = utils::generate_uuid();
    if (request.request_id.empty()) request.request_id = utils::generate_uuid();

    std::shared_lock lock(mutex_);
    require_ready("get_data_product");

    utils::log::info(std::format("[TXN:{}] Gateway: data product '{}' requested by {} SQL: {}",
        request.transaction_id, request.product_id, request.principal_id.value_or("-"), request.sql));

    Invocation call{
        {},
        {},
        request.transaction_id,
        request.request_id,
        request.timeout.value_or(config_.gateway.query_timeout),
        std::move(request.principal_id),
        std::move(request.principal_context),
        nullptr
    };

    const auto fail = [&](ErrorCode code, std::string message) {
        auto envelope = ResponseEnvelope::failure(code, std::move(message), call.transaction_id, call.request_id);
        if (!request.product_id.empty()) envelope.product_id = request.product_id;
        annotate(envelope, call);
        return envelope;
    };

    try {
        if (request.product_id.empty()) {
            return fail(ErrorCode::INVALID_REQUEST, "product_id is required");
        }

        call.product = definitions_.find_product(request.product_id);
        if (!call.product) {
            utils::log::debug(std::format("[TXN:{}] Gateway: no registry entry for '{}'",
                call.transaction_id, request.product_id));
        }

        if (!config_.security.allow_custom_sql) {
            if (!call.product) {
                return fail(ErrorCode::DATA_PRODUCT_NOT_FOUND,
                    std::format("data product '{}' is not registered", request.product_id));
            }
            call.sql = "SELECT * FROM " + utils::quote_identifier(call.product->primary_table_or_view);
            if (request.limit) {
                call.sql += std::format(" LIMIT {}", *request.limit);
            }
            utils::log::info(std::format("[TXN:{}] Gateway: custom SQL disabled, using registry query: {}",
                call.transaction_id, call.sql));
        } else {
            if (utils::trim(request.sql).empty()) {
                return fail(ErrorCode::INVALID_REQUEST, "sql is required for data product retrieval");
            }
            auto normalized = SqlNormalizer::normalize(request.sql);
            if (normalized.is_error()) {
                return fail(ErrorCode::INVALID_REQUEST, normalized.error_message());
            }
            call.sql = std::move(normalized.value());
            if (call.sql != request.sql) {
                utils::log::debug(std::format("[TXN:{}] Gateway: normalized SQL: {}",
                    call.transaction_id, call.sql));
            }
        }

        auto envelope = run_locked(call);
        envelope.product_id = request.product_id;
        if (envelope.is_success() && request.limit && envelope.row_count >= *request.limit) {
            envelope.truncated = true;
        }
        return envelope;
    } catch (const std::exception& e) {
        utils::log::error(std::format("[TXN:{}] Gateway: data product '{}' failed: {}",
            call.transaction_id, request.product_id, e.what()));
        return fail(ErrorCode::DATA_PRODUCT_RETRIEVAL_ERROR,
            std::format("data product retrieval failed: {}", e.what()));
    }
}

} // namespace dpgw
