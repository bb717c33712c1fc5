#pragma once

#include "db/backend_adapter.hpp"
#include "core/utils.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stop_token>
#include <string>
#include <vector>

namespace dpgw::testing {

/**
 * @brief Scriptable adapter that records every call
 *
 * execute_query() returns the configured result after an optional delay.
 * A stop request on the call's own token, or interrupt(), cuts the delay
 * short and the call reports "interrupted".
 */
class MockBackendAdapter : public IBackendAdapter {
public:
    explicit MockBackendAdapter(std::string label = "mock")
        : label_(std::move(label)), guard_(ReadOnlySqlGuard::embedded()) {
        result_ = QueryResult::ok({"value"}, {{int64_t{1}}});
    }

    [[nodiscard]] std::string type() const override { return label_; }

    bool connect(const ConnectionParams& /*params*/) override {
        connect_count_.fetch_add(1, std::memory_order_relaxed);
        if (!connect_succeeds_) return false;
        connected_ = true;
        return true;
    }

    bool disconnect() override {
        connected_ = false;
        return true;
    }

    [[nodiscard]] bool is_connected() const override { return connected_.load(); }

    [[nodiscard]] QueryResult execute_query(
        const std::string& sql,
        const QueryParameters& /*parameters*/,
        const std::string& /*transaction_id*/,
        std::stop_token cancel) override {
        require_connected("execute_query");
        execute_count_.fetch_add(1, std::memory_order_relaxed);

        std::unique_lock<std::mutex> lock(mutex_);
        executed_.push_back(sql);
        if (delay_.count() > 0) {
            cv_.wait_for(lock, cancel, delay_, [this] { return interrupted_; });
            if (cancel.stop_requested()) {
                cancel_count_.fetch_add(1, std::memory_order_relaxed);
                return QueryResult::error("INTERRUPT Error: Interrupted!");
            }
            if (interrupted_) {
                return QueryResult::error("INTERRUPT Error: Interrupted!");
            }
        }
        return result_;
    }

    [[nodiscard]] ValidationResult validate_sql(const std::string& sql) const override {
        return guard_.validate(sql);
    }

    void interrupt() override {
        interrupt_count_.fetch_add(1, std::memory_order_relaxed);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            interrupted_ = true;
        }
        cv_.notify_all();
    }

    bool create_view(const std::string& name, const std::string& sql, bool /*replace*/) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (utils::to_lower(name) == utils::to_lower(failing_view_)) return false;
        for (auto& [existing, body] : views_) {
            if (utils::to_lower(existing) == utils::to_lower(name)) {
                body = sql;
                return true;
            }
        }
        views_.emplace_back(name, sql);
        return true;
    }

    [[nodiscard]] std::vector<std::string> list_views() override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> names;
        for (const auto& [name, body] : views_) names.push_back(name);
        return names;
    }

    [[nodiscard]] bool check_view_exists(const std::string& name) override {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [existing, body] : views_) {
            if (utils::to_lower(existing) == utils::to_lower(name)) return true;
        }
        return false;
    }

    bool register_data_source(const DataSourceInfo& source) override {
        std::lock_guard<std::mutex> lock(mutex_);
        registered_sources_.push_back(source.table_name);
        return true;
    }

    std::map<std::string, bool> create_fallback_views(
        const std::vector<std::string>& view_names) override {
        std::map<std::string, bool> results;
        for (const auto& name : view_names) {
            results[name] = create_view(name, "SELECT 1 AS row_id", true);
        }
        std::lock_guard<std::mutex> lock(mutex_);
        fallback_requests_.insert(fallback_requests_.end(), view_names.begin(), view_names.end());
        return results;
    }

    [[nodiscard]] std::map<std::string, std::string> get_metadata() override {
        return {
            {"database_type", label_},
            {"status", connected_ ? "connected" : "disconnected"}
        };
    }

    // ---- Scripting ----

    void set_result(QueryResult result) {
        std::lock_guard<std::mutex> lock(mutex_);
        result_ = std::move(result);
    }

    void set_delay(std::chrono::milliseconds delay) {
        std::lock_guard<std::mutex> lock(mutex_);
        delay_ = delay;
        interrupted_ = false;
    }

    void set_connect_succeeds(bool v) { connect_succeeds_ = v; }
    void set_failing_view(std::string name) { failing_view_ = std::move(name); }

    // ---- Inspection ----

    [[nodiscard]] uint64_t execute_count() const { return execute_count_.load(std::memory_order_relaxed); }
    [[nodiscard]] uint64_t connect_count() const { return connect_count_.load(std::memory_order_relaxed); }
    [[nodiscard]] uint64_t interrupt_count() const { return interrupt_count_.load(std::memory_order_relaxed); }
    [[nodiscard]] uint64_t cancel_count() const { return cancel_count_.load(std::memory_order_relaxed); }

    [[nodiscard]] std::vector<std::string> executed_sql() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return executed_;
    }

    [[nodiscard]] std::vector<std::string> registered_sources() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return registered_sources_;
    }

    [[nodiscard]] std::vector<std::string> fallback_requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return fallback_requests_;
    }

private:
    std::string label_;
    ReadOnlySqlGuard guard_;

    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
    QueryResult result_;
    std::chrono::milliseconds delay_{0};
    bool interrupted_ = false;
    std::vector<std::string> executed_;
    std::vector<std::pair<std::string, std::string>> views_;
    std::vector<std::string> registered_sources_;
    std::vector<std::string> fallback_requests_;
    std::string failing_view_;

    std::atomic<bool> connected_{false};
    std::atomic<bool> connect_succeeds_{true};
    std::atomic<uint64_t> execute_count_{0};
    std::atomic<uint64_t> connect_count_{0};
    std::atomic<uint64_t> interrupt_count_{0};
    std::atomic<uint64_t> cancel_count_{0};
};

} // namespace dpgw::testing
