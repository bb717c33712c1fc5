#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace dpgw {

/**
 * @brief Failure taxonomy shared by the gateway and its adapters
 */
enum class ErrorCategory {
    NONE,
    VALIDATION_ERROR,   // malformed or disallowed SQL, never reaches a backend
    CONNECTION_ERROR,   // backend unreachable or not initialized
    EXECUTION_ERROR,    // backend-native failure on permitted SQL
    TIMEOUT_ERROR,      // call exceeded its wall-clock bound
    INTERNAL_ERROR
};

[[nodiscard]] inline const char* error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE:             return "none";
        case ErrorCategory::VALIDATION_ERROR: return "validation";
        case ErrorCategory::CONNECTION_ERROR: return "connection";
        case ErrorCategory::EXECUTION_ERROR:  return "execution";
        case ErrorCategory::TIMEOUT_ERROR:    return "timeout";
        case ErrorCategory::INTERNAL_ERROR:   return "internal";
        default:                              return "unknown";
    }
}

/**
 * @brief Result type for operations that can fail
 */
template<typename T>
class Result {
public:
    static Result ok(T value) {
        Result r;
        r.success_ = true;
        r.value_ = std::move(value);
        return r;
    }

    static Result error(ErrorCategory category, std::string message) {
        Result r;
        r.success_ = false;
        r.error_category_ = category;
        r.error_message_ = std::move(message);
        return r;
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    ErrorCategory error_category() const { return error_category_; }
    const std::string& error_message() const { return error_message_; }

private:
    bool success_ = false;
    std::optional<T> value_;
    ErrorCategory error_category_ = ErrorCategory::NONE;
    std::string error_message_;
};

/**
 * @brief Thrown when a component is driven outside its state machine
 *
 * Examples: executing on a disconnected adapter, calling the gateway before
 * initialize(). These are programmer errors and are never retried.
 */
class UsageError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

} // namespace dpgw
