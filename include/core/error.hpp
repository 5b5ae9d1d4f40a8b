#pragma once

#include <string>
#include <optional>
#include <utility>

namespace meshguard {

/**
 * @brief Error categories for admission and selection
 */
enum class ErrorCategory {
    NONE,
    CIRCUIT_OPEN,           // Rejected before attempting, dependency presumed unhealthy
    TOO_MANY_REQUESTS,      // Half-open probe cap or bulkhead saturation
    NO_HEALTHY_INSTANCES,   // Empty candidate set after filtering
    INVALID_ALGORITHM,      // Unknown or unconfigured strategy
    NOT_FOUND,
    CONFIG_ERROR,
    UPSTREAM_ERROR,         // Wrapped call reported failure
    INTERNAL_ERROR
};

inline constexpr const char* error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE:                 return "none";
        case ErrorCategory::CIRCUIT_OPEN:         return "circuit_open";
        case ErrorCategory::TOO_MANY_REQUESTS:    return "too_many_requests";
        case ErrorCategory::NO_HEALTHY_INSTANCES: return "no_healthy_instances";
        case ErrorCategory::INVALID_ALGORITHM:    return "invalid_algorithm";
        case ErrorCategory::NOT_FOUND:            return "not_found";
        case ErrorCategory::CONFIG_ERROR:         return "config_error";
        case ErrorCategory::UPSTREAM_ERROR:       return "upstream_error";
        case ErrorCategory::INTERNAL_ERROR:       return "internal_error";
    }
    return "unknown";
}

/**
 * @brief Result type for operations that can fail
 */
template<typename T>
class Result {
public:
    using value_type = T;

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
 * @brief Result for operations with no value (success or categorized error)
 */
template<>
class Result<void> {
public:
    using value_type = void;

    static Result ok() {
        Result r;
        r.success_ = true;
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

    ErrorCategory error_category() const { return error_category_; }
    const std::string& error_message() const { return error_message_; }

private:
    bool success_ = false;
    ErrorCategory error_category_ = ErrorCategory::NONE;
    std::string error_message_;
};

using Status = Result<void>;

} // namespace meshguard
