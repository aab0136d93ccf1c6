#pragma once

#include <optional>
#include <string>

namespace flbkinesis {

/**
 * @brief Error categories for the plugin
 */
enum class ErrorCategory {
    NONE,
    CONFIGURATION_ERROR,
    DELIVERY_RETRYABLE,
    DELIVERY_FATAL
};

inline constexpr const char* error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE:                return "none";
        case ErrorCategory::CONFIGURATION_ERROR: return "configuration_error";
        case ErrorCategory::DELIVERY_RETRYABLE:  return "delivery_retryable";
        case ErrorCategory::DELIVERY_FATAL:      return "delivery_fatal";
    }
    return "unknown";
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

} // namespace flbkinesis
