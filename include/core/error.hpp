#pragma once

#include <optional>
#include <string>

namespace xraylite {

/**
 * @brief Error categories for tracing setup and transport
 */
enum class ErrorCategory {
    NONE,
    MISSING_ENV_VAR,
    BAD_CONFIG,
    PARSE_ERROR,
    IO_ERROR,
    JSON_ERROR,
    INTERNAL_ERROR
};

[[nodiscard]] constexpr const char* error_category_name(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE:            return "none";
        case ErrorCategory::MISSING_ENV_VAR: return "missing_env_var";
        case ErrorCategory::BAD_CONFIG:      return "bad_config";
        case ErrorCategory::PARSE_ERROR:     return "parse_error";
        case ErrorCategory::IO_ERROR:        return "io_error";
        case ErrorCategory::JSON_ERROR:      return "json_error";
        case ErrorCategory::INTERNAL_ERROR:  return "internal_error";
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

    /// Re-wrap the error of another Result (value types may differ)
    template<typename U>
    static Result error_from(const Result<U>& other) {
        return error(other.error_category(), other.error_message());
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

} // namespace xraylite
