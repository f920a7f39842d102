#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace equipstat {

/**
 * @brief Error categories reported at component boundaries
 */
enum class ErrorCategory {
    NONE,
    VALIDATION_ERROR,
    NOT_FOUND,
    STORAGE_ERROR,
    INTERNAL_ERROR
};

inline constexpr const char* error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE:             return "none";
        case ErrorCategory::VALIDATION_ERROR: return "validation_error";
        case ErrorCategory::NOT_FOUND:        return "not_found";
        case ErrorCategory::STORAGE_ERROR:    return "storage_error";
        case ErrorCategory::INTERNAL_ERROR:   return "internal_error";
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

/**
 * @brief Raised by snapshot/threshold store backends on storage failure
 */
struct StoreError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

} // namespace equipstat
