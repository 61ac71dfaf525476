#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace tracectx {

/**
 * @brief Error categories for trace context operations
 */
enum class ErrorCategory {
    NONE,
    INVALID_ARGUMENT
};

/**
 * @brief Thrown when a constructor argument fails validation
 *
 * Carries the name of the offending parameter so callers can tell which
 * identifier was rejected.
 */
class InvalidArgument : public std::invalid_argument {
public:
    InvalidArgument(std::string param_name, const std::string& message)
        : std::invalid_argument(message), param_name_(std::move(param_name)) {}

    [[nodiscard]] const std::string& param_name() const noexcept { return param_name_; }

private:
    std::string param_name_;
};

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

} // namespace tracectx
