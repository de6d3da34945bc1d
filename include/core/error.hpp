#pragma once

#include <string>
#include <string_view>
#include <optional>

namespace devscrub {

/**
 * @brief Error categories surfaced by the driver and config layers
 *
 * Pattern matching and value policy never fail; only I/O, parsing and
 * configuration problems reach the caller.
 */
enum class ErrorCategory {
    NONE,
    INPUT_NOT_FOUND,
    MALFORMED_INPUT,
    OUTPUT_WRITE_FAILED,
    CONFIG_ERROR,
    UNEXPECTED_FAILURE
};

[[nodiscard]] inline constexpr std::string_view error_category_name(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE:                return "none";
        case ErrorCategory::INPUT_NOT_FOUND:     return "input not found";
        case ErrorCategory::MALFORMED_INPUT:     return "malformed input";
        case ErrorCategory::OUTPUT_WRITE_FAILED: return "output write failed";
        case ErrorCategory::CONFIG_ERROR:        return "config error";
        case ErrorCategory::UNEXPECTED_FAILURE:  return "unexpected failure";
    }
    return "unexpected failure";
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

} // namespace devscrub
