#pragma once

#include <format>
#include <optional>
#include <stdexcept>
#include <string>

namespace tempo {

/**
 * @brief Error categories surfaced by the schema and repository layers
 */
enum class ErrorCategory {
    NONE,
    SCHEMA_CONFLICT,          // needs an explicit destructive-change allowance
    DDL_APPLICATION_FAILURE,  // a specific change failed to apply
    OPTIMISTIC_CONFLICT,      // lost a race against a concurrent updater
    UNSUPPORTED_TYPE,         // declared type has no mapping for the dialect
    VALIDATION_BYPASS,        // value incompatible with the column after coercion
    TENANT_ISOLATION,
    NOT_FOUND,
    UNSUPPORTED_OPERATION,
    CANCELLED,                // deadline expired or stop requested
    DATABASE_ERROR,
    INTERNAL_ERROR
};

[[nodiscard]] inline const char* error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE:                    return "NONE";
        case ErrorCategory::SCHEMA_CONFLICT:         return "SCHEMA_CONFLICT";
        case ErrorCategory::DDL_APPLICATION_FAILURE: return "DDL_APPLICATION_FAILURE";
        case ErrorCategory::OPTIMISTIC_CONFLICT:     return "OPTIMISTIC_CONFLICT";
        case ErrorCategory::UNSUPPORTED_TYPE:        return "UNSUPPORTED_TYPE";
        case ErrorCategory::VALIDATION_BYPASS:       return "VALIDATION_BYPASS";
        case ErrorCategory::TENANT_ISOLATION:        return "TENANT_ISOLATION";
        case ErrorCategory::NOT_FOUND:               return "NOT_FOUND";
        case ErrorCategory::UNSUPPORTED_OPERATION:   return "UNSUPPORTED_OPERATION";
        case ErrorCategory::CANCELLED:               return "CANCELLED";
        case ErrorCategory::DATABASE_ERROR:          return "DATABASE_ERROR";
        case ErrorCategory::INTERNAL_ERROR:          return "INTERNAL_ERROR";
        default:                                     return "UNKNOWN";
    }
}

/**
 * @brief Where an error happened: table, column/index/field, operation
 */
struct ErrorContext {
    std::string table;
    std::string subject;
    std::string operation;
};

/**
 * @brief Exception raised inside a unit of work
 *
 * Thrown from the query builder, row decoding and the repositories' internal
 * steps; the public entry points catch it (after the transaction guard has
 * rolled back) and turn it into Result::error.
 *
 * DATABASE_ERROR carries the server's SQLSTATE when there is one; the
 * repositories decide from it whether a retry can help.
 */
class EngineError : public std::runtime_error {
public:
    EngineError(ErrorCategory category, const std::string& message, ErrorContext context = {},
                std::string sql_state = {})
        : std::runtime_error(message), category_(category), context_(std::move(context)),
          sql_state_(std::move(sql_state)) {}

    [[nodiscard]] ErrorCategory category() const { return category_; }
    [[nodiscard]] const ErrorContext& context() const { return context_; }
    [[nodiscard]] const std::string& sql_state() const { return sql_state_; }

private:
    ErrorCategory category_;
    ErrorContext context_;
    std::string sql_state_;
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

    static Result error(ErrorCategory category, std::string message, ErrorContext context = {}) {
        Result r;
        r.success_ = false;
        r.error_category_ = category;
        r.error_message_ = std::move(message);
        r.error_context_ = std::move(context);
        return r;
    }

    static Result error(const EngineError& e) {
        return error(e.category(), e.what(), e.context());
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    ErrorCategory error_category() const { return error_category_; }
    const std::string& error_message() const { return error_message_; }
    const ErrorContext& error_context() const { return error_context_; }

    /**
     * @brief "CATEGORY [table.subject/operation]: message" for logs
     */
    std::string describe() const {
        return std::format("{} [{}.{}/{}]: {}", error_category_to_string(error_category_),
            error_context_.table, error_context_.subject, error_context_.operation,
            error_message_);
    }

private:
    bool success_ = false;
    std::optional<T> value_;
    ErrorCategory error_category_ = ErrorCategory::NONE;
    std::string error_message_;
    ErrorContext error_context_;
};

} // namespace tempo
