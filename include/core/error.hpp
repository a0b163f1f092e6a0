#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <variant>

namespace pgmapper {

/**
 * @brief Error categories for runtime operations
 */
enum class ErrorCategory {
    NONE,
    CONNECTION_ERROR,
    STATEMENT_ERROR,
    NOT_FOUND,
    DECODE_ERROR,
    CONFIG_ERROR,
    INTERNAL_ERROR
};

[[nodiscard]] inline const char* error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE: return "NONE";
        case ErrorCategory::CONNECTION_ERROR: return "CONNECTION_ERROR";
        case ErrorCategory::STATEMENT_ERROR: return "STATEMENT_ERROR";
        case ErrorCategory::NOT_FOUND: return "NOT_FOUND";
        case ErrorCategory::DECODE_ERROR: return "DECODE_ERROR";
        case ErrorCategory::CONFIG_ERROR: return "CONFIG_ERROR";
        case ErrorCategory::INTERNAL_ERROR: return "INTERNAL_ERROR";
        default: return "UNKNOWN";
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

    /**
     * @brief Re-wrap the error of another result (value types may differ)
     */
    template<typename U>
    static Result propagate(const Result<U>& other) {
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

/**
 * @brief Result of an operation with no value
 */
using Status = Result<std::monostate>;

[[nodiscard]] inline Status ok_status() {
    return Status::ok(std::monostate{});
}

/**
 * @brief Kinds of record-type synthesis failures
 */
enum class SynthesisErrorKind {
    MISSING_PRIMARY_KEY,
    UNSUPPORTED_TYPE,
    UNSUPPORTED_SHAPE,
    DUPLICATE_COLUMN_NAME,
    DUPLICATE_PRIMARY_KEY
};

[[nodiscard]] inline const char* synthesis_error_kind_to_string(SynthesisErrorKind kind) {
    switch (kind) {
        case SynthesisErrorKind::MISSING_PRIMARY_KEY: return "MissingPrimaryKey";
        case SynthesisErrorKind::UNSUPPORTED_TYPE: return "UnsupportedType";
        case SynthesisErrorKind::UNSUPPORTED_SHAPE: return "UnsupportedShape";
        case SynthesisErrorKind::DUPLICATE_COLUMN_NAME: return "DuplicateColumnName";
        case SynthesisErrorKind::DUPLICATE_PRIMARY_KEY: return "DuplicatePrimaryKey";
        default: return "Unknown";
    }
}

/**
 * @brief Raised when a record type cannot be turned into a TypeDescriptor
 *
 * Thrown on first use of the type, before any SQL is sent. Never retried.
 */
class SynthesisError : public std::runtime_error {
public:
    SynthesisError(SynthesisErrorKind kind, std::string type_name,
                   std::string field_name, const std::string& message)
        : std::runtime_error(message),
          kind_(kind),
          type_name_(std::move(type_name)),
          field_name_(std::move(field_name)) {}

    SynthesisErrorKind kind() const { return kind_; }
    const std::string& type_name() const { return type_name_; }

    /// Empty when the failure concerns the type as a whole
    const std::string& field_name() const { return field_name_; }

private:
    SynthesisErrorKind kind_;
    std::string type_name_;
    std::string field_name_;
};

} // namespace pgmapper
