#pragma once

#include <optional>
#include <string>
#include <vector>

namespace sqlrag {

/**
 * @brief Stable error kinds surfaced to callers
 *
 * Ambiguity is not an error kind; it is routed to clarification,
 * not reported as a failure.
 */
enum class ErrorKind {
    NONE,
    INVALID_INPUT,
    SECURITY_VIOLATION,
    VALIDATION_FAILED,
    GENERATION_FAILED,
    GENERATION_TIMEOUT,
    UNANSWERABLE,
    EXECUTION_FAILED,
    TRANSIENT_EXHAUSTED,
    CIRCUIT_OPEN,
    TIMEOUT,
    BACKEND_UNAVAILABLE,
    INTERNAL_ERROR
};

[[nodiscard]] inline const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE:                return "none";
        case ErrorKind::INVALID_INPUT:       return "invalid_input";
        case ErrorKind::SECURITY_VIOLATION:  return "security_violation";
        case ErrorKind::VALIDATION_FAILED:   return "validation_failed";
        case ErrorKind::GENERATION_FAILED:   return "generation_failed";
        case ErrorKind::GENERATION_TIMEOUT:  return "generation_timeout";
        case ErrorKind::UNANSWERABLE:        return "unanswerable";
        case ErrorKind::EXECUTION_FAILED:    return "execution_failed";
        case ErrorKind::TRANSIENT_EXHAUSTED: return "transient_exhausted";
        case ErrorKind::CIRCUIT_OPEN:        return "circuit_open";
        case ErrorKind::TIMEOUT:             return "timeout";
        case ErrorKind::BACKEND_UNAVAILABLE: return "backend_unavailable";
        case ErrorKind::INTERNAL_ERROR:      return "internal_error";
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

    static Result error(ErrorKind kind, std::string message,
                        std::vector<std::string> suggestions = {}) {
        Result r;
        r.success_ = false;
        r.error_kind_ = kind;
        r.error_message_ = std::move(message);
        r.suggestions_ = std::move(suggestions);
        return r;
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    ErrorKind error_kind() const { return error_kind_; }
    const std::string& error_message() const { return error_message_; }
    const std::vector<std::string>& suggestions() const { return suggestions_; }

private:
    bool success_ = false;
    std::optional<T> value_;
    ErrorKind error_kind_ = ErrorKind::NONE;
    std::string error_message_;
    std::vector<std::string> suggestions_;
};

} // namespace sqlrag
