#pragma once
#include <string>
#include <variant>

namespace scriptgate::core::errors {

    // 1. Typed error categories
    enum class ErrorCategory {
        Input,      // E.g., malformed CLI flag or workflow argument
        Policy,     // E.g., script rejected by the static safety gate
        Execution,  // E.g., interpreter could not be spawned
        Internal    // E.g., filesystem failure while preparing a run
    };

    // The standardized error payload
    struct GateError {
            ErrorCategory category;
            std::string message;
            std::string code = "unknown_error";
            std::string hint = "";              // Usage line or fix-up tip for the caller
        };

    // 2. Propagation strategy: a Result holds either a value of type T or a GateError.
    template <typename T>
    using Result = std::variant<T, GateError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<GateError>(result);
    }

    template <typename T>
    const GateError& get_error(const Result<T>& result) {
        return std::get<GateError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input:     return "input";
            case ErrorCategory::Policy:    return "policy";
            case ErrorCategory::Execution: return "execution";
            case ErrorCategory::Internal:  return "internal";
            default: return "unknown";
        }
    }

} // namespace scriptgate::core::errors
