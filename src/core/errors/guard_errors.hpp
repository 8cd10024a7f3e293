#pragma once
#include <string>
#include <variant>

namespace trustgate::core::errors {

    enum class ErrorCategory {
        Input,
        Execution,
        Policy,     // a guard refused the request
        Config,
        Internal
    };

    struct GuardError {
        ErrorCategory category;
        std::string message;
        std::string code = "unknown_error";
        std::string hint = "";
    };

    // Path rejections are ordinary GuardErrors with category Policy.
    using PathSecurityError = GuardError;

    template <typename T>
    using Result = std::variant<T, GuardError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<GuardError>(result);
    }

    template <typename T>
    const GuardError& get_error(const Result<T>& result) {
        return std::get<GuardError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    template <typename T>
    T& get_value(Result<T>& result) {
        return std::get<T>(result);
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input: return "input";
            case ErrorCategory::Execution: return "execution";
            case ErrorCategory::Policy: return "policy";
            case ErrorCategory::Config: return "config";
            case ErrorCategory::Internal: return "internal";
            default: return "unknown";
        }
    }

} // namespace trustgate::core::errors
