#pragma once
#include <string>
#include <variant>

namespace prompt_guard::core::errors {

    // 1. Typed error categories
    enum class ErrorCategory {
        Input,     // E.g., unknown CLI flag or unreadable --input file
        Framing,   // E.g., hook payload is not JSON or has the wrong shape
        Internal   // E.g., a pattern failed to compile or a stream broke
    };

    // The standardized error payload
    struct GuardError {
            ErrorCategory category;
            std::string message;
            std::string code = "unknown_error";
            std::string hint = "";              // Helpful tips for the user
        };

    // 2. Propagation strategy: a Result holds either a value of type T, OR a GuardError.
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
            case ErrorCategory::Input:    return "input";
            case ErrorCategory::Framing:  return "framing";
            case ErrorCategory::Internal: return "internal";
            default: return "unknown";
        }
    }

} // namespace prompt_guard::core::errors
