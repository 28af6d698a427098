#pragma once
#include <optional>
#include <string>
#include <variant>

namespace warden::core::errors {

    // 1. Typed error categories shared by every layer
    enum class ErrorCategory {
        Input,      // Malformed input: empty strings, missing tool fields, bad flags
        Execution,  // A tool ran and failed: I/O errors, decode failures, unknown tool
        Provider,   // The model endpoint failed (see provider::ApiError for the detail)
        Policy,     // A validator rejected untrusted input
        Internal    // pipe/fork failures, logic bugs
    };

    // The standardized error payload
    struct AgentError {
        ErrorCategory category;
        std::string message;
        std::string code = "unknown_error";
        std::string hint = "";
    };

    // 2. Propagation strategy: a Result holds either a value of type T or an AgentError.
    template <typename T>
    using Result = std::variant<T, AgentError>;

    // Operations with no value to return report success as an empty optional.
    using Status = std::optional<AgentError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<AgentError>(result);
    }

    template <typename T>
    const AgentError& get_error(const Result<T>& result) {
        return std::get<AgentError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    template <typename T>
    T take_value(Result<T>&& result) {
        return std::get<T>(std::move(result));
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Input:     return "input";
            case ErrorCategory::Execution: return "execution";
            case ErrorCategory::Provider:  return "provider";
            case ErrorCategory::Policy:    return "policy";
            case ErrorCategory::Internal:  return "internal";
            default: return "unknown";
        }
    }

    // "[policy/blocked_command] Command contains blocked operation: reboot"
    inline std::string describe(const AgentError& error) {
        std::string text = "[" + to_string(error.category) + "/" + error.code + "] " +
                           error.message;
        if (!error.hint.empty()) {
            text += " (hint: " + error.hint + ")";
        }
        return text;
    }

} // namespace warden::core::errors
