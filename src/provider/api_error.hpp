#pragma once
#include <cstdint>
#include <string>
#include <variant>
#include "core/errors/agent_errors.hpp"

namespace warden::provider {

    // Closed set of failures the model endpoint can produce.
    enum class ApiErrorKind {
        HttpError,       // any other non-2xx status
        RateLimit,       // 429
        Authentication,  // 401
        Overloaded,      // 529
        InvalidRequest,  // 400
        Network,
        Timeout,
        ParseError
    };

    struct ApiError {
        ApiErrorKind kind;
        std::string detail;  // response body or transport cause
        int status = 0;
        std::uint32_t retry_after_seconds = 0;
        std::uint32_t timeout_seconds = 0;

        // RateLimit, Overloaded, Network and Timeout are retried; the rest
        // are permanent.
        bool retryable() const {
            switch (kind) {
                case ApiErrorKind::RateLimit:
                case ApiErrorKind::Overloaded:
                case ApiErrorKind::Network:
                case ApiErrorKind::Timeout:
                    return true;
                default:
                    return false;
            }
        }
    };

    template <typename T>
    using ApiResult = std::variant<T, ApiError>;

    inline std::string to_code(const ApiErrorKind kind) {
        switch (kind) {
            case ApiErrorKind::HttpError:      return "http_error";
            case ApiErrorKind::RateLimit:      return "rate_limit";
            case ApiErrorKind::Authentication: return "authentication";
            case ApiErrorKind::Overloaded:     return "overloaded";
            case ApiErrorKind::InvalidRequest: return "invalid_request";
            case ApiErrorKind::Network:        return "network";
            case ApiErrorKind::Timeout:        return "timeout";
            case ApiErrorKind::ParseError:     return "parse_error";
            default: return "unknown";
        }
    }

    inline std::string to_string(const ApiError& error) {
        switch (error.kind) {
            case ApiErrorKind::HttpError:
                return "HTTP error " + std::to_string(error.status) + ": " + error.detail;
            case ApiErrorKind::RateLimit:
                return "Rate limit exceeded, retry after " +
                       std::to_string(error.retry_after_seconds) + " seconds";
            case ApiErrorKind::Authentication:
                return "Authentication failed: invalid API key";
            case ApiErrorKind::Overloaded:
                return "Server overloaded: " + error.detail;
            case ApiErrorKind::InvalidRequest:
                return "Invalid request: " + error.detail;
            case ApiErrorKind::Network:
                return "Network error: " + error.detail;
            case ApiErrorKind::Timeout:
                return "Request timed out after " + std::to_string(error.timeout_seconds) +
                       " seconds";
            case ApiErrorKind::ParseError:
                return "Failed to parse response: " + error.detail;
            default:
                return error.detail;
        }
    }

    inline core::errors::AgentError to_agent_error(const ApiError& error) {
        std::string hint;
        if (error.kind == ApiErrorKind::Authentication) {
            hint = "Check ANTHROPIC_API_KEY or .warden/settings.json.";
        }
        return core::errors::AgentError{core::errors::ErrorCategory::Provider,
                                        to_string(error), to_code(error.kind), hint};
    }

} // namespace warden::provider
