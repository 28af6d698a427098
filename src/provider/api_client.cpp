#include "provider/api_client.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <system_error>
#include <thread>
#include <utility>
#include "core/logging/logger.hpp"

namespace warden::provider {

namespace {

constexpr std::uint32_t kDefaultRetryAfterSeconds = 60;
constexpr std::chrono::milliseconds kCancelPollInterval{50};

std::uint32_t parse_retry_after(const HeaderMap& headers) {
    const auto it = headers.find("retry-after");
    if (it == headers.end()) {
        return kDefaultRetryAfterSeconds;
    }
    std::uint32_t seconds = 0;
    const char* begin = it->second.data();
    const char* end = it->second.data() + it->second.size();
    const auto [ptr, ec] = std::from_chars(begin, end, seconds);
    if (ec != std::errc() || ptr != end) {
        return kDefaultRetryAfterSeconds;
    }
    return seconds;
}

bool cancelled(const std::shared_ptr<std::atomic_bool>& token) {
    return token && token->load();
}

ApiError cancellation_error() {
    return ApiError{ApiErrorKind::Network, "request cancelled"};
}

}  // namespace

ResilientApiClient::ResilientApiClient(policy::ValidatedKey api_key, ClientConfig config,
                                       std::shared_ptr<HttpTransport> transport,
                                       std::shared_ptr<PerformanceStats> stats,
                                       Sleeper sleeper)
    : api_key_(std::move(api_key)),
      config_(std::move(config)),
      url_(messages_url(config_.api_base_url)),
      transport_(std::move(transport)),
      stats_(std::move(stats)),
      sleeper_(std::move(sleeper)) {
    if (!stats_) {
        stats_ = std::make_shared<PerformanceStats>();
    }
}

core::errors::Result<protocol::ModelResponse> ResilientApiClient::send(
    const std::vector<protocol::Message>& history, const bool tools_enabled,
    const std::shared_ptr<std::atomic_bool>& cancel_token) {
    const std::string body = encode_request(history, config_.request, tools_enabled);
    auto result = send_with_retry(body, cancel_token);
    if (std::holds_alternative<ApiError>(result)) {
        return to_agent_error(std::get<ApiError>(result));
    }
    return std::get<protocol::ModelResponse>(std::move(result));
}

std::optional<ApiError> ResilientApiClient::classify(const HttpResponse& response,
                                                     const std::uint64_t timeout_ms) {
    if (response.timeout) {
        ApiError error{ApiErrorKind::Timeout, response.network_error_message};
        error.timeout_seconds = static_cast<std::uint32_t>(timeout_ms / 1000);
        return error;
    }
    if (response.cancelled) {
        return cancellation_error();
    }
    if (response.network_error) {
        return ApiError{ApiErrorKind::Network, response.network_error_message};
    }
    if (response.status >= 200 && response.status < 300) {
        return std::nullopt;
    }

    const int status = static_cast<int>(response.status);
    switch (status) {
        case 429: {
            ApiError error{ApiErrorKind::RateLimit, response.body, status};
            error.retry_after_seconds = parse_retry_after(response.headers);
            return error;
        }
        case 401:
            return ApiError{ApiErrorKind::Authentication, response.body, status};
        case 400:
            return ApiError{ApiErrorKind::InvalidRequest, response.body, status};
        case 529:
            return ApiError{ApiErrorKind::Overloaded, response.body, status};
        default:
            return ApiError{ApiErrorKind::HttpError, response.body, status};
    }
}

HeaderMap ResilientApiClient::request_headers() const {
    HeaderMap headers;
    headers["x-api-key"] = api_key_.value();
    headers["anthropic-version"] = kAnthropicVersion;
    headers["content-type"] = "application/json";
    if (!config_.correlation_id.empty()) {
        headers["x-request-id"] = config_.correlation_id;
    }
    return headers;
}

ApiResult<protocol::ModelResponse> ResilientApiClient::attempt(
    const std::string& body, const std::shared_ptr<std::atomic_bool>& cancel_token) {
    stats_->record_attempt();
    const HttpResponse response =
        transport_->post_json(url_, request_headers(), body, config_.timeout_ms, cancel_token);

    auto error = classify(response, config_.timeout_ms);
    if (error.has_value()) {
        return *error;
    }
    return decode_response(response.body);
}

std::chrono::milliseconds ResilientApiClient::delay_for(const std::uint32_t retry_index,
                                                        const ApiError& error) const {
    const auto& policy = config_.retry;
    const double scaled = static_cast<double>(policy.initial_delay.count()) *
                          std::pow(policy.multiplier, static_cast<double>(retry_index));
    const double capped = std::min(scaled, static_cast<double>(policy.max_delay.count()));
    auto delay = std::chrono::milliseconds(static_cast<std::int64_t>(capped));

    if (error.kind == ApiErrorKind::RateLimit) {
        const auto requested = std::chrono::milliseconds(
            static_cast<std::int64_t>(error.retry_after_seconds) * 1000);
        delay = std::min(std::max(delay, requested), policy.max_delay);
    }
    return delay;
}

ApiResult<protocol::ModelResponse> ResilientApiClient::send_with_retry(
    const std::string& body, const std::shared_ptr<std::atomic_bool>& cancel_token) {
    const auto started = std::chrono::steady_clock::now();
    std::uint32_t retries = 0;

    while (true) {
        if (cancelled(cancel_token)) {
            stats_->record_failure();
            return cancellation_error();
        }

        auto result = attempt(body, cancel_token);
        if (!std::holds_alternative<ApiError>(result)) {
            const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - started);
            stats_->record_success(elapsed);
            if (retries > 0) {
                WARDEN_LOG_INFO("API call succeeded after " + std::to_string(retries) +
                                " retries");
            }
            return result;
        }

        const ApiError error = std::get<ApiError>(result);
        if (!error.retryable() || cancelled(cancel_token)) {
            WARDEN_LOG_ERROR("API call failed permanently: " + to_string(error));
            stats_->record_failure();
            return error;
        }
        if (retries >= config_.retry.max_retries) {
            WARDEN_LOG_ERROR("API call failed after " + std::to_string(retries) +
                             " retries: " + to_string(error));
            stats_->record_failure();
            return error;
        }

        const auto delay = delay_for(retries, error);
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
        if (elapsed + delay > config_.retry.budget) {
            WARDEN_LOG_ERROR("Retry budget exhausted after " +
                             std::to_string(elapsed.count()) + " ms: " + to_string(error));
            stats_->record_failure();
            return error;
        }

        WARDEN_LOG_WARN("Retryable API error (" + to_string(error) + "), retrying in " +
                        std::to_string(delay.count()) + " ms");
        stats_->record_retry();
        ++retries;
        wait_before_retry(delay, cancel_token);
    }
}

void ResilientApiClient::wait_before_retry(
    const std::chrono::milliseconds delay,
    const std::shared_ptr<std::atomic_bool>& cancel_token) const {
    if (sleeper_) {
        sleeper_(delay);
        return;
    }
    // Sleep in slices so a cancelled turn does not sit out the whole delay.
    const auto until = std::chrono::steady_clock::now() + delay;
    while (!cancelled(cancel_token)) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= until) {
            return;
        }
        std::this_thread::sleep_for(
            std::min<std::chrono::steady_clock::duration>(until - now, kCancelPollInterval));
    }
}

}  // namespace warden::provider
