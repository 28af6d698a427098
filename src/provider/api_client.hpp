#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/agent_errors.hpp"
#include "policy/policy_guard.hpp"
#include "protocol/message_contract.hpp"
#include "provider/api_error.hpp"
#include "provider/http_transport.hpp"
#include "provider/performance_stats.hpp"
#include "provider/wire_codec.hpp"

namespace warden::provider {

// Exponential backoff for retryable failures. A retry is skipped when its
// delay would push the total elapsed time past `budget`.
struct RetryPolicy {
    std::chrono::milliseconds initial_delay{1000};
    double multiplier = 2.0;
    std::chrono::milliseconds max_delay{30000};
    std::chrono::milliseconds budget{120000};
    std::uint32_t max_retries = 3;
};

struct ClientConfig {
    std::string api_base_url = "https://api.anthropic.com";
    std::uint64_t timeout_ms = 120000;
    std::string correlation_id;
    RequestOptions request;
    RetryPolicy retry;
};

// Replaces the real wait between retries (tests record delays instead).
using Sleeper = std::function<void(std::chrono::milliseconds)>;

// What the orchestrator talks to. One whole request/response per call.
class ModelClient {
public:
    virtual ~ModelClient() = default;

    virtual core::errors::Result<protocol::ModelResponse> send(
        const std::vector<protocol::Message>& history, bool tools_enabled,
        const std::shared_ptr<std::atomic_bool>& cancel_token) = 0;
};

class ResilientApiClient final : public ModelClient {
public:
    ResilientApiClient(policy::ValidatedKey api_key, ClientConfig config,
                       std::shared_ptr<HttpTransport> transport,
                       std::shared_ptr<PerformanceStats> stats, Sleeper sleeper = {});

    core::errors::Result<protocol::ModelResponse> send(
        const std::vector<protocol::Message>& history, bool tools_enabled,
        const std::shared_ptr<std::atomic_bool>& cancel_token) override;

    // Retries retryable failures per the policy and records one terminal
    // outcome in the stats.
    ApiResult<protocol::ModelResponse> send_with_retry(
        const std::string& body, const std::shared_ptr<std::atomic_bool>& cancel_token);

    // Maps a transport result to the error taxonomy; nullopt for 2xx.
    static std::optional<ApiError> classify(const HttpResponse& response,
                                            std::uint64_t timeout_ms);

    const std::shared_ptr<PerformanceStats>& stats() const { return stats_; }

private:
    ApiResult<protocol::ModelResponse> attempt(
        const std::string& body, const std::shared_ptr<std::atomic_bool>& cancel_token);
    std::chrono::milliseconds delay_for(std::uint32_t retry_index, const ApiError& error) const;
    HeaderMap request_headers() const;
    void wait_before_retry(std::chrono::milliseconds delay,
                           const std::shared_ptr<std::atomic_bool>& cancel_token) const;

    policy::ValidatedKey api_key_;
    ClientConfig config_;
    std::string url_;
    std::shared_ptr<HttpTransport> transport_;
    std::shared_ptr<PerformanceStats> stats_;
    Sleeper sleeper_;
};

}  // namespace warden::provider
