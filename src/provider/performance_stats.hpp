#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

namespace warden::provider {

struct StatsSnapshot {
    std::uint64_t total_requests = 0;
    std::uint64_t successful_requests = 0;
    std::uint64_t failed_requests = 0;
    std::uint64_t attempts = 0;
    std::uint64_t retries = 0;
    std::uint64_t total_duration_ms = 0;

    // Mean latency of successful requests; 0 when there are none.
    double average_duration_ms() const;
    // Percentage in [0, 100]; 100 when nothing has been recorded.
    double success_rate() const;
};

// Counters shared by reference between whoever issues API calls and whoever
// reports on them. Only terminal outcomes count as requests.
class PerformanceStats {
public:
    void record_attempt();
    void record_retry();
    void record_success(std::chrono::milliseconds duration);
    void record_failure();

    StatsSnapshot snapshot() const;

private:
    std::atomic<std::uint64_t> total_requests_{0};
    std::atomic<std::uint64_t> successful_requests_{0};
    std::atomic<std::uint64_t> failed_requests_{0};
    std::atomic<std::uint64_t> attempts_{0};
    std::atomic<std::uint64_t> retries_{0};
    std::atomic<std::uint64_t> total_duration_ms_{0};
};

}  // namespace warden::provider
