#include "provider/performance_stats.hpp"

namespace warden::provider {

double StatsSnapshot::average_duration_ms() const {
    if (successful_requests == 0) {
        return 0.0;
    }
    return static_cast<double>(total_duration_ms) / static_cast<double>(successful_requests);
}

double StatsSnapshot::success_rate() const {
    if (total_requests == 0) {
        return 100.0;
    }
    return static_cast<double>(successful_requests) / static_cast<double>(total_requests) *
           100.0;
}

void PerformanceStats::record_attempt() {
    attempts_.fetch_add(1, std::memory_order_relaxed);
}

void PerformanceStats::record_retry() {
    retries_.fetch_add(1, std::memory_order_relaxed);
}

void PerformanceStats::record_success(const std::chrono::milliseconds duration) {
    total_requests_.fetch_add(1, std::memory_order_relaxed);
    successful_requests_.fetch_add(1, std::memory_order_relaxed);
    const auto count = duration.count();
    total_duration_ms_.fetch_add(count > 0 ? static_cast<std::uint64_t>(count) : 0,
                                 std::memory_order_relaxed);
}

void PerformanceStats::record_failure() {
    total_requests_.fetch_add(1, std::memory_order_relaxed);
    failed_requests_.fetch_add(1, std::memory_order_relaxed);
}

StatsSnapshot PerformanceStats::snapshot() const {
    StatsSnapshot snapshot;
    snapshot.total_requests = total_requests_.load(std::memory_order_relaxed);
    snapshot.successful_requests = successful_requests_.load(std::memory_order_relaxed);
    snapshot.failed_requests = failed_requests_.load(std::memory_order_relaxed);
    snapshot.attempts = attempts_.load(std::memory_order_relaxed);
    snapshot.retries = retries_.load(std::memory_order_relaxed);
    snapshot.total_duration_ms = total_duration_ms_.load(std::memory_order_relaxed);
    return snapshot;
}

}  // namespace warden::provider
