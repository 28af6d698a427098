#include <chrono>
#include <cstdint>
#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include "provider/performance_stats.hpp"

namespace {

using warden::provider::PerformanceStats;
using warden::provider::StatsSnapshot;

TEST(PerformanceStatsTest, EmptyStatsReportFullSuccessAndZeroAverage) {
    const StatsSnapshot stats = PerformanceStats().snapshot();
    EXPECT_EQ(stats.total_requests, 0u);
    EXPECT_DOUBLE_EQ(stats.success_rate(), 100.0);
    EXPECT_DOUBLE_EQ(stats.average_duration_ms(), 0.0);
}

TEST(PerformanceStatsTest, AveragesOnlySuccessfulRequests) {
    PerformanceStats stats;
    stats.record_success(std::chrono::milliseconds(100));
    stats.record_success(std::chrono::milliseconds(300));
    stats.record_failure();
    stats.record_failure();

    const auto snapshot = stats.snapshot();
    EXPECT_EQ(snapshot.total_requests, 4u);
    EXPECT_EQ(snapshot.successful_requests, 2u);
    EXPECT_EQ(snapshot.failed_requests, 2u);
    EXPECT_DOUBLE_EQ(snapshot.average_duration_ms(), 200.0);
    EXPECT_DOUBLE_EQ(snapshot.success_rate(), 50.0);

    const auto failures_only = [] {
        PerformanceStats only_failures;
        only_failures.record_failure();
        return only_failures.snapshot();
    }();
    EXPECT_DOUBLE_EQ(failures_only.average_duration_ms(), 0.0);
    EXPECT_DOUBLE_EQ(failures_only.success_rate(), 0.0);
}

TEST(PerformanceStatsTest, AttemptsAndRetriesAreNotRequests) {
    PerformanceStats stats;
    stats.record_attempt();
    stats.record_retry();
    stats.record_attempt();
    const auto snapshot = stats.snapshot();
    EXPECT_EQ(snapshot.attempts, 2u);
    EXPECT_EQ(snapshot.retries, 1u);
    EXPECT_EQ(snapshot.total_requests, 0u);
}

TEST(PerformanceStatsTest, ConcurrentUpdatesAreNotLost) {
    PerformanceStats stats;
    constexpr int kThreads = 8;
    constexpr int kPerThread = 1000;

    std::vector<std::thread> workers;
    for (int t = 0; t < kThreads; ++t) {
        workers.emplace_back([&stats, t] {
            for (int i = 0; i < kPerThread; ++i) {
                stats.record_attempt();
                if (t % 2 == 0) {
                    stats.record_success(std::chrono::milliseconds(1));
                } else {
                    stats.record_failure();
                }
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    const auto snapshot = stats.snapshot();
    EXPECT_EQ(snapshot.attempts, static_cast<std::uint64_t>(kThreads * kPerThread));
    EXPECT_EQ(snapshot.total_requests, static_cast<std::uint64_t>(kThreads * kPerThread));
    EXPECT_EQ(snapshot.successful_requests, snapshot.failed_requests);
    EXPECT_EQ(snapshot.total_duration_ms, static_cast<std::uint64_t>(kThreads / 2 * kPerThread));
    EXPECT_DOUBLE_EQ(snapshot.success_rate(), 50.0);
}

}  // namespace
