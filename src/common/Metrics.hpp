#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace cfe::common::metrics {

// Process-wide request and ingest counters, served by GET /stats.
class Registry {
private:
    class ScopedTimerImpl;

public:
    // Latency quantiles are computed over the most recent samples only.
    static constexpr std::size_t kLatencyWindow = 1024;

    struct RouteSnapshot {
        std::uint64_t totalRequests{0};
        std::optional<double> p95Ms{};
        std::optional<double> p99Ms{};
    };

    struct Snapshot {
        std::chrono::steady_clock::time_point startTime;
        std::chrono::steady_clock::time_point capturedAt;
        std::unordered_map<std::string, RouteSnapshot> routes;
        std::unordered_map<std::string, std::uint64_t> counters;
    };

    class ScopedTimer {
    public:
        explicit ScopedTimer(std::string routeKey);
        ~ScopedTimer();

        ScopedTimer(const ScopedTimer&) = delete;
        ScopedTimer& operator=(const ScopedTimer&) = delete;

    private:
        std::unique_ptr<ScopedTimerImpl> impl_;
    };

    static Registry& instance();

    void incrementRequest(const std::string& routeKey);
    void incrementCounter(const std::string& counterKey, std::uint64_t value = 1U);
    std::uint64_t counter(const std::string& counterKey) const;
    Snapshot snapshot() const;

private:
    struct RouteMetrics {
        std::atomic<std::uint64_t> totalRequests{0};
        mutable std::mutex latenciesMutex;
        std::vector<double> latenciesMs;
        std::size_t nextSlot{0};

        void addLatency(double latencyMs);
        std::vector<double> copyLatencies() const;
    };

    class ScopedTimerImpl {
    public:
        ScopedTimerImpl(Registry& registry, const std::string& routeKey);
        ~ScopedTimerImpl();

    private:
        RouteMetrics* metrics_{nullptr};
        std::chrono::steady_clock::time_point start_;
    };

    Registry();

    RouteMetrics& ensureRouteMetrics(const std::string& routeKey);

    const std::chrono::steady_clock::time_point startTime_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::unique_ptr<RouteMetrics>> routeMetrics_;
    std::unordered_map<std::string, std::uint64_t> counters_;
};

}  // namespace cfe::common::metrics
