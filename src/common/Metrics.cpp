#include "common/Metrics.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace cfe::common::metrics {
namespace {

double quantile(const std::vector<double>& sorted, double q) {
    if (sorted.empty()) {
        return 0.0;
    }
    if (sorted.size() == 1U) {
        return sorted.front();
    }

    const double position = std::clamp(q, 0.0, 1.0) * static_cast<double>(sorted.size() - 1U);
    const auto lower = static_cast<std::size_t>(std::floor(position));
    const auto upper = static_cast<std::size_t>(std::ceil(position));
    if (lower == upper) {
        return sorted[lower];
    }

    const double weight = position - static_cast<double>(lower);
    return sorted[lower] + weight * (sorted[upper] - sorted[lower]);
}

}  // namespace

Registry::Registry() : startTime_(std::chrono::steady_clock::now()) {}

Registry& Registry::instance() {
    static Registry instance;
    return instance;
}

Registry::ScopedTimer::ScopedTimer(std::string routeKey)
    : impl_(std::make_unique<ScopedTimerImpl>(Registry::instance(), routeKey)) {}

Registry::ScopedTimer::~ScopedTimer() = default;

void Registry::incrementRequest(const std::string& routeKey) {
    ensureRouteMetrics(routeKey).totalRequests.fetch_add(1U, std::memory_order_relaxed);
}

void Registry::incrementCounter(const std::string& counterKey, std::uint64_t value) {
    if (value == 0U) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    counters_[counterKey] += value;
}

std::uint64_t Registry::counter(const std::string& counterKey) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = counters_.find(counterKey);
    return it != counters_.end() ? it->second : 0U;
}

Registry::Snapshot Registry::snapshot() const {
    Snapshot snapshot;
    snapshot.startTime = startTime_;
    snapshot.capturedAt = std::chrono::steady_clock::now();

    std::lock_guard<std::mutex> lock(mutex_);
    snapshot.routes.reserve(routeMetrics_.size());
    for (const auto& [routeKey, metrics] : routeMetrics_) {
        RouteSnapshot route;
        route.totalRequests = metrics->totalRequests.load(std::memory_order_relaxed);

        auto latencies = metrics->copyLatencies();
        if (!latencies.empty()) {
            std::sort(latencies.begin(), latencies.end());
            route.p95Ms = quantile(latencies, 0.95);
            route.p99Ms = quantile(latencies, 0.99);
        }
        snapshot.routes.emplace(routeKey, route);
    }
    snapshot.counters = counters_;
    return snapshot;
}

void Registry::RouteMetrics::addLatency(double latencyMs) {
    std::lock_guard<std::mutex> lock(latenciesMutex);
    if (latenciesMs.size() < kLatencyWindow) {
        latenciesMs.push_back(latencyMs);
        return;
    }
    latenciesMs[nextSlot] = latencyMs;
    nextSlot = (nextSlot + 1U) % kLatencyWindow;
}

std::vector<double> Registry::RouteMetrics::copyLatencies() const {
    std::lock_guard<std::mutex> lock(latenciesMutex);
    return latenciesMs;
}

Registry::RouteMetrics& Registry::ensureRouteMetrics(const std::string& routeKey) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto [it, inserted] = routeMetrics_.try_emplace(routeKey, nullptr);
    if (inserted) {
        it->second = std::make_unique<RouteMetrics>();
    }
    return *it->second;
}

Registry::ScopedTimerImpl::ScopedTimerImpl(Registry& registry, const std::string& routeKey)
    : metrics_(&registry.ensureRouteMetrics(routeKey)), start_(std::chrono::steady_clock::now()) {}

Registry::ScopedTimerImpl::~ScopedTimerImpl() {
    const auto elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start_);
    metrics_->addLatency(elapsed.count());
}

}  // namespace cfe::common::metrics
