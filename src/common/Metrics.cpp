#include "common/Metrics.hpp"

#include <algorithm>
#include <utility>

namespace zen::common::metrics {

Registry::Registry() : startTime_(std::chrono::steady_clock::now()) {}

Registry& Registry::instance() {
    static Registry instance;
    return instance;
}

Registry::ScopedTimer::ScopedTimer(std::string timerKey)
    : key_(std::move(timerKey)), start_(std::chrono::steady_clock::now()) {}

Registry::ScopedTimer::~ScopedTimer() {
    const auto elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start_);
    Registry::instance().recordTiming(key_, elapsed.count());
}

void Registry::incrementCounter(const std::string& counterKey, std::uint64_t value) {
    if (value == 0U) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    counters_[counterKey] += value;
}

void Registry::setGauge(const std::string& gaugeKey, double value) {
    std::lock_guard<std::mutex> lock(mutex_);
    gauges_[gaugeKey] = value;
}

void Registry::recordTiming(const std::string& timerKey, double elapsedMs) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& stats = timers_[timerKey];
    ++stats.samples;
    stats.totalMs += elapsedMs;
    stats.maxMs = std::max(stats.maxMs, elapsedMs);
}

std::uint64_t Registry::counter(const std::string& counterKey) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = counters_.find(counterKey);
    return it == counters_.end() ? 0U : it->second;
}

Registry::Snapshot Registry::snapshot() const {
    Snapshot snapshot;
    snapshot.uptimeSeconds =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - startTime_).count();

    std::lock_guard<std::mutex> lock(mutex_);
    snapshot.counters = counters_;
    snapshot.gauges = gauges_;
    snapshot.timers = timers_;
    return snapshot;
}

void Registry::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    counters_.clear();
    gauges_.clear();
    timers_.clear();
}

}  // namespace zen::common::metrics
