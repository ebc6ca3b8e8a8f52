#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>

namespace zen::common::metrics {

// Process-wide counters, gauges and timers. Shared by every Runtime in the
// process. Nothing in the library reads these values back.
class Registry {
public:
    struct TimerStats {
        std::uint64_t samples{0};
        double totalMs{0.0};
        double maxMs{0.0};
    };

    struct Snapshot {
        double uptimeSeconds{0.0};
        std::map<std::string, std::uint64_t> counters;
        std::map<std::string, double> gauges;
        std::map<std::string, TimerStats> timers;
    };

    // Records the elapsed wall time under timerKey when destroyed.
    class ScopedTimer {
    public:
        explicit ScopedTimer(std::string timerKey);
        ~ScopedTimer();

        ScopedTimer(const ScopedTimer&) = delete;
        ScopedTimer& operator=(const ScopedTimer&) = delete;

    private:
        std::string key_;
        std::chrono::steady_clock::time_point start_;
    };

    static Registry& instance();

    void incrementCounter(const std::string& counterKey, std::uint64_t value = 1U);
    void setGauge(const std::string& gaugeKey, double value);
    void recordTiming(const std::string& timerKey, double elapsedMs);

    std::uint64_t counter(const std::string& counterKey) const;
    Snapshot snapshot() const;
    void reset();

private:
    Registry();

    const std::chrono::steady_clock::time_point startTime_;
    mutable std::mutex mutex_;
    std::map<std::string, std::uint64_t> counters_;
    std::map<std::string, double> gauges_;
    std::map<std::string, TimerStats> timers_;
};

}  // namespace zen::common::metrics
