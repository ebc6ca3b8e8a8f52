#include "app/Reports.hpp"

#include <array>
#include <cstdint>
#include <utility>

#include <boost/json/array.hpp>
#include <boost/json/serializer.hpp>

namespace zen::app {

boost::json::object toJson(const reactive::MemoryStats& stats) {
    boost::json::object object;
    object["totalKeys"] = static_cast<std::uint64_t>(stats.totalKeys);
    object["totalListeners"] = static_cast<std::uint64_t>(stats.totalListeners);
    object["maxListenersPerKey"] = static_cast<std::uint64_t>(stats.maxListenersPerKey);
    object["emptyKeys"] = static_cast<std::uint64_t>(stats.emptyKeys);
    object["notificationCount"] = stats.notificationCount;
    object["errorCount"] = stats.errorCount;
    return object;
}

boost::json::object toJson(const reactive::HealthStatus& health) {
    boost::json::object object;
    object["status"] = reactive::toString(health.status);
    object["memoryPressure"] = reactive::toString(health.memoryPressure);
    object["errorRate"] = health.errorRate;

    boost::json::array recommendations;
    for (const auto& recommendation : health.recommendations) {
        recommendations.emplace_back(recommendation);
    }
    object["recommendations"] = std::move(recommendations);
    object["stats"] = toJson(health.stats);
    return object;
}

boost::json::object toJson(const di::ScopeManager::Stats& stats) {
    boost::json::object object;
    object["totalScopes"] = static_cast<std::uint64_t>(stats.totalScopes);
    object["namedScopes"] = static_cast<std::uint64_t>(stats.namedScopes);
    object["maxDepth"] = static_cast<std::uint64_t>(stats.maxDepth);
    object["totalBindings"] = static_cast<std::uint64_t>(stats.totalBindings);
    object["totalFactories"] = static_cast<std::uint64_t>(stats.totalFactories);
    return object;
}

boost::json::object toJson(const common::metrics::Registry::Snapshot& snapshot) {
    boost::json::object counters;
    for (const auto& entry : snapshot.counters) {
        counters[entry.first] = entry.second;
    }
    boost::json::object gauges;
    for (const auto& entry : snapshot.gauges) {
        gauges[entry.first] = entry.second;
    }
    boost::json::object timers;
    for (const auto& entry : snapshot.timers) {
        boost::json::object timer;
        timer["samples"] = entry.second.samples;
        timer["totalMs"] = entry.second.totalMs;
        timer["maxMs"] = entry.second.maxMs;
        timers[entry.first] = std::move(timer);
    }

    boost::json::object object;
    object["uptimeSeconds"] = snapshot.uptimeSeconds;
    object["counters"] = std::move(counters);
    object["gauges"] = std::move(gauges);
    object["timers"] = std::move(timers);
    return object;
}

std::string serializeJson(const boost::json::value& value) {
    boost::json::serializer sr;
    sr.reset(&value);

    std::string result;
    std::array<char, 4096> buffer{};

    while (!sr.done()) {
        boost::json::string_view chunk = sr.read(buffer.data(), buffer.size());
        result.append(chunk.data(), chunk.size());
    }

    return result;
}

}  // namespace zen::app
