#pragma once

#include <string>

#include <boost/json/object.hpp>
#include <boost/json/value.hpp>

#include "common/Metrics.hpp"
#include "di/ScopeManager.hpp"
#include "reactive/ReactiveHub.hpp"

namespace zen::app {

// JSON renderings of the runtime's observability snapshots.
boost::json::object toJson(const reactive::MemoryStats& stats);
boost::json::object toJson(const reactive::HealthStatus& health);
boost::json::object toJson(const di::ScopeManager::Stats& stats);
boost::json::object toJson(const common::metrics::Registry::Snapshot& snapshot);

std::string serializeJson(const boost::json::value& value);

}  // namespace zen::app
