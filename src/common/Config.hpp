#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "common/Log.hpp"

namespace zen::common {

struct Config {
    zen::log::Level logLevel = zen::log::Level::Info;

    // Reactive hub maintenance runs once every N notifications.
    std::uint32_t hubMaintenanceInterval = 100;

    std::size_t hubWarnListenersPerKey = 50;
    std::size_t hubCriticalListenersPerKey = 100;
    std::size_t hubWarnTotalListeners = 500;
    std::size_t hubCriticalTotalListeners = 1000;

    // Listener error rates (percent of invocations) reported as WARNING / CRITICAL.
    double hubWarnErrorRatePct = 1.0;
    double hubCriticalErrorRatePct = 10.0;

    // Dependency-graph walks deeper than this are reported as cycles.
    std::size_t cycleDepthLimit = 100;

    std::string rootScopeName = "RootScope";

    static Config fromArgs(int argc, char** argv);
};

}  // namespace zen::common
