#include "common/Config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <limits>
#include <stdexcept>
#include <string>

namespace zen::common {
namespace {

std::string toLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

std::string trim(std::string value) {
    auto isSpace = [](unsigned char ch) { return std::isspace(ch) != 0; };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(), [&](unsigned char ch) {
                   return !isSpace(ch);
               }));
    value.erase(std::find_if(value.rbegin(), value.rend(), [&](unsigned char ch) {
                    return !isSpace(ch);
                }).base(),
                value.end());
    return value;
}

// Digits only: std::stoull would accept "-1" (wrapping) and trailing junk.
unsigned long long parseUnsigned(const std::string& value) {
    if (value.empty() || !std::isdigit(static_cast<unsigned char>(value.front()))) {
        throw std::invalid_argument("not an unsigned number");
    }
    std::size_t consumed = 0;
    const auto parsed = std::stoull(value, &consumed);
    if (consumed != value.size()) {
        throw std::invalid_argument("trailing characters");
    }
    return parsed;
}

std::uint32_t parseInterval(const std::string& value, const std::string& label) {
    try {
        const auto parsed = parseUnsigned(value);
        if (parsed == 0U || parsed > std::numeric_limits<std::uint32_t>::max()) {
            throw std::out_of_range("interval out of range");
        }
        return static_cast<std::uint32_t>(parsed);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid value for " + label + ": " + value);
    }
}

std::size_t parseCount(const std::string& value, const std::string& label) {
    try {
        const auto parsed = parseUnsigned(value);
        if (parsed == 0U || parsed > std::numeric_limits<std::size_t>::max()) {
            throw std::out_of_range("count must be >= 1");
        }
        return static_cast<std::size_t>(parsed);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid value for " + label + ": " + value);
    }
}

double parsePercent(const std::string& value, const std::string& label) {
    try {
        std::size_t consumed = 0;
        const double parsed = std::stod(value, &consumed);
        if (consumed != value.size() || parsed < 0.0 || parsed > 100.0) {
            throw std::out_of_range("percent out of range");
        }
        return parsed;
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid value for " + label + ": " + value);
    }
}

std::string valueFromArgs(int argc, char** argv, const std::string& key) {
    const std::string withEquals = key + '=';
    for (int i = 1; i < argc; ++i) {
        std::string arg{argv[i]};
        if (arg == key && i + 1 < argc) {
            return argv[i + 1];
        }
        if (arg.rfind(withEquals, 0) == 0) {
            return arg.substr(withEquals.size());
        }
    }
    return {};
}

}  // namespace

Config Config::fromArgs(int argc, char** argv) {
    Config config{};

    if (const char* envLogLevel = std::getenv("ZEN_LOG_LEVEL")) {
        config.logLevel = zen::log::levelFromString(toLower(trim(envLogLevel)));
    }
    if (const char* envInterval = std::getenv("ZEN_HUB_MAINTENANCE_INTERVAL")) {
        config.hubMaintenanceInterval = parseInterval(trim(envInterval), "ZEN_HUB_MAINTENANCE_INTERVAL");
    }
    if (const char* envDepth = std::getenv("ZEN_CYCLE_DEPTH_LIMIT")) {
        config.cycleDepthLimit = parseCount(trim(envDepth), "ZEN_CYCLE_DEPTH_LIMIT");
    }

    if (auto levelArg = valueFromArgs(argc, argv, "--log-level"); !levelArg.empty()) {
        config.logLevel = zen::log::levelFromString(toLower(levelArg));
    }
    if (auto intervalArg = valueFromArgs(argc, argv, "--hub-maintenance-interval"); !intervalArg.empty()) {
        config.hubMaintenanceInterval = parseInterval(intervalArg, "--hub-maintenance-interval");
    }
    if (auto warnKeyArg = valueFromArgs(argc, argv, "--hub-warn-listeners-per-key"); !warnKeyArg.empty()) {
        config.hubWarnListenersPerKey = parseCount(warnKeyArg, "--hub-warn-listeners-per-key");
    }
    if (auto criticalKeyArg = valueFromArgs(argc, argv, "--hub-critical-listeners-per-key");
        !criticalKeyArg.empty()) {
        config.hubCriticalListenersPerKey = parseCount(criticalKeyArg, "--hub-critical-listeners-per-key");
    }
    if (auto warnTotalArg = valueFromArgs(argc, argv, "--hub-warn-total-listeners"); !warnTotalArg.empty()) {
        config.hubWarnTotalListeners = parseCount(warnTotalArg, "--hub-warn-total-listeners");
    }
    if (auto criticalTotalArg = valueFromArgs(argc, argv, "--hub-critical-total-listeners");
        !criticalTotalArg.empty()) {
        config.hubCriticalTotalListeners = parseCount(criticalTotalArg, "--hub-critical-total-listeners");
    }
    if (auto warnRateArg = valueFromArgs(argc, argv, "--hub-warn-error-rate"); !warnRateArg.empty()) {
        config.hubWarnErrorRatePct = parsePercent(warnRateArg, "--hub-warn-error-rate");
    }
    if (auto criticalRateArg = valueFromArgs(argc, argv, "--hub-critical-error-rate"); !criticalRateArg.empty()) {
        config.hubCriticalErrorRatePct = parsePercent(criticalRateArg, "--hub-critical-error-rate");
    }
    if (auto depthArg = valueFromArgs(argc, argv, "--cycle-depth-limit"); !depthArg.empty()) {
        config.cycleDepthLimit = parseCount(depthArg, "--cycle-depth-limit");
    }
    if (auto rootArg = valueFromArgs(argc, argv, "--root-scope-name"); !rootArg.empty()) {
        auto rootName = trim(rootArg);
        if (!rootName.empty()) {
            config.rootScopeName = std::move(rootName);
        }
    }

    if (config.hubCriticalListenersPerKey < config.hubWarnListenersPerKey) {
        config.hubCriticalListenersPerKey = config.hubWarnListenersPerKey;
    }
    if (config.hubCriticalTotalListeners < config.hubWarnTotalListeners) {
        config.hubCriticalTotalListeners = config.hubWarnTotalListeners;
    }
    if (config.hubCriticalErrorRatePct < config.hubWarnErrorRatePct) {
        config.hubCriticalErrorRatePct = config.hubWarnErrorRatePct;
    }

    LOG_DEBUG("Config loaded: logLevel=" << zen::log::levelToString(config.logLevel)
                                         << " maintenanceInterval=" << config.hubMaintenanceInterval
                                         << " cycleDepthLimit=" << config.cycleDepthLimit);

    return config;
}

}  // namespace zen::common
