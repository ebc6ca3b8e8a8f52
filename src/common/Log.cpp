#include "common/Log.hpp"

#include <algorithm>
#include <array>
#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <utility>

namespace zen::log {
namespace {

std::atomic<Level> g_level{Level::Info};
std::mutex g_outputMutex;
Sink g_sink;

struct LevelName {
    std::string_view text;
    Level level;
};

constexpr std::array<LevelName, 10> kLevelNames{{
    {"debug", Level::Debug},
    {"trace", Level::Debug},
    {"info", Level::Info},
    {"warn", Level::Warn},
    {"warning", Level::Warn},
    {"err", Level::Error},
    {"error", Level::Error},
    {"off", Level::Off},
    {"none", Level::Off},
    {"quiet", Level::Off},
}};

// "2024-01-31 12:00:00.123 WARN  [tid] "
std::string linePrefix(Level level) {
    const auto now = std::chrono::system_clock::now();
    const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    const auto millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;

    std::tm local{};
#if defined(_WIN32)
    localtime_s(&local, &seconds);
#else
    localtime_r(&seconds, &local);
#endif

    std::ostringstream prefix;
    prefix << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << millis
           << ' ' << std::left << std::setw(5) << std::setfill(' ') << levelToString(level) << " ["
           << std::this_thread::get_id() << "] ";
    return prefix.str();
}

}  // namespace

void setLevel(Level level) noexcept {
    g_level.store(level, std::memory_order_relaxed);
}

Level getLevel() noexcept {
    return g_level.load(std::memory_order_relaxed);
}

bool shouldLog(Level level) noexcept {
    return level != Level::Off && static_cast<int>(level) >= static_cast<int>(getLevel());
}

void setSink(Sink sink) {
    std::lock_guard<std::mutex> lock(g_outputMutex);
    g_sink = std::move(sink);
}

void log(Level level, const std::string& message) {
    std::lock_guard<std::mutex> lock(g_outputMutex);
    if (g_sink) {
        g_sink(level, message);
        return;
    }
    std::ostream& out = level >= Level::Warn ? std::cerr : std::cout;
    out << linePrefix(level) << message << '\n';
    if (level >= Level::Warn) {
        out.flush();
    }
}

const char* levelToString(Level level) noexcept {
    switch (level) {
    case Level::Debug:
        return "DEBUG";
    case Level::Info:
        return "INFO";
    case Level::Warn:
        return "WARN";
    case Level::Error:
        return "ERROR";
    case Level::Off:
        return "OFF";
    }
    return "INFO";
}

Level levelFromString(std::string_view text) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });

    for (const auto& entry : kLevelNames) {
        if (entry.text == lower) {
            return entry.level;
        }
    }
    throw std::invalid_argument("Unknown log level: " + std::string(text));
}

}  // namespace zen::log
