#pragma once

#include <functional>
#include <sstream>
#include <string>
#include <string_view>

namespace zen::log {

enum class Level : int {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
    Off = 4,
};

// Receives every line that passes the level filter. An empty sink restores the
// default stdout/stderr output.
using Sink = std::function<void(Level, const std::string&)>;

void setLevel(Level level) noexcept;
Level getLevel() noexcept;
bool shouldLog(Level level) noexcept;
void log(Level level, const std::string& message);
const char* levelToString(Level level) noexcept;
Level levelFromString(std::string_view text);
void setSink(Sink sink);

}  // namespace zen::log

#define ZEN_LOG_IMPL(level, expr)                                                         \
    do {                                                                                  \
        if (::zen::log::shouldLog(level)) {                                               \
            std::ostringstream zenLogLine;                                                \
            zenLogLine << expr;                                                           \
            ::zen::log::log(level, zenLogLine.str());                                     \
        }                                                                                 \
    } while (false)

#define LOG_DEBUG(expr) ZEN_LOG_IMPL(::zen::log::Level::Debug, expr)
#define LOG_INFO(expr) ZEN_LOG_IMPL(::zen::log::Level::Info, expr)
#define LOG_WARN(expr) ZEN_LOG_IMPL(::zen::log::Level::Warn, expr)
#define LOG_ERR(expr) ZEN_LOG_IMPL(::zen::log::Level::Error, expr)
