#pragma once

#include <functional>
#include <sstream>
#include <string>
#include <string_view>

namespace fxb::log {

enum class Level : int {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
};

// Receives every emitted line after level filtering. Used by tests to capture output.
using Observer = std::function<void(Level, const std::string&)>;

void setLevel(Level level) noexcept;
Level getLevel() noexcept;
bool shouldLog(Level level) noexcept;
void log(Level level, const std::string& message);
const char* levelToString(Level level) noexcept;
Level levelFromString(std::string_view text);

void setObserver(Observer observer);
void clearObserver();

}  // namespace fxb::log

#define FXB_LOG_IMPL(level, expr)                                                          \
    do {                                                                                   \
        if (::fxb::log::shouldLog(level)) {                                                \
            std::ostringstream fxb_log_stream__;                                           \
            fxb_log_stream__ << expr;                                                      \
            ::fxb::log::log(level, fxb_log_stream__.str());                                \
        }                                                                                  \
    } while (false)

#define LOG_DEBUG(expr) FXB_LOG_IMPL(::fxb::log::Level::Debug, expr)
#define LOG_INFO(expr) FXB_LOG_IMPL(::fxb::log::Level::Info, expr)
#define LOG_WARN(expr) FXB_LOG_IMPL(::fxb::log::Level::Warn, expr)
#define LOG_ERR(expr) FXB_LOG_IMPL(::fxb::log::Level::Error, expr)
