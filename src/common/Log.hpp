#pragma once

#include <sstream>
#include <string>
#include <string_view>

namespace cfe::log {

enum class Level : int {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
};

void setLevel(Level level) noexcept;
Level getLevel() noexcept;
bool shouldLog(Level level) noexcept;
// One line per record: UTC timestamp, level, thread id, message.
void log(Level level, const std::string& message);
const char* levelToString(Level level) noexcept;
Level levelFromString(std::string_view text);

}  // namespace cfe::log

#define CFE_LOG_IMPL(level, expr)                                                          \
    do {                                                                                   \
        if (::cfe::log::shouldLog(level)) {                                                \
            std::ostringstream cfe_log_stream__;                                           \
            cfe_log_stream__ << expr;                                                      \
            ::cfe::log::log(level, cfe_log_stream__.str());                                \
        }                                                                                  \
    } while (false)

#define LOG_DEBUG(expr) CFE_LOG_IMPL(::cfe::log::Level::Debug, expr)
#define LOG_INFO(expr) CFE_LOG_IMPL(::cfe::log::Level::Info, expr)
#define LOG_WARN(expr) CFE_LOG_IMPL(::cfe::log::Level::Warn, expr)
#define LOG_ERR(expr) CFE_LOG_IMPL(::cfe::log::Level::Error, expr)
