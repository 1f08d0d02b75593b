#pragma once

#include <sstream>
#include <string>
#include <string_view>

namespace mdi::log {

enum class Level : int {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
};

void setLevel(Level level) noexcept;
Level getLevel() noexcept;
bool shouldLog(Level level) noexcept;
void log(Level level, const std::string& message);
const char* levelToString(Level level) noexcept;
Level levelFromString(std::string_view text);

// Mirrors every line into an append-only file; an empty path closes it.
void setOutputFile(const std::string& path);

}  // namespace mdi::log

#define MDI_LOG_IMPL(level, expr)                                                          \
    do {                                                                                   \
        if (::mdi::log::shouldLog(level)) {                                                \
            std::ostringstream mdi_log_stream__;                                           \
            mdi_log_stream__ << expr;                                                      \
            ::mdi::log::log(level, mdi_log_stream__.str());                                \
        }                                                                                  \
    } while (false)

#define LOG_DEBUG(expr) MDI_LOG_IMPL(::mdi::log::Level::Debug, expr)
#define LOG_INFO(expr) MDI_LOG_IMPL(::mdi::log::Level::Info, expr)
#define LOG_WARN(expr) MDI_LOG_IMPL(::mdi::log::Level::Warn, expr)
#define LOG_ERR(expr) MDI_LOG_IMPL(::mdi::log::Level::Error, expr)
