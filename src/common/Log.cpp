#include "common/Log.hpp"

#include <atomic>
#include <chrono>
#include <cctype>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <thread>

namespace mdi::log {
namespace {

std::atomic<Level> g_level{Level::Info};
std::mutex g_outputMutex;
std::ofstream g_file;

const char* kLevelLabels[] = {"DEBUG", "INFO", "WARN", "ERROR"};

std::ostream& streamFor(Level level) {
    if (level == Level::Warn || level == Level::Error) {
        return std::cerr;
    }
    return std::cout;
}

// Log lines carry UTC stamps so they line up with trade and bar timestamps.
std::tm safeGmtime(std::time_t time) {
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &time);
#else
    gmtime_r(&time, &tm);
#endif
    return tm;
}

}  // namespace

void setLevel(Level level) noexcept { g_level.store(level, std::memory_order_relaxed); }

Level getLevel() noexcept { return g_level.load(std::memory_order_relaxed); }

bool shouldLog(Level level) noexcept {
    return static_cast<int>(level) >= static_cast<int>(getLevel());
}

void log(Level level, const std::string& message) {
    const auto now = std::chrono::system_clock::now();
    const auto seconds = std::chrono::system_clock::to_time_t(now);
    const auto milliseconds = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    const auto tm = safeGmtime(seconds);

    std::ostringstream header;
    header << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
           << milliseconds.count();

    std::ostringstream threadIdStream;
    threadIdStream << std::this_thread::get_id();

    std::lock_guard<std::mutex> lock(g_outputMutex);
    auto& out = streamFor(level);
    out << '[' << header.str() << "] [" << levelToString(level) << "] [thread "
        << threadIdStream.str() << "] " << message << std::endl;
    if (g_file.is_open()) {
        g_file << '[' << header.str() << "] [" << levelToString(level) << "] [thread "
               << threadIdStream.str() << "] " << message << '\n';
        if (level >= Level::Warn) {
            g_file.flush();
        }
    }
}

void setOutputFile(const std::string& path) {
    std::lock_guard<std::mutex> lock(g_outputMutex);
    if (g_file.is_open()) {
        g_file.flush();
        g_file.close();
    }
    if (path.empty()) {
        return;
    }
    g_file.open(path, std::ios::out | std::ios::app);
    if (!g_file) {
        throw std::runtime_error("Unable to open log file: " + path);
    }
}

const char* levelToString(Level level) noexcept {
    const auto index = static_cast<std::size_t>(level);
    if (index < (sizeof(kLevelLabels) / sizeof(kLevelLabels[0]))) {
        return kLevelLabels[index];
    }
    return "INFO";
}

Level levelFromString(std::string_view text) {
    std::string lower{text};
    for (auto& ch : lower) {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }

    if (lower == "debug") {
        return Level::Debug;
    }
    if (lower == "info") {
        return Level::Info;
    }
    if (lower == "warn" || lower == "warning") {
        return Level::Warn;
    }
    if (lower == "err" || lower == "error") {
        return Level::Error;
    }

    throw std::invalid_argument("Unknown log level: " + std::string{text});
}

}  // namespace mdi::log
