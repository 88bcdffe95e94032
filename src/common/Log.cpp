#include "common/Log.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <iterator>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace cfe::log {
namespace {

struct LevelName {
    Level level;
    const char* label;
    const char* alias;
};

constexpr LevelName kLevelNames[] = {
    {Level::Debug, "DEBUG", "debug"},
    {Level::Info, "INFO", "info"},
    {Level::Warn, "WARN", "warning"},
    {Level::Error, "ERROR", "err"},
};

std::atomic<Level> g_threshold{Level::Info};
std::mutex g_writeMutex;

// 2026-10-19T08:15:02.417Z
std::string utcStamp(std::chrono::system_clock::time_point at) {
    const auto sinceEpoch = at.time_since_epoch();
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(sinceEpoch).count() % 1000;
    const auto seconds = std::chrono::system_clock::to_time_t(at);

    std::tm utc{};
    gmtime_r(&seconds, &utc);

    char buffer[32];
    const auto written = std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &utc);
    std::string stamp(buffer, written);
    char fraction[8];
    std::snprintf(fraction, sizeof(fraction), ".%03dZ", static_cast<int>(millis));
    return stamp + fraction;
}

}  // namespace

void setLevel(Level level) noexcept { g_threshold.store(level, std::memory_order_relaxed); }

Level getLevel() noexcept { return g_threshold.load(std::memory_order_relaxed); }

bool shouldLog(Level level) noexcept { return static_cast<int>(level) >= static_cast<int>(getLevel()); }

void log(Level level, const std::string& message) {
    const auto stamp = utcStamp(std::chrono::system_clock::now());
    const auto thread = std::this_thread::get_id();

    // Warnings and errors go to stderr so they survive a redirected stdout.
    std::lock_guard<std::mutex> lock(g_writeMutex);
    auto& out = level >= Level::Warn ? std::cerr : std::cout;
    out << stamp << ' ' << levelToString(level) << " [" << thread << "] " << message << '\n';
    out.flush();
}

const char* levelToString(Level level) noexcept {
    for (const auto& entry : kLevelNames) {
        if (entry.level == level) {
            return entry.label;
        }
    }
    return "INFO";
}

Level levelFromString(std::string_view text) {
    std::string token;
    std::transform(text.begin(), text.end(), std::back_inserter(token), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });

    for (const auto& entry : kLevelNames) {
        std::string label(entry.label);
        std::transform(label.begin(), label.end(), label.begin(), [](unsigned char ch) {
            return static_cast<char>(std::tolower(ch));
        });
        if (token == label || token == entry.alias) {
            return entry.level;
        }
    }
    throw std::invalid_argument("Unknown log level: " + std::string{text});
}

}  // namespace cfe::log
