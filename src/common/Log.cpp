#include "common/Log.hpp"

#include <array>
#include <atomic>
#include <chrono>
#include <cctype>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace slob::log {
namespace {

std::atomic<Level> g_level{Level::Info};
std::atomic<std::uint64_t> g_criticals{0};

// Guards console output and the journal stream.
std::mutex g_outputMutex;
std::ofstream g_journal;

constexpr std::array<const char*, 5> kLevelLabels{"DEBUG", "INFO", "WARN", "ERROR", "CRITICAL"};

std::tm utcTime(std::time_t time) {
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &time);
#else
    gmtime_r(&time, &tm);
#endif
    return tm;
}

// [YYYY-mm-dd HH:MM:SS.mmm] [LEVEL] [thread id] message
std::string formatLine(Level level, const std::string& message) {
    const auto now = std::chrono::system_clock::now();
    const auto millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    const auto tm = utcTime(std::chrono::system_clock::to_time_t(now));

    std::ostringstream line;
    line << '[' << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
         << millis << "] [" << levelToString(level) << "] [thread " << std::this_thread::get_id() << "] "
         << message;
    return line.str();
}

}  // namespace

void setLevel(Level level) noexcept { g_level.store(level, std::memory_order_relaxed); }

Level getLevel() noexcept { return g_level.load(std::memory_order_relaxed); }

bool shouldLog(Level level) noexcept {
    return static_cast<int>(level) >= static_cast<int>(getLevel());
}

void log(Level level, const std::string& message) {
    if (level == Level::Critical) {
        g_criticals.fetch_add(1, std::memory_order_relaxed);
    }
    const auto line = formatLine(level, message);

    std::lock_guard<std::mutex> lock(g_outputMutex);
    auto& console = level >= Level::Warn ? std::cerr : std::cout;
    console << line << std::endl;
    if (g_journal.is_open()) {
        g_journal << line << '\n';
        if (level >= Level::Error) {
            g_journal.flush();
        }
    }
}

void openJournal(const std::string& path) {
    std::lock_guard<std::mutex> lock(g_outputMutex);
    if (g_journal.is_open()) {
        g_journal.close();
    }
    if (path.empty()) {
        return;
    }
    g_journal.open(path, std::ios::out | std::ios::app);
    if (!g_journal) {
        g_journal.clear();
        throw std::runtime_error("unable to open log journal: " + path);
    }
}

void closeJournal() noexcept {
    std::lock_guard<std::mutex> lock(g_outputMutex);
    if (g_journal.is_open()) {
        g_journal.flush();
        g_journal.close();
    }
}

std::uint64_t criticalCount() noexcept { return g_criticals.load(std::memory_order_relaxed); }

const char* levelToString(Level level) noexcept {
    const auto index = static_cast<std::size_t>(level);
    return index < kLevelLabels.size() ? kLevelLabels[index] : "INFO";
}

Level levelFromString(std::string_view text) {
    std::string lower{text};
    for (auto& ch : lower) {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }

    if (lower == "debug" || lower == "trace") {
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
    if (lower == "crit" || lower == "critical") {
        return Level::Critical;
    }

    throw std::invalid_argument("unknown log level: " + std::string{text});
}

}  // namespace slob::log
