#pragma once

#include <cstdint>
#include <sstream>
#include <string>
#include <string_view>

namespace slob::log {

enum class Level : int {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
    Critical = 4,
};

void setLevel(Level level) noexcept;
Level getLevel() noexcept;
bool shouldLog(Level level) noexcept;
void log(Level level, const std::string& message);
const char* levelToString(Level level) noexcept;
Level levelFromString(std::string_view text);

// Mirrors every emitted line into an append-only journal next to the console
// output. An empty path closes the journal. Throws when the file cannot be opened.
void openJournal(const std::string& path);
void closeJournal() noexcept;

// Number of CRITICAL lines emitted since start. Critical lines are the engine's
// standing alerts (safe mode, drawdown halt, reconciliation mismatch).
std::uint64_t criticalCount() noexcept;

}  // namespace slob::log

#define SLOB_LOG_IMPL(level, expr)                                                         \
    do {                                                                                   \
        if (::slob::log::shouldLog(level)) {                                               \
            std::ostringstream slob_log_stream__;                                          \
            slob_log_stream__ << expr;                                                     \
            ::slob::log::log(level, slob_log_stream__.str());                              \
        }                                                                                  \
    } while (false)

#define LOG_DEBUG(expr) SLOB_LOG_IMPL(::slob::log::Level::Debug, expr)
#define LOG_INFO(expr) SLOB_LOG_IMPL(::slob::log::Level::Info, expr)
#define LOG_WARN(expr) SLOB_LOG_IMPL(::slob::log::Level::Warn, expr)
#define LOG_ERR(expr) SLOB_LOG_IMPL(::slob::log::Level::Error, expr)
#define LOG_CRIT(expr) SLOB_LOG_IMPL(::slob::log::Level::Critical, expr)
