//===----------------------------------------------------------------------===//
//
// Part of the ITE project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/log.cpp
// Purpose: Implement the stderr logger used across the editor.
// Key invariants: Level checks are lock-free; formatting and output happen
//                 under a single mutex so concurrent lines never interleave.
// Ownership/Lifetime: Process-wide state with static storage duration.
//
//===----------------------------------------------------------------------===//

#include "support/log.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <iostream>
#include <mutex>
#include <string>

namespace ite::log
{
namespace
{
std::atomic<int> g_level{static_cast<int>(Level::Info)};
std::mutex g_mutex;
std::ostream *g_stream = nullptr;

std::string timestamp()
{
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    localtime_r(&now, &tm);
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%02d:%02d:%02d", tm.tm_hour, tm.tm_min, tm.tm_sec);
    return buf;
}
} // namespace

Level level() noexcept
{
    return static_cast<Level>(g_level.load(std::memory_order_relaxed));
}

void setLevel(Level lvl) noexcept
{
    g_level.store(static_cast<int>(lvl), std::memory_order_relaxed);
}

bool enabled(Level lvl) noexcept
{
    return lvl != Level::Off && static_cast<int>(lvl) >= g_level.load(std::memory_order_relaxed);
}

std::optional<Level> parseLevel(std::string_view name)
{
    std::string lower(name);
    std::transform(
        lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return std::tolower(c); });
    if (lower == "debug")
        return Level::Debug;
    if (lower == "info")
        return Level::Info;
    if (lower == "warn" || lower == "warning")
        return Level::Warn;
    if (lower == "error")
        return Level::Error;
    if (lower == "off" || lower == "none")
        return Level::Off;
    return std::nullopt;
}

const char *levelName(Level lvl) noexcept
{
    switch (lvl)
    {
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
    return "?";
}

bool applyEnvironment()
{
    const char *env = std::getenv("ITE_LOG_LEVEL");
    if (env == nullptr || *env == '\0')
    {
        return false;
    }
    if (auto parsed = parseLevel(env))
    {
        setLevel(*parsed);
        return true;
    }
    write(Level::Warn, std::string("ignoring unknown ITE_LOG_LEVEL '") + env + "'");
    return false;
}

void setStream(std::ostream *os)
{
    std::lock_guard<std::mutex> lock(g_mutex);
    g_stream = os;
}

void write(Level lvl, std::string_view message)
{
    if (!enabled(lvl))
    {
        return;
    }
    const std::string ts = timestamp();
    std::lock_guard<std::mutex> lock(g_mutex);
    std::ostream &os = g_stream ? *g_stream : std::cerr;
    os << '[' << levelName(lvl) << "] " << ts << ' ' << message << '\n';
    os.flush();
}

} // namespace ite::log
