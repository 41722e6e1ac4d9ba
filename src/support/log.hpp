//===----------------------------------------------------------------------===//
//
// Part of the ITE project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/log.hpp
// Purpose: Levelled diagnostic logging shared by the UI thread and task threads.
//
// Log Levels:
//   DEBUG (0) - Detailed diagnostic information
//   INFO  (1) - General informational messages (default)
//   WARN  (2) - Warning conditions
//   ERROR (3) - Error conditions
//   OFF   (4) - Disable all logging
//
// Messages are written to stderr with format: [LEVEL] HH:MM:SS message
// Key invariants: Writes are serialised; a line is never interleaved with another.
// Ownership/Lifetime: The logger borrows the output stream installed via setStream().
//
//===----------------------------------------------------------------------===//

#pragma once

#include <optional>
#include <ostream>
#include <string_view>

namespace ite::log
{

/// @brief Severity threshold for emitted messages.
enum class Level
{
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
    Off = 4
};

/// @brief Get the current log level.
Level level() noexcept;

/// @brief Set the log level.
void setLevel(Level lvl) noexcept;

/// @brief Check if messages at @p lvl would be written.
bool enabled(Level lvl) noexcept;

/// @brief Parse a level name ("debug", "info", "warn", "error", "off"), case-insensitive.
/// @return Parsed level or std::nullopt for unrecognised names.
std::optional<Level> parseLevel(std::string_view name);

/// @brief Upper-case label used in the line prefix.
const char *levelName(Level lvl) noexcept;

/// @brief Apply ITE_LOG_LEVEL when set to a valid level name.
/// @return True when the environment overrode the level.
bool applyEnvironment();

/// @brief Redirect output; nullptr restores stderr.
/// @note The stream must outlive all subsequent log calls.
void setStream(std::ostream *os);

/// @brief Write one line at @p lvl when enabled.
void write(Level lvl, std::string_view message);

inline void debug(std::string_view message)
{
    write(Level::Debug, message);
}

inline void info(std::string_view message)
{
    write(Level::Info, message);
}

inline void warn(std::string_view message)
{
    write(Level::Warn, message);
}

inline void error(std::string_view message)
{
    write(Level::Error, message);
}

} // namespace ite::log
