//===----------------------------------------------------------------------===//
//
// Part of the ITE project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: config/Config.hpp
// Purpose: Editor settings and the INI-like loader that fills them.
// Key invariants: Loading only overwrites settings whose values parse; every
//                 other field keeps its default.
// Ownership/Lifetime: Config is a plain value; loaders borrow the stream/path.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/log.hpp"
#include "support/result.hpp"
#include "task/TaskRunner.hpp"

#include <chrono>
#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ite::config
{

struct PollerSettings
{
    std::chrono::milliseconds interval{100};
    bool discard_stale = false;
};

struct EditorSettings
{
    std::string default_extension{".go"};
};

/// @brief Complete editor configuration.
struct Config
{
    task::CommandSet commands{};
    PollerSettings poller{};
    EditorSettings editor{};
    log::Level log_level = log::Level::Info;
};

/// @brief Parse sections [build], [run], [poller], [editor] and [log] from @p in.
/// @return False only when the stream could not be read.
bool loadFromStream(std::istream &in, Config &out);

/// @brief Load settings from the file at @p path.
/// @return False when the file cannot be opened.
bool loadFromFile(const std::string &path, Config &out);

/// @brief Split a command line on whitespace; double quotes group a token.
std::vector<std::string> splitCommand(std::string_view text);

/// @brief Pick the configuration file to load.
/// @details Order: @p explicitPath, then $ITE_CONFIG, then
///          $HOME/.config/ite/ite.ini. A named file that does not exist is an
///          error; a missing default file yields std::nullopt.
support::Result<std::optional<std::string>> resolveConfigPath(
    const std::optional<std::string> &explicitPath);

} // namespace ite::config
