// config/Config.cpp
// @brief INI-like configuration loader implementation.
// @invariant Reads sections [build], [run], [poller], [editor] and [log].
// @ownership Loader does not own external resources beyond file path.

#include "config/Config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace ite::config
{

namespace
{
constexpr long kMinPollMs = 1;
constexpr long kMaxPollMs = 60000;

std::string trim(std::string_view sv)
{
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front())))
    {
        sv.remove_prefix(1);
    }
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back())))
    {
        sv.remove_suffix(1);
    }
    return std::string(sv);
}

std::string lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

std::optional<bool> parse_bool(const std::string &s)
{
    const std::string v = lower(s);
    if (v == "1" || v == "true" || v == "yes" || v == "on")
        return true;
    if (v == "0" || v == "false" || v == "no" || v == "off")
        return false;
    return std::nullopt;
}

std::optional<long> parse_long(const std::string &s)
{
    try
    {
        size_t parsed = 0;
        const long v = std::stol(s, &parsed);
        if (parsed != s.size())
        {
            return std::nullopt;
        }
        return v;
    }
    catch (const std::invalid_argument &)
    {
        return std::nullopt;
    }
    catch (const std::out_of_range &)
    {
        return std::nullopt;
    }
}

void warn_value(int lineNo, const std::string &section, const std::string &key, const std::string &value)
{
    log::warn("config line " + std::to_string(lineNo) + ": ignoring [" + section + "] " + key +
              " = '" + value + "'");
}

bool apply(const std::string &section, const std::string &key, const std::string &value, Config &out)
{
    if (section == "build" || section == "run")
    {
        if (key != "command")
            return false;
        std::vector<std::string> argv = splitCommand(value);
        if (argv.empty())
            return false;
        (section == "build" ? out.commands.build : out.commands.run) = std::move(argv);
        return true;
    }
    if (section == "poller")
    {
        if (key == "interval_ms")
        {
            const auto ms = parse_long(value);
            if (!ms || *ms < kMinPollMs || *ms > kMaxPollMs)
                return false;
            out.poller.interval = std::chrono::milliseconds(*ms);
            return true;
        }
        if (key == "discard_stale")
        {
            const auto b = parse_bool(value);
            if (!b)
                return false;
            out.poller.discard_stale = *b;
            return true;
        }
        return false;
    }
    if (section == "editor")
    {
        if (key != "default_extension" || value.empty())
            return false;
        out.editor.default_extension = value.front() == '.' ? value : "." + value;
        return true;
    }
    if (section == "log")
    {
        if (key != "level")
            return false;
        const auto lvl = log::parseLevel(value);
        if (!lvl)
            return false;
        out.log_level = *lvl;
        return true;
    }
    return false;
}

} // namespace

std::vector<std::string> splitCommand(std::string_view text)
{
    std::vector<std::string> tokens;
    std::string current;
    bool inToken = false;
    bool quoted = false;
    for (const char ch : text)
    {
        if (ch == '"')
        {
            quoted = !quoted;
            inToken = true;
            continue;
        }
        if (!quoted && std::isspace(static_cast<unsigned char>(ch)))
        {
            if (inToken)
            {
                tokens.push_back(std::move(current));
                current.clear();
                inToken = false;
            }
            continue;
        }
        current.push_back(ch);
        inToken = true;
    }
    if (inToken)
    {
        tokens.push_back(std::move(current));
    }
    return tokens;
}

bool loadFromStream(std::istream &in, Config &out)
{
    if (!in)
    {
        return false;
    }
    std::string line;
    std::string section;
    int lineNo = 0;
    while (std::getline(in, line))
    {
        ++lineNo;
        std::string trimmed = trim(line);
        if (trimmed.empty() || trimmed[0] == '#' || trimmed[0] == ';')
        {
            continue;
        }
        if (trimmed.front() == '[' && trimmed.back() == ']')
        {
            section = lower(trim(trimmed.substr(1, trimmed.size() - 2)));
            continue;
        }
        auto eq = trimmed.find('=');
        if (eq == std::string::npos)
        {
            continue;
        }
        const std::string key = lower(trim(trimmed.substr(0, eq)));
        const std::string value = trim(trimmed.substr(eq + 1));
        if (!apply(section, key, value, out))
        {
            warn_value(lineNo, section, key, value);
        }
    }
    return true;
}

bool loadFromFile(const std::string &path, Config &out)
{
    std::ifstream in(path);
    if (!in)
    {
        return false;
    }
    log::debug("loading config " + path);
    return loadFromStream(in, out);
}

support::Result<std::optional<std::string>> resolveConfigPath(
    const std::optional<std::string> &explicitPath)
{
    namespace fs = std::filesystem;
    using R = support::Result<std::optional<std::string>>;

    std::optional<std::string> named = explicitPath;
    if (!named)
    {
        if (const char *env = std::getenv("ITE_CONFIG"); env != nullptr && *env != '\0')
            named = std::string(env);
    }
    std::error_code ec;
    if (named)
    {
        if (!fs::is_regular_file(*named, ec))
            return R::error("config file not found: " + *named);
        return R::success(named);
    }

    const char *home = std::getenv("HOME");
    if (home == nullptr || *home == '\0')
    {
        return R::success(std::optional<std::string>{});
    }
    const fs::path candidate = fs::path(home) / ".config" / "ite" / "ite.ini";
    if (fs::is_regular_file(candidate, ec))
    {
        return R::success(std::optional<std::string>{candidate.string()});
    }
    return R::success(std::optional<std::string>{});
}

} // namespace ite::config
