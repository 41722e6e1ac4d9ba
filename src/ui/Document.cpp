//===----------------------------------------------------------------------===//
//
// Part of the ITE project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: ui/Document.cpp
// Purpose: Load, save and describe the edited file.
// Key invariants: Failed saves leave the path and modified flag untouched.
// Ownership/Lifetime: See Document.hpp.
//
//===----------------------------------------------------------------------===//

#include "ui/Document.hpp"

#include "support/log.hpp"

#include <algorithm>
#include <cerrno>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace ite::ui
{
namespace
{
std::string absolute_path(const std::string &path)
{
    std::error_code ec;
    fs::path abs = fs::absolute(fs::path(path), ec);
    if (ec)
    {
        return path;
    }
    return abs.lexically_normal().string();
}

std::string errno_text()
{
    return std::error_code(errno, std::generic_category()).message();
}
} // namespace

Document::Document(std::string defaultExtension) : defaultExtension_(std::move(defaultExtension)) {}

void Document::reset()
{
    path_.reset();
    text_.clear();
    modified_ = false;
}

support::Result<void> Document::open(const std::string &path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in)
    {
        return support::Result<void>::error("Error opening file: " + path + ": " + errno_text());
    }
    std::ostringstream contents;
    contents << in.rdbuf();
    if (in.bad())
    {
        return support::Result<void>::error("Error opening file: " + path + ": read failed");
    }
    text_ = contents.str();
    path_ = absolute_path(path);
    modified_ = false;
    log::debug("opened " + *path_);
    return support::Result<void>::success();
}

support::Result<void> Document::writeTo(const std::string &path) const
{
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out)
    {
        return support::Result<void>::error(path + ": " + errno_text());
    }
    out.write(text_.data(), static_cast<std::streamsize>(text_.size()));
    out.flush();
    if (!out)
    {
        return support::Result<void>::error(path + ": write failed");
    }
    return support::Result<void>::success();
}

support::Result<void> Document::save()
{
    if (!path_)
    {
        return support::Result<void>::error("document has no file name; use saveas");
    }
    auto written = writeTo(*path_);
    if (!written)
    {
        return written;
    }
    modified_ = false;
    log::debug("saved " + *path_);
    return written;
}

support::Result<void> Document::saveAs(std::string path)
{
    if (path.empty())
    {
        return support::Result<void>::error("empty file name");
    }
    if (fs::path(path).extension().empty())
    {
        path += defaultExtension_;
    }
    const std::string abs = absolute_path(path);
    auto written = writeTo(abs);
    if (!written)
    {
        return written;
    }
    path_ = abs;
    modified_ = false;
    log::debug("saved " + abs);
    return written;
}

void Document::append(std::string_view line)
{
    text_.append(line);
    text_.push_back('\n');
    modified_ = true;
}

std::optional<std::string> Document::currentDirectory() const
{
    if (!path_)
    {
        return std::nullopt;
    }
    return fs::path(*path_).parent_path().string();
}

std::string Document::title() const
{
    if (!path_)
    {
        return "Untitled - ITE";
    }
    return fs::path(*path_).filename().string() + " - ITE";
}

std::size_t Document::lineCount() const noexcept
{
    if (text_.empty())
    {
        return 0;
    }
    const auto newlines = static_cast<std::size_t>(std::count(text_.begin(), text_.end(), '\n'));
    return text_.back() == '\n' ? newlines : newlines + 1;
}

} // namespace ite::ui
