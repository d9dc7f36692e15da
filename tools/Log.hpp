/**
 * @file Log.hpp
 * @brief Levelled stderr logging for the command-line tools.
 *
 * Lines look like "[lhefix] WARN message". Colour is used only when
 * stderr is a terminal and neither NO_COLOR nor LHEUTILS_NO_COLOUR is set.
 */

#pragma once

#include <cstdio>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

#include <unistd.h>

namespace lheutils
{
namespace log
{
    enum class Level
    {
        Info,
        Success,
        Warn,
        Error
    };

    inline bool useColour()
    {
        static int enabled = -1;
        if (enabled >= 0) return enabled != 0;

        if (std::getenv("NO_COLOR") || std::getenv("LHEUTILS_NO_COLOUR"))
        {
            enabled = 0;
        }
        else
        {
            enabled = ::isatty(::fileno(stderr)) ? 1 : 0;
        }
        return enabled != 0;
    }

    inline const char* levelName(Level level)
    {
        switch (level)
        {
        case Level::Success: return "DONE";
        case Level::Warn:    return "WARN";
        case Level::Error:   return "ERROR";
        case Level::Info:
        default:             return "INFO";
        }
    }

    inline const char* levelColour(Level level)
    {
        switch (level)
        {
        case Level::Success: return "\033[1;32m";
        case Level::Warn:    return "\033[1;33m";
        case Level::Error:   return "\033[1;31m";
        case Level::Info:
        default:             return "\033[1;36m";
        }
    }

    inline std::string decorate(const std::string& text, const char* colour)
    {
        if (!useColour()) return text;
        return colour + text + "\033[0m";
    }

    /// 950 -> "950", 12345 -> "12.3k", 4200000 -> "4.2M"
    inline std::string formatCount(long long count)
    {
        std::ostringstream out;
        if (count >= 1000000)
        {
            out << std::fixed << std::setprecision(1) << (static_cast<double>(count) / 1e6) << "M";
        }
        else if (count >= 1000)
        {
            out << std::fixed << std::setprecision(1) << (static_cast<double>(count) / 1e3) << "k";
        }
        else
        {
            out << count;
        }
        return out.str();
    }

    inline void line(const std::string& tool, Level level, const std::string& message)
    {
        std::ostringstream out;
        out << decorate("[" + tool + "]", "\033[1;34m") << ' '
            << decorate(levelName(level), levelColour(level)) << ' '
            << message;
        std::cerr << out.str() << '\n';
    }

    inline void info(const std::string& tool, const std::string& message) { line(tool, Level::Info, message); }
    inline void success(const std::string& tool, const std::string& message) { line(tool, Level::Success, message); }
    inline void warning(const std::string& tool, const std::string& message) { line(tool, Level::Warn, message); }
    inline void error(const std::string& tool, const std::string& message) { line(tool, Level::Error, message); }

} // namespace log
} // namespace lheutils
