#ifndef RAOLIB_LOG_HPP
#define RAOLIB_LOG_HPP

#include <cctype>
#include <cstdarg>
#include <cstddef>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

namespace raolib
{
    // Numeric values follow Python's logging module, so the binding and the
    // environment variable use the same scale
    enum class RAOLIB_LogLevel
    {
        CRITICAL = 50,
        ERROR = 40,
        WARNING = 30,
        INFO = 20,
        DEBUG = 10,
        NOTSET = 0
    };

    /**
     * @brief Parses a level given by name ("debug", "WARNING", ...) or by number ("10").
     *
     * @return true and sets `level` on success; false leaves `level` untouched.
     */
    inline bool parse_level(const char *text, RAOLIB_LogLevel &level)
    {
        std::string key;
        for (const char *c = text; *c != '\0'; ++c)
        {
            key.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(*c))));
        }

        if (key == "CRITICAL")
            level = RAOLIB_LogLevel::CRITICAL;
        else if (key == "ERROR")
            level = RAOLIB_LogLevel::ERROR;
        else if (key == "WARNING" || key == "WARN")
            level = RAOLIB_LogLevel::WARNING;
        else if (key == "INFO")
            level = RAOLIB_LogLevel::INFO;
        else if (key == "DEBUG")
            level = RAOLIB_LogLevel::DEBUG;
        else
        {
            char *end = nullptr;
            long value = std::strtol(text, &end, 10);
            if (end == text || *end != '\0' || value < 0 || value > 50)
            {
                return false;
            }
            level = static_cast<RAOLIB_LogLevel>(static_cast<int>(value));
        }
        return true;
    }

    /**
     * @brief Process-wide threshold; messages below it are dropped.
     *
     * Initialized on first use from `RAOLIB_LOG_LEVEL`. Without it, or when it
     * does not parse, only CRITICAL messages are printed.
     */
    inline RAOLIB_LogLevel &get_min_level()
    {
        static RAOLIB_LogLevel level = []() -> RAOLIB_LogLevel
        {
            RAOLIB_LogLevel from_env = RAOLIB_LogLevel::CRITICAL;
            if (const char *text = std::getenv("RAOLIB_LOG_LEVEL"))
            {
                parse_level(text, from_env);
            }
            return from_env;
        }();
        return level;
    }

    inline void set_min_level(RAOLIB_LogLevel level)
    {
        get_min_level() = level;
    }

    inline const char *level_to_string(RAOLIB_LogLevel level)
    {
        switch (level)
        {
        case RAOLIB_LogLevel::CRITICAL:
            return "CRITICAL";
        case RAOLIB_LogLevel::ERROR:
            return "ERROR";
        case RAOLIB_LogLevel::WARNING:
            return "WARNING";
        case RAOLIB_LogLevel::INFO:
            return "INFO";
        case RAOLIB_LogLevel::DEBUG:
            return "DEBUG";
        default:
            return "NOTSET";
        }
    }

    // ANSI escape for the level tag
    inline const char *level_to_color(RAOLIB_LogLevel level)
    {
        switch (level)
        {
        case RAOLIB_LogLevel::CRITICAL:
            return "\x1b[1;35m";
        case RAOLIB_LogLevel::ERROR:
            return "\x1b[31m";
        case RAOLIB_LogLevel::WARNING:
            return "\x1b[33m";
        case RAOLIB_LogLevel::DEBUG:
            return "\x1b[34m";
        default:
            return "\x1b[36m";
        }
    }

    /**
     * @brief printf-style logging to std::cerr, used through the RAOLIB_* macros.
     *
     * Output: `[raolib] LEVEL file:line func: message`.
     */
    inline void log(RAOLIB_LogLevel level, const char *file, int line, const char *func, const char *format, ...)
    {
        if (static_cast<int>(level) < static_cast<int>(get_min_level()))
        {
            return;
        }

        va_list args;
        va_start(args, format);
        va_list sizing;
        va_copy(sizing, args);
        int size = std::vsnprintf(nullptr, 0, format, sizing);
        va_end(sizing);

        std::string message;
        if (size < 0)
        {
            message = format;
        }
        else
        {
            std::vector<char> buffer(static_cast<std::size_t>(size) + 1);
            std::vsnprintf(buffer.data(), buffer.size(), format, args);
            message.assign(buffer.data(), static_cast<std::size_t>(size));
        }
        va_end(args);

        std::cerr << "[raolib] " << level_to_color(level) << level_to_string(level) << "\x1b[0m "
                  << file << ":" << line << " " << func << ": " << message << std::endl;
    }

}; // namespace raolib

#ifdef RAOLIB_ENABLE_DEBUG_LOGGING
#define RAOLIB_DEBUG(format, ...) \
    raolib::log(raolib::RAOLIB_LogLevel::DEBUG, __FILE__, __LINE__, __func__, format, ##__VA_ARGS__)
#else
#define RAOLIB_DEBUG(format, ...) \
    do                            \
    {                             \
    } while (0)
#endif // RAOLIB_ENABLE_DEBUG_LOGGING

#define RAOLIB_WARN(format, ...) \
    raolib::log(raolib::RAOLIB_LogLevel::WARNING, __FILE__, __LINE__, __func__, format, ##__VA_ARGS__)

#define RAOLIB_ERROR(format, ...) \
    raolib::log(raolib::RAOLIB_LogLevel::ERROR, __FILE__, __LINE__, __func__, format, ##__VA_ARGS__)

#endif // RAOLIB_LOG_HPP
