// utils/logging.hpp
#pragma once
#include <cctype>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <string>

namespace utils
{

    enum class LogLevel : int
    {
        Trace = 0,
        Debug = 1,
        Info = 2,
        Warn = 3,
        Error = 4,
        Off = 5
    };

    inline const char *to_string(LogLevel lvl)
    {
        switch (lvl)
        {
        case LogLevel::Trace:
            return "TRACE";
        case LogLevel::Debug:
            return "DEBUG";
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Warn:
            return "WARN";
        case LogLevel::Error:
            return "ERROR";
        default:
            return "OFF";
        }
    }

    // Accepts "trace".."off" in any case. Returns false and leaves `out`
    // untouched on an unknown name.
    inline bool parse_level(const std::string &name, LogLevel &out)
    {
        std::string v;
        v.reserve(name.size());
        for (char c : name)
            v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));

        if (v == "trace")
            out = LogLevel::Trace;
        else if (v == "debug")
            out = LogLevel::Debug;
        else if (v == "info")
            out = LogLevel::Info;
        else if (v == "warn" || v == "warning")
            out = LogLevel::Warn;
        else if (v == "error")
            out = LogLevel::Error;
        else if (v == "off")
            out = LogLevel::Off;
        else
            return false;
        return true;
    }

    inline LogLevel &global_level()
    {
        static LogLevel lvl = LogLevel::Info;
        return lvl;
    }

    inline std::ofstream &global_log_file()
    {
        static std::ofstream log_file;
        return log_file;
    }

    inline void set_level(LogLevel lvl)
    {
        global_level() = lvl;
    }

    inline bool enabled(LogLevel lvl)
    {
        return global_level() != LogLevel::Off && lvl >= global_level();
    }

    inline bool open_log_file(const std::string &path)
    {
        auto &f = global_log_file();
        if (f.is_open())
            f.close();

        f.open(path, std::ios::out | std::ios::trunc);
        if (!f.is_open())
        {
            std::fprintf(stderr, "[ERROR] Failed to open log file: %s\n", path.c_str());
            return false;
        }

        std::fprintf(stderr, "[INFO] Logging to file: %s\n", path.c_str());
        return true;
    }

    inline void close_log_file()
    {
        auto &f = global_log_file();
        if (f.is_open())
            f.close();
    }

    inline void vlogf(LogLevel lvl, const char *fmt, va_list args)
    {
        if (!enabled(lvl))
            return;

        std::time_t t = std::time(nullptr);
        std::tm tm{};
        localtime_r(&t, &tm);

        char ts[16];
        std::snprintf(ts, sizeof(ts), "%02d:%02d:%02d", tm.tm_hour, tm.tm_min, tm.tm_sec);

        char msg[1024];
        std::vsnprintf(msg, sizeof(msg), fmt, args);

        char line[1100];
        std::snprintf(line, sizeof(line), "[%s] %-5s: %s\n", ts, to_string(lvl), msg);

        std::fputs(line, stderr);

        auto &f = global_log_file();
        if (f.is_open())
        {
            f << line;
            f.flush();
        }
    }

    inline void logf(LogLevel lvl, const char *fmt, ...)
    {
        va_list args;
        va_start(args, fmt);
        vlogf(lvl, fmt, args);
        va_end(args);
    }

} // namespace utils

#define LOG_TRACE(...) ::utils::logf(::utils::LogLevel::Trace, __VA_ARGS__)
#define LOG_DEBUG(...) ::utils::logf(::utils::LogLevel::Debug, __VA_ARGS__)
#define LOG_INFO(...) ::utils::logf(::utils::LogLevel::Info, __VA_ARGS__)
#define LOG_WARN(...) ::utils::logf(::utils::LogLevel::Warn, __VA_ARGS__)
#define LOG_ERROR(...) ::utils::logf(::utils::LogLevel::Error, __VA_ARGS__)
