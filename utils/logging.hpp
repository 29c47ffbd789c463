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
        static const char *const names[] = {"TRACE", "DEBUG", "INFO", "WARN", "ERROR", "OFF"};
        const int i = static_cast<int>(lvl);
        return (i >= 0 && i <= 5) ? names[i] : "OFF";
    }

    // Accepts trace|debug|info|warn|error|off in any case.
    inline bool parse_level(const std::string &name, LogLevel &out)
    {
        std::string v;
        for (char c : name)
            v.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        if (v == "warning")
            v = "warn";

        for (int i = 0; i <= static_cast<int>(LogLevel::Off); ++i)
        {
            std::string candidate = to_string(static_cast<LogLevel>(i));
            for (auto &c : candidate)
                c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            if (v == candidate)
            {
                out = static_cast<LogLevel>(i);
                return true;
            }
        }
        return false;
    }

    // Process-wide sink: threshold plus optional mirror file
    struct LogState
    {
        LogLevel level = LogLevel::Info;
        std::ofstream file;
    };

    inline LogState &log_state()
    {
        static LogState state;
        return state;
    }

    inline void set_level(LogLevel lvl)
    {
        log_state().level = lvl;
    }

    inline LogLevel get_level()
    {
        return log_state().level;
    }

    inline bool enabled(LogLevel lvl)
    {
        const LogLevel threshold = log_state().level;
        return threshold != LogLevel::Off && lvl >= threshold;
    }

    // Appends: a restarted daemon keeps writing to the same file.
    inline bool open_log_file(const std::string &path)
    {
        auto &f = log_state().file;
        if (f.is_open())
            f.close();

        f.open(path, std::ios::out | std::ios::app);
        if (!f.is_open())
        {
            std::fprintf(stderr, "[ERROR] Failed to open log file: %s\n", path.c_str());
            return false;
        }
        return true;
    }

    inline void close_log_file()
    {
        auto &f = log_state().file;
        if (f.is_open())
            f.close();
    }

    // Closes the mirror file on scope exit
    class LogFileGuard
    {
    public:
        explicit LogFileGuard(const std::string &path) : open_(!path.empty() && open_log_file(path)) {}
        ~LogFileGuard()
        {
            if (open_)
                close_log_file();
        }

        LogFileGuard(const LogFileGuard &) = delete;
        LogFileGuard &operator=(const LogFileGuard &) = delete;

        bool is_open() const { return open_; }

    private:
        bool open_;
    };

    inline void vlogf(LogLevel lvl, const char *fmt, va_list args)
    {
        if (!enabled(lvl))
            return;

        const std::time_t now = std::time(nullptr);
        std::tm local{};
        localtime_r(&now, &local);

        char line[1280];
        int n = static_cast<int>(std::strftime(line, 32, "[%Y-%m-%d %H:%M:%S] ", &local));
        n += std::snprintf(line + n, sizeof(line) - static_cast<size_t>(n), "%-5s: ", to_string(lvl));
        if (n < static_cast<int>(sizeof(line)))
            std::vsnprintf(line + n, sizeof(line) - static_cast<size_t>(n), fmt, args);

        std::fprintf(stderr, "%s\n", line);

        auto &f = log_state().file;
        if (f.is_open())
        {
            f << line << '\n';
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

// Arguments are not evaluated below the threshold
#define KBD_LOG_AT(lvl, ...)                          \
    do                                                \
    {                                                 \
        if (::utils::enabled(lvl))                    \
            ::utils::logf(lvl, __VA_ARGS__);          \
    } while (0)

#define LOG_TRACE(...) KBD_LOG_AT(::utils::LogLevel::Trace, __VA_ARGS__)
#define LOG_DEBUG(...) KBD_LOG_AT(::utils::LogLevel::Debug, __VA_ARGS__)
#define LOG_INFO(...) KBD_LOG_AT(::utils::LogLevel::Info, __VA_ARGS__)
#define LOG_WARN(...) KBD_LOG_AT(::utils::LogLevel::Warn, __VA_ARGS__)
#define LOG_ERROR(...) KBD_LOG_AT(::utils::LogLevel::Error, __VA_ARGS__)
