#ifndef UPTIME_WATCH_LOGGER_HPP
#define UPTIME_WATCH_LOGGER_HPP

#include <cstdarg>
#include <cstdio>
#include <mutex>

namespace logging {
    enum class Level { ERROR = 0, WARN, INFO, DEBUG };

    // Process-wide, printf-style. Configure once from main() before workers start.
    class Logger {
       public:
        Logger() = delete;

        static void init(Level level, FILE* sink = stderr);
        [[nodiscard]] static bool is_enabled(Level level);

        static void error(const char* fmt, ...);
        static void warn(const char* fmt, ...);
        static void info(const char* fmt, ...);
        static void debug(const char* fmt, ...);

       private:
        static void log(Level level, const char* fmt, va_list ap);

        static Level level_;
        static FILE* sink_;
        static std::mutex mutex_;
    };
}  // namespace logging

#endif
