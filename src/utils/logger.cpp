#include "logger.hpp"

#include <array>
#include <chrono>
#include <ctime>

namespace logging {
    Level Logger::level_ = Level::INFO;
    FILE* Logger::sink_ = stderr;
    std::mutex Logger::mutex_;

    void Logger::init(Level level, FILE* sink) {
        std::lock_guard<std::mutex> lock(mutex_);
        level_ = level;
        sink_ = sink != nullptr ? sink : stderr;
    }

    bool Logger::is_enabled(Level level) { return level <= level_; }

    void Logger::error(const char* fmt, ...) {
        if (!is_enabled(Level::ERROR)) {
            return;
        }
        va_list ap;
        va_start(ap, fmt);
        log(Level::ERROR, fmt, ap);
        va_end(ap);
    }

    void Logger::warn(const char* fmt, ...) {
        if (!is_enabled(Level::WARN)) {
            return;
        }
        va_list ap;
        va_start(ap, fmt);
        log(Level::WARN, fmt, ap);
        va_end(ap);
    }

    void Logger::info(const char* fmt, ...) {
        if (!is_enabled(Level::INFO)) {
            return;
        }
        va_list ap;
        va_start(ap, fmt);
        log(Level::INFO, fmt, ap);
        va_end(ap);
    }

    void Logger::debug(const char* fmt, ...) {
        if (!is_enabled(Level::DEBUG)) {
            return;
        }
        va_list ap;
        va_start(ap, fmt);
        log(Level::DEBUG, fmt, ap);
        va_end(ap);
    }

    void Logger::log(Level level, const char* fmt, va_list ap) {
        static constexpr std::array<const char*, 4> NAMES = {"ERROR", "WARN", "INFO", "DEBUG"};

        const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        std::tm tm_utc{};
        gmtime_r(&now, &tm_utc);
        std::array<char, 32> stamp{};
        std::strftime(stamp.data(), stamp.size(), "%Y-%m-%dT%H:%M:%SZ", &tm_utc);

        std::lock_guard<std::mutex> lock(mutex_);
        std::fprintf(sink_, "%s [%s] ", stamp.data(), NAMES[static_cast<size_t>(level)]);
        std::vfprintf(sink_, fmt, ap);
        std::fprintf(sink_, "\n");
        std::fflush(sink_);
    }
}  // namespace logging
