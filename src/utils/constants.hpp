
#ifndef UPTIME_WATCH_CONSTANTS_HPP
#define UPTIME_WATCH_CONSTANTS_HPP

#include <chrono>
#include <cstddef>

namespace constants {
    inline constexpr int BASE_10 = 10;
    inline constexpr long HTTP_SUCCESS_LOWER_BOUNDARY = 200;
    inline constexpr long HTTP_SUCCESS_UPPER_BOUNDARY = 300;
    inline constexpr double PERCENT = 100.0;

    inline constexpr bool DEFAULT_HTTPS_REQUIRED = true;
    inline constexpr size_t DEFAULT_MAX_BODY_BYTES = 64 * 1024;
    inline constexpr size_t DEFAULT_WORKER_COUNT = 50;
    inline constexpr size_t DEFAULT_MAX_RETRIES = 1;
    inline constexpr long DEFAULT_REQUEST_TIMEOUT_MS = 5'000;
    inline constexpr long DEFAULT_INTERVAL_S = 30;
    inline constexpr std::chrono::milliseconds SLEEP_SLICE{200};

    inline constexpr const char* UNKNOWN_TIMESTAMP = "unknown";
    inline constexpr const char* FAKE_TIMESTAMP = "2020-01-01T00:00:00Z";
    inline constexpr const char* FAKE_TIME_ENV = "TEST_FAKE_TIME";
    inline constexpr const char* DEFAULT_TARGETS_FILE = "website_list.txt";
    inline constexpr const char* HTTP_SCHEME = "http://";
    inline constexpr const char* HTTPS_SCHEME = "https://";
    inline constexpr const char* CONTENT_TYPE_HEADER = "Content-Type";
}  // namespace constants

#endif
