#ifndef UPTIME_WATCH_MODEL_HPP
#define UPTIME_WATCH_MODEL_HPP

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace http::model {
    inline constexpr size_t UNLIMITED_BODY = static_cast<size_t>(-1);

    struct Request {
        std::string url_;
        std::chrono::milliseconds timeout_{0};
        // Bytes of body to keep; 0 means the body is not read at all.
        size_t max_body_bytes_ = UNLIMITED_BODY;

        std::vector<std::string> headers_;
    };

    struct Response {
        long status_ = 0;

        std::string body_;
        bool body_truncated_ = false;

        // In arrival order, names as sent by the server.
        std::vector<std::pair<std::string, std::string>> headers_;

        // Case-insensitive lookup, first match wins.
        [[nodiscard]] std::optional<std::string> header(std::string_view name) const;
    };
}  // namespace http::model

#endif
