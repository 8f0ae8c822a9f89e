#ifndef UPTIME_WATCH_TRANSPORT_ERROR_HPP
#define UPTIME_WATCH_TRANSPORT_ERROR_HPP

#include <stdexcept>
#include <string>

namespace http::error {
    // No interpretable HTTP response: DNS, connect, TLS, timeout, malformed reply.
    struct TransportError : public std::runtime_error {
        std::string url_;
        int curl_code_;
        explicit TransportError(std::string u, int code, const std::string &msg);
    };
}  // namespace http::error

#endif
