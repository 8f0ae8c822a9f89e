#include "transport_error.hpp"

#include <stdexcept>
#include <string>

namespace http::error {
    TransportError::TransportError(std::string u, int code, const std::string &msg)
        : std::runtime_error(msg), url_(std::move(u)), curl_code_(code) {}
};  // namespace http::error
