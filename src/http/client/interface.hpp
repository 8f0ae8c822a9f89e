#ifndef UPTIME_WATCH_CLIENT_INTERFACE_HPP
#define UPTIME_WATCH_CLIENT_INTERFACE_HPP

#include "../model/model.hpp"

namespace http::client {
    class IHttpClient {
       public:
        IHttpClient() = default;
        virtual ~IHttpClient() = default;
        IHttpClient(const IHttpClient&) = delete;
        virtual IHttpClient& operator=(const IHttpClient&) = delete;
        IHttpClient(IHttpClient&&) = delete;
        virtual IHttpClient& operator=(IHttpClient&&) = delete;

        // Returns any HTTP response, whatever its status. Throws
        // http::error::TransportError when no usable response was obtained.
        virtual http::model::Response get(const http::model::Request& req) = 0;
    };
}  // namespace http::client

#endif
