#ifndef UPTIME_WATCH_CURL_GLOBAL_HPP
#define UPTIME_WATCH_CURL_GLOBAL_HPP

#include <curl/curl.h>

#include <array>
#include <mutex>

namespace http::client {

    // Process-wide libcurl state: global init/cleanup and a share handle that
    // lets the easy handles of every worker reuse one DNS cache.
    class CurlGlobal {
       public:
        CurlGlobal();

        ~CurlGlobal();
        CurlGlobal(const CurlGlobal&) = delete;
        CurlGlobal& operator=(const CurlGlobal&) = delete;
        CurlGlobal(CurlGlobal&&) = delete;
        CurlGlobal& operator=(CurlGlobal&&) = delete;

        [[nodiscard]] CURLSH* share() const { return share_; }

       private:
        static void lock_cb(CURL* handle, curl_lock_data data, curl_lock_access access, void* userptr);
        static void unlock_cb(CURL* handle, curl_lock_data data, void* userptr);

        CURLSH* share_{};
        std::array<std::mutex, CURL_LOCK_DATA_LAST> locks_;
    };

}  // namespace http::client

#endif
