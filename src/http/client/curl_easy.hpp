#ifndef UPTIME_WATCH_CURL_EASY_HPP
#define UPTIME_WATCH_CURL_EASY_HPP

#include <curl/curl.h>

#include <array>
#include <chrono>
#include <string>
#include <utility>
#include <vector>

#include "../model/model.hpp"
#include "interface.hpp"

struct curl_slist;

namespace http::client {
    const size_t ERROR_BUFFER_SIZE = CURL_ERROR_SIZE;

    // One easy handle, reused across requests. Not thread-safe: give each
    // worker its own instance.
    class CurlEasy : public IHttpClient {
       public:
        explicit CurlEasy(CURLSH* share = nullptr);

        ~CurlEasy() override;
        CurlEasy(const CurlEasy&) = delete;
        CurlEasy& operator=(const CurlEasy&) = delete;
        CurlEasy(CurlEasy&&) = delete;
        CurlEasy& operator=(CurlEasy&&) = delete;

        http::model::Response get(const http::model::Request& req) override;

       private:
        template <typename T>
        void setopt(int option, T value);  // defined in .cpp with CURLoption

        void set_url(const std::string& u);
        void set_headers(const std::vector<std::string>& hs);
        void set_timeout(std::chrono::milliseconds timeout);
        void set_defaults_once(CURLSH* share);
        void prepare_for_new_request(size_t max_body_bytes);
        void perform_throw(const std::string& url);
        http::model::Response make_response(const std::string& url);

        static size_t header_cb(char* buffer, size_t size, size_t n_items, void* userdata);
        static size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata);

        std::string last_body_;
        size_t body_limit_ = http::model::UNLIMITED_BODY;
        bool body_truncated_ = false;
        std::vector<std::pair<std::string, std::string>> last_response_headers_;

        std::array<char, ERROR_BUFFER_SIZE> error_buf_{};
        curl_slist* headers_{};

        CURL* handle_{};
    };
}  // namespace http::client

#endif
