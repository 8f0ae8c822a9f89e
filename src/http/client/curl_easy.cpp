#include "curl_easy.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <stdexcept>
#include <string>
#include <vector>

#include "../../utils/constants.hpp"
#include "../../utils/logger.hpp"
#include "../../utils/string_utils.hpp"
#include "../error/transport_error.hpp"
#include "../model/model.hpp"

namespace http::client {

    struct CurlDefaults {
        static constexpr long FOLLOW_LOCATION = 1L;
        static constexpr long MAX_REDIRECTS = 5L;
        static constexpr long CONNECT_TIMEOUT_MS = 10'000L;
        static constexpr long TIMEOUT_MS = 30'000L;
        static constexpr const char* USER_AGENT = "uptime-watch/1.0";
        static constexpr long NO_PROGRESS = 1L;
        static constexpr long NO_SIGNAL = 1L;
        static constexpr long HTTP_GET = 1L;
        static constexpr long HTTP09_ALLOWED = 0L;
        static constexpr const char* ALLOWED_PROTOCOLS = "http,https";
    };

    static constexpr const char* STATUS_LINE_PREFIX = "HTTP/";

    template <typename T>
    void CurlEasy::setopt(int option, T value) {
        const auto rc = curl_easy_setopt(handle_, static_cast<CURLoption>(option), value);

        if (rc != CURLE_OK) {
            throw std::runtime_error(std::string("curl_easy_setopt failed: ") + curl_easy_strerror(rc));
        }
    }

    CurlEasy::CurlEasy(CURLSH* share) : handle_(curl_easy_init()) {
        if (handle_ == nullptr) {
            throw std::runtime_error("Failed to create CURL easy handle");
        }

        error_buf_[0] = '\0';

        set_defaults_once(share);
    }

    CurlEasy::~CurlEasy() {
        if (headers_ != nullptr) {
            curl_slist_free_all(headers_);
        }

        if (handle_ != nullptr) {
            curl_easy_cleanup(handle_);
        }
    }

    void CurlEasy::set_url(const std::string& u) {
        const bool http_scheme = string_utils::ieq_prefix(u.c_str(), u.size(), constants::HTTP_SCHEME) ||
                                 string_utils::ieq_prefix(u.c_str(), u.size(), constants::HTTPS_SCHEME);
        if (!http_scheme) {
            throw http::error::TransportError(u, static_cast<int>(CURLE_UNSUPPORTED_PROTOCOL), "Unsupported URL, expected http:// or https://");
        }

        // A URL curl refuses is a property of the target, not of the client.
        const auto rc = curl_easy_setopt(handle_, CURLOPT_URL, u.c_str());
        if (rc != CURLE_OK) {
            throw http::error::TransportError(u, static_cast<int>(rc), std::string("Invalid URL: ") + curl_easy_strerror(rc));
        }
    }

    void CurlEasy::set_headers(const std::vector<std::string>& hs) {
        if (headers_ != nullptr) {
            curl_slist_free_all(headers_);
            headers_ = nullptr;
        }
        for (const auto& h : hs) {
            headers_ = curl_slist_append(headers_, h.c_str());
        }
        setopt(CURLOPT_HTTPHEADER, headers_);
    }

    void CurlEasy::set_timeout(std::chrono::milliseconds timeout) {
        const long total_ms = timeout.count() > 0 ? static_cast<long>(timeout.count()) : CurlDefaults::TIMEOUT_MS;
        setopt(CURLOPT_TIMEOUT_MS, total_ms);
        setopt(CURLOPT_CONNECTTIMEOUT_MS, std::min(total_ms, CurlDefaults::CONNECT_TIMEOUT_MS));
    }

    void CurlEasy::set_defaults_once(CURLSH* share) {
        setopt(CURLOPT_ERRORBUFFER, error_buf_.data());
        setopt(CURLOPT_FOLLOWLOCATION, CurlDefaults::FOLLOW_LOCATION);
        setopt(CURLOPT_MAXREDIRS, CurlDefaults::MAX_REDIRECTS);
        setopt(CURLOPT_NOPROGRESS, CurlDefaults::NO_PROGRESS);
        setopt(CURLOPT_USERAGENT, CurlDefaults::USER_AGENT);
        setopt(CURLOPT_NOSIGNAL, CurlDefaults::NO_SIGNAL);  // safe in multithreaded apps
        setopt(CURLOPT_HTTP09_ALLOWED, CurlDefaults::HTTP09_ALLOWED);
        setopt(CURLOPT_PROTOCOLS_STR, CurlDefaults::ALLOWED_PROTOCOLS);
        setopt(CURLOPT_REDIR_PROTOCOLS_STR, CurlDefaults::ALLOWED_PROTOCOLS);

        if (share != nullptr) {
            setopt(CURLOPT_SHARE, share);
        }
    }

    void CurlEasy::prepare_for_new_request(size_t max_body_bytes) {
        // Clear per-request scratch
        last_response_headers_.clear();
        last_body_.clear();
        body_limit_ = max_body_bytes;
        body_truncated_ = false;
        error_buf_[0] = '\0';

        setopt(CURLOPT_HTTPGET, CurlDefaults::HTTP_GET);
        setopt(CURLOPT_WRITEFUNCTION, &CurlEasy::write_cb);
        setopt(CURLOPT_WRITEDATA, this);
        setopt(CURLOPT_HEADERFUNCTION, &CurlEasy::header_cb);
        setopt(CURLOPT_HEADERDATA, this);
    }

    size_t CurlEasy::header_cb(char* buffer, size_t size, size_t n_items, void* userdata) {
        auto* self = static_cast<CurlEasy*>(userdata);
        const size_t bytes = size * n_items;

        // A new status line starts a new response (redirect hop, 100 Continue).
        if (string_utils::ieq_prefix(buffer, bytes, STATUS_LINE_PREFIX)) {
            self->last_response_headers_.clear();
            return bytes;
        }

        const std::string line(buffer, bytes);
        const auto colon = line.find(':');
        if (colon == std::string::npos) {
            return bytes;
        }

        std::string name = string_utils::trim(line.substr(0, colon));
        if (!name.empty()) {
            self->last_response_headers_.emplace_back(std::move(name), string_utils::trim(line.substr(colon + 1)));
        }

        return bytes;
    }

    size_t CurlEasy::write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
        auto* self = static_cast<CurlEasy*>(userdata);
        const size_t total = size * nmemb;

        const size_t room = self->body_limit_ - std::min(self->body_limit_, self->last_body_.size());
        if (total > room) {
            // Keep what fits and stop the transfer; perform_throw() treats this as success.
            self->last_body_.append(ptr, room);
            self->body_truncated_ = true;
            return 0;
        }

        self->last_body_.append(ptr, total);
        return total;
    }

    http::model::Response CurlEasy::get(const http::model::Request& req) {
        set_url(req.url_);
        set_headers(req.headers_);
        set_timeout(req.timeout_);
        prepare_for_new_request(req.max_body_bytes_);

        perform_throw(req.url_);
        return make_response(req.url_);
    }

    void CurlEasy::perform_throw(const std::string& url) {
        const auto rc = curl_easy_perform(handle_);

        if (rc == CURLE_OK || (rc == CURLE_WRITE_ERROR && body_truncated_)) {
            return;
        }

        std::string err;

        if (error_buf_[0] != '\0') {
            err = error_buf_.data();
        } else {
            err = curl_easy_strerror(rc);
        }

        logging::Logger::debug("curl_easy_perform failed for %s: %s (CURLcode=%d)", url.c_str(), err.c_str(), static_cast<int>(rc));
        throw http::error::TransportError(url, static_cast<int>(rc), err);
    }

    http::model::Response CurlEasy::make_response(const std::string& url) {
        long code = 0;
        curl_easy_getinfo(handle_, CURLINFO_RESPONSE_CODE, &code);

        if (code <= 0) {
            throw http::error::TransportError(url, static_cast<int>(CURLE_WEIRD_SERVER_REPLY), "No HTTP status received");
        }

        http::model::Response r;
        r.status_ = code;
        r.body_ = std::move(last_body_);
        r.body_truncated_ = body_truncated_;
        r.headers_ = std::move(last_response_headers_);

        last_body_.clear();
        last_response_headers_.clear();
        return r;
    }

}  // namespace http::client
