#include "curl_global.hpp"

#include <curl/curl.h>

#include <stdexcept>
#include <string>

#include "../../utils/logger.hpp"

namespace http::client {

    CurlGlobal::CurlGlobal() {
        const auto rc = curl_global_init(CURL_GLOBAL_ALL);
        if (rc != CURLE_OK) {
            throw std::runtime_error("Failed to initialize libcurl");
        }

        share_ = curl_share_init();
        if (share_ == nullptr) {
            // Workers still run, each with a private DNS cache.
            logging::Logger::warn("CurlGlobal: curl_share_init failed, DNS cache is not shared");
            return;
        }

        curl_share_setopt(share_, CURLSHOPT_LOCKFUNC, &CurlGlobal::lock_cb);
        curl_share_setopt(share_, CURLSHOPT_UNLOCKFUNC, &CurlGlobal::unlock_cb);
        curl_share_setopt(share_, CURLSHOPT_USERDATA, this);

        const auto src = curl_share_setopt(share_, CURLSHOPT_SHARE, CURL_LOCK_DATA_DNS);
        if (src != CURLSHE_OK) {
            curl_share_cleanup(share_);
            share_ = nullptr;
            curl_global_cleanup();
            throw std::runtime_error(std::string("curl_share_setopt failed: ") + curl_share_strerror(src));
        }
    }

    CurlGlobal::~CurlGlobal() {
        if (share_ != nullptr) {
            curl_share_cleanup(share_);
        }

        curl_global_cleanup();
    }

    void CurlGlobal::lock_cb(CURL* /*handle*/, curl_lock_data data, curl_lock_access /*access*/, void* userptr) {
        auto* self = static_cast<CurlGlobal*>(userptr);
        self->locks_.at(static_cast<size_t>(data)).lock();
    }

    void CurlGlobal::unlock_cb(CURL* /*handle*/, curl_lock_data data, void* userptr) {
        auto* self = static_cast<CurlGlobal*>(userptr);
        self->locks_.at(static_cast<size_t>(data)).unlock();
    }

}  // namespace http::client
