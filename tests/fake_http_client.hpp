#ifndef UPTIME_WATCH_TESTS_FAKE_HTTP_CLIENT_HPP
#define UPTIME_WATCH_TESTS_FAKE_HTTP_CLIENT_HPP

#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>

#include "src/http/api/time_api.hpp"
#include "src/http/client/interface.hpp"
#include "src/http/error/transport_error.hpp"
#include "src/http/model/model.hpp"

namespace testing_support {

    // Per-URL canned behaviour shared by every client a factory hands out.
    // A URL with no script fails with a transport error.
    class ScriptedServer {
       public:
        struct Script {
            long status_ = 200;
            std::string content_type_ = "text/html";
            std::string body_;
            size_t transport_failures_before_success_ = 0;  // SIZE_MAX: always fail
        };

        void set(const std::string& url, Script script) {
            std::lock_guard<std::mutex> lock(mutex_);
            scripts_[url] = std::move(script);
        }

        http::model::Response serve(const http::model::Request& req) {
            std::lock_guard<std::mutex> lock(mutex_);
            const size_t attempt = attempts_[req.url_]++;
            last_request_[req.url_] = req;

            const auto it = scripts_.find(req.url_);
            if (it == scripts_.end() || attempt < it->second.transport_failures_before_success_) {
                throw http::error::TransportError(req.url_, 7, "Could not connect to server");
            }

            http::model::Response resp;
            resp.status_ = it->second.status_;
            if (!it->second.content_type_.empty()) {
                resp.headers_.emplace_back("Content-Type", it->second.content_type_);
            }
            resp.body_ = it->second.body_.substr(0, req.max_body_bytes_);
            resp.body_truncated_ = resp.body_.size() < it->second.body_.size();
            return resp;
        }

        size_t attempts(const std::string& url) {
            std::lock_guard<std::mutex> lock(mutex_);
            return attempts_[url];
        }

        http::model::Request last_request(const std::string& url) {
            std::lock_guard<std::mutex> lock(mutex_);
            return last_request_.at(url);
        }

       private:
        std::mutex mutex_;
        std::map<std::string, Script> scripts_;
        std::map<std::string, size_t> attempts_;
        std::map<std::string, http::model::Request> last_request_;
    };

    class FakeHttpClient : public http::client::IHttpClient {
       public:
        explicit FakeHttpClient(std::shared_ptr<ScriptedServer> server) : server_(std::move(server)) {}

        http::model::Response get(const http::model::Request& req) override { return server_->serve(req); }

       private:
        std::shared_ptr<ScriptedServer> server_;
    };

    class ThrowingTimeSource : public http::time_api::ITimeSource {
       public:
        [[nodiscard]] std::string fetch_utc_timestamp() override { throw std::runtime_error("time service unreachable"); }
    };

}  // namespace testing_support

#endif
