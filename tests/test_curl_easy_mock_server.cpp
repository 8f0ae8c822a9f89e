#include <arpa/inet.h>
#include <gtest/gtest.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <variant>

#include "src/config/run_config.hpp"
#include "src/http/client/curl_easy.hpp"
#include "src/http/client/curl_global.hpp"
#include "src/http/error/transport_error.hpp"
#include "src/probe/probe.hpp"

namespace {
    constexpr const char* OK_HTML_RESPONSE =
        "HTTP/1.1 200 OK\r\n"
        "Content-Type: text/html; charset=utf-8\r\n"
        "Content-Length: 11\r\n"
        "X-Frame-Options: DENY\r\n"
        "Connection: close\r\n"
        "\r\n"
        "hello world";

    constexpr const char* NOT_FOUND_RESPONSE =
        "HTTP/1.1 404 Not Found\r\n"
        "Content-Type: text/html\r\n"
        "Content-Length: 9\r\n"
        "Connection: close\r\n"
        "\r\n"
        "Not Found";

    constexpr const char* MALFORMED_RESPONSE = "LOL WHAT\r\n\r\n";

    // Accepts exactly one connection on 127.0.0.1, reads the request head,
    // optionally waits, writes `response` and closes.
    class OneShotServer {
       public:
        explicit OneShotServer(std::string response, std::chrono::milliseconds delay = std::chrono::milliseconds{0})
            : response_(std::move(response)), delay_(delay) {
            listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
            if (listen_fd_ < 0) {
                throw std::runtime_error("socket() failed");
            }

            sockaddr_in addr{};
            addr.sin_family = AF_INET;
            addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
            addr.sin_port = 0;
            if (::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 || ::listen(listen_fd_, 1) != 0) {
                ::close(listen_fd_);
                throw std::runtime_error("bind/listen failed");
            }

            socklen_t len = sizeof(addr);
            if (::getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
                ::close(listen_fd_);
                throw std::runtime_error("getsockname failed");
            }
            port_ = ntohs(addr.sin_port);

            thread_ = std::thread([this]() { serve_once(); });
        }

        ~OneShotServer() {
            // Unblocks accept() when nobody ever connected.
            ::shutdown(listen_fd_, SHUT_RDWR);
            if (thread_.joinable()) {
                thread_.join();
            }
            ::close(listen_fd_);
        }

        OneShotServer(const OneShotServer&) = delete;
        OneShotServer& operator=(const OneShotServer&) = delete;
        OneShotServer(OneShotServer&&) = delete;
        OneShotServer& operator=(OneShotServer&&) = delete;

        [[nodiscard]] std::string url() const { return "http://127.0.0.1:" + std::to_string(port_) + "/"; }
        [[nodiscard]] std::string host_and_port() const { return "127.0.0.1:" + std::to_string(port_); }
        [[nodiscard]] bool accepted() const { return accepted_.load(); }

       private:
        void serve_once() {
            const int conn = ::accept(listen_fd_, nullptr, nullptr);
            if (conn < 0) {
                return;
            }
            accepted_ = true;

            std::string request;
            char buf[1024];
            while (request.find("\r\n\r\n") == std::string::npos) {
                const ssize_t n = ::recv(conn, buf, sizeof(buf), 0);
                if (n <= 0) {
                    break;
                }
                request.append(buf, static_cast<size_t>(n));
            }

            if (delay_.count() > 0) {
                std::this_thread::sleep_for(delay_);
            }

            size_t sent = 0;
            while (sent < response_.size()) {
                const ssize_t n = ::send(conn, response_.data() + sent, response_.size() - sent, MSG_NOSIGNAL);
                if (n <= 0) {
                    break;
                }
                sent += static_cast<size_t>(n);
            }

            ::shutdown(conn, SHUT_WR);
            ::close(conn);
        }

        std::string response_;
        std::chrono::milliseconds delay_;
        int listen_fd_ = -1;
        unsigned short port_ = 0;
        std::atomic<bool> accepted_{false};
        std::thread thread_;
    };
}  // namespace

class CurlEasyMockServerTest : public ::testing::Test {
   protected:
    static void SetUpTestSuite() { curl_global_ = std::make_unique<http::client::CurlGlobal>(); }
    static void TearDownTestSuite() { curl_global_.reset(); }

    void SetUp() override {
        client_ = std::make_unique<http::client::CurlEasy>(curl_global_->share());
        cfg_.https_required_ = false;
    }

    static std::unique_ptr<http::client::CurlGlobal> curl_global_;
    std::unique_ptr<http::client::CurlEasy> client_;
    config::RunConfig cfg_;
};

std::unique_ptr<http::client::CurlGlobal> CurlEasyMockServerTest::curl_global_;

TEST_F(CurlEasyMockServerTest, OkHtmlIsSuccessWithBodyMatch) {
    OneShotServer server(OK_HTML_RESPONSE);
    cfg_.body_contains_all_ = {"world"};
    cfg_.header_equals_ = {{"X-Frame-Options", "DENY"}};

    const probe::Probe probe(*client_);
    const probe::ProbeResult r = probe.run(server.url(), cfg_, "2020-01-01T00:00:00Z");

    ASSERT_TRUE(std::holds_alternative<probe::Success>(r.outcome_));
    EXPECT_EQ(std::get<probe::Success>(r.outcome_).status_, 200);
    EXPECT_TRUE(r.validation_.header_ok_);
    EXPECT_TRUE(r.validation_.body_ok_);
    EXPECT_TRUE(r.validation_.https_policy_ok_);
    EXPECT_TRUE(r.validation_.issues_.empty());
}

TEST_F(CurlEasyMockServerTest, NotFoundIsHttpErrorWithValidHeaders) {
    OneShotServer server(NOT_FOUND_RESPONSE);

    const probe::Probe probe(*client_);
    const probe::ProbeResult r = probe.run(server.url(), cfg_, "ts");

    ASSERT_TRUE(std::holds_alternative<probe::HttpError>(r.outcome_));
    EXPECT_EQ(std::get<probe::HttpError>(r.outcome_).status_, 404);
    EXPECT_TRUE(r.validation_.header_ok_);
    EXPECT_TRUE(r.validation_.body_ok_);
    EXPECT_TRUE(r.validation_.overall_ok());
}

TEST_F(CurlEasyMockServerTest, MalformedReplyIsTransportError) {
    OneShotServer server(MALFORMED_RESPONSE);

    const probe::Probe probe(*client_);
    const probe::ProbeResult r = probe.run(server.url(), cfg_, "ts");

    ASSERT_TRUE(std::holds_alternative<probe::Transport>(r.outcome_));
    EXPECT_FALSE(r.validation_.header_ok_);
    EXPECT_FALSE(r.validation_.body_ok_);
}

TEST_F(CurlEasyMockServerTest, SlowServerTimesOut) {
    OneShotServer server(OK_HTML_RESPONSE, std::chrono::milliseconds{2'000});
    cfg_.request_timeout_ = std::chrono::milliseconds{1'000};

    const probe::Probe probe(*client_);
    const probe::ProbeResult r = probe.run(server.url(), cfg_, "ts");

    ASSERT_TRUE(std::holds_alternative<probe::Transport>(r.outcome_));
    EXPECT_GE(r.elapsed_.count(), 900);
    EXPECT_LT(r.elapsed_.count(), 2'000);
}

TEST_F(CurlEasyMockServerTest, BodyIsTruncatedAtCapWithoutError) {
    OneShotServer server(OK_HTML_RESPONSE);

    http::model::Request req;
    req.url_ = server.url();
    req.timeout_ = std::chrono::milliseconds{2'000};
    req.max_body_bytes_ = 5;

    const http::model::Response resp = client_->get(req);

    EXPECT_EQ(resp.status_, 200);
    EXPECT_EQ(resp.body_, "hello");
    EXPECT_TRUE(resp.body_truncated_);
    ASSERT_TRUE(resp.header("content-type").has_value());
    EXPECT_EQ(*resp.header("content-type"), "text/html; charset=utf-8");
}

TEST_F(CurlEasyMockServerTest, UnlimitedBodyIsReadFully) {
    OneShotServer server(OK_HTML_RESPONSE);

    http::model::Request req;
    req.url_ = server.url();
    req.timeout_ = std::chrono::milliseconds{2'000};

    const http::model::Response resp = client_->get(req);

    EXPECT_EQ(resp.body_, "hello world");
    EXPECT_FALSE(resp.body_truncated_);
}

TEST_F(CurlEasyMockServerTest, ConnectionRefusedThrowsTransportError) {
    std::string url;
    {
        // Grab a free port, then let the server go away before connecting.
        OneShotServer server("");
        url = server.url();
        const int fd = ::socket(AF_INET, SOCK_STREAM, 0);
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = htons(static_cast<unsigned short>(std::stoi(url.substr(url.rfind(':') + 1))));
        (void)::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
        ::close(fd);
    }

    http::model::Request req;
    req.url_ = url;
    req.timeout_ = std::chrono::milliseconds{2'000};

    EXPECT_THROW((void)client_->get(req), http::error::TransportError);
}

TEST_F(CurlEasyMockServerTest, SchemelessTargetIsTransportErrorWithoutConnecting) {
    OneShotServer server(OK_HTML_RESPONSE);

    const probe::Probe probe(*client_);
    const probe::ProbeResult r = probe.run(server.host_and_port() + "/", cfg_, "ts");

    ASSERT_TRUE(std::holds_alternative<probe::Transport>(r.outcome_));
    EXPECT_FALSE(r.validation_.header_ok_);
    EXPECT_FALSE(r.validation_.body_ok_);
    EXPECT_FALSE(server.accepted());
}

TEST_F(CurlEasyMockServerTest, NonHttpSchemeIsRejected) {
    OneShotServer server(OK_HTML_RESPONSE);

    http::model::Request req;
    req.url_ = "ftp://" + server.host_and_port() + "/";
    req.timeout_ = std::chrono::milliseconds{2'000};

    EXPECT_THROW((void)client_->get(req), http::error::TransportError);
    EXPECT_FALSE(server.accepted());
}

TEST_F(CurlEasyMockServerTest, OversizedUrlIsTransportError) {
    http::model::Request req;
    req.url_ = "http://a/" + std::string(9'000'000, 'x');
    req.timeout_ = std::chrono::milliseconds{2'000};

    EXPECT_THROW((void)client_->get(req), http::error::TransportError);

    const probe::Probe probe(*client_);
    const probe::ProbeResult r = probe.run(req.url_, cfg_, "ts");
    EXPECT_TRUE(std::holds_alternative<probe::Transport>(r.outcome_));
}
