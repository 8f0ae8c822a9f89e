#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <variant>

#include "fake_http_client.hpp"
#include "src/config/run_config.hpp"
#include "src/probe/probe.hpp"

class ProbeTest : public ::testing::Test {
   protected:
    void SetUp() override {
        server_ = std::make_shared<testing_support::ScriptedServer>();
        client_ = std::make_unique<testing_support::FakeHttpClient>(server_);
    }

    std::shared_ptr<testing_support::ScriptedServer> server_;
    std::unique_ptr<testing_support::FakeHttpClient> client_;
    config::RunConfig cfg_;
};

TEST_F(ProbeTest, SuccessIsValidated) {
    server_->set("https://ok.test/", {.status_ = 200, .content_type_ = "text/html", .body_ = "hello world"});
    cfg_.body_contains_all_ = {"world"};

    const probe::Probe probe(*client_);
    const probe::ProbeResult r = probe.run("https://ok.test/", cfg_, "2020-01-01T00:00:00Z");

    ASSERT_TRUE(std::holds_alternative<probe::Success>(r.outcome_));
    EXPECT_EQ(std::get<probe::Success>(r.outcome_).status_, 200);
    EXPECT_EQ(r.target_, "https://ok.test/");
    EXPECT_EQ(r.timestamp_utc_, "2020-01-01T00:00:00Z");
    EXPECT_TRUE(r.validation_.overall_ok());
    EXPECT_TRUE(r.validation_.issues_.empty());
}

TEST_F(ProbeTest, NotFoundIsHttpErrorButStillValidated) {
    server_->set("https://missing.test/", {.status_ = 404, .content_type_ = "text/html", .body_ = "not here"});

    const probe::Probe probe(*client_);
    const probe::ProbeResult r = probe.run("https://missing.test/", cfg_, "ts");

    ASSERT_TRUE(std::holds_alternative<probe::HttpError>(r.outcome_));
    EXPECT_EQ(std::get<probe::HttpError>(r.outcome_).status_, 404);
    EXPECT_TRUE(r.validation_.header_ok_);
    EXPECT_TRUE(r.validation_.body_ok_);
    EXPECT_TRUE(r.validation_.https_policy_ok_);
}

TEST_F(ProbeTest, HttpPolicyFailureDoesNotBlockTheRequest) {
    server_->set("http://plain.test/", {.status_ = 200});

    const probe::Probe probe(*client_);
    const probe::ProbeResult r = probe.run("http://plain.test/", cfg_, "ts");

    EXPECT_TRUE(std::holds_alternative<probe::Success>(r.outcome_));
    EXPECT_EQ(server_->attempts("http://plain.test/"), 1U);
    EXPECT_FALSE(r.validation_.https_policy_ok_);
    EXPECT_TRUE(r.validation_.header_ok_);
    EXPECT_FALSE(r.validation_.overall_ok());
}

TEST_F(ProbeTest, TransportFailureForcesHeaderAndBodyFalse) {
    const probe::Probe probe(*client_);
    const probe::ProbeResult r = probe.run("https://down.test/", cfg_, "ts");

    ASSERT_TRUE(std::holds_alternative<probe::Transport>(r.outcome_));
    EXPECT_EQ(std::get<probe::Transport>(r.outcome_).message_, "Could not connect to server");
    EXPECT_FALSE(r.validation_.header_ok_);
    EXPECT_FALSE(r.validation_.body_ok_);
    EXPECT_TRUE(r.validation_.https_policy_ok_);
    ASSERT_EQ(r.validation_.issues_.size(), 1U);
    EXPECT_EQ(r.validation_.issues_[0], "Transport error: Could not connect to server");
}

TEST_F(ProbeTest, BodyIsNotRequestedWithoutBodyRules) {
    server_->set("https://ok.test/", {.status_ = 200, .content_type_ = "text/html", .body_ = "hello"});

    const probe::Probe probe(*client_);
    (void)probe.run("https://ok.test/", cfg_, "ts");

    EXPECT_EQ(server_->last_request("https://ok.test/").max_body_bytes_, 0U);
}

TEST_F(ProbeTest, RequestCarriesTimeoutAndBodyCap) {
    server_->set("https://ok.test/", {.status_ = 200, .content_type_ = "text/html", .body_ = "hello"});
    cfg_.body_contains_any_ = {"hello"};
    cfg_.max_body_bytes_ = 1234;
    cfg_.request_timeout_ = std::chrono::milliseconds{750};

    const probe::Probe probe(*client_);
    (void)probe.run("https://ok.test/", cfg_, "ts");

    const http::model::Request req = server_->last_request("https://ok.test/");
    EXPECT_EQ(req.max_body_bytes_, 1234U);
    EXPECT_EQ(req.timeout_.count(), 750);
}
