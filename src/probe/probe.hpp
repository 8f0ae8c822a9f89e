#ifndef UPTIME_WATCH_PROBE_HPP
#define UPTIME_WATCH_PROBE_HPP

#include <chrono>
#include <string>
#include <variant>

#include "../config/run_config.hpp"
#include "../http/client/interface.hpp"
#include "../validation/validation.hpp"

namespace probe {

    struct Success {
        long status_;
    };

    struct HttpError {
        long status_;
    };

    struct Transport {
        std::string message_;
    };

    // Exactly one kind per result. Visitors end with an `else static_assert`
    // so a new kind is a compile error at every site.
    using CheckOutcome = std::variant<Success, HttpError, Transport>;

    template <class>
    inline constexpr bool always_false_v = false;

    struct ProbeResult {
        std::string target_;
        CheckOutcome outcome_;
        std::chrono::milliseconds elapsed_{0};
        std::string timestamp_utc_;
        validation::ValidationReport validation_;
    };

    class Probe {
       public:
        explicit Probe(http::client::IHttpClient& http) : http_(http) {}

        // One attempt: HTTPS policy, GET, classification, validation. Never throws
        // for network failures; they become a Transport outcome.
        [[nodiscard]] ProbeResult run(const std::string& target, const config::RunConfig& cfg, const std::string& batch_timestamp) const;

       private:
        http::client::IHttpClient& http_;
    };

}  // namespace probe

#endif
