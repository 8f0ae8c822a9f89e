#include "probe.hpp"

#include <chrono>
#include <string>

#include "../http/error/transport_error.hpp"
#include "../http/model/model.hpp"
#include "../utils/constants.hpp"
#include "../utils/logger.hpp"

namespace probe {

    ProbeResult Probe::run(const std::string& target, const config::RunConfig& cfg, const std::string& batch_timestamp) const {
        ProbeResult result;
        result.target_ = target;
        result.timestamp_utc_ = batch_timestamp;

        validation::enforce_https_policy(target, cfg, result.validation_);

        http::model::Request req;
        req.url_ = target;
        req.timeout_ = cfg.request_timeout_;
        req.max_body_bytes_ = cfg.has_body_rules() ? cfg.max_body_bytes_ : 0;

        const auto start = std::chrono::steady_clock::now();
        try {
            const http::model::Response resp = http_.get(req);
            result.elapsed_ = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);

            if (resp.status_ >= constants::HTTP_SUCCESS_LOWER_BOUNDARY && resp.status_ < constants::HTTP_SUCCESS_UPPER_BOUNDARY) {
                result.outcome_ = Success{resp.status_};
            } else {
                // Error pages still carry headers and bodies worth validating.
                result.outcome_ = HttpError{resp.status_};
            }

            validation::validate_response(resp, cfg, result.validation_);
        } catch (const http::error::TransportError& e) {
            logging::Logger::debug("transport error for %s (CURLcode=%d): %s", e.url_.c_str(), e.curl_code_, e.what());
            result.elapsed_ = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
            result.outcome_ = Transport{e.what()};
            result.validation_.header_ok_ = false;
            result.validation_.body_ok_ = false;
            result.validation_.issues_.push_back(std::string("Transport error: ") + e.what());
        }

        logging::Logger::debug("probe %s finished in %lld ms", target.c_str(), static_cast<long long>(result.elapsed_.count()));
        return result;
    }

}  // namespace probe
