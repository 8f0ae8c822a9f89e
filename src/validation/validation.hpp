#ifndef UPTIME_WATCH_VALIDATION_HPP
#define UPTIME_WATCH_VALIDATION_HPP

#include <string>
#include <string_view>
#include <vector>

#include "../config/run_config.hpp"
#include "../http/model/model.hpp"

namespace validation {

    struct ValidationReport {
        bool header_ok_ = false;
        bool body_ok_ = false;
        bool https_policy_ok_ = false;
        std::vector<std::string> issues_;

        [[nodiscard]] bool overall_ok() const { return header_ok_ && body_ok_ && https_policy_ok_; }
    };

    struct BodyCheck {
        bool ok_ = true;
        std::vector<std::string> issues_;
    };

    // Records a policy issue; never blocks the request.
    void enforce_https_policy(std::string_view url, const config::RunConfig& cfg, ValidationReport& report);

    // Header rules, then body rules when any are configured.
    void validate_response(const http::model::Response& resp, const config::RunConfig& cfg, ValidationReport& report);

    void validate_headers(const http::model::Response& resp, const config::RunConfig& cfg, ValidationReport& report);

    [[nodiscard]] BodyCheck check_body_text(std::string_view text, const config::RunConfig& cfg);

    /// True when `needle` occurs in `text` as a standalone token: the bytes on
    /// either side are not ASCII alphanumeric (or are the string edges).
    /// Needles with any non-alphanumeric character use plain substring search;
    /// an empty needle always matches.
    [[nodiscard]] bool contains_token(std::string_view text, std::string_view needle);

}  // namespace validation

#endif
