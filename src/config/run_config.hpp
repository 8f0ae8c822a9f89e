#ifndef UPTIME_WATCH_CONFIG_RUN_CONFIG_HPP
#define UPTIME_WATCH_CONFIG_RUN_CONFIG_HPP

#include <simdjson.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "../utils/constants.hpp"

namespace config {

    template <typename T>
    struct ParserOptions {
        bool is_required_ = false;
        T fallback_value_;
        std::string error_message_;
    };

    using HeaderRule = std::pair<std::string, std::string>;

    // Validation policy plus run parameters. Built once, then shared read-only
    // (as std::shared_ptr<const RunConfig>) by every probe of a batch.
    struct RunConfig {
        bool https_required_ = constants::DEFAULT_HTTPS_REQUIRED;

        std::vector<std::string> required_headers_ = {constants::CONTENT_TYPE_HEADER};
        std::vector<std::string> content_type_allowlist_ = {"text/html", "application/json"};
        std::vector<HeaderRule> header_equals_;
        std::vector<HeaderRule> header_contains_;

        size_t max_body_bytes_ = constants::DEFAULT_MAX_BODY_BYTES;
        std::vector<std::string> body_contains_all_;
        std::vector<std::string> body_contains_any_;

        size_t worker_count_ = constants::DEFAULT_WORKER_COUNT;
        size_t max_retries_ = constants::DEFAULT_MAX_RETRIES;
        std::chrono::milliseconds request_timeout_{constants::DEFAULT_REQUEST_TIMEOUT_MS};

        [[nodiscard]] bool has_body_rules() const { return !body_contains_all_.empty() || !body_contains_any_.empty(); }
    };

    const ParserOptions<bool> HTTPS_REQUIRED_PARSER_OPTIONS = {
        .is_required_ = false, .fallback_value_ = constants::DEFAULT_HTTPS_REQUIRED, .error_message_ = "Invalid https_required"};
    const ParserOptions<int64_t> MAX_BODY_BYTES_PARSER_OPTIONS = {.is_required_ = false,
                                                                  .fallback_value_ = static_cast<int64_t>(constants::DEFAULT_MAX_BODY_BYTES),
                                                                  .error_message_ = "Invalid max_body_bytes, must be a positive integer"};
    const ParserOptions<int64_t> WORKER_COUNT_PARSER_OPTIONS = {.is_required_ = false,
                                                                .fallback_value_ = static_cast<int64_t>(constants::DEFAULT_WORKER_COUNT),
                                                                .error_message_ = "Invalid worker_count, must be a non-negative integer"};
    const ParserOptions<int64_t> MAX_RETRIES_PARSER_OPTIONS = {.is_required_ = false,
                                                               .fallback_value_ = static_cast<int64_t>(constants::DEFAULT_MAX_RETRIES),
                                                               .error_message_ = "Invalid max_retries, must be a non-negative integer"};
    const ParserOptions<int64_t> REQUEST_TIMEOUT_MS_PARSER_OPTIONS = {.is_required_ = false,
                                                                      .fallback_value_ = constants::DEFAULT_REQUEST_TIMEOUT_MS,
                                                                      .error_message_ = "Invalid request_timeout_ms, must be a positive integer"};

    class RunConfigLoader {
       public:
        [[nodiscard]] static RunConfig load_from_file(const std::filesystem::path& path);
        [[nodiscard]] static RunConfig parse_json(std::string_view json);

       private:
        [[nodiscard]] static RunConfig parse_document(simdjson::ondemand::document& doc);
    };

}  // namespace config

#endif
