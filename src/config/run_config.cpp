#include "run_config.hpp"

#include <simdjson.h>

#include <filesystem>
#include <stdexcept>
#include <string>

namespace config {
    namespace parser {
        template <typename T>
        static T parse_value(simdjson::simdjson_result<T> result, const ParserOptions<T>& options) {
            if (result.error() == simdjson::error_code::NO_SUCH_FIELD && !options.is_required_) {
                return options.fallback_value_;
            }

            if (result.error() != simdjson::error_code::SUCCESS) {
                throw std::runtime_error(options.error_message_);
            }

            return result.value();
        }

        static std::vector<std::string> parse_string_list(simdjson::ondemand::document& doc, const char* key,
                                                          const std::vector<std::string>& fallback) {
            simdjson::ondemand::array raw_list;
            const auto error = doc[key].get_array().get(raw_list);
            if (error == simdjson::error_code::NO_SUCH_FIELD) {
                return fallback;
            }
            if (error != simdjson::error_code::SUCCESS) {
                throw std::runtime_error(std::string("Invalid ") + key + ", expected an array of strings");
            }

            std::vector<std::string> out;
            for (auto raw_item : raw_list) {
                std::string_view item;
                if (raw_item.get_string().get(item) != simdjson::error_code::SUCCESS) {
                    throw std::runtime_error(std::string("Invalid ") + key + " entry, expected a string");
                }
                out.emplace_back(item);
            }
            return out;
        }

        // [{"name": "...", "value": "..."}, ...]
        static std::vector<HeaderRule> parse_header_rules(simdjson::ondemand::document& doc, const char* key) {
            simdjson::ondemand::array raw_rules;
            const auto error = doc[key].get_array().get(raw_rules);
            if (error == simdjson::error_code::NO_SUCH_FIELD) {
                return {};
            }
            if (error != simdjson::error_code::SUCCESS) {
                throw std::runtime_error(std::string("Invalid ") + key + ", expected an array of objects");
            }

            std::vector<HeaderRule> out;
            for (auto raw_rule : raw_rules) {
                simdjson::ondemand::object rule;
                if (raw_rule.get_object().get(rule) != simdjson::error_code::SUCCESS) {
                    throw std::runtime_error(std::string("Invalid ") + key + " entry, expected an object");
                }

                std::string_view name;
                std::string_view value;
                if (rule["name"].get_string().get(name) != simdjson::error_code::SUCCESS || name.empty()) {
                    throw std::runtime_error(std::string("Invalid ") + key + " entry, missing header name");
                }
                if (rule["value"].get_string().get(value) != simdjson::error_code::SUCCESS) {
                    throw std::runtime_error(std::string("Invalid ") + key + " entry, missing value");
                }
                out.emplace_back(std::string(name), std::string(value));
            }
            return out;
        }
    }  // namespace parser

    RunConfig RunConfigLoader::load_from_file(const std::filesystem::path& path) {
        if (!std::filesystem::exists(path) || !std::filesystem::is_regular_file(path)) {
            throw std::runtime_error("Config file not found: " + path.string());
        }

        simdjson::padded_string json;
        if (simdjson::padded_string::load(path.string()).get(json) != simdjson::error_code::SUCCESS) {
            throw std::runtime_error("Config file could not be read: " + path.string());
        }

        simdjson::ondemand::parser json_parser;
        simdjson::ondemand::document doc;
        if (json_parser.iterate(json).get(doc) != simdjson::error_code::SUCCESS) {
            throw std::runtime_error("Config file is not valid JSON: " + path.string());
        }

        return parse_document(doc);
    }

    RunConfig RunConfigLoader::parse_json(std::string_view json) {
        simdjson::padded_string padded(json);
        simdjson::ondemand::parser json_parser;
        simdjson::ondemand::document doc;
        if (json_parser.iterate(padded).get(doc) != simdjson::error_code::SUCCESS) {
            throw std::runtime_error("Config is not valid JSON");
        }

        return parse_document(doc);
    }

    RunConfig RunConfigLoader::parse_document(simdjson::ondemand::document& doc) {
        const RunConfig defaults;
        RunConfig out;

        out.https_required_ = parser::parse_value(doc["https_required"].get_bool(), HTTPS_REQUIRED_PARSER_OPTIONS);

        out.required_headers_ = parser::parse_string_list(doc, "required_headers", defaults.required_headers_);
        out.content_type_allowlist_ = parser::parse_string_list(doc, "content_type_allowlist", defaults.content_type_allowlist_);
        out.header_equals_ = parser::parse_header_rules(doc, "header_equals");
        out.header_contains_ = parser::parse_header_rules(doc, "header_contains");

        const int64_t max_body_bytes = parser::parse_value(doc["max_body_bytes"].get_int64(), MAX_BODY_BYTES_PARSER_OPTIONS);
        if (max_body_bytes <= 0) {
            throw std::runtime_error(MAX_BODY_BYTES_PARSER_OPTIONS.error_message_);
        }
        out.max_body_bytes_ = static_cast<size_t>(max_body_bytes);

        out.body_contains_all_ = parser::parse_string_list(doc, "body_contains_all", defaults.body_contains_all_);
        out.body_contains_any_ = parser::parse_string_list(doc, "body_contains_any", defaults.body_contains_any_);

        const int64_t worker_count = parser::parse_value(doc["worker_count"].get_int64(), WORKER_COUNT_PARSER_OPTIONS);
        if (worker_count < 0) {
            throw std::runtime_error(WORKER_COUNT_PARSER_OPTIONS.error_message_);
        }
        out.worker_count_ = static_cast<size_t>(worker_count);

        const int64_t max_retries = parser::parse_value(doc["max_retries"].get_int64(), MAX_RETRIES_PARSER_OPTIONS);
        if (max_retries < 0) {
            throw std::runtime_error(MAX_RETRIES_PARSER_OPTIONS.error_message_);
        }
        out.max_retries_ = static_cast<size_t>(max_retries);

        const int64_t timeout_ms = parser::parse_value(doc["request_timeout_ms"].get_int64(), REQUEST_TIMEOUT_MS_PARSER_OPTIONS);
        if (timeout_ms <= 0) {
            throw std::runtime_error(REQUEST_TIMEOUT_MS_PARSER_OPTIONS.error_message_);
        }
        out.request_timeout_ = std::chrono::milliseconds{timeout_ms};

        return out;
    }

}  // namespace config
