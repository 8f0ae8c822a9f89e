#include "timeapi_io.hpp"

#include <simdjson.h>

#include <chrono>
#include <stdexcept>
#include <string>

#include "../api/time_api.hpp"
#include "../model/model.hpp"
using namespace simdjson;

namespace http::provider {
    struct TimeApiIoOptions {
        static constexpr const char* BASE_URL = "https://timeapi.io";
        static constexpr const char* CURRENT_UTC_PATH = "/api/Time/current/zone?timeZone=UTC";
        static constexpr long TIMEOUT_MS = 5'000L;
        static constexpr size_t MAX_BODY_BYTES = 16 * 1024;
    };

    TimeApiIoProvider::TimeApiIoProvider() : base_url_(TimeApiIoOptions::BASE_URL) {}

    http::model::Request TimeApiIoProvider::build_current_time() const {
        http::model::Request r;
        r.url_ = base_url_ + TimeApiIoOptions::CURRENT_UTC_PATH;
        r.headers_ = {"Accept: application/json"};
        r.timeout_ = std::chrono::milliseconds{TimeApiIoOptions::TIMEOUT_MS};
        r.max_body_bytes_ = TimeApiIoOptions::MAX_BODY_BYTES;
        return r;
    }

    std::string TimeApiIoProvider::parse_current_time(const http::model::Response& resp) const {
        try {
            ondemand::parser parser;
            padded_string json(resp.body_);
            ondemand::document doc = parser.iterate(json);

            auto date_time = doc["dateTime"].get_string();
            if (date_time.error() != simdjson::SUCCESS) {
                throw std::runtime_error("Time response has no dateTime field");
            }

            return std::string(date_time.value());
        } catch (const simdjson::simdjson_error& e) {
            throw std::runtime_error("Failed to parse time JSON: " + std::string(e.what()));
        }
    }
}  // namespace http::provider
