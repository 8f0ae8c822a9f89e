#include "time_api.hpp"

#include <stdexcept>
#include <string>

#include "../../utils/constants.hpp"
#include "../model/model.hpp"

namespace http::time_api {
    TimeAPI::TimeAPI(std::unique_ptr<ITimeProvider> p, std::unique_ptr<http::client::IHttpClient> client)
        : provider_(std::move(p)), http_(std::move(client)) {}

    std::string TimeAPI::fetch_utc_timestamp() {
        const http::model::Request req = provider_->build_current_time();
        const http::model::Response resp = http_->get(req);

        if (resp.status_ < constants::HTTP_SUCCESS_LOWER_BOUNDARY || resp.status_ >= constants::HTTP_SUCCESS_UPPER_BOUNDARY) {
            throw std::runtime_error("Time request failed with status " + std::to_string(resp.status_));
        }

        return provider_->parse_current_time(resp);
    }
}  // namespace http::time_api
