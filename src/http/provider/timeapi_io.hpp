#ifndef UPTIME_WATCH_TIMEAPI_IO_HPP
#define UPTIME_WATCH_TIMEAPI_IO_HPP

#include <string>

#include "../api/time_api.hpp"
#include "../model/model.hpp"

namespace http::provider {
    class TimeApiIoProvider : public http::time_api::ITimeProvider {
       public:
        TimeApiIoProvider();
        [[nodiscard]] http::model::Request build_current_time() const override;
        [[nodiscard]] std::string parse_current_time(const http::model::Response& resp) const override;

       private:
        std::string base_url_;
    };
}  // namespace http::provider

#endif
