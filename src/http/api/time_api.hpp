#ifndef UPTIME_WATCH_TIME_API_HPP
#define UPTIME_WATCH_TIME_API_HPP

#include <memory>
#include <string>

#include "../client/interface.hpp"
#include "../model/model.hpp"

namespace http::time_api {

    class ITimeSource {
       public:
        ITimeSource() = default;
        virtual ~ITimeSource() = default;
        ITimeSource(const ITimeSource&) = delete;
        ITimeSource& operator=(const ITimeSource&) = delete;
        ITimeSource(ITimeSource&&) = delete;
        ITimeSource& operator=(ITimeSource&&) = delete;

        // ISO-8601 UTC timestamp. Throws on any failure.
        [[nodiscard]] virtual std::string fetch_utc_timestamp() = 0;
    };

    class ITimeProvider {
       public:
        ITimeProvider() = default;
        virtual ~ITimeProvider() = default;
        ITimeProvider(const ITimeProvider&) = delete;
        ITimeProvider& operator=(const ITimeProvider&) = delete;
        ITimeProvider(ITimeProvider&&) = delete;
        ITimeProvider& operator=(ITimeProvider&&) = delete;

        [[nodiscard]] virtual http::model::Request build_current_time() const = 0;
        [[nodiscard]] virtual std::string parse_current_time(const http::model::Response& resp) const = 0;
    };

    class TimeAPI : public ITimeSource {
       public:
        explicit TimeAPI(std::unique_ptr<ITimeProvider> p, std::unique_ptr<http::client::IHttpClient> client);
        [[nodiscard]] std::string fetch_utc_timestamp() override;

       private:
        std::unique_ptr<ITimeProvider> provider_;
        std::unique_ptr<http::client::IHttpClient> http_;
    };

    class FixedTimeSource : public ITimeSource {
       public:
        explicit FixedTimeSource(std::string timestamp) : timestamp_(std::move(timestamp)) {}
        [[nodiscard]] std::string fetch_utc_timestamp() override { return timestamp_; }

       private:
        std::string timestamp_;
    };

}  // namespace http::time_api

#endif
