#ifndef UPTIME_WATCH_DISPATCHER_HPP
#define UPTIME_WATCH_DISPATCHER_HPP

#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "../config/run_config.hpp"
#include "../http/api/time_api.hpp"
#include "../http/client/interface.hpp"
#include "../probe/probe.hpp"

namespace watch {

    using HttpClientFactory = std::function<std::unique_ptr<http::client::IHttpClient>()>;

    class Dispatcher {
       public:
        // The factory is called once per worker thread.
        Dispatcher(HttpClientFactory http_client_factory, std::shared_ptr<http::time_api::ITimeSource> time_source);

        // Results are in input order: result[i].target_ == targets[i].
        [[nodiscard]] std::vector<probe::ProbeResult> check_all(const std::vector<std::string>& targets,
                                                                const std::shared_ptr<const config::RunConfig>& cfg) const;

        [[nodiscard]] static size_t effective_worker_count(size_t configured, size_t target_count);

        // Only transport failures are worth another attempt.
        [[nodiscard]] static bool is_retryable(const probe::CheckOutcome& outcome);

        // Retries in place, with no delay, while the outcome is Transport and
        // retries remain. Only the last attempt is returned.
        [[nodiscard]] static probe::ProbeResult probe_with_retries(const probe::Probe& probe, const std::string& target, const config::RunConfig& cfg,
                                                                   const std::string& batch_timestamp);

       private:
        [[nodiscard]] std::string fetch_batch_timestamp() const;

        HttpClientFactory http_client_factory_;
        std::shared_ptr<http::time_api::ITimeSource> time_source_;
    };

}  // namespace watch

#endif
