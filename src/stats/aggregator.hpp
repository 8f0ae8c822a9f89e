#ifndef UPTIME_WATCH_AGGREGATOR_HPP
#define UPTIME_WATCH_AGGREGATOR_HPP

#include <cstddef>
#include <vector>

#include "../probe/probe.hpp"

namespace stats {

    struct BatchSummary {
        size_t total_ = 0;
        size_t successes_ = 0;
        size_t http_errors_ = 0;
        size_t transport_errors_ = 0;
        double avg_response_ms_ = 0.0;
        double uptime_pct_ = 0.0;  // successes / total * 100
    };

    [[nodiscard]] BatchSummary summarize(const std::vector<probe::ProbeResult>& results);

}  // namespace stats

#endif
