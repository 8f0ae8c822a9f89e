#include "aggregator.hpp"

#include <type_traits>
#include <variant>

#include "../utils/constants.hpp"

namespace stats {

    BatchSummary summarize(const std::vector<probe::ProbeResult>& results) {
        BatchSummary summary;
        summary.total_ = results.size();

        if (summary.total_ == 0) {
            return summary;
        }

        long long total_ms = 0;
        for (const auto& r : results) {
            total_ms += r.elapsed_.count();
            std::visit(
                [&summary](const auto& outcome) {
                    using T = std::decay_t<decltype(outcome)>;

                    if constexpr (std::is_same_v<T, probe::Success>) {
                        ++summary.successes_;
                    } else if constexpr (std::is_same_v<T, probe::HttpError>) {
                        ++summary.http_errors_;
                    } else if constexpr (std::is_same_v<T, probe::Transport>) {
                        ++summary.transport_errors_;
                    } else {
                        static_assert(probe::always_false_v<T>, "unhandled CheckOutcome");
                    }
                },
                r.outcome_);
        }

        const auto total = static_cast<double>(summary.total_);
        summary.avg_response_ms_ = static_cast<double>(total_ms) / total;
        summary.uptime_pct_ = static_cast<double>(summary.successes_) * constants::PERCENT / total;
        return summary;
    }

}  // namespace stats
