#include "dispatcher.hpp"

#include <algorithm>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

#include "../utils/channel.hpp"
#include "../utils/constants.hpp"
#include "../utils/logger.hpp"
#include "../utils/thread_pool.hpp"

namespace watch {

    struct Job {
        size_t index_;
        std::string target_;
    };

    struct IndexedResult {
        size_t index_;
        probe::ProbeResult result_;
    };

    Dispatcher::Dispatcher(HttpClientFactory http_client_factory, std::shared_ptr<http::time_api::ITimeSource> time_source)
        : http_client_factory_(std::move(http_client_factory)), time_source_(std::move(time_source)) {
        if (!http_client_factory_) {
            throw std::invalid_argument("HTTP client factory is required");
        }
        if (time_source_ == nullptr) {
            throw std::invalid_argument("Time source is required");
        }
    }

    size_t Dispatcher::effective_worker_count(size_t configured, size_t target_count) { return std::max<size_t>(1, std::min(configured, target_count)); }

    bool Dispatcher::is_retryable(const probe::CheckOutcome& outcome) {
        return std::visit(
            [](const auto& arg) {
                using T = std::decay_t<decltype(arg)>;

                if constexpr (std::is_same_v<T, probe::Transport>) {
                    return true;
                } else if constexpr (std::is_same_v<T, probe::Success> || std::is_same_v<T, probe::HttpError>) {
                    return false;
                } else {
                    static_assert(probe::always_false_v<T>, "unhandled CheckOutcome");
                }
            },
            outcome);
    }

    std::string Dispatcher::fetch_batch_timestamp() const {
        try {
            return time_source_->fetch_utc_timestamp();
        } catch (const std::exception& e) {
            logging::Logger::warn("Timestamp fetch failed, using '%s': %s", constants::UNKNOWN_TIMESTAMP, e.what());
            return constants::UNKNOWN_TIMESTAMP;
        }
    }

    probe::ProbeResult Dispatcher::probe_with_retries(const probe::Probe& probe, const std::string& target, const config::RunConfig& cfg,
                                                      const std::string& batch_timestamp) {
        size_t retries = 0;
        probe::ProbeResult result = probe.run(target, cfg, batch_timestamp);

        while (is_retryable(result.outcome_) && retries < cfg.max_retries_) {
            ++retries;
            logging::Logger::debug("retry %zu/%zu for %s: %s", retries, cfg.max_retries_, target.c_str(),
                                   std::get<probe::Transport>(result.outcome_).message_.c_str());
            result = probe.run(target, cfg, batch_timestamp);
        }

        return result;
    }

    std::vector<probe::ProbeResult> Dispatcher::check_all(const std::vector<std::string>& targets,
                                                          const std::shared_ptr<const config::RunConfig>& cfg) const {
        if (targets.empty()) {
            return {};
        }
        if (cfg == nullptr) {
            throw std::invalid_argument("Run config is required");
        }

        const size_t workers = effective_worker_count(cfg->worker_count_, targets.size());
        const std::string batch_timestamp = fetch_batch_timestamp();

        logging::Logger::info("Checking %zu targets with %zu workers (timestamp %s)", targets.size(), workers, batch_timestamp.c_str());

        concurrency::Channel<Job> jobs;
        for (size_t i = 0; i < targets.size(); ++i) {
            jobs.push(Job{.index_ = i, .target_ = targets[i]});
        }
        jobs.close();

        concurrency::Channel<IndexedResult> results;
        {
            const config::RunConfig* shared_cfg = cfg.get();

            concurrency::WorkerPool pool(workers, [this, &jobs, &results, shared_cfg, &batch_timestamp](size_t worker_id) {
                auto http_client = http_client_factory_();
                const probe::Probe probe(*http_client);

                while (auto job = jobs.pop()) {
                    results.push(IndexedResult{.index_ = job->index_,
                                               .result_ = probe_with_retries(probe, job->target_, *shared_cfg, batch_timestamp)});
                }

                logging::Logger::debug("worker %zu drained the queue", worker_id);
            });

            pool.join_all();
        }
        results.close();

        std::vector<std::optional<probe::ProbeResult>> slots(targets.size());
        while (auto item = results.pop()) {
            slots.at(item->index_) = std::move(item->result_);
        }

        std::vector<probe::ProbeResult> out;
        out.reserve(slots.size());
        for (size_t i = 0; i < slots.size(); ++i) {
            if (!slots[i]) {
                throw std::logic_error("Dispatcher produced no result for target index " + std::to_string(i));
            }
            out.push_back(std::move(*slots[i]));
        }

        return out;
    }

}  // namespace watch
