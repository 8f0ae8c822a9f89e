#include "watch_engine.hpp"

#include <algorithm>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <thread>

#include "../utils/constants.hpp"
#include "../utils/logger.hpp"

namespace watch {

    //
    // WatchEngineBuilder implementation
    //

    WatchEngineBuilder::WatchEngineBuilder() : watch_engine_(std::make_unique<WatchEngine>()) {}

    WatchEngineBuilder& WatchEngineBuilder::with_http_client_factory(HttpClientFactory http_client_factory) {
        http_client_factory_ = std::move(http_client_factory);
        return *this;
    }

    WatchEngineBuilder& WatchEngineBuilder::with_time_source(std::shared_ptr<http::time_api::ITimeSource> time_source) {
        time_source_ = std::move(time_source);
        return *this;
    }

    WatchEngineBuilder& WatchEngineBuilder::with_run_config(config::RunConfig run_config) {
        watch_engine_->set_run_config(std::make_shared<const config::RunConfig>(std::move(run_config)));
        return *this;
    }

    WatchEngineBuilder& WatchEngineBuilder::with_targets(std::vector<std::string> targets) {
        watch_engine_->set_targets(std::move(targets));
        return *this;
    }

    WatchEngineBuilder& WatchEngineBuilder::with_renderer(std::unique_ptr<renderers::IRenderer> renderer) {
        has_renderer_ = renderer != nullptr;
        watch_engine_->set_renderer(std::move(renderer));
        return *this;
    }

    WatchEngineBuilder& WatchEngineBuilder::validate() {
        if (http_client_factory_ == nullptr) {
            throw std::runtime_error("HTTP client factory is required");
        }
        if (time_source_ == nullptr) {
            throw std::runtime_error("Time source is required");
        }
        if (watch_engine_->get_run_config() == nullptr) {
            throw std::runtime_error("Run config is required");
        }
        if (watch_engine_->get_targets().empty()) {
            throw std::runtime_error("At least one target is required");
        }
        if (!has_renderer_) {
            throw std::runtime_error("Renderer is required");
        }
        return *this;
    }

    std::unique_ptr<WatchEngine> WatchEngineBuilder::build() {
        watch_engine_->set_dispatcher(std::make_unique<Dispatcher>(http_client_factory_, time_source_));
        return std::move(watch_engine_);
    };

    //
    // WatchEngine implementation
    //

    void WatchEngine::set_dispatcher(std::unique_ptr<Dispatcher> dispatcher) { dispatcher_ = std::move(dispatcher); }

    void WatchEngine::set_renderer(std::unique_ptr<renderers::IRenderer> renderer) { renderer_ = std::move(renderer); }

    void WatchEngine::set_run_config(std::shared_ptr<const config::RunConfig> run_config) { run_config_ = std::move(run_config); }

    void WatchEngine::set_targets(std::vector<std::string> targets) { targets_ = std::move(targets); }

    const std::vector<std::string>& WatchEngine::get_targets() const { return targets_; }

    const std::shared_ptr<const config::RunConfig>& WatchEngine::get_run_config() const { return run_config_; }

    BatchReport WatchEngine::run_batch() const {
        renderer_->render_batch_start();

        BatchReport report;
        report.results_ = dispatcher_->check_all(targets_, run_config_);
        report.summary_ = stats::summarize(report.results_);

        renderer_->render_results(report.results_);
        renderer_->render_summary(report.summary_);
        return report;
    }

    void WatchEngine::run_forever(std::chrono::seconds interval, const std::function<bool()>& keep_running) const {
        while (keep_running()) {
            const BatchReport report = run_batch();
            logging::Logger::info("Batch done: %zu/%zu up (%.2f%%)", report.summary_.successes_, report.summary_.total_, report.summary_.uptime_pct_);

            if (!keep_running()) {
                break;
            }

            logging::Logger::info("Sleeping %lld seconds before next run...", static_cast<long long>(interval.count()));
            const auto wake_at = std::chrono::steady_clock::now() + interval;
            for (auto now = std::chrono::steady_clock::now(); now < wake_at; now = std::chrono::steady_clock::now()) {
                if (!keep_running()) {
                    return;
                }
                std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(constants::SLEEP_SLICE, wake_at - now));
            }
        }
    }
}  // namespace watch
