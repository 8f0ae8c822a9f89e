#ifndef UPTIME_WATCH_WATCH_ENGINE_HPP
#define UPTIME_WATCH_WATCH_ENGINE_HPP

#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "../config/run_config.hpp"
#include "../http/api/time_api.hpp"
#include "../renderers/interface.hpp"
#include "../stats/aggregator.hpp"
#include "dispatcher.hpp"

namespace watch {
    struct BatchReport {
        std::vector<probe::ProbeResult> results_;
        stats::BatchSummary summary_;
    };

    class WatchEngine {
       public:
        void set_dispatcher(std::unique_ptr<Dispatcher> dispatcher);
        void set_renderer(std::unique_ptr<renderers::IRenderer> renderer);
        void set_run_config(std::shared_ptr<const config::RunConfig> run_config);
        void set_targets(std::vector<std::string> targets);

        [[nodiscard]] const std::vector<std::string>& get_targets() const;
        [[nodiscard]] const std::shared_ptr<const config::RunConfig>& get_run_config() const;

        // Check every target once, summarize, render.
        BatchReport run_batch() const;

        // Batches back to back with `interval` between them while keep_running() holds.
        void run_forever(std::chrono::seconds interval, const std::function<bool()>& keep_running) const;

       private:
        std::vector<std::string> targets_;
        std::shared_ptr<const config::RunConfig> run_config_;
        std::unique_ptr<Dispatcher> dispatcher_;
        std::unique_ptr<renderers::IRenderer> renderer_;
    };

    class WatchEngineBuilder {
       public:
        WatchEngineBuilder();

        WatchEngineBuilder& with_http_client_factory(HttpClientFactory http_client_factory);
        WatchEngineBuilder& with_time_source(std::shared_ptr<http::time_api::ITimeSource> time_source);
        WatchEngineBuilder& with_run_config(config::RunConfig run_config);
        WatchEngineBuilder& with_targets(std::vector<std::string> targets);
        WatchEngineBuilder& with_renderer(std::unique_ptr<renderers::IRenderer> renderer);
        WatchEngineBuilder& validate();
        std::unique_ptr<WatchEngine> build();

       private:
        std::unique_ptr<WatchEngine> watch_engine_;
        HttpClientFactory http_client_factory_;
        std::shared_ptr<http::time_api::ITimeSource> time_source_;
        bool has_renderer_ = false;
    };

}  // namespace watch

#endif
