#ifndef UPTIME_WATCH_RENDERERS_INTERFACE_HPP
#define UPTIME_WATCH_RENDERERS_INTERFACE_HPP

#include <vector>

#include "../probe/probe.hpp"
#include "../stats/aggregator.hpp"

namespace renderers {
    class IRenderer {
       public:
        IRenderer() = default;
        virtual ~IRenderer() = default;
        IRenderer(const IRenderer&) = delete;
        IRenderer& operator=(const IRenderer&) = delete;
        IRenderer(IRenderer&&) = delete;
        IRenderer& operator=(IRenderer&&) = delete;

        virtual void render_batch_start() = 0;
        virtual void render_results(const std::vector<probe::ProbeResult>& results) = 0;
        virtual void render_summary(const stats::BatchSummary& summary) = 0;
    };
}  // namespace renderers

#endif
