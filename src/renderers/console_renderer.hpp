#ifndef UPTIME_WATCH_CONSOLE_RENDERER_HPP
#define UPTIME_WATCH_CONSOLE_RENDERER_HPP

#include <iostream>
#include <ostream>

#include "interface.hpp"

namespace renderers {
    class ConsoleRenderer : public IRenderer {
       public:
        explicit ConsoleRenderer(std::ostream& out = std::cout) : out_(out) {}

        void render_batch_start() override;
        void render_results(const std::vector<probe::ProbeResult>& results) override;
        void render_summary(const stats::BatchSummary& summary) override;

        static void render_result(std::ostream& out, const probe::ProbeResult& result);

       private:
        std::ostream& out_;
    };
}  // namespace renderers

#endif
