#include "console_renderer.hpp"

#include <iomanip>
#include <type_traits>
#include <variant>

namespace renderers {
    static constexpr const char* SEPARATOR = "----------------------------------------";

    void ConsoleRenderer::render_batch_start() { out_ << "=== Running website checks ===\n"; }

    void ConsoleRenderer::render_result(std::ostream& out, const probe::ProbeResult& result) {
        const auto flag = [](bool b) { return b ? "true" : "false"; };

        out << "URL: " << result.target_ << "\n";
        std::visit(
            [&out](const auto& outcome) {
                using T = std::decay_t<decltype(outcome)>;

                if constexpr (std::is_same_v<T, probe::Success>) {
                    out << "Status: " << outcome.status_ << " (success)\n";
                } else if constexpr (std::is_same_v<T, probe::HttpError>) {
                    out << "Status: " << outcome.status_ << " (http error)\n";
                } else if constexpr (std::is_same_v<T, probe::Transport>) {
                    out << "Transport error: " << outcome.message_ << "\n";
                } else {
                    static_assert(probe::always_false_v<T>, "unhandled CheckOutcome");
                }
            },
            result.outcome_);
        out << "Response time (ms): " << result.elapsed_.count() << "\n";
        out << "Timestamp (UTC): " << result.timestamp_utc_ << "\n";
        out << "Validation overall ok? " << flag(result.validation_.overall_ok()) << "\n";
        out << " - Header ok: " << flag(result.validation_.header_ok_) << "\n";
        out << " - Body ok: " << flag(result.validation_.body_ok_) << "\n";
        out << " - HTTPS policy ok: " << flag(result.validation_.https_policy_ok_) << "\n";

        if (!result.validation_.issues_.empty()) {
            out << "Issues:\n";
            for (const auto& issue : result.validation_.issues_) {
                out << " * " << issue << "\n";
            }
        }
    }

    void ConsoleRenderer::render_results(const std::vector<probe::ProbeResult>& results) {
        for (const auto& result : results) {
            render_result(out_, result);
            out_ << "\n" << SEPARATOR << "\n";
        }
    }

    void ConsoleRenderer::render_summary(const stats::BatchSummary& summary) {
        out_ << "=== Summary ===\n"
             << "Total: " << summary.total_ << "\n"
             << "Successes: " << summary.successes_ << "\n"
             << "HTTP errors: " << summary.http_errors_ << "\n"
             << "Transport errors: " << summary.transport_errors_ << "\n"
             << std::fixed << std::setprecision(2) << "Avg response time (ms): " << summary.avg_response_ms_ << "\n"
             << "Uptime: " << summary.uptime_pct_ << "%\n";
        out_ << std::defaultfloat;
        out_.flush();
    }
}  // namespace renderers
