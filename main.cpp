#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include "src/config/run_config.hpp"
#include "src/http/api/time_api.hpp"
#include "src/http/client/curl_easy.hpp"
#include "src/http/client/curl_global.hpp"
#include "src/http/provider/timeapi_io.hpp"
#include "src/io/target_loader.hpp"
#include "src/renderers/console_renderer.hpp"
#include "src/utils/constants.hpp"
#include "src/utils/logger.hpp"
#include "src/watch/watch_engine.hpp"

namespace {
    volatile std::sig_atomic_t g_stop_requested = 0;

    void handle_stop_signal(int /*signal*/) { g_stop_requested = 1; }

    struct Args {
        std::string targets_ = constants::DEFAULT_TARGETS_FILE;
        std::string config_;
        std::string logfile_;
        std::optional<long> workers_;
        std::optional<long> retries_;
        std::optional<long> timeout_ms_;
        long interval_s_ = constants::DEFAULT_INTERVAL_S;
        bool once_ = false;
        bool debug_ = false;
    };

    long parse_long(const std::string& value, const char* flag) {
        char* end = nullptr;
        const long v = std::strtol(value.c_str(), &end, constants::BASE_10);
        if (value.empty() || end == nullptr || *end != '\0' || v < 0) {
            throw std::runtime_error(std::string("Invalid value for ") + flag + ": " + value);
        }
        return v;
    }

    bool parse_args(int argc, char* argv[], Args& args) {
        for (int i = 1; i < argc; ++i) {
            const std::string s(argv[i]);
            if (s == "--once") {
                args.once_ = true;
            } else if (s == "--debug") {
                args.debug_ = true;
            } else if (s.rfind("--targets=", 0) == 0) {
                args.targets_ = s.substr(10);
            } else if (s.rfind("--config=", 0) == 0) {
                args.config_ = s.substr(9);
            } else if (s.rfind("--logfile=", 0) == 0) {
                args.logfile_ = s.substr(10);
            } else if (s.rfind("--workers=", 0) == 0) {
                args.workers_ = parse_long(s.substr(10), "--workers");
            } else if (s.rfind("--retries=", 0) == 0) {
                args.retries_ = parse_long(s.substr(10), "--retries");
            } else if (s.rfind("--timeout-ms=", 0) == 0) {
                args.timeout_ms_ = parse_long(s.substr(13), "--timeout-ms");
            } else if (s.rfind("--interval=", 0) == 0) {
                args.interval_s_ = parse_long(s.substr(11), "--interval");
            } else {
                std::fprintf(stderr, "Unknown argument: %s\n", s.c_str());
                return false;
            }
        }
        return true;
    }

    config::RunConfig build_run_config(const Args& args) {
        config::RunConfig cfg = args.config_.empty() ? config::RunConfig{} : config::RunConfigLoader::load_from_file(args.config_);

        if (args.workers_) {
            cfg.worker_count_ = static_cast<size_t>(*args.workers_);
        }
        if (args.retries_) {
            cfg.max_retries_ = static_cast<size_t>(*args.retries_);
        }
        if (args.timeout_ms_) {
            if (*args.timeout_ms_ == 0) {
                throw std::runtime_error("--timeout-ms must be positive");
            }
            cfg.request_timeout_ = std::chrono::milliseconds{*args.timeout_ms_};
        }
        return cfg;
    }
}  // namespace

int main(int argc, char* argv[]) {
    FILE* logfp = nullptr;

    try {
        Args args;
        if (!parse_args(argc, argv, args)) {
            std::fprintf(stderr,
                         "Usage: %s [--targets=file] [--config=file.json] [--workers=N] [--retries=N] [--timeout-ms=N] "
                         "[--interval=seconds] [--once] [--debug] [--logfile=path]\n",
                         argv[0]);
            return 1;
        }

        if (!args.logfile_.empty()) {
            logfp = std::fopen(args.logfile_.c_str(), "a");
            if (logfp == nullptr) {
                std::cerr << "Cannot open logfile: " << args.logfile_ << std::endl;
                return 1;
            }
        }
        logging::Logger::init(args.debug_ ? logging::Level::DEBUG : logging::Level::INFO, logfp != nullptr ? logfp : stderr);

        //
        // Collect
        //

        auto targets = io::load_targets(args.targets_);
        if (targets.empty()) {
            std::cerr << "No URLs found in " << args.targets_ << std::endl;
            if (logfp != nullptr) {
                std::fclose(logfp);
            }
            return 0;
        }

        config::RunConfig run_config = build_run_config(args);

        http::client::CurlGlobal curl_global;
        CURLSH* share = curl_global.share();

        std::shared_ptr<http::time_api::ITimeSource> time_source;
        if (std::getenv(constants::FAKE_TIME_ENV) != nullptr) {
            time_source = std::make_shared<http::time_api::FixedTimeSource>(constants::FAKE_TIMESTAMP);
        } else {
            time_source = std::make_shared<http::time_api::TimeAPI>(std::make_unique<http::provider::TimeApiIoProvider>(),
                                                                    std::make_unique<http::client::CurlEasy>(share));
        }

        auto engine = watch::WatchEngineBuilder()
                          .with_http_client_factory([share]() { return std::make_unique<http::client::CurlEasy>(share); })
                          .with_time_source(time_source)
                          .with_run_config(std::move(run_config))
                          .with_targets(std::move(targets))
                          .with_renderer(std::make_unique<renderers::ConsoleRenderer>())
                          .validate()
                          .build();

        //
        // Run
        //

        if (args.once_) {
            engine->run_batch();
        } else {
            std::signal(SIGINT, handle_stop_signal);
            std::signal(SIGTERM, handle_stop_signal);
            engine->run_forever(std::chrono::seconds{args.interval_s_}, []() { return g_stop_requested == 0; });
        }
    } catch (const std::exception& e) {
        std::cerr << "Fatal Error: " << e.what() << std::endl;
        if (logfp != nullptr) {
            logging::Logger::error("Fatal Error: %s", e.what());
            std::fclose(logfp);
        }
        return 1;
    }

    if (logfp != nullptr) {
        std::fclose(logfp);
    }
    return 0;
};
