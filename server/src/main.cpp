#include "tubeq/config.hpp"
#include "tubeq/expiry_sweeper.hpp"
#include "tubeq/transition_listener.hpp"
#include "tubeq/tube_registry.hpp"
#include <spdlog/spdlog.h>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace {

std::atomic<bool> g_shutdown{false};

void signal_handler(int signal) {
    (void)signal;
    g_shutdown.store(true);
}

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options]\n"
              << "Options:\n"
              << "  --tube NAME             Create tube NAME at startup (repeatable)\n"
              << "  --sweep-interval MS     Expiry sweep interval (default: 1000)\n"
              << "  --no-sweep              Disable the background sweeper\n"
              << "  --dev                   Debug logging, including every transition\n"
              << "  --help                  Show this help message\n"
              << "\n"
              << "Environment variables:\n"
              << "  TUBE_MAX_JOBS                 Jobs per tube, 0 = unlimited (default: 0)\n"
              << "  TUBE_MAX_WAITERS              Blocked reserves per tube (default: 10000)\n"
              << "  TUBE_DEFAULT_TTR              TTR for puts with ttr <= 0 (default: 60)\n"
              << "  TUBE_ALLOW_UNRESERVED_DELETE  Allow deleting READY/DELAYED jobs (default: false)\n"
              << "  SWEEP_ENABLED                 Run the background sweeper (default: true)\n"
              << "  SWEEP_INTERVAL_MS             Expiry sweep interval (default: 1000)\n"
              << "  LOG_LEVEL                     trace/debug/info/warn/error (default: info)\n"
              << std::endl;
}

} // namespace

int main(int argc, char* argv[]) {
    tubeq::Config config = tubeq::Config::load();
    tubeq::configure_logging(config.logging);

    bool dev_mode = false;
    std::vector<std::string> tubes = {"default"};

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--tube" && i + 1 < argc) {
            tubes.push_back(argv[++i]);
        } else if (arg == "--sweep-interval" && i + 1 < argc) {
            config.sweeper.interval_ms = std::atoi(argv[++i]);
        } else if (arg == "--no-sweep") {
            config.sweeper.enabled = false;
        } else if (arg == "--dev") {
            dev_mode = true;
            spdlog::set_level(spdlog::level::debug);
        } else {
            std::cerr << "Unknown argument: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        std::shared_ptr<tubeq::TransitionListener> listener;
        if (dev_mode) {
            listener = std::make_shared<tubeq::LoggingTransitionListener>();
        }

        auto registry = std::make_shared<tubeq::TubeRegistry>(config.tube, nullptr, nullptr, listener);
        for (const auto& name : tubes) {
            registry->get_or_create(name);
        }

        spdlog::info("tubeq broker starting");
        spdlog::info("Configuration:");
        spdlog::info("  - Tubes: {}", registry->size());
        spdlog::info("  - Max jobs per tube: {}", config.tube.max_jobs);
        spdlog::info("  - Max waiters per tube: {}", config.tube.max_waiters);
        spdlog::info("  - Default TTR: {}s", config.tube.default_ttr);
        spdlog::info("  - Unreserved delete: {}", config.tube.allow_unreserved_delete ? "allowed" : "refused");
        spdlog::info("  - Sweeper: {}", config.sweeper.enabled
                     ? "every " + std::to_string(config.sweeper.interval_ms) + "ms"
                     : std::string("disabled"));

        tubeq::ExpirySweeper sweeper(registry, config.sweeper.interval_ms);
        if (config.sweeper.enabled) {
            sweeper.start();
        }

        while (!g_shutdown.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        spdlog::info("Shutdown requested");
        sweeper.stop();

        for (const auto& tube : registry->tubes()) {
            auto counts = tube->counts();
            spdlog::info("Tube '{}': ready={}, delayed={}, reserved={}, buried={}",
                         tube->name(), counts.ready, counts.delayed, counts.reserved, counts.buried);
        }

    } catch (const std::exception& e) {
        spdlog::error("Broker error: {}", e.what());
        return 1;
    }

    spdlog::info("Broker exited cleanly");
    return 0;
}
