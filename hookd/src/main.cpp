#include "auth.hpp"
#include "config.hpp"
#include "repo_sync.hpp"
#include "restart_coordinator.hpp"
#include "util.hpp"
#include "webhook_handler.hpp"
#include "webhook_server.hpp"
#include <spdlog/spdlog.h>
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

namespace {

std::atomic<bool> shutdown_requested{false};

void signal_handler(int) {
    shutdown_requested = true;
}

}

class HookDaemon {
public:
    explicit HookDaemon(const Config& config)
        : config_(config)
        , synchronizer_(config_)
        , coordinator_(RestartCoordinator::sentinel_file_trigger(config_.restart_trigger),
                       std::chrono::milliseconds(config_.restart_poll_ms))
        , handler_(config_, synchronizer_, coordinator_)
        , server_(config_, handler_, coordinator_) {}

    void run() {
        spdlog::info("Serving repositories under {}", config_.repo_root.string());
        spdlog::info("Restart trigger: {}", config_.restart_trigger.string());
        if (AccessGuard(config_).is_open()) {
            spdlog::warn("No security token configured, webhook authentication is disabled");
        }
        if (config_.debug) {
            spdlog::warn("Debug mode enabled, tokens may be written to the log");
        }

        coordinator_.start();
        server_.start();
    }

    bool is_running() const {
        return server_.is_running();
    }

    void shutdown() {
        server_.stop();
        coordinator_.stop();
    }

private:
    const Config& config_;
    GitSynchronizer synchronizer_;
    RestartCoordinator coordinator_;
    WebhookHandler handler_;
    WebhookServer server_;
};

int main(int argc, char* argv[]) {
    Config config;
    try {
        config = Config::from_env();
        if (!config.apply_args(argc, argv)) {
            std::cout << Config::usage(argv[0]);
            return 0;
        }
        config.validate();
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n\n" << Config::usage(argv[0]);
        return 1;
    }

    util::setup_logging(config.service_name, config.log_level);

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    try {
        HookDaemon daemon(config);
        daemon.run();

        // Block until a signal arrives or the listener dies
        while (!shutdown_requested && daemon.is_running()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        spdlog::info("Shutting down");
        daemon.shutdown();
    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }

    return 0;
}
