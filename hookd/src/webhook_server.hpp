#pragma once
#include "config.hpp"
#include "webhook_handler.hpp"
#include "restart_coordinator.hpp"
#include <httplib.h>
#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

class WebhookServer {
public:
    WebhookServer(const Config& config, WebhookHandler& handler,
                  const RestartCoordinator& coordinator);
    ~WebhookServer();

    // Binds synchronously and serves on a background thread. Throws
    // std::runtime_error if the address cannot be bound.
    void start();
    void stop();
    bool is_running() const;
    bool wait_until_ready(std::chrono::milliseconds timeout = std::chrono::seconds(5)) const;

private:
    const Config& config_;
    WebhookHandler& handler_;
    const RestartCoordinator& coordinator_;
    std::unique_ptr<httplib::Server> server_;
    std::thread server_thread_;
    std::atomic<bool> running_;

    void setup_routes();
};
