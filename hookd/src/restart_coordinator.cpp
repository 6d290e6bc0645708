#include "restart_coordinator.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

RestartCoordinator::RestartCoordinator(Trigger trigger, std::chrono::milliseconds interval)
    : trigger_(std::move(trigger)), interval_(interval),
      restart_requested_(false), running_(false) {}

RestartCoordinator::~RestartCoordinator() {
    stop();
}

void RestartCoordinator::request_restart() {
    std::lock_guard<std::mutex> lock(restart_mutex_);
    restart_requested_ = true;
}

bool RestartCoordinator::restart_pending() const {
    std::lock_guard<std::mutex> lock(restart_mutex_);
    return restart_requested_;
}

bool RestartCoordinator::poll_once() {
    std::lock_guard<std::mutex> lock(restart_mutex_);
    if (!restart_requested_) {
        return false;
    }

    spdlog::info("Restart signal received");
    try {
        trigger_();
    } catch (const std::exception& e) {
        // Reload is best effort; the request is consumed either way
        spdlog::error("Restart trigger failed: {}", e.what());
    }
    restart_requested_ = false;
    return true;
}

void RestartCoordinator::start() {
    if (running_.exchange(true)) {
        return;
    }
    monitor_thread_ = std::thread(&RestartCoordinator::monitor_loop, this);
    spdlog::info("Restart monitor started (interval {}ms)", interval_.count());
}

void RestartCoordinator::stop() {
    if (running_.exchange(false)) {
        {
            std::lock_guard<std::mutex> lock(wakeup_mutex_);
        }
        wakeup_cv_.notify_all();
        if (monitor_thread_.joinable()) {
            monitor_thread_.join();
        }
        spdlog::info("Restart monitor stopped");
    }
}

bool RestartCoordinator::is_running() const {
    return running_;
}

void RestartCoordinator::monitor_loop() {
    while (running_) {
        poll_once();

        std::unique_lock<std::mutex> lock(wakeup_mutex_);
        wakeup_cv_.wait_for(lock, interval_, [this] { return !running_; });
    }
}

RestartCoordinator::Trigger RestartCoordinator::sentinel_file_trigger(const std::filesystem::path& path) {
    return [path]() {
        util::touch_file(path);
        spdlog::info("Touched restart trigger {}", path.string());
    };
}
