#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <functional>
#include <mutex>
#include <thread>

// Level-triggered restart signal. Webhook workers raise it after a successful
// update; a single background loop observes it, fires the reload trigger and
// lowers it. Requests raised between two polls collapse into one trigger.
class RestartCoordinator {
public:
    using Trigger = std::function<void()>;

    RestartCoordinator(Trigger trigger, std::chrono::milliseconds interval);
    ~RestartCoordinator();

    RestartCoordinator(const RestartCoordinator&) = delete;
    RestartCoordinator& operator=(const RestartCoordinator&) = delete;

    void request_restart();
    bool restart_pending() const;

    // Fires the trigger and clears the flag if set. Returns true if it fired.
    bool poll_once();

    void start();
    void stop();
    bool is_running() const;

    static Trigger sentinel_file_trigger(const std::filesystem::path& path);

private:
    Trigger trigger_;
    std::chrono::milliseconds interval_;

    mutable std::mutex restart_mutex_;
    bool restart_requested_;

    std::thread monitor_thread_;
    std::atomic<bool> running_;
    std::mutex wakeup_mutex_;
    std::condition_variable wakeup_cv_;

    void monitor_loop();
};
