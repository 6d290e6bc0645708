#include <catch2/catch_all.hpp>
#include "restart_coordinator.hpp"
#include <atomic>
#include <chrono>
#include <filesystem>
#include <stdexcept>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using namespace std::chrono_literals;

TEST_CASE("Poll without a request does nothing") {
    int fired = 0;
    RestartCoordinator coordinator([&] { fired++; }, 1000ms);

    REQUIRE_FALSE(coordinator.restart_pending());
    REQUIRE_FALSE(coordinator.poll_once());
    REQUIRE(fired == 0);
}

TEST_CASE("One request fires exactly once") {
    int fired = 0;
    RestartCoordinator coordinator([&] { fired++; }, 1000ms);

    coordinator.request_restart();
    REQUIRE(coordinator.restart_pending());

    REQUIRE(coordinator.poll_once());
    REQUIRE(fired == 1);
    REQUIRE_FALSE(coordinator.restart_pending());

    REQUIRE_FALSE(coordinator.poll_once());
    REQUIRE(fired == 1);
}

TEST_CASE("Requests between polls collapse into one trigger") {
    int fired = 0;
    RestartCoordinator coordinator([&] { fired++; }, 1000ms);

    coordinator.request_restart();
    coordinator.request_restart();
    coordinator.request_restart();

    REQUIRE(coordinator.poll_once());
    REQUIRE_FALSE(coordinator.poll_once());
    REQUIRE(fired == 1);
}

TEST_CASE("Failing trigger still clears the request") {
    int attempts = 0;
    RestartCoordinator coordinator([&] {
        attempts++;
        throw std::runtime_error("read-only filesystem");
    }, 1000ms);

    coordinator.request_restart();
    REQUIRE(coordinator.poll_once());
    REQUIRE(attempts == 1);
    REQUIRE_FALSE(coordinator.restart_pending());
}

TEST_CASE("Background loop fires within one interval") {
    std::atomic<int> fired{0};
    RestartCoordinator coordinator([&] { fired++; }, 50ms);
    coordinator.start();
    REQUIRE(coordinator.is_running());

    coordinator.request_restart();
    coordinator.request_restart();

    auto deadline = std::chrono::steady_clock::now() + 2s;
    while (fired.load() == 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(10ms);
    }
    std::this_thread::sleep_for(200ms);

    REQUIRE(fired.load() == 1);
    REQUIRE_FALSE(coordinator.restart_pending());

    coordinator.stop();
    REQUIRE_FALSE(coordinator.is_running());
}

TEST_CASE("Concurrent requests never produce more triggers than polls") {
    std::atomic<int> fired{0};
    RestartCoordinator coordinator([&] { fired++; }, 1000ms);

    std::vector<std::thread> workers;
    for (int i = 0; i < 8; ++i) {
        workers.emplace_back([&] {
            for (int j = 0; j < 100; ++j) coordinator.request_restart();
        });
    }
    for (auto& w : workers) w.join();

    REQUIRE(coordinator.poll_once());
    REQUIRE_FALSE(coordinator.poll_once());
    REQUIRE(fired.load() == 1);
}

TEST_CASE("Sentinel trigger creates and touches the file") {
    auto dir = fs::temp_directory_path() / "hookd_sentinel";
    fs::remove_all(dir);
    fs::create_directories(dir);
    auto sentinel = dir / "restart_trigger";

    auto trigger = RestartCoordinator::sentinel_file_trigger(sentinel);
    trigger();
    REQUIRE(fs::exists(sentinel));

    auto old_time = fs::file_time_type::clock::now() - 1h;
    fs::last_write_time(sentinel, old_time);
    trigger();
    REQUIRE(fs::last_write_time(sentinel) > old_time);

    auto bad = RestartCoordinator::sentinel_file_trigger(dir / "no-such-dir" / "trigger");
    REQUIRE_THROWS(bad());
}
