#include <catch2/catch_all.hpp>
#include "webhook_server.hpp"
#include <filesystem>
#include <mutex>
#include <vector>

namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace {

class RecordingSynchronizer : public RepoSynchronizer {
public:
    SyncResult synchronize(const fs::path& repo_dir) override {
        std::lock_guard<std::mutex> lock(mutex_);
        calls.push_back(repo_dir);
        return SyncResult::success();
    }

    std::mutex mutex_;
    std::vector<fs::path> calls;
};

}

TEST_CASE("HTTP surface") {
    auto root = fs::temp_directory_path() / "hookd_server";
    fs::remove_all(root);
    fs::create_directories(root / "blog");
    fs::create_directories(root / "my site");

    Config config;
    config.repo_root = root;
    config.listen_addr = "127.0.0.1";
    config.listen_port = 18573;
    config.security_token = "abc123";

    RecordingSynchronizer sync;
    RestartCoordinator coordinator([] {}, 1000ms);
    WebhookHandler handler(config, sync, coordinator);
    WebhookServer server(config, handler, coordinator);
    server.start();
    REQUIRE(server.is_running());
    REQUIRE(server.wait_until_ready());

    httplib::Client client("127.0.0.1", config.listen_port);
    httplib::Headers auth = {{"X-Security-Token", "abc123"}};

    SECTION("authorized update") {
        auto res = client.Post("/webhook/blog", auth, std::string(), "application/json");
        REQUIRE(res);
        REQUIRE(res->status == 200);
        REQUIRE(nlohmann::json::parse(res->body) ==
                nlohmann::json{{"status", "success"}, {"message", "Repository updated"}});
        REQUIRE(sync.calls.size() == 1);
        REQUIRE(coordinator.restart_pending());
    }

    SECTION("missing token") {
        auto res = client.Post("/webhook/blog", std::string(), "application/json");
        REQUIRE(res);
        REQUIRE(res->status == 401);
        REQUIRE(nlohmann::json::parse(res->body)["message"] == "Unauthorized");
        REQUIRE(sync.calls.empty());
    }

    SECTION("missing repository keeps its JSON body") {
        auto res = client.Post("/webhook/missing-site", auth, std::string(), "application/json");
        REQUIRE(res);
        REQUIRE(res->status == 404);
        REQUIRE(nlohmann::json::parse(res->body)["message"] == "Repository not found");
    }

    SECTION("percent-decoded subpath reaches the validator") {
        auto res = client.Post("/webhook/my%20site", auth, std::string(), "application/json");
        REQUIRE(res);
        REQUIRE(res->status == 400);
        REQUIRE(sync.calls.empty());
    }

    SECTION("unknown route") {
        auto res = client.Get("/nothing-here");
        REQUIRE(res);
        REQUIRE(res->status == 404);
        REQUIRE(nlohmann::json::parse(res->body)["status"] == "error");
    }

    SECTION("health") {
        auto res = client.Get("/health");
        REQUIRE(res);
        REQUIRE(res->status == 200);
        auto body = nlohmann::json::parse(res->body);
        REQUIRE(body["status"] == "ok");
        REQUIRE(body["restart_pending"] == false);
    }

    server.stop();
    REQUIRE_FALSE(server.is_running());
}

TEST_CASE("Stop right after start does not hang") {
    auto root = fs::temp_directory_path() / "hookd_server_quick_stop";
    fs::create_directories(root);

    Config config;
    config.repo_root = root;
    config.listen_addr = "127.0.0.1";
    config.listen_port = 18574;

    RecordingSynchronizer sync;
    RestartCoordinator coordinator([] {}, 1000ms);
    WebhookHandler handler(config, sync, coordinator);

    for (int i = 0; i < 20; ++i) {
        WebhookServer server(config, handler, coordinator);
        server.start();
        server.stop();
        REQUIRE_FALSE(server.is_running());
    }
}
