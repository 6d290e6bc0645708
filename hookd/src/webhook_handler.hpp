#pragma once
#include "config.hpp"
#include "auth.hpp"
#include "path_validator.hpp"
#include "repo_sync.hpp"
#include "restart_coordinator.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

struct WebhookRequest {
    std::string subpath;
    std::optional<std::string> token;
};

struct WebhookResponse {
    int status = 500;
    nlohmann::json body;

    static WebhookResponse success(const std::string& message);
    static WebhookResponse error(int status, const std::string& message);
};

class WebhookHandler {
public:
    WebhookHandler(const Config& config, RepoSynchronizer& synchronizer,
                   RestartCoordinator& coordinator);

    // Authenticate, validate, resolve, synchronize, then request a restart.
    // Never throws; every outcome is a response.
    WebhookResponse handle(const WebhookRequest& request);

private:
    const Config& config_;
    AccessGuard guard_;
    PathValidator validator_;
    RepoSynchronizer& synchronizer_;
    RestartCoordinator& coordinator_;

    // One lock per repository so syncs of the same tree do not interleave
    std::mutex repo_locks_mutex_;
    std::unordered_map<std::string, std::shared_ptr<std::mutex>> repo_locks_;

    std::shared_ptr<std::mutex> lock_for(const std::filesystem::path& repo_dir);
    SyncResult synchronize(const std::filesystem::path& repo_dir);
};
