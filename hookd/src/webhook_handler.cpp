#include "webhook_handler.hpp"
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

WebhookResponse WebhookResponse::success(const std::string& message) {
    WebhookResponse response;
    response.status = 200;
    response.body = {{"status", "success"}, {"message", message}};
    return response;
}

WebhookResponse WebhookResponse::error(int status, const std::string& message) {
    WebhookResponse response;
    response.status = status;
    response.body = {{"status", "error"}, {"message", message}};
    return response;
}

WebhookHandler::WebhookHandler(const Config& config, RepoSynchronizer& synchronizer,
                               RestartCoordinator& coordinator)
    : config_(config), guard_(config), validator_(config.repo_root),
      synchronizer_(synchronizer), coordinator_(coordinator) {}

WebhookResponse WebhookHandler::handle(const WebhookRequest& request) {
    if (!guard_.authorize(request.token)) {
        spdlog::warn("Unauthorized access attempt");
        return WebhookResponse::error(401, "Unauthorized");
    }

    if (!validator_.validate(request.subpath)) {
        spdlog::error("Invalid repository path: {}", request.subpath);
        return WebhookResponse::error(400, "Invalid repository path");
    }

    auto repo_dir = validator_.resolve(request.subpath);
    if (!repo_dir) {
        spdlog::error("Repository path escapes {}: {}", config_.repo_root.string(), request.subpath);
        return WebhookResponse::error(400, "Invalid repository path");
    }

    spdlog::info("Processing webhook for: {}", repo_dir->string());

    std::error_code ec;
    if (!fs::is_directory(*repo_dir, ec)) {
        spdlog::error("Repository directory not found: {}", repo_dir->string());
        return WebhookResponse::error(404, "Repository not found");
    }

    auto result = synchronize(*repo_dir);
    if (!result.ok) {
        auto message = "Git operation failed: " + result.diagnostic;
        spdlog::error("{}", message);
        return WebhookResponse::error(500, message);
    }

    coordinator_.request_restart();
    spdlog::info("Repository updated: {}", repo_dir->string());
    return WebhookResponse::success("Repository updated");
}

std::shared_ptr<std::mutex> WebhookHandler::lock_for(const fs::path& repo_dir) {
    std::lock_guard<std::mutex> lock(repo_locks_mutex_);
    auto& entry = repo_locks_[repo_dir.string()];
    if (!entry) {
        entry = std::make_shared<std::mutex>();
    }
    return entry;
}

SyncResult WebhookHandler::synchronize(const fs::path& repo_dir) {
    auto repo_lock = lock_for(repo_dir);
    std::lock_guard<std::mutex> lock(*repo_lock);

    try {
        return synchronizer_.synchronize(repo_dir);
    } catch (const std::exception& e) {
        return SyncResult::failure(e.what());
    }
}
