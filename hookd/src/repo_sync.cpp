#include "repo_sync.hpp"
#include "process.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <stdexcept>

namespace fs = std::filesystem;

namespace {

std::string trim(std::string s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' ')) {
        s.pop_back();
    }
    size_t start = s.find_first_not_of(" \n\r");
    return start == std::string::npos ? std::string() : s.substr(start);
}

std::string join(const std::vector<std::string>& args) {
    std::string out;
    for (const auto& a : args) {
        if (!out.empty()) out += ' ';
        out += a;
    }
    return out;
}

}

GitSynchronizer::GitSynchronizer(const Config& config) : config_(config) {}

SyncResult GitSynchronizer::run_git(const std::vector<std::string>& args,
                                    const fs::path& repo_dir,
                                    std::string* output) const {
    std::vector<std::string> argv{"git"};
    argv.insert(argv.end(), args.begin(), args.end());
    auto command = join(argv);

    spdlog::debug("[git] {} in {}", command, repo_dir.string());

    CommandResult result;
    try {
        result = run_command(argv, repo_dir,
                             std::chrono::seconds(config_.git_timeout_seconds),
                             {"GIT_TERMINAL_PROMPT=0"});
    } catch (const std::exception& e) {
        return SyncResult::failure(fmt::format("{}: {}", command, e.what()));
    }

    if (result.timed_out) {
        return SyncResult::failure(fmt::format("{}: timed out after {}s",
                                               command, config_.git_timeout_seconds));
    }
    if (result.exit_code != 0) {
        return SyncResult::failure(fmt::format("{} (exit {}): {}",
                                               command, result.exit_code, trim(result.output)));
    }

    if (output) {
        *output = trim(result.output);
    }
    return SyncResult::success();
}

SyncResult GitSynchronizer::synchronize(const fs::path& repo_dir) {
    // git searches parent directories; only a checkout rooted at repo_dir may be touched
    std::string toplevel;
    auto step = run_git({"rev-parse", "--show-toplevel"}, repo_dir, &toplevel);
    if (!step.ok) {
        return step;
    }
    std::error_code ec;
    if (toplevel.empty() || !fs::equivalent(toplevel, repo_dir, ec)) {
        return SyncResult::failure(repo_dir.string() + " is not the top level of a git repository");
    }

    std::string branch;
    step = run_git({"rev-parse", "--abbrev-ref", "HEAD"}, repo_dir, &branch);
    if (!step.ok) {
        return step;
    }
    if (branch.empty() || branch == "HEAD") {
        return SyncResult::failure("HEAD is detached in " + repo_dir.string() + ", no branch to update");
    }

    const auto& remote = config_.git_remote;

    // Fetch first so a network failure leaves the working tree untouched
    step = run_git({"fetch", remote, branch}, repo_dir);
    if (!step.ok) {
        return step;
    }

    step = run_git({"reset", "--hard", remote + "/" + branch}, repo_dir);
    if (!step.ok) {
        return step;
    }

    step = run_git({"clean", "-fd"}, repo_dir);
    if (!step.ok) {
        return step;
    }

    std::string head;
    if (run_git({"rev-parse", "--short", "HEAD"}, repo_dir, &head).ok) {
        spdlog::info("[git] {} is at {}/{} ({})", repo_dir.string(), remote, branch, head);
    }
    return SyncResult::success();
}
