#pragma once
#include <string>
#include <optional>
#include <filesystem>

constexpr int kMaxGitTimeoutSeconds = 86400;

struct Config {
    // Parent directory holding the deployable repositories
    std::filesystem::path repo_root;
    std::string listen_addr = "0.0.0.0";
    int listen_port = 5123;

    // No token configured means every request is accepted
    std::optional<std::string> security_token;

    // Logs presented tokens verbatim; never enable in production
    bool debug = false;
    std::string log_level = "info";

    std::filesystem::path restart_trigger = "/tmp/webhook_restart_trigger";
    int restart_poll_ms = 1000;

    std::string git_remote = "origin";
    int git_timeout_seconds = 120;

    std::string service_name = "hookd";

    static Config from_env();

    // Command line flags override the environment. Returns false when
    // --help was requested.
    bool apply_args(int argc, const char* const* argv);

    void validate();

    static std::string usage(const std::string& prog);
};
