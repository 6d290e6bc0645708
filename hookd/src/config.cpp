#include "config.hpp"
#include <cstdlib>
#include <cstring>
#include <charconv>
#include <fstream>
#include <stdexcept>
#include <string_view>

namespace fs = std::filesystem;

namespace {

std::string get_env(const char* name, const std::string& default_val) {
    const char* value = std::getenv(name);
    return value ? value : default_val;
}

int parse_int(const std::string& name, const char* value) {
    int int_val = 0;
    auto end = value + std::strlen(value);
    auto result = std::from_chars(value, end, int_val);
    if (result.ec != std::errc() || result.ptr != end) {
        throw std::invalid_argument("Invalid integer for " + name + ": " + value);
    }
    return int_val;
}

int get_env_int(const char* name, int default_val) {
    const char* value = std::getenv(name);
    if (value && *value) {
        return parse_int(name, value);
    }
    return default_val;
}

bool get_env_bool(const char* name, bool default_val) {
    const char* value = std::getenv(name);
    if (!value) {
        return default_val;
    }
    std::string_view v(value);
    return v == "1" || v == "true" || v == "yes" || v == "on";
}

std::optional<std::string> read_secret(const char* file_env, const char* value_env) {
    const char* file_path = std::getenv(file_env);
    if (file_path) {
        std::ifstream file(file_path);
        if (!file.is_open()) {
            throw std::runtime_error(std::string("Cannot read ") + file_env + ": " + file_path);
        }
        std::string content;
        std::getline(file, content);
        return content;
    }

    const char* value = std::getenv(value_env);
    if (value) {
        return std::string(value);
    }
    return std::nullopt;
}

}

Config Config::from_env() {
    Config config;

    auto repo_dir = get_env("GIT_REPO_DIR", "");
    if (!repo_dir.empty()) {
        config.repo_root = repo_dir;
    }
    config.listen_addr = get_env("LISTEN_ADDR", config.listen_addr);
    config.listen_port = get_env_int("LISTEN_PORT", config.listen_port);
    config.security_token = read_secret("SECURITY_TOKEN_FILE", "SECURITY_TOKEN");
    config.debug = get_env_bool("DEBUG", config.debug);
    config.log_level = get_env("LOG_LEVEL", config.log_level);
    config.restart_trigger = get_env("RESTART_TRIGGER", config.restart_trigger.string());
    config.restart_poll_ms = get_env_int("RESTART_POLL_MS", config.restart_poll_ms);
    config.git_remote = get_env("GIT_REMOTE", config.git_remote);
    config.git_timeout_seconds = get_env_int("GIT_TIMEOUT_SECONDS", config.git_timeout_seconds);
    config.service_name = get_env("SERVICE_NAME", config.service_name);

    return config;
}

bool Config::apply_args(int argc, const char* const* argv) {
    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        auto next = [&]() -> const char* {
            if (i + 1 >= argc) {
                throw std::invalid_argument(std::string(arg) + " requires a value");
            }
            return argv[++i];
        };

        if (arg == "--help" || arg == "-h") {
            return false;
        } else if (arg == "--git-repo-dir") {
            repo_root = next();
        } else if (arg == "--port") {
            listen_port = parse_int("--port", next());
        } else if (arg == "--host") {
            listen_addr = next();
        } else if (arg == "--security-token") {
            security_token = std::string(next());
        } else if (arg == "--debug") {
            debug = true;
        } else if (arg == "--restart-trigger") {
            restart_trigger = next();
        } else {
            throw std::invalid_argument("Unknown argument: " + std::string(arg));
        }
    }
    return true;
}

void Config::validate() {
    if (repo_root.empty()) {
        throw std::runtime_error("Repository root is required (--git-repo-dir or GIT_REPO_DIR)");
    }

    std::error_code ec;
    if (!fs::is_directory(repo_root, ec)) {
        throw std::runtime_error("Repository root is not a directory: " + repo_root.string());
    }
    repo_root = fs::absolute(repo_root).lexically_normal();

    if (listen_port <= 0 || listen_port > 65535) {
        throw std::runtime_error("Listen port out of range: " + std::to_string(listen_port));
    }

    if (restart_poll_ms <= 0) {
        throw std::runtime_error("Restart poll interval must be positive");
    }

    if (git_timeout_seconds < 0 || git_timeout_seconds > kMaxGitTimeoutSeconds) {
        throw std::runtime_error("Git timeout must be between 0 and " +
                                 std::to_string(kMaxGitTimeoutSeconds) + " seconds");
    }

    if (security_token && security_token->empty()) {
        throw std::runtime_error("Security token must not be empty when set");
    }

    if (debug) {
        log_level = "debug";
    }
}

std::string Config::usage(const std::string& prog) {
    return "Usage: " + prog + " --git-repo-dir DIR [--port N] [--host ADDR]\n"
           "       [--security-token TOKEN] [--restart-trigger PATH] [--debug]\n"
           "\n"
           "Git webhook server: POST /webhook/<subpath> pulls DIR/<subpath>\n"
           "and touches the restart trigger file.\n"
           "\n"
           "  --git-repo-dir DIR       parent directory of the git repositories\n"
           "  --port N                 listen port (default: 5123)\n"
           "  --host ADDR              listen address (default: 0.0.0.0)\n"
           "  --security-token TOKEN   required X-Security-Token header value\n"
           "  --restart-trigger PATH   file touched after a successful update\n"
           "  --debug                  verbose logging (may expose sensitive information)\n"
           "\n"
           "Example: curl -X POST -H \"X-Security-Token: TOKEN\" http://localhost:5123/webhook/site\n";
}
