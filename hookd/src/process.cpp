#include "process.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <array>
#include <limits>
#include <string_view>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace {

void close_pipe(int pfd[2]) {
    if (pfd[0] >= 0) ::close(pfd[0]);
    if (pfd[1] >= 0) ::close(pfd[1]);
}

int wait_child(pid_t pid) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return -1;
        }
    }
    return WIFEXITED(status) ? WEXITSTATUS(status) : 128 + WTERMSIG(status);
}

}

CommandResult run_command(const std::vector<std::string>& args,
                          const std::filesystem::path& cwd,
                          std::chrono::seconds timeout,
                          const std::vector<std::string>& extra_env) {
    if (args.empty()) {
        throw std::invalid_argument("run_command: empty argument list");
    }

    // Everything the child touches is prepared before fork
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& a : args) argv.push_back(const_cast<char*>(a.c_str()));
    argv.push_back(nullptr);

    // Overrides replace inherited entries of the same name
    std::vector<char*> envp;
    for (const auto& e : extra_env) envp.push_back(const_cast<char*>(e.c_str()));
    for (char** e = environ; e && *e; ++e) {
        std::string_view entry(*e);
        auto name = entry.substr(0, entry.find('=') + 1);
        bool overridden = std::any_of(extra_env.begin(), extra_env.end(), [&](const std::string& o) {
            return std::string_view(o).substr(0, o.find('=') + 1) == name;
        });
        if (!overridden) envp.push_back(*e);
    }
    envp.push_back(nullptr);

    std::string cwd_str = cwd.string();

    int out_pfd[2] = {-1, -1};
    int err_pfd[2] = {-1, -1};
    if (::pipe2(out_pfd, O_CLOEXEC) != 0 || ::pipe2(err_pfd, O_CLOEXEC) != 0) {
        int err = errno;
        close_pipe(out_pfd);
        close_pipe(err_pfd);
        throw std::runtime_error(std::string("pipe failed: ") + std::strerror(err));
    }

    int devnull = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
    if (devnull < 0) {
        int err = errno;
        close_pipe(out_pfd);
        close_pipe(err_pfd);
        throw std::runtime_error(std::string("open /dev/null failed: ") + std::strerror(err));
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        close_pipe(out_pfd);
        close_pipe(err_pfd);
        ::close(devnull);
        throw std::runtime_error(std::string("fork failed: ") + std::strerror(err));
    }

    if (pid == 0) {
        ::dup2(devnull, STDIN_FILENO);
        ::dup2(out_pfd[1], STDOUT_FILENO);
        ::dup2(out_pfd[1], STDERR_FILENO);

        if (!cwd_str.empty() && ::chdir(cwd_str.c_str()) != 0) {
            int err = errno;
            (void)!::write(err_pfd[1], &err, sizeof(err));
            _exit(127);
        }

        ::execvpe(argv[0], argv.data(), envp.data());

        int err = errno;
        (void)!::write(err_pfd[1], &err, sizeof(err));
        _exit(127);
    }

    ::close(devnull);
    ::close(out_pfd[1]);
    ::close(err_pfd[1]);

    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(err_pfd[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    ::close(err_pfd[0]);

    if (n > 0) {
        ::close(out_pfd[0]);
        wait_child(pid);
        throw std::runtime_error("cannot execute " + args[0] + " in " + cwd_str + ": " +
                                 std::strerror(child_errno));
    }

    CommandResult result;
    auto deadline = std::chrono::steady_clock::now() + timeout;
    std::array<char, 4096> buf{};

    while (true) {
        int wait_ms = -1;
        if (timeout.count() > 0) {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (left.count() <= 0) {
                result.timed_out = true;
                break;
            }
            wait_ms = static_cast<int>(std::min<std::chrono::milliseconds::rep>(
                left.count(), std::numeric_limits<int>::max()));
        }

        pollfd pfd{out_pfd[0], POLLIN, 0};
        int rc = ::poll(&pfd, 1, wait_ms);
        if (rc < 0) {
            if (errno == EINTR) continue;
            spdlog::error("poll on {} output failed: {}", args[0], std::strerror(errno));
            break;
        }
        if (rc == 0) {
            continue;
        }

        ssize_t got = ::read(out_pfd[0], buf.data(), buf.size());
        if (got < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (got == 0) {
            break;
        }
        result.output.append(buf.data(), static_cast<size_t>(got));
    }

    if (result.timed_out) {
        spdlog::warn("{} timed out after {}s, killing pid {}", args[0], timeout.count(), pid);
        ::kill(pid, SIGKILL);
    }
    ::close(out_pfd[0]);

    result.exit_code = wait_child(pid);
    return result;
}
