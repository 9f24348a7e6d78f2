#include "exec/process.hpp"

#include "log/log.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace devkit::exec {

namespace {

/// Parent environment with `extra` overriding or adding entries.
std::vector<std::string> build_environment(const VarTable& extra) {
    std::vector<std::string> env;
    for (char** entry = environ; entry && *entry; ++entry) {
        std::string pair(*entry);
        auto eq = pair.find('=');
        if (eq != std::string::npos && extra.count(pair.substr(0, eq)) != 0) {
            continue;
        }
        env.push_back(std::move(pair));
    }
    for (const auto& [key, value] : extra) {
        env.push_back(key + "=" + value);
    }
    return env;
}

std::vector<char*> to_argv(std::vector<std::string>& strings) {
    std::vector<char*> ptrs;
    ptrs.reserve(strings.size() + 1);
    for (auto& s : strings) {
        ptrs.push_back(s.data());
    }
    ptrs.push_back(nullptr);
    return ptrs;
}

void close_pipe(int fds[2]) {
    if (fds[0] >= 0) {
        close(fds[0]);
    }
    if (fds[1] >= 0) {
        close(fds[1]);
    }
}

/// Reads both pipes until the child closes them.
void drain(int out_fd, int err_fd, std::string& out, std::string& err) {
    pollfd fds[2] = {{out_fd, POLLIN, 0}, {err_fd, POLLIN, 0}};
    std::string* sinks[2] = {&out, &err};
    int open_count = 2;
    char buf[4096];

    while (open_count > 0) {
        int ready = poll(fds, 2, -1);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }
        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) {
                continue;
            }
            ssize_t n = read(fds[i].fd, buf, sizeof(buf));
            if (n > 0) {
                sinks[i]->append(buf, static_cast<size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                fds[i].fd = -1;
                --open_count;
            }
        }
    }
}

} // namespace

ProcessResult PosixProcessRunner::run(const ProcessRequest& request) {
    using Clock = std::chrono::steady_clock;
    auto start = Clock::now();

    ProcessResult result;

    std::vector<std::string> argv_strings;
    argv_strings.push_back(request.program);
    argv_strings.insert(argv_strings.end(), request.args.begin(), request.args.end());
    auto argv = to_argv(argv_strings);

    auto env_strings = build_environment(request.extra_env);
    auto envp = to_argv(env_strings);

    std::string cwd = request.working_dir.string();

    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    if (request.capture) {
        if (pipe2(stdout_pipe, O_CLOEXEC) != 0 || pipe2(stderr_pipe, O_CLOEXEC) != 0) {
            result.error = std::string("failed to create pipes: ") + std::strerror(errno);
            close_pipe(stdout_pipe);
            close_pipe(stderr_pipe);
            return result;
        }
    }

    pid_t pid = fork();
    if (pid < 0) {
        result.error = std::string("failed to fork: ") + std::strerror(errno);
        close_pipe(stdout_pipe);
        close_pipe(stderr_pipe);
        return result;
    }

    if (pid == 0) {
        // Child process
        if (request.capture) {
            dup2(stdout_pipe[1], STDOUT_FILENO);
            dup2(stderr_pipe[1], STDERR_FILENO);
        }
        if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
            static const char msg[] = "devkit: cannot change to working directory\n";
            ssize_t ignored = write(STDERR_FILENO, msg, sizeof(msg) - 1);
            (void)ignored;
            _exit(127);
        }
        execvpe(argv[0], argv.data(), envp.data());
        static const char msg[] = "devkit: cannot execute program\n";
        ssize_t ignored = write(STDERR_FILENO, msg, sizeof(msg) - 1);
        (void)ignored;
        _exit(127);
    }

    result.launched = true;
    DEVKIT_LOG_TRACE("process", "Spawned pid " << pid << ": " << request.program);

    if (request.capture) {
        close(stdout_pipe[1]);
        close(stderr_pipe[1]);
        drain(stdout_pipe[0], stderr_pipe[0], result.stdout_output, result.stderr_output);
        close(stdout_pipe[0]);
        close(stderr_pipe[0]);
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            result.error = std::string("waitpid failed: ") + std::strerror(errno);
            return result;
        }
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.signal = WTERMSIG(status);
        result.exit_code = 128 + result.signal;
    }

    auto end = Clock::now();
    result.duration_us = std::chrono::duration_cast<std::chrono::microseconds>(end - start).count();
    return result;
}

} // namespace devkit::exec
