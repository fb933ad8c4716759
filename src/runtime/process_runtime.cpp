/**
 * @file process_runtime.cpp
 * @brief ProcessRuntime: one child process group per node environment.
 * @author Dimitris Kafetzis
 *
 * start_environment:
 *   1. Build argv/envp before fork (the child may only call async-signal-safe
 *      functions).
 *   2. fork; the child moves into its own process group, redirects stdio to
 *      /dev/null and execs the keep-alive command.
 *   3. A CLOEXEC pipe reports an exec failure (errno) back to the parent;
 *      EOF on the pipe means exec succeeded.
 */

#include "runtime/container_runtime.hpp"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

extern char** environ;

namespace kubesim {

namespace {

constexpr auto REAP_POLL = std::chrono::milliseconds(10);

/**
 * @brief Non-blocking reap. True when `pid` has exited (or is not our child).
 */
bool reap(pid_t pid) {
    int status = 0;
    pid_t ret = ::waitpid(pid, &status, WNOHANG);
    return ret == pid || (ret < 0 && errno == ECHILD);
}

}  // anonymous namespace

ProcessRuntime::ProcessRuntime(std::vector<std::string> command, Duration stop_grace)
    : command_(std::move(command)), stop_grace_(stop_grace) {}

ProcessRuntime::~ProcessRuntime() {
    std::lock_guard lock(mutex_);
    for (auto& [handle, env] : environments_) {
        if (env.pid > 0) {
            ::kill(-env.pid, SIGKILL);
            ::waitpid(env.pid, nullptr, 0);
            env.pid = -1;
        }
    }
}

Result<RuntimeHandle> ProcessRuntime::create_environment(const EnvironmentSpec& spec) {
    std::lock_guard lock(mutex_);
    RuntimeHandle handle = "proc-" + std::to_string(next_id_++);
    environments_[handle] = Environment{.spec = spec, .pid = -1};
    return handle;
}

Result<void> ProcessRuntime::start_environment(const RuntimeHandle& handle) {
    Environment env;
    {
        std::lock_guard lock(mutex_);
        auto it = environments_.find(handle);
        if (it == environments_.end()) {
            return Error{ErrorCode::NotFound, "no environment " + handle};
        }
        if (it->second.pid > 0 && !reap(it->second.pid)) {
            return Result<void>{};  // already running
        }
        env = it->second;
    }

    auto pid = spawn(env);
    if (!pid) return pid.error();

    std::lock_guard lock(mutex_);
    auto it = environments_.find(handle);
    if (it == environments_.end()) {
        // Removed while we were spawning.
        terminate_group(*pid);
        return Error{ErrorCode::NotFound, "environment " + handle + " removed during start"};
    }
    it->second.pid = *pid;
    return Result<void>{};
}

Result<void> ProcessRuntime::stop_environment(const RuntimeHandle& handle) {
    pid_t pid = -1;
    {
        std::lock_guard lock(mutex_);
        auto it = environments_.find(handle);
        if (it == environments_.end()) {
            return Error{ErrorCode::NotFound, "no environment " + handle};
        }
        pid = it->second.pid;
        it->second.pid = -1;
    }

    if (pid <= 0) return Result<void>{};

    ::kill(-pid, SIGTERM);
    auto deadline = std::chrono::steady_clock::now() + stop_grace_;
    while (std::chrono::steady_clock::now() < deadline) {
        if (reap(pid)) return Result<void>{};
        std::this_thread::sleep_for(REAP_POLL);
    }

    terminate_group(pid);
    return Result<void>{};
}

Result<void> ProcessRuntime::remove_environment(const RuntimeHandle& handle) {
    auto stopped = stop_environment(handle);
    if (!stopped) return stopped;

    std::lock_guard lock(mutex_);
    if (environments_.erase(handle) == 0) {
        return Error{ErrorCode::NotFound, "no environment " + handle};
    }
    return Result<void>{};
}

bool ProcessRuntime::is_alive(const RuntimeHandle& handle) {
    std::lock_guard lock(mutex_);
    auto it = environments_.find(handle);
    if (it == environments_.end() || it->second.pid <= 0) return false;

    if (reap(it->second.pid)) {
        it->second.pid = -1;
        return false;
    }
    return ::kill(it->second.pid, 0) == 0;
}

pid_t ProcessRuntime::pid_of(const RuntimeHandle& handle) const {
    std::lock_guard lock(mutex_);
    auto it = environments_.find(handle);
    return it == environments_.end() ? -1 : it->second.pid;
}

Result<pid_t> ProcessRuntime::spawn(const Environment& env) const {
    // argv
    std::vector<std::string> args = command_;
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (auto& arg : args) argv.push_back(arg.data());
    argv.push_back(nullptr);

    // envp: inherited environment plus the node's identity and limits
    std::vector<std::string> vars;
    for (char** e = environ; e != nullptr && *e != nullptr; ++e) {
        vars.emplace_back(*e);
    }
    vars.push_back("KUBESIM_ENVIRONMENT=" + env.spec.name);
    vars.push_back("KUBESIM_CPU=" + std::to_string(env.spec.limits.cpu));
    vars.push_back("KUBESIM_MEMORY_MB=" + std::to_string(env.spec.limits.memory_mb));
    for (const auto& [key, value] : env.spec.labels) {
        vars.push_back("KUBESIM_LABEL_" + key + "=" + value);
    }
    std::vector<char*> envp;
    envp.reserve(vars.size() + 1);
    for (auto& var : vars) envp.push_back(var.data());
    envp.push_back(nullptr);

    int status_pipe[2];
    if (::pipe2(status_pipe, O_CLOEXEC) < 0) {
        return Error{ErrorCode::Runtime, "pipe2 failed: " + std::string(strerror(errno))};
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        ::close(status_pipe[0]);
        ::close(status_pipe[1]);
        return Error{ErrorCode::Runtime, "fork failed: " + std::string(strerror(err))};
    }

    if (pid == 0) {
        // Child: async-signal-safe calls only.
        ::close(status_pipe[0]);
        ::setpgid(0, 0);
        int devnull = ::open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            ::dup2(devnull, STDOUT_FILENO);
            ::dup2(devnull, STDERR_FILENO);
            if (devnull > STDERR_FILENO) ::close(devnull);
        }
        ::execvpe(argv[0], argv.data(), envp.data());
        int err = errno;
        ssize_t ignored = ::write(status_pipe[1], &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    // Parent
    ::setpgid(pid, pid);
    ::close(status_pipe[1]);

    int child_errno = 0;
    ssize_t n = 0;
    do {
        n = ::read(status_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    ::close(status_pipe[0]);

    if (n > 0) {
        ::waitpid(pid, nullptr, 0);
        return Error{ErrorCode::Runtime, "exec of '" + command_.front() + "' failed: "
                     + std::string(strerror(child_errno))};
    }

    return pid;
}

void ProcessRuntime::terminate_group(pid_t pid) const {
    ::kill(-pid, SIGKILL);
    ::waitpid(pid, nullptr, 0);
}

}  // namespace kubesim
