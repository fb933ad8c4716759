/**
 * @file container_runtime.hpp
 * @brief Container runtime capability interface and implementations.
 * @author Dimitris Kafetzis
 *
 * The NodeLifecycleManager is the only caller. Calls may be slow; the
 * manager runs them off the store's critical path and bounds each one with
 * a timeout, so implementations are free to block.
 *
 * Provides ProcessRuntime (one child process per environment) and
 * SimulatedRuntime (in-memory, with fault injection for tests).
 */

#pragma once

#include "core/config.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <sys/types.h>
#include <unordered_map>
#include <vector>

namespace kubesim {

/**
 * @brief What the runtime needs to create an environment for a node.
 */
struct EnvironmentSpec {
    std::string name;
    Resources limits;
    std::map<std::string, std::string> labels;
};

// ─────────────────────────────────────────────
// IContainerRuntime
// ─────────────────────────────────────────────

class IContainerRuntime {
public:
    virtual ~IContainerRuntime() = default;

    virtual Result<RuntimeHandle> create_environment(const EnvironmentSpec& spec) = 0;
    virtual Result<void> start_environment(const RuntimeHandle& handle) = 0;
    virtual Result<void> stop_environment(const RuntimeHandle& handle) = 0;
    virtual Result<void> remove_environment(const RuntimeHandle& handle) = 0;
    virtual bool is_alive(const RuntimeHandle& handle) = 0;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

// ─────────────────────────────────────────────
// ProcessRuntime
// ─────────────────────────────────────────────

/**
 * @brief Backs each environment with a child process in its own process group.
 *
 * start_environment fork/execs the configured keep-alive command;
 * stop_environment sends SIGTERM to the group and escalates to SIGKILL
 * after the grace period. Liveness is reaped with waitpid(WNOHANG).
 */
class ProcessRuntime : public IContainerRuntime {
public:
    explicit ProcessRuntime(std::vector<std::string> command,
                            Duration stop_grace = Duration{2000});
    ~ProcessRuntime() override;

    // Non-copyable
    ProcessRuntime(const ProcessRuntime&) = delete;
    ProcessRuntime& operator=(const ProcessRuntime&) = delete;

    Result<RuntimeHandle> create_environment(const EnvironmentSpec& spec) override;
    Result<void> start_environment(const RuntimeHandle& handle) override;
    Result<void> stop_environment(const RuntimeHandle& handle) override;
    Result<void> remove_environment(const RuntimeHandle& handle) override;
    bool is_alive(const RuntimeHandle& handle) override;

    [[nodiscard]] std::string_view name() const noexcept override { return "process"; }

    /// Pid of a started environment, -1 when not running.
    [[nodiscard]] pid_t pid_of(const RuntimeHandle& handle) const;

private:
    struct Environment {
        EnvironmentSpec spec;
        pid_t pid{-1};
    };

    Result<pid_t> spawn(const Environment& env) const;
    void terminate_group(pid_t pid) const;

    std::vector<std::string> command_;
    Duration stop_grace_;

    mutable std::mutex mutex_;
    std::unordered_map<RuntimeHandle, Environment> environments_;
    uint64_t next_id_{1};
};

// ─────────────────────────────────────────────
// SimulatedRuntime
// ─────────────────────────────────────────────

/**
 * @brief In-memory runtime for tests and for running without real processes.
 *
 * Environments are plain records. Test helpers inject failures, crashes and
 * latency so the control plane's error paths can be exercised.
 */
class SimulatedRuntime : public IContainerRuntime {
public:
    SimulatedRuntime() = default;

    Result<RuntimeHandle> create_environment(const EnvironmentSpec& spec) override;
    Result<void> start_environment(const RuntimeHandle& handle) override;
    Result<void> stop_environment(const RuntimeHandle& handle) override;
    Result<void> remove_environment(const RuntimeHandle& handle) override;
    bool is_alive(const RuntimeHandle& handle) override;

    [[nodiscard]] std::string_view name() const noexcept override { return "simulated"; }

    // Test helpers
    void fail_next_create(std::string message);
    void fail_next_start(std::string message);
    void fail_next_stop(std::string message);
    void set_alive(const RuntimeHandle& handle, bool alive);
    void set_latency(Duration latency);

    [[nodiscard]] size_t environment_count() const;
    [[nodiscard]] size_t running_count() const;
    [[nodiscard]] bool exists(const RuntimeHandle& handle) const;

private:
    struct Environment {
        EnvironmentSpec spec;
        bool running{false};
        bool crashed{false};
    };

    void apply_latency() const;

    mutable std::mutex mutex_;
    std::unordered_map<RuntimeHandle, Environment> environments_;
    uint64_t next_id_{1};
    std::string create_failure_;
    std::string start_failure_;
    std::string stop_failure_;
    Duration latency_{0};
};

/**
 * @brief Build the runtime selected by `[runtime] kind`.
 */
Result<std::shared_ptr<IContainerRuntime>> make_runtime(const RuntimeConfig& config);

}  // namespace kubesim
