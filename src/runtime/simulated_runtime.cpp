/**
 * @file simulated_runtime.cpp
 * @brief SimulatedRuntime implementation and the runtime factory.
 * @author Dimitris Kafetzis
 */

#include "runtime/container_runtime.hpp"

#include <thread>

namespace kubesim {

Result<RuntimeHandle> SimulatedRuntime::create_environment(const EnvironmentSpec& spec) {
    apply_latency();
    std::lock_guard lock(mutex_);
    if (!create_failure_.empty()) {
        auto message = std::move(create_failure_);
        create_failure_.clear();
        return Error{ErrorCode::Runtime, message};
    }
    RuntimeHandle handle = "simulated-" + std::to_string(next_id_++);
    environments_[handle] = Environment{.spec = spec, .running = false, .crashed = false};
    return handle;
}

Result<void> SimulatedRuntime::start_environment(const RuntimeHandle& handle) {
    apply_latency();
    std::lock_guard lock(mutex_);
    auto it = environments_.find(handle);
    if (it == environments_.end()) {
        return Error{ErrorCode::NotFound, "no environment " + handle};
    }
    if (!start_failure_.empty()) {
        auto message = std::move(start_failure_);
        start_failure_.clear();
        return Error{ErrorCode::Runtime, message};
    }
    it->second.running = true;
    it->second.crashed = false;
    return Result<void>{};
}

Result<void> SimulatedRuntime::stop_environment(const RuntimeHandle& handle) {
    apply_latency();
    std::lock_guard lock(mutex_);
    auto it = environments_.find(handle);
    if (it == environments_.end()) {
        return Error{ErrorCode::NotFound, "no environment " + handle};
    }
    if (!stop_failure_.empty()) {
        auto message = std::move(stop_failure_);
        stop_failure_.clear();
        return Error{ErrorCode::Runtime, message};
    }
    it->second.running = false;
    return Result<void>{};
}

Result<void> SimulatedRuntime::remove_environment(const RuntimeHandle& handle) {
    apply_latency();
    std::lock_guard lock(mutex_);
    if (environments_.erase(handle) == 0) {
        return Error{ErrorCode::NotFound, "no environment " + handle};
    }
    return Result<void>{};
}

bool SimulatedRuntime::is_alive(const RuntimeHandle& handle) {
    apply_latency();
    std::lock_guard lock(mutex_);
    auto it = environments_.find(handle);
    return it != environments_.end() && it->second.running && !it->second.crashed;
}

void SimulatedRuntime::fail_next_create(std::string message) {
    std::lock_guard lock(mutex_);
    create_failure_ = std::move(message);
}

void SimulatedRuntime::fail_next_start(std::string message) {
    std::lock_guard lock(mutex_);
    start_failure_ = std::move(message);
}

void SimulatedRuntime::fail_next_stop(std::string message) {
    std::lock_guard lock(mutex_);
    stop_failure_ = std::move(message);
}

void SimulatedRuntime::set_alive(const RuntimeHandle& handle, bool alive) {
    std::lock_guard lock(mutex_);
    if (auto it = environments_.find(handle); it != environments_.end()) {
        it->second.crashed = !alive;
    }
}

void SimulatedRuntime::set_latency(Duration latency) {
    std::lock_guard lock(mutex_);
    latency_ = latency;
}

size_t SimulatedRuntime::environment_count() const {
    std::lock_guard lock(mutex_);
    return environments_.size();
}

size_t SimulatedRuntime::running_count() const {
    std::lock_guard lock(mutex_);
    size_t n = 0;
    for (const auto& [handle, env] : environments_) {
        if (env.running && !env.crashed) ++n;
    }
    return n;
}

bool SimulatedRuntime::exists(const RuntimeHandle& handle) const {
    std::lock_guard lock(mutex_);
    return environments_.count(handle) > 0;
}

void SimulatedRuntime::apply_latency() const {
    Duration latency;
    {
        std::lock_guard lock(mutex_);
        latency = latency_;
    }
    if (latency.count() > 0) {
        std::this_thread::sleep_for(latency);
    }
}

// ─────────────────────────────────────────────
// Factory
// ─────────────────────────────────────────────

Result<std::shared_ptr<IContainerRuntime>> make_runtime(const RuntimeConfig& config) {
    if (config.kind == "simulated") {
        return std::shared_ptr<IContainerRuntime>(std::make_shared<SimulatedRuntime>());
    }
    if (config.kind == "process") {
        if (config.command.empty()) {
            return Error{ErrorCode::Validation, "process runtime needs a command"};
        }
        return std::shared_ptr<IContainerRuntime>(
            std::make_shared<ProcessRuntime>(config.command));
    }
    return Error{ErrorCode::Validation, "unknown runtime kind: " + config.kind};
}

}  // namespace kubesim
