/**
 * @file config.hpp
 * @brief Control plane configuration with TOML deserialization.
 * @author Dimitris Kafetzis
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "core/result.hpp"

namespace kubesim {

struct ApiConfig {
    bool enabled = true;
    uint16_t port = 5000;
};

struct RuntimeConfig {
    std::string kind = "simulated";     ///< "simulated", "process"
    std::vector<std::string> command = {"/bin/sleep", "infinity"};
    uint32_t operation_timeout_ms = 5000;
    uint32_t readiness_timeout_ms = 10000;
    uint32_t readiness_poll_ms = 50;
};

struct HealthConfig {
    uint32_t check_interval_ms = 5000;
    uint32_t missed_heartbeat_threshold = 3;
};

struct SchedulerConfig {
    std::string policy = "first_fit";   ///< "first_fit", "best_fit"
    uint32_t reconcile_interval_ms = 1000;
    uint32_t max_commit_retries = 8;
};

struct ExecutorConfig {
    uint32_t thread_count = 4;          ///< 0 = hardware_concurrency
};

struct TelemetryConfig {
    std::filesystem::path log_dir = "./logs";
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
    std::string log_level = "info";
};

/**
 * @brief Top-level control plane configuration.
 */
struct Config {
    std::string cluster_name = "kubesim";
    ApiConfig api;
    RuntimeConfig runtime;
    HealthConfig health;
    SchedulerConfig scheduler;
    ExecutorConfig executor;
    TelemetryConfig telemetry;
};

/**
 * @brief Load configuration from a TOML file.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Create a default configuration.
 */
Config default_config();

}  // namespace kubesim
