/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 * @author Dimitris Kafetzis
 */

#include "core/config.hpp"

#include <toml++/toml.hpp>

#include <limits>

namespace kubesim {

namespace {

/// Read `section.key` as an integer, rejecting values outside [min, max].
template <typename Int, typename View>
Result<Int> read_integer(View table, const std::string& section, const std::string& key,
                         int64_t fallback, int64_t min,
                         int64_t max = static_cast<int64_t>(std::numeric_limits<Int>::max())) {
    const int64_t value = table[key].value_or(fallback);
    if (value < min || value > max) {
        return Error{ErrorCode::Validation, section + "." + key + " must be in ["
                     + std::to_string(min) + ", " + std::to_string(max) + "], got "
                     + std::to_string(value)};
    }
    return static_cast<Int>(value);
}

}  // namespace

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorCode::NotFound, "Configuration file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        Config config;

        config.cluster_name = tbl["cluster_name"].value_or(std::string{"kubesim"});

        // [api]
        if (auto api = tbl["api"]; api.is_table()) {
            config.api.enabled = api["enabled"].value_or(true);
            auto port = read_integer<uint16_t>(api, "api", "port", 5000, 0);
            if (!port) return port.error();
            config.api.port = *port;
        }

        // [runtime]
        if (auto runtime = tbl["runtime"]; runtime.is_table()) {
            config.runtime.kind = runtime["kind"].value_or(std::string{"simulated"});
            if (auto* command = runtime["command"].as_array()) {
                std::vector<std::string> argv;
                for (const auto& element : *command) {
                    if (auto arg = element.value<std::string>()) {
                        argv.push_back(*arg);
                    }
                }
                if (argv.empty()) {
                    return Error{ErrorCode::Validation, "runtime.command must not be empty"};
                }
                config.runtime.command = std::move(argv);
            }
            auto operation_timeout = read_integer<uint32_t>(
                runtime, "runtime", "operation_timeout_ms", 5000, 1);
            if (!operation_timeout) return operation_timeout.error();
            config.runtime.operation_timeout_ms = *operation_timeout;

            auto readiness_timeout = read_integer<uint32_t>(
                runtime, "runtime", "readiness_timeout_ms", 10000, 1);
            if (!readiness_timeout) return readiness_timeout.error();
            config.runtime.readiness_timeout_ms = *readiness_timeout;

            auto readiness_poll = read_integer<uint32_t>(
                runtime, "runtime", "readiness_poll_ms", 50, 1);
            if (!readiness_poll) return readiness_poll.error();
            config.runtime.readiness_poll_ms = *readiness_poll;
        }

        // [health]
        if (auto health = tbl["health"]; health.is_table()) {
            auto interval = read_integer<uint32_t>(health, "health", "check_interval_ms", 5000, 1);
            if (!interval) return interval.error();
            config.health.check_interval_ms = *interval;

            auto threshold = read_integer<uint32_t>(
                health, "health", "missed_heartbeat_threshold", 3, 1);
            if (!threshold) return threshold.error();
            config.health.missed_heartbeat_threshold = *threshold;
        }

        // [scheduler]
        if (auto scheduler = tbl["scheduler"]; scheduler.is_table()) {
            config.scheduler.policy = scheduler["policy"].value_or(std::string{"first_fit"});
            auto interval = read_integer<uint32_t>(
                scheduler, "scheduler", "reconcile_interval_ms", 1000, 1);
            if (!interval) return interval.error();
            config.scheduler.reconcile_interval_ms = *interval;

            auto retries = read_integer<uint32_t>(
                scheduler, "scheduler", "max_commit_retries", 8, 0, 1000);
            if (!retries) return retries.error();
            config.scheduler.max_commit_retries = *retries;
        }

        // [executor]
        if (auto executor = tbl["executor"]; executor.is_table()) {
            auto threads = read_integer<uint32_t>(executor, "executor", "thread_count", 4, 0, 1024);
            if (!threads) return threads.error();
            config.executor.thread_count = *threads;
        }

        // [telemetry]
        if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
            config.telemetry.log_dir = telemetry["log_dir"].value_or(std::string{"./logs"});
            auto max_size = read_integer<uint32_t>(
                telemetry, "telemetry", "max_file_size_mb", 50, 1, 1 << 20);
            if (!max_size) return max_size.error();
            config.telemetry.max_file_size_mb = *max_size;

            auto rotate = read_integer<uint32_t>(telemetry, "telemetry", "rotate_count", 5, 0, 1000);
            if (!rotate) return rotate.error();
            config.telemetry.rotate_count = *rotate;
            config.telemetry.log_level = telemetry["log_level"].value_or(std::string{"info"});
        }

        return config;

    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::Validation,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Config default_config() {
    return Config{};
}

}  // namespace kubesim
