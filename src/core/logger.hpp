/**
 * @file logger.hpp
 * @brief Logging infrastructure with pluggable sinks.
 * @author Dimitris Kafetzis
 *
 * Provides ILogSink (virtual interface for runtime-configurable log destinations)
 * and a thread-safe Logger front-end that renders one JSON object per line.
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace kubesim {

// ─────────────────────────────────────────────
// Log Levels
// ─────────────────────────────────────────────

enum class LogLevel : uint8_t {
    Debug,
    Info,
    Warn,
    Error
};

[[nodiscard]] constexpr std::string_view to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info:  return "info";
        case LogLevel::Warn:  return "warn";
        case LogLevel::Error: return "error";
    }
    return "unknown";
}

/**
 * @brief Parse a level name as written in the config file.
 */
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view name) noexcept;

/**
 * @brief Escape a string for embedding in a JSON string literal.
 */
[[nodiscard]] std::string json_escape(std::string_view text);

// ─────────────────────────────────────────────
// ILogSink (virtual, chosen at runtime)
// ─────────────────────────────────────────────

/**
 * @brief Abstract interface for log output destinations.
 */
class ILogSink {
public:
    virtual ~ILogSink() = default;

    virtual void write(std::string_view json_line) = 0;
    virtual void flush() = 0;
};

// ─────────────────────────────────────────────
// Logger
// ─────────────────────────────────────────────

/// Extra string-valued keys appended to a log line, in order.
using LogFields = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief Thread-safe logger front-end.
 *
 * Line layout: `{"level":..,"ts":..,"msg":..,<context>..,<fields>..}`.
 * Context fields are set once (e.g. the cluster name) and appear on every
 * line; per-call fields identify the node or workload a line is about.
 */
class Logger {
public:
    explicit Logger(std::unique_ptr<ILogSink> sink, LogLevel min_level = LogLevel::Info);

    void debug(std::string_view message, const LogFields& fields = {});
    void info(std::string_view message, const LogFields& fields = {});
    void warn(std::string_view message, const LogFields& fields = {});
    void error(std::string_view message, const LogFields& fields = {});

    void log(LogLevel level, std::string_view message, const LogFields& fields = {});
    void flush();

    /// Add a key rendered on every subsequent line.
    void add_context(std::string key, std::string value);

    void set_level(LogLevel level) noexcept;
    [[nodiscard]] LogLevel level() const noexcept;
    [[nodiscard]] bool enabled(LogLevel level) const noexcept { return level >= level_.load(); }

private:
    std::unique_ptr<ILogSink> sink_;
    std::atomic<LogLevel> level_;
    LogFields context_;
    mutable std::mutex mutex_;
};

}  // namespace kubesim
