/**
 * @file logger.cpp
 * @brief Logger implementation with ISO 8601 timestamps.
 * @author Dimitris Kafetzis
 */

#include "core/logger.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace kubesim {

std::optional<LogLevel> parse_log_level(std::string_view name) noexcept {
    if (name == "debug") return LogLevel::Debug;
    if (name == "info")  return LogLevel::Info;
    if (name == "warn" || name == "warning") return LogLevel::Warn;
    if (name == "error") return LogLevel::Error;
    return std::nullopt;
}

std::string json_escape(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    std::ostringstream oss;
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                        << static_cast<int>(c);
                    out += oss.str();
                } else {
                    out += c;
                }
        }
    }
    return out;
}

namespace {

void append_fields(std::ostringstream& oss, const LogFields& fields) {
    for (const auto& [key, value] : fields) {
        oss << ",\"" << json_escape(key) << "\":\"" << json_escape(value) << '"';
    }
}

}  // anonymous namespace

Logger::Logger(std::unique_ptr<ILogSink> sink, LogLevel min_level)
    : sink_(std::move(sink)), level_(min_level) {}

void Logger::debug(std::string_view message, const LogFields& fields) {
    log(LogLevel::Debug, message, fields);
}
void Logger::info(std::string_view message, const LogFields& fields) {
    log(LogLevel::Info, message, fields);
}
void Logger::warn(std::string_view message, const LogFields& fields) {
    log(LogLevel::Warn, message, fields);
}
void Logger::error(std::string_view message, const LogFields& fields) {
    log(LogLevel::Error, message, fields);
}

void Logger::log(LogLevel level, std::string_view message, const LogFields& fields) {
    if (!enabled(level)) return;

    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm utc{};
    gmtime_r(&time_t_now, &utc);

    std::ostringstream oss;
    oss << R"({"level":")" << to_string(level) << R"(","ts":")"
        << std::put_time(&utc, "%FT%T")
        << '.' << std::setfill('0') << std::setw(3) << ms.count()
        << R"(Z","msg":")" << json_escape(message) << '"';

    std::lock_guard lock(mutex_);
    append_fields(oss, context_);
    append_fields(oss, fields);
    oss << '}';
    sink_->write(oss.str());
}

void Logger::flush() {
    std::lock_guard lock(mutex_);
    sink_->flush();
}

void Logger::add_context(std::string key, std::string value) {
    std::lock_guard lock(mutex_);
    context_.emplace_back(std::move(key), std::move(value));
}

void Logger::set_level(LogLevel level) noexcept { level_.store(level); }
LogLevel Logger::level() const noexcept { return level_.load(); }

}  // namespace kubesim
