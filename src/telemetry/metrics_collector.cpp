/**
 * @file metrics_collector.cpp
 * @brief MetricsCollector implementation.
 * @author Dimitris Kafetzis
 */

#include "telemetry/metrics_collector.hpp"

#include <sstream>

namespace kubesim {

MetricsCollector::MetricsCollector(std::unique_ptr<ILogSink> sink)
    : sink_(std::move(sink)) {}

void MetricsCollector::record_node_phase(const NodeId& id, NodePhase phase,
                                         std::string_view message) {
    std::ostringstream oss;
    oss << R"({"event":"node_phase")"
        << R"(,"node":")" << json_escape(id) << "\""
        << R"(,"phase":")" << to_string(phase) << "\"";
    if (!message.empty()) {
        oss << R"(,"message":")" << json_escape(message) << "\"";
    }
    oss << "}";
    emit(oss.str());
}

void MetricsCollector::record_workload_phase(const WorkloadId& id, WorkloadPhase phase,
                                             const std::optional<NodeId>& node) {
    std::ostringstream oss;
    oss << R"({"event":"workload_phase")"
        << R"(,"workload":")" << json_escape(id) << "\""
        << R"(,"phase":")" << to_string(phase) << "\"";
    if (node) {
        oss << R"(,"node":")" << json_escape(*node) << "\"";
    }
    oss << "}";
    emit(oss.str());
}

void MetricsCollector::record_placement(const WorkloadId& workload, const NodeId& node) {
    std::ostringstream oss;
    oss << R"({"event":"placement")"
        << R"(,"workload":")" << json_escape(workload) << "\""
        << R"(,"node":")" << json_escape(node) << "\""
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_eviction(const WorkloadId& workload, const NodeId& node,
                                       std::string_view reason) {
    evictions_.fetch_add(1);
    std::ostringstream oss;
    oss << R"({"event":"eviction")"
        << R"(,"workload":")" << json_escape(workload) << "\""
        << R"(,"node":")" << json_escape(node) << "\""
        << R"(,"reason":")" << json_escape(reason) << "\""
        << "}";
    emit(oss.str());
}

void MetricsCollector::record_custom(std::string_view event, std::string_view json_payload) {
    std::ostringstream oss;
    oss << R"({"event":")" << event << "\""
        << R"(,"data":)" << json_payload
        << "}";
    emit(oss.str());
}

void MetricsCollector::emit(std::string_view json_line) {
    std::lock_guard lock(write_mutex_);
    sink_->write(json_line);
}

void MetricsCollector::flush() {
    std::lock_guard lock(write_mutex_);
    sink_->flush();
}

}  // namespace kubesim
