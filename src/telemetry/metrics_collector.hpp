/**
 * @file metrics_collector.hpp
 * @brief Structured cluster events for telemetry.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/logger.hpp"
#include "core/types.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <string_view>

namespace kubesim {

/**
 * @brief Collects and logs structured cluster events as NDJSON.
 *
 * Every phase transition and eviction the control plane performs is
 * recorded here, which makes autonomous recovery observable.
 */
class MetricsCollector {
public:
    explicit MetricsCollector(std::unique_ptr<ILogSink> sink);

    void record_node_phase(const NodeId& id, NodePhase phase, std::string_view message = {});
    void record_workload_phase(const WorkloadId& id, WorkloadPhase phase,
                               const std::optional<NodeId>& node);
    void record_placement(const WorkloadId& workload, const NodeId& node);
    void record_eviction(const WorkloadId& workload, const NodeId& node,
                         std::string_view reason);
    void record_custom(std::string_view event, std::string_view json_payload);

    [[nodiscard]] uint64_t eviction_count() const noexcept { return evictions_.load(); }

    void flush();

private:
    std::unique_ptr<ILogSink> sink_;
    std::mutex write_mutex_;
    std::atomic<uint64_t> evictions_{0};

    void emit(std::string_view json_line);
};

}  // namespace kubesim
