/**
 * @file control_plane.cpp
 * @brief ControlPlane wiring and background loops.
 * @author Dimitris Kafetzis
 */

#include "control_plane/control_plane.hpp"

#include "api/api_codec.hpp"
#include "scheduler/best_fit_policy.hpp"
#include "scheduler/first_fit_policy.hpp"
#include "telemetry/json_sink.hpp"

#include <chrono>

namespace kubesim {

namespace {

size_t resolve_thread_count(uint32_t configured) {
    if (configured != 0) return configured;
    auto hw = std::thread::hardware_concurrency();
    return hw == 0 ? 4 : hw;
}

NodeManagerOptions node_options(const Config& config) {
    return NodeManagerOptions{
        .operation_timeout = Duration{config.runtime.operation_timeout_ms},
        .readiness_timeout = Duration{config.runtime.readiness_timeout_ms},
        .readiness_poll = Duration{config.runtime.readiness_poll_ms},
        .missed_heartbeat_threshold = config.health.missed_heartbeat_threshold,
        .max_commit_retries = config.scheduler.max_commit_retries
    };
}

std::unique_ptr<ILogSink> or_null(std::unique_ptr<ILogSink> sink) {
    if (sink) return sink;
    return std::make_unique<NullSink>();
}

}  // anonymous namespace

Result<std::unique_ptr<IPlacementPolicy>> create_policy(std::string_view name) {
    if (name == "first_fit") {
        return std::unique_ptr<IPlacementPolicy>(std::make_unique<FirstFitPolicy>());
    }
    if (name == "best_fit") {
        return std::unique_ptr<IPlacementPolicy>(std::make_unique<BestFitPolicy>());
    }
    return Error{ErrorCode::Validation, "unknown scheduler policy '" + std::string{name}
                 + "' (expected first_fit or best_fit)"};
}

// ─────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────

Result<std::unique_ptr<ControlPlane>> ControlPlane::create(Options opts) {
    auto policy = create_policy(opts.config.scheduler.policy);
    if (!policy) return policy.error();

    std::shared_ptr<IContainerRuntime> runtime = opts.runtime;
    if (!runtime) {
        auto made = make_runtime(opts.config.runtime);
        if (!made) return made.error();
        runtime = *made;
    }

    return std::unique_ptr<ControlPlane>(
        new ControlPlane(std::move(opts), std::move(runtime), std::move(*policy)));
}

ControlPlane::ControlPlane(Options opts,
                           std::shared_ptr<IContainerRuntime> runtime,
                           std::unique_ptr<IPlacementPolicy> policy)
    : config_(std::move(opts.config))
    , logger_(or_null(std::move(opts.log_sink)), opts.log_level)
    , metrics_(or_null(std::move(opts.metrics_sink)))
    , thread_pool_(resolve_thread_count(config_.executor.thread_count))
    , runtime_(std::move(runtime))
    , nodes_(store_, runtime_, thread_pool_, logger_, metrics_, node_options(config_))
    , reconciler_(store_, nodes_, std::move(policy), logger_, metrics_,
                  ReconcilerOptions{.max_commit_retries = config_.scheduler.max_commit_retries})
    , api_(store_, nodes_, reconciler_, logger_, [this] { wake(); }) {

    logger_.add_context("cluster", config_.cluster_name);

    store_.watch([this](const std::vector<StoreEvent>& events) {
        for (const auto& event : events) {
            bool created_workload = event.kind == ObjectKind::Workload
                                    && event.type == StoreEventType::Created;
            bool released = event.kind == ObjectKind::Placement
                            && event.type == StoreEventType::Deleted;
            if (created_workload || released) {
                wake();
                return;
            }
        }
    });

    nodes_.on_phase_change([this](const NodeId&, NodePhase phase) {
        if (phase == NodePhase::Ready) wake();
    });
}

ControlPlane::~ControlPlane() {
    stop();
}

// ─────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────

Result<void> ControlPlane::start() {
    if (running_.exchange(true)) {
        return Error{ErrorCode::Conflict, "control plane already running"};
    }

    logger_.info("Control plane '" + config_.cluster_name + "' starting: runtime="
                 + std::string{runtime_->name()} + " policy="
                 + std::string{reconciler_.policy_name()} + " threads="
                 + std::to_string(thread_pool_.thread_count()));

    if (config_.api.enabled) {
        auto listening = api_server_.listen(config_.api.port);
        if (!listening) {
            logger_.error("Could not start API server: " + listening.error().message);
            running_ = false;
            return listening.error();
        }
        api_server_.serve([this](const std::vector<uint8_t>& request) {
            return handle_api_request(request);
        });
        logger_.info("API server listening on port " + std::to_string(api_server_.bound_port()));
    }

    reconcile_thread_ = std::jthread([this](std::stop_token stop) { reconcile_loop(stop); });
    health_thread_ = std::jthread([this](std::stop_token stop) { health_loop(stop); });

    logger_.info("Control plane started (reconcile every "
                 + std::to_string(config_.scheduler.reconcile_interval_ms) + "ms, health every "
                 + std::to_string(config_.health.check_interval_ms) + "ms)");
    return Result<void>{};
}

void ControlPlane::stop() {
    if (!running_.exchange(false)) return;

    logger_.info("Control plane shutting down...");
    api_server_.stop_serving();

    reconcile_thread_.request_stop();
    health_thread_.request_stop();
    if (reconcile_thread_.joinable()) reconcile_thread_.join();
    if (health_thread_.joinable()) health_thread_.join();

    metrics_.flush();
    logger_.info("Control plane stopped");
    logger_.flush();
}

void ControlPlane::wake() {
    {
        std::lock_guard lock(wake_mutex_);
        wake_pending_ = true;
    }
    wake_cv_.notify_one();
}

// ─────────────────────────────────────────────
// Loops
// ─────────────────────────────────────────────

void ControlPlane::reconcile_loop(std::stop_token stop) {
    const auto interval = Duration{config_.scheduler.reconcile_interval_ms};

    while (!stop.stop_requested()) {
        reconciler_.reconcile();

        std::unique_lock lock(wake_mutex_);
        wake_cv_.wait_for(lock, stop, interval, [this] { return wake_pending_; });
        wake_pending_ = false;
    }
}

void ControlPlane::health_loop(std::stop_token stop) {
    const auto interval = Duration{config_.health.check_interval_ms};

    while (!stop.stop_requested()) {
        {
            std::unique_lock lock(health_mutex_);
            // Only a stop request ends the wait early.
            health_cv_.wait_for(lock, stop, interval, [] { return false; });
        }
        if (stop.stop_requested()) break;

        auto failed = nodes_.health_check_all();
        if (failed > 0) {
            logger_.warn("Health check: " + std::to_string(failed) + " node(s) failed");
            wake();
        }
    }
}

std::vector<uint8_t> ControlPlane::handle_api_request(const std::vector<uint8_t>& request) {
    auto decoded = ApiCodec::decode_request(request);
    if (!decoded) {
        logger_.warn("Rejected API request: " + decoded.error().message);
        return ApiCodec::encode_response(ApiResponse::failure(decoded.error()));
    }

    auto response = api_.dispatch(*decoded);
    if (!response.ok()) {
        logger_.debug("API op " + std::to_string(static_cast<int>(decoded->op))
                      + " failed: " + response.message);
    }
    return ApiCodec::encode_response(response);
}

}  // namespace kubesim
