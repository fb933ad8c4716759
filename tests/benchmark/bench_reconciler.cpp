/**
 * @file bench_reconciler.cpp
 * @brief Performance benchmarks for placement planning, the object store,
 *        reconcile passes and the TCP API.
 * @author Dimitris Kafetzis
 *
 * Usage: ./bench_reconciler [--csv]
 */

#include "api/api_codec.hpp"
#include "control_plane/control_plane.hpp"
#include "core/types.hpp"
#include "network/transport.hpp"
#include "scheduler/best_fit_policy.hpp"
#include "scheduler/first_fit_policy.hpp"
#include "store/bindings.hpp"
#include "store/object_store.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <numeric>
#include <random>
#include <string>
#include <thread>
#include <vector>

using namespace kubesim;
using Clock = std::chrono::high_resolution_clock;

// ─────────────────────────────────────────────
// Benchmark Harness
// ─────────────────────────────────────────────

struct BenchResult {
    std::string name;
    std::string category;
    double mean_us;
    double stddev_us;
    double min_us;
    double max_us;
    double p99_us;
    size_t iterations;
    std::string extra;
};

template <typename Fn>
BenchResult run_bench(const std::string& name,
                      const std::string& category,
                      size_t iterations,
                      Fn&& fn,
                      const std::string& extra = "") {
    std::vector<double> timings;
    timings.reserve(iterations);

    // Warmup
    for (size_t i = 0; i < std::min(iterations / 10, size_t{5}); ++i) fn();

    for (size_t i = 0; i < iterations; ++i) {
        auto start = Clock::now();
        fn();
        auto end = Clock::now();
        timings.push_back(std::chrono::duration<double, std::micro>(end - start).count());
    }

    std::sort(timings.begin(), timings.end());

    double sum = std::accumulate(timings.begin(), timings.end(), 0.0);
    double mean = sum / static_cast<double>(iterations);
    double sq_sum = std::accumulate(timings.begin(), timings.end(), 0.0,
        [mean](double acc, double v) { return acc + (v - mean) * (v - mean); });
    double stddev = std::sqrt(sq_sum / static_cast<double>(iterations));

    size_t p99_idx = std::min(static_cast<size_t>(0.99 * static_cast<double>(iterations)),
                              iterations - 1);

    return BenchResult{
        .name = name, .category = category,
        .mean_us = mean, .stddev_us = stddev,
        .min_us = timings.front(), .max_us = timings.back(),
        .p99_us = timings[p99_idx], .iterations = iterations, .extra = extra
    };
}

void print_results(const std::vector<BenchResult>& results, bool csv) {
    if (csv) {
        std::cout << "category,name,mean_us,stddev_us,min_us,max_us,p99_us,iterations,extra\n";
        for (const auto& r : results) {
            std::cout << r.category << "," << r.name << ","
                      << std::fixed << std::setprecision(2)
                      << r.mean_us << "," << r.stddev_us << ","
                      << r.min_us << "," << r.max_us << "," << r.p99_us << ","
                      << r.iterations << "," << r.extra << "\n";
        }
        return;
    }

    std::string current_cat;
    for (const auto& r : results) {
        if (r.category != current_cat) {
            current_cat = r.category;
            std::cout << "\n══ " << current_cat << " ══\n";
            std::cout << std::left << std::setw(42) << "Benchmark"
                      << std::right << std::setw(11) << "Mean(us)"
                      << std::setw(11) << "Stddev"
                      << std::setw(11) << "P99(us)"
                      << std::setw(11) << "Min(us)"
                      << "  Info\n"
                      << std::string(98, '-') << "\n";
        }
        std::cout << std::left << std::setw(42) << r.name
                  << std::right << std::fixed << std::setprecision(1)
                  << std::setw(11) << r.mean_us
                  << std::setw(11) << r.stddev_us
                  << std::setw(11) << r.p99_us
                  << std::setw(11) << r.min_us
                  << "  " << r.extra << "\n";
    }
}

// ─────────────────────────────────────────────
// Helpers
// ─────────────────────────────────────────────

std::vector<NodeCapacity> make_nodes(size_t n) {
    std::mt19937 rng(42);
    std::uniform_int_distribution<uint32_t> cpu(4, 64);
    std::vector<NodeCapacity> nodes;
    for (size_t i = 0; i < n; ++i) {
        uint32_t c = cpu(rng);
        nodes.push_back(NodeCapacity{"node-" + std::to_string(i), {c, uint64_t{c} * 2048}});
    }
    return nodes;
}

std::vector<PendingWorkload> make_pending(size_t n) {
    std::mt19937 rng(7);
    std::uniform_int_distribution<uint32_t> cpu(1, 8);
    std::uniform_int_distribution<uint64_t> mem(128, 8192);
    std::vector<PendingWorkload> pending;
    for (size_t i = 0; i < n; ++i) {
        pending.push_back(PendingWorkload{"w-" + std::to_string(i), {cpu(rng), mem(rng)}, i + 1});
    }
    return pending;
}

Workload make_workload(const WorkloadId& id, Resources request) {
    Workload w;
    w.id = id;
    w.group = id;
    w.request = request;
    return w;
}

Node make_ready_node(const NodeId& id, Resources capacity) {
    Node n;
    n.id = id;
    n.capacity = capacity;
    n.phase = NodePhase::Ready;
    return n;
}

std::unique_ptr<ControlPlane> make_plane(bool serve_api) {
    ControlPlane::Options opts;
    opts.config = default_config();
    opts.config.api.enabled = serve_api;
    opts.config.api.port = 0;
    opts.config.runtime.readiness_poll_ms = 1;
    opts.runtime = std::make_shared<SimulatedRuntime>();
    auto plane = ControlPlane::create(std::move(opts));
    if (!plane) return nullptr;
    return std::move(*plane);
}

// ─────────────────────────────────────────────
// Suites
// ─────────────────────────────────────────────

std::vector<BenchResult> bench_planning() {
    std::vector<BenchResult> R;
    FirstFitPolicy first_fit;
    BestFitPolicy best_fit;

    const std::vector<std::pair<size_t, size_t>> sizes{{10, 100}, {100, 1000}, {1000, 1000}};
    for (auto [nodes, workloads] : sizes) {
        auto node_set = make_nodes(nodes);
        auto pending = make_pending(workloads);
        auto label = std::to_string(workloads) + "W, " + std::to_string(nodes) + "N";
        auto suffix = "(" + std::to_string(nodes) + "x" + std::to_string(workloads) + ")";
        size_t iters = nodes * workloads > 100000 ? 20 : 200;

        R.push_back(run_bench("first_fit" + suffix, "Planning", iters,
            [&]{ auto d = plan_placements(first_fit, pending, node_set); (void)d; }, label));
        R.push_back(run_bench("best_fit" + suffix, "Planning", iters,
            [&]{ auto d = plan_placements(best_fit, pending, node_set); (void)d; }, label));
    }
    return R;
}

std::vector<BenchResult> bench_store() {
    std::vector<BenchResult> R;
    constexpr size_t N = 1000;

    ObjectStore store;
    size_t next = 0;
    R.push_back(run_bench("create_workload", "Object Store", N,
        [&]{ auto r = store.create(make_workload("c-" + std::to_string(next++), {1, 128})); (void)r; }));

    R.push_back(run_bench("get_workload", "Object Store", N,
        [&]{ auto r = store.get<Workload>("c-0"); (void)r; }));

    R.push_back(run_bench("update_workload", "Object Store", N, [&]{
        auto current = store.get<Workload>("c-1");
        if (!current) return;
        auto r = store.update<Workload>("c-1", current->revision,
            [](Workload& w) -> Result<void> { w.message = "touched"; return Result<void>{}; });
        (void)r;
    }));

    R.push_back(run_bench("list_workloads", "Object Store", 100,
        [&]{ auto r = store.list<Workload>(); (void)r; },
        std::to_string(store.count(ObjectKind::Workload)) + " objects"));

    R.push_back(run_bench("batch_create(10)", "Object Store", N, [&]{
        WriteBatch batch;
        for (int i = 0; i < 10; ++i) {
            batch.create(make_workload("b-" + std::to_string(next++), {1, 128}));
        }
        auto r = store.commit(std::move(batch));
        (void)r;
    }, "10 ops"));

    ObjectStore bind_store;
    (void)bind_store.create(make_ready_node("node-a", {1024, 1 << 20}));
    (void)bind_store.create(make_workload("cycle", {1, 128}));
    R.push_back(run_bench("bind_release_cycle", "Object Store", N, [&]{
        auto w = bind_store.get<Workload>("cycle");
        auto n = bind_store.get<Node>("node-a");
        if (!w || !n) return;
        auto bound = bind_workload(bind_store, *w, *n);
        if (!bound) return;
        auto released = release_workload(bind_store, "cycle", WorkloadPhase::Pending, "bench");
        (void)released;
    }, "2 commits"));

    return R;
}

std::vector<BenchResult> bench_reconcile() {
    std::vector<BenchResult> R;

    const std::vector<std::pair<size_t, size_t>> sizes{{10, 100}, {50, 1000}};
    for (auto [nodes, workloads] : sizes) {
        auto plane = make_plane(false);
        if (!plane) return R;
        auto& api = plane->api();
        for (size_t i = 0; i < nodes; ++i) {
            (void)api.create_node({"node-" + std::to_string(i), {64, 131072}});
        }
        for (size_t i = 0; i < workloads; ++i) {
            (void)api.create_workload({"w-" + std::to_string(i), {1, 512}, 1});
        }

        auto label = std::to_string(workloads) + "W, " + std::to_string(nodes) + "N";
        auto start = Clock::now();
        auto first = plane->reconciler().reconcile();
        auto cold_us = std::chrono::duration<double, std::micro>(Clock::now() - start).count();
        R.push_back(BenchResult{
            .name = "cold_pass(" + std::to_string(workloads) + ")", .category = "Reconcile",
            .mean_us = cold_us, .stddev_us = 0, .min_us = cold_us, .max_us = cold_us,
            .p99_us = cold_us, .iterations = 1,
            .extra = label + ", placed " + std::to_string(first.placed)
        });

        R.push_back(run_bench("converged_pass(" + std::to_string(workloads) + ")", "Reconcile", 50,
            [&]{ auto r = plane->reconciler().reconcile(); (void)r; }, label));
    }
    return R;
}

std::vector<BenchResult> bench_api() {
    std::vector<BenchResult> R;
    auto plane = make_plane(true);
    if (!plane || !plane->start()) return R;
    (void)plane->api().create_node({"node-a", {8, 8192}});
    (void)plane->api().create_workload({"web", {1, 256}, 4});
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    TcpTransport client;
    if (!client.connect("127.0.0.1", plane->api_port(), 2000)) {
        plane->stop();
        return R;
    }

    auto health = ApiCodec::encode_request(ApiRequest{.op = ApiOp::Health});
    R.push_back(run_bench("tcp_health", "API", 200,
        [&]{ auto r = client.request(health, 5000); (void)r; }, "empty response"));

    auto status = ApiCodec::encode_request(ApiRequest{.op = ApiOp::ClusterStatus});
    R.push_back(run_bench("tcp_cluster_status", "API", 200, [&]{
        auto r = client.request(status, 5000);
        if (r) { auto decoded = ApiCodec::decode_response(*r); (void)decoded; }
    }, "1 node, 4 workloads"));

    client.disconnect();
    plane->stop();
    return R;
}

int main(int argc, char* argv[]) {
    bool csv = (argc > 1 && std::strcmp(argv[1], "--csv") == 0);

    if (!csv) {
        std::cout << "\n  kubesim Performance Benchmarks\n"
                  << "  " << std::string(40, '=') << "\n"
                  << "  Platform: " << sizeof(void*) * 8 << "-bit, "
                  << std::thread::hardware_concurrency() << " cores\n";
    }

    std::vector<BenchResult> all;
    auto append = [&](auto&& v){ all.insert(all.end(), v.begin(), v.end()); };

    append(bench_planning());
    append(bench_store());
    append(bench_reconcile());
    append(bench_api());

    print_results(all, csv);
    if (!csv) std::cout << "\n  Total: " << all.size() << " benchmarks\n\n";
    return 0;
}
