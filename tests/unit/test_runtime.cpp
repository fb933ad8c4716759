/**
 * @file test_runtime.cpp
 * @brief Unit tests for SimulatedRuntime, ProcessRuntime and make_runtime.
 * @author Dimitris Kafetzis
 */

#include "runtime/container_runtime.hpp"

#include <gtest/gtest.h>
#include <chrono>
#include <csignal>
#include <thread>

using namespace kubesim;

namespace {

EnvironmentSpec make_spec(const std::string& name = "kubesim-node-a") {
    return EnvironmentSpec{
        .name = name,
        .limits = {2, 1024},
        .labels = {{"app", "kubesim"}, {"type", "node"}}
    };
}

bool wait_until_dead(ProcessRuntime& rt, const RuntimeHandle& handle) {
    for (int i = 0; i < 200; ++i) {
        if (!rt.is_alive(handle)) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return false;
}

}  // namespace

// ═══════════════════════════════════════════════
// SimulatedRuntime
// ═══════════════════════════════════════════════

TEST(SimulatedRuntimeTest, Lifecycle) {
    SimulatedRuntime rt;
    auto handle = rt.create_environment(make_spec());
    ASSERT_TRUE(handle.has_value());
    EXPECT_TRUE(rt.exists(*handle));
    EXPECT_FALSE(rt.is_alive(*handle));

    ASSERT_TRUE(rt.start_environment(*handle));
    EXPECT_TRUE(rt.is_alive(*handle));
    EXPECT_EQ(rt.running_count(), 1u);

    ASSERT_TRUE(rt.stop_environment(*handle));
    EXPECT_FALSE(rt.is_alive(*handle));

    ASSERT_TRUE(rt.remove_environment(*handle));
    EXPECT_FALSE(rt.exists(*handle));
    EXPECT_EQ(rt.environment_count(), 0u);
}

TEST(SimulatedRuntimeTest, HandlesAreUnique) {
    SimulatedRuntime rt;
    auto a = rt.create_environment(make_spec("a"));
    auto b = rt.create_environment(make_spec("b"));
    ASSERT_TRUE(a && b);
    EXPECT_NE(*a, *b);
}

TEST(SimulatedRuntimeTest, UnknownHandleIsNotFound) {
    SimulatedRuntime rt;
    EXPECT_EQ(rt.start_environment("nope").error().code, ErrorCode::NotFound);
    EXPECT_EQ(rt.stop_environment("nope").error().code, ErrorCode::NotFound);
    EXPECT_EQ(rt.remove_environment("nope").error().code, ErrorCode::NotFound);
    EXPECT_FALSE(rt.is_alive("nope"));
}

TEST(SimulatedRuntimeTest, InjectedFailuresFireOnce) {
    SimulatedRuntime rt;
    rt.fail_next_create("no capacity");
    auto failed = rt.create_environment(make_spec());
    ASSERT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error().code, ErrorCode::Runtime);
    EXPECT_EQ(failed.error().message, "no capacity");

    auto handle = rt.create_environment(make_spec());
    ASSERT_TRUE(handle.has_value());

    rt.fail_next_start("image pull failed");
    EXPECT_FALSE(rt.start_environment(*handle));
    EXPECT_TRUE(rt.start_environment(*handle));

    rt.fail_next_stop("stuck");
    EXPECT_FALSE(rt.stop_environment(*handle));
    EXPECT_TRUE(rt.is_alive(*handle));
}

TEST(SimulatedRuntimeTest, CrashAndRecover) {
    SimulatedRuntime rt;
    auto handle = *rt.create_environment(make_spec());
    ASSERT_TRUE(rt.start_environment(handle));

    rt.set_alive(handle, false);
    EXPECT_FALSE(rt.is_alive(handle));
    EXPECT_EQ(rt.running_count(), 0u);

    rt.set_alive(handle, true);
    EXPECT_TRUE(rt.is_alive(handle));
}

TEST(SimulatedRuntimeTest, LatencyDelaysCalls) {
    SimulatedRuntime rt;
    rt.set_latency(Duration{50});
    auto start = std::chrono::steady_clock::now();
    ASSERT_TRUE(rt.create_environment(make_spec()));
    EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(50));
}

// ═══════════════════════════════════════════════
// make_runtime
// ═══════════════════════════════════════════════

TEST(RuntimeFactoryTest, BuildsConfiguredKind) {
    RuntimeConfig config;
    config.kind = "simulated";
    auto simulated = make_runtime(config);
    ASSERT_TRUE(simulated.has_value());
    EXPECT_EQ((*simulated)->name(), "simulated");

    config.kind = "process";
    auto process = make_runtime(config);
    ASSERT_TRUE(process.has_value());
    EXPECT_EQ((*process)->name(), "process");
}

TEST(RuntimeFactoryTest, RejectsUnknownKind) {
    RuntimeConfig config;
    config.kind = "docker";
    auto rt = make_runtime(config);
    ASSERT_FALSE(rt.has_value());
    EXPECT_EQ(rt.error().code, ErrorCode::Validation);
}

TEST(RuntimeFactoryTest, ProcessNeedsCommand) {
    RuntimeConfig config;
    config.kind = "process";
    config.command.clear();
    auto rt = make_runtime(config);
    ASSERT_FALSE(rt.has_value());
    EXPECT_EQ(rt.error().code, ErrorCode::Validation);
}

// ═══════════════════════════════════════════════
// ProcessRuntime
// ═══════════════════════════════════════════════

TEST(ProcessRuntimeTest, StartStopRemove) {
    ProcessRuntime rt(std::vector<std::string>{"/bin/sleep", "30"}, Duration{500});
    auto handle = rt.create_environment(make_spec());
    ASSERT_TRUE(handle.has_value());
    EXPECT_FALSE(rt.is_alive(*handle));
    EXPECT_EQ(rt.pid_of(*handle), -1);

    auto started = rt.start_environment(*handle);
    ASSERT_TRUE(started) << started.error().message;
    EXPECT_GT(rt.pid_of(*handle), 0);
    EXPECT_TRUE(rt.is_alive(*handle));

    ASSERT_TRUE(rt.stop_environment(*handle));
    EXPECT_FALSE(rt.is_alive(*handle));

    ASSERT_TRUE(rt.remove_environment(*handle));
    EXPECT_EQ(rt.remove_environment(*handle).error().code, ErrorCode::NotFound);
}

TEST(ProcessRuntimeTest, DetectsExitedProcess) {
    ProcessRuntime rt(std::vector<std::string>{"/bin/sleep", "30"}, Duration{500});
    auto handle = *rt.create_environment(make_spec());
    ASSERT_TRUE(rt.start_environment(handle));

    pid_t pid = rt.pid_of(handle);
    ASSERT_GT(pid, 0);
    ::kill(pid, SIGKILL);

    EXPECT_TRUE(wait_until_dead(rt, handle));
    ASSERT_TRUE(rt.remove_environment(handle));
}

TEST(ProcessRuntimeTest, MissingExecutableFailsStart) {
    ProcessRuntime rt(std::vector<std::string>{"/nonexistent/kubesim-keepalive"});
    auto handle = *rt.create_environment(make_spec());

    auto started = rt.start_environment(handle);
    ASSERT_FALSE(started);
    EXPECT_EQ(started.error().code, ErrorCode::Runtime);
    EXPECT_FALSE(rt.is_alive(handle));
}
