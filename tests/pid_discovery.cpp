#include <gtest/gtest.h>

#include "pid_discovery.h"
#include "test_support.h"

#include <atomic>
#include <chrono>

using namespace livereload;
using livereload::test::FakeBridge;

TEST(PidDiscovery, ParsesFirstToken) {
    EXPECT_EQ(parse_pidof_output("12345\n"), 12345);
    EXPECT_EQ(parse_pidof_output("  678 910\n"), 678);
    EXPECT_FALSE(parse_pidof_output("").has_value());
    EXPECT_FALSE(parse_pidof_output("\n").has_value());
    EXPECT_FALSE(parse_pidof_output("pidof: not found").has_value());
    EXPECT_FALSE(parse_pidof_output("0").has_value());
    EXPECT_FALSE(parse_pidof_output("-5").has_value());
}

TEST(PidDiscovery, QueriesTargetDevice) {
    FakeBridge bridge;
    bridge.responses["-s SER shell pidof -s com.example.app"] = test::output_result("4321\n");

    PidDiscovery discovery(bridge, std::string("SER"));
    std::atomic<bool> stop{false};
    auto pid = discovery.wait_for_app_pid("com.example.app", std::chrono::seconds(5), stop,
                                          std::chrono::milliseconds(10));
    ASSERT_TRUE(pid.has_value());
    EXPECT_EQ(*pid, 4321);
    EXPECT_EQ(bridge.calls().size(), 1u);
}

TEST(PidDiscovery, KeepsPollingUntilTimeout) {
    FakeBridge bridge;
    PidDiscovery discovery(bridge, std::nullopt);
    std::atomic<bool> stop{false};

    auto started = std::chrono::steady_clock::now();
    auto pid = discovery.wait_for_app_pid("com.example.app", std::chrono::milliseconds(200), stop,
                                          std::chrono::milliseconds(20));
    auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_FALSE(pid.has_value());
    EXPECT_GT(bridge.calls().size(), 1u);
    EXPECT_LT(elapsed, std::chrono::seconds(2));
    EXPECT_EQ(bridge.calls()[0], (std::vector<std::string>{"shell", "pidof", "-s", "com.example.app"}));
}

TEST(PidDiscovery, StopsWhenRequested) {
    FakeBridge bridge;
    PidDiscovery discovery(bridge, std::nullopt);
    std::atomic<bool> stop{true};

    EXPECT_FALSE(discovery.wait_for_app_pid("com.example.app", std::chrono::seconds(60), stop).has_value());
    EXPECT_TRUE(bridge.calls().empty());
}
