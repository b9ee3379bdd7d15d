#include <gtest/gtest.h>

#include "session.h"
#include "test_support.h"

#include <unistd.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <thread>

using namespace livereload;
using livereload::test::ConsoleCapture;
using livereload::test::FakeBridge;
using livereload::test::TempDir;

namespace {

const char *kDeviceList = "List of devices attached\nR58M\tdevice\nemulator-5554\tdevice\n";

SessionTimings fast_timings() {
    SessionTimings t;
    t.port_ready_timeout = std::chrono::milliseconds(300);
    t.poll_interval = std::chrono::milliseconds(50);
    t.pid_timeout = std::chrono::milliseconds(500);
    t.pid_interval = std::chrono::milliseconds(20);
    t.discovery_attempts = 2;
    t.discovery_interval = std::chrono::milliseconds(20);
    t.logcat_grace = std::chrono::milliseconds(1000);
    t.dev_grace = std::chrono::milliseconds(1000);
    t.runner_grace = std::chrono::milliseconds(1000);
    t.bridge_grace = std::chrono::milliseconds(1000);
    return t;
}

int unused_port() {
    int port = 0;
    int fd = test::listen_loopback(port);
    if (fd >= 0) {
        close(fd);
    }
    return port;
}

Options base_options(const std::string &project_dir) {
    Options opts;
    opts.port = unused_port();
    opts.project_dir = project_dir;
    opts.logcat = false;
    return opts;
}

SessionCommands long_running_commands(std::shared_ptr<std::optional<SessionConfig>> seen = nullptr) {
    SessionCommands commands;
    commands.dev_server = [](const SessionConfig &) {
        return std::vector<std::string>{"sleep", "30"};
    };
    commands.app_runner = [seen](const SessionConfig &config) {
        if (seen) {
            *seen = config;
        }
        return std::vector<std::string>{"sleep", "30"};
    };
    return commands;
}

struct Outcome {
    int code = -1;
    bool alive_before_stop = false;
    std::string out;
};

// Runs the session on a worker thread, lets it settle for run_for, then
// raises the stop flag the way the signal handler does.
Outcome run_session(Session &session, std::atomic<bool> &stop, ConsoleCapture &capture,
                    std::chrono::milliseconds run_for) {
    Outcome outcome;
    std::atomic<bool> returned{false};
    std::thread runner([&]() {
        outcome.code = session.run();
        returned = true;
    });
    std::this_thread::sleep_for(run_for);
    outcome.alive_before_stop = !returned;
    stop = true;
    runner.join();
    outcome.out = capture.text();
    return outcome;
}

bool contains(const std::string &haystack, const std::string &needle) {
    return haystack.find(needle) != std::string::npos;
}

}  // namespace

TEST(Session, DevServerExitKeepsSessionAlive) {
    TempDir project;
    FakeBridge bridge;
    bridge.present = false;
    SessionCommands commands = long_running_commands();
    commands.dev_server = [](const SessionConfig &) {
        return std::vector<std::string>{"sh", "-c", "exit 1"};
    };

    ConsoleCapture capture;
    std::atomic<bool> stop{false};
    Session session(base_options(project.path()), bridge, stop, fast_timings(), commands);
    Outcome outcome = run_session(session, stop, capture, std::chrono::milliseconds(1200));

    EXPECT_TRUE(outcome.alive_before_stop);
    EXPECT_EQ(outcome.code, 0);
    EXPECT_TRUE(contains(outcome.out, "[dev] process exited with code 1; keeping session alive."));
    EXPECT_TRUE(contains(outcome.out, "Warning: dev server not ready yet, continuing anyway."));
    EXPECT_TRUE(contains(outcome.out, "Live reload running."));

    const auto &procs = session.supervisor().processes();
    ASSERT_EQ(procs.size(), 2u);
    EXPECT_EQ(procs[1]->label, "cap");
    EXPECT_TRUE(procs[1]->terminated);
    EXPECT_EQ(session.supervisor().alive_count(), 0u);
}

TEST(Session, LogcatDisabledSkipsLogStreamAndPidDiscovery) {
    TempDir project;
    FakeBridge bridge;
    bridge.responses["devices"] = test::output_result(kDeviceList);
    auto seen = std::make_shared<std::optional<SessionConfig>>();

    Options opts = base_options(project.path());
    opts.logcat_mode = LogcatMode::App;
    opts.app_id = "com.example.app";

    ConsoleCapture capture;
    std::atomic<bool> stop{false};
    Session session(opts, bridge, stop, fast_timings(), long_running_commands(seen));
    Outcome outcome = run_session(session, stop, capture, std::chrono::milliseconds(700));

    EXPECT_TRUE(bridge.saw("devices"));
    EXPECT_FALSE(bridge.saw("logcat"));
    EXPECT_FALSE(bridge.saw("pidof"));
    EXPECT_TRUE(bridge.streams().empty());
    EXPECT_TRUE(contains(outcome.out, "Using device: R58M"));

    ASSERT_TRUE(seen->has_value());
    const SessionConfig &config = **seen;
    EXPECT_EQ(config.target, std::optional<std::string>("R58M"));
    EXPECT_FALSE(config.logcat_enabled);
    auto runner = app_runner_command(config);
    std::string port = std::to_string(config.port);
    EXPECT_EQ(runner, (std::vector<std::string>{"npx", "cap", "run", "android", "-l", "--host", "localhost",
                                                "--port", port, "--forwardPorts", port + ":" + port,
                                                "--target", "R58M"}));
}

TEST(Session, AppModeWithoutAppIdShowsAllLogs) {
    TempDir project;
    FakeBridge bridge;
    bridge.responses["devices"] = test::output_result(kDeviceList);

    Options opts = base_options(project.path());
    opts.logcat = true;
    opts.logcat_mode = LogcatMode::App;
    opts.logcat_tags = {"Capacitor"};

    ConsoleCapture capture;
    std::atomic<bool> stop{false};
    Session session(opts, bridge, stop, fast_timings(), long_running_commands());
    Outcome outcome = run_session(session, stop, capture, std::chrono::milliseconds(700));

    EXPECT_TRUE(contains(outcome.out, "Warning: appId not found; showing all logs."));
    EXPECT_TRUE(contains(outcome.out, "Starting adb logcat (all mode)..."));
    auto streams = bridge.streams();
    ASSERT_EQ(streams.size(), 1u);
    EXPECT_EQ(streams[0], (std::vector<std::string>{"-s", "R58M", "logcat", "-v", "threadtime"}));
    EXPECT_FALSE(bridge.saw("pidof"));
}

TEST(Session, AppModeFiltersByDiscoveredPid) {
    TempDir project;
    project.write("capacitor.config.json", R"({"appId":"com.example.app","appName":"Example"})");

    FakeBridge bridge;
    bridge.responses["devices"] = test::output_result(kDeviceList);
    bridge.responses["-s R58M shell pidof -s com.example.app"] = test::output_result("777\n");
    bridge.stream_command = {"sh", "-c",
                             "sleep 0.5; "
                             "echo '10-19 12:00:00.000   777   777 I App: mine'; "
                             "echo '10-19 12:00:00.000   888   888 I Other: theirs'; "
                             "sleep 30"};

    Options opts = base_options(project.path());
    opts.logcat = true;
    opts.logcat_mode = LogcatMode::App;

    ConsoleCapture capture;
    std::atomic<bool> stop{false};
    Session session(opts, bridge, stop, fast_timings(), long_running_commands());
    Outcome outcome = run_session(session, stop, capture, std::chrono::milliseconds(1500));

    EXPECT_TRUE(contains(outcome.out, "App PID: 777"));
    EXPECT_TRUE(contains(outcome.out, "[logcat] 10-19 12:00:00.000   777   777 I App: mine"));
    EXPECT_FALSE(contains(outcome.out, "theirs"));
}

TEST(Session, ExportsSessionIdToChildren) {
    TempDir project;
    FakeBridge bridge;
    bridge.present = false;
    SessionCommands commands = long_running_commands();
    commands.dev_server = [](const SessionConfig &) {
        return std::vector<std::string>{"sh", "-c", "echo session=$LIVERELOAD_SESSION_ID; exec sleep 30"};
    };

    ConsoleCapture capture;
    std::atomic<bool> stop{false};
    Session session(base_options(project.path()), bridge, stop, fast_timings(), commands);
    Outcome outcome = run_session(session, stop, capture, std::chrono::milliseconds(600));

    ASSERT_EQ(session.session_id().size(), 36u);
    EXPECT_TRUE(contains(outcome.out, "livereload session " + session.session_id()));
    EXPECT_TRUE(contains(outcome.out, "[dev] session=" + session.session_id()));
}

TEST(Session, BusyPreferredPortIsReplacedEverywhere) {
    TempDir project;
    FakeBridge bridge;
    bridge.present = false;
    auto seen = std::make_shared<std::optional<SessionConfig>>();

    int busy = 0;
    int listener = test::listen_loopback(busy);
    ASSERT_GE(listener, 0);
    Options opts = base_options(project.path());
    opts.port = busy;

    ConsoleCapture capture;
    std::atomic<bool> stop{false};
    Session session(opts, bridge, stop, fast_timings(), long_running_commands(seen));
    Outcome outcome = run_session(session, stop, capture, std::chrono::milliseconds(600));
    close(listener);

    ASSERT_TRUE(seen->has_value());
    int chosen = (*seen)->port;
    EXPECT_NE(chosen, busy);
    EXPECT_EQ((*seen)->preferred_port, busy);
    EXPECT_TRUE(contains(outcome.out, "Port " + std::to_string(busy) + " is busy; using " +
                                          std::to_string(chosen) + " instead."));
    auto dev = dev_server_command(**seen);
    EXPECT_EQ(dev.back(), std::to_string(chosen));
}
