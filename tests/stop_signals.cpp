#include <gtest/gtest.h>

#include "session.h"
#include "stop_signals.h"
#include "test_support.h"

#include <signal.h>
#include <unistd.h>

#include <chrono>
#include <cstring>
#include <string>
#include <thread>
#include <vector>

using namespace livereload;
using livereload::test::ConsoleCapture;
using livereload::test::FakeBridge;
using livereload::test::TempDir;

namespace {

void restore_default_handlers() {
    for (int sig : kStopSignals) {
        signal(sig, SIG_DFL);
    }
    stop_flag() = false;
}

}  // namespace

TEST(StopSignals, EveryStopSignalRaisesFlag) {
    ASSERT_TRUE(install_stop_handlers());
    for (int sig : {SIGINT, SIGTERM, SIGHUP, SIGQUIT}) {
        stop_flag() = false;
        raise(sig);
        EXPECT_TRUE(stop_flag()) << strsignal(sig);
    }
    restore_default_handlers();
}

TEST(StopSignals, HangupTearsDownEveryChild) {
    TempDir project;
    FakeBridge bridge;
    bridge.present = false;

    int port = 0;
    int fd = test::listen_loopback(port);
    ASSERT_GE(fd, 0);
    close(fd);

    Options opts;
    opts.port = port;
    opts.project_dir = project.path();
    opts.logcat = false;

    SessionTimings timings;
    timings.port_ready_timeout = std::chrono::milliseconds(200);
    timings.poll_interval = std::chrono::milliseconds(50);
    timings.dev_grace = std::chrono::milliseconds(1000);
    timings.runner_grace = std::chrono::milliseconds(1000);

    SessionCommands commands;
    commands.dev_server = [](const SessionConfig &) { return std::vector<std::string>{"sleep", "30"}; };
    commands.app_runner = [](const SessionConfig &) { return std::vector<std::string>{"sleep", "30"}; };

    ASSERT_TRUE(install_stop_handlers());
    stop_flag() = false;

    ConsoleCapture capture;
    Session session(opts, bridge, stop_flag(), timings, commands);
    int code = -1;
    std::thread runner([&]() { code = session.run(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(600));
    kill(getpid(), SIGHUP);
    runner.join();
    restore_default_handlers();

    EXPECT_EQ(code, 0);
    EXPECT_TRUE(capture.contains("Stopping 2 process(es)..."));
    const auto &procs = session.supervisor().processes();
    ASSERT_EQ(procs.size(), 2u);
    for (const auto &p : procs) {
        EXPECT_TRUE(p->terminated) << p->label;
        EXPECT_EQ(p->exit_code, -SIGTERM) << p->label;
    }
    EXPECT_EQ(session.supervisor().alive_count(), 0u);
}
