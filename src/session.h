#ifndef LIVERELOAD_SESSION_H
#define LIVERELOAD_SESSION_H

#include "config.h"
#include "debug_bridge.h"
#include "device_bridge.h"
#include "process_supervisor.h"

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace livereload {

struct SessionCommands {
    std::function<std::vector<std::string>(const SessionConfig &)> dev_server = dev_server_command;
    std::function<std::vector<std::string>(const SessionConfig &)> app_runner = app_runner_command;
};

// One live-reload session: resolves the configuration, starts the dev
// server, log stream, app runner and debug bridge in that order, then
// supervises them until stop is set.
class Session {
public:
    Session(Options options, DeviceBridge &bridge, const std::atomic<bool> &stop,
            SessionTimings timings = {}, SessionCommands commands = {});
    ~Session();

    Session(const Session &) = delete;
    Session &operator=(const Session &) = delete;

    // Blocks until stop is set; every child is terminated before it returns.
    int run();

    const std::string &session_id() const { return session_id_; }
    ProcessSupervisor &supervisor() { return supervisor_; }

private:
    SessionConfig resolve();
    void teardown();

    Options options_;
    DeviceBridge &bridge_;
    const std::atomic<bool> &stop_;
    SessionTimings timings_;
    SessionCommands commands_;
    std::string session_id_;
    ProcessSupervisor supervisor_;
    std::unique_ptr<DebugBridge> debug_bridge_;
};

}  // namespace livereload

#endif  // LIVERELOAD_SESSION_H
