#include "session.h"

#include "common.h"
#include "device_registry.h"
#include "log_filter.h"
#include "pid_discovery.h"
#include "port_allocator.h"

#include <utility>

namespace livereload {

Session::Session(Options options, DeviceBridge &bridge, const std::atomic<bool> &stop,
                 SessionTimings timings, SessionCommands commands)
    : options_(std::move(options)),
      bridge_(bridge),
      stop_(stop),
      timings_(timings),
      commands_(std::move(commands)),
      session_id_(generate_session_id()),
      supervisor_(std::map<std::string, std::string>{{kSessionIdEnv, session_id_}}) {}

Session::~Session() {
    teardown();
}

SessionConfig Session::resolve() {
    int port = find_free_port(kLoopbackHost, options_.port, timings_.port_attempts);
    if (port != options_.port) {
        console().info("Port " + std::to_string(options_.port) + " is busy; using " +
                       std::to_string(port) + " instead.");
    }

    std::optional<std::string> target = options_.target;
    if (!target) {
        DeviceRegistry registry(bridge_);
        auto chosen = DeviceRegistry::choose_target(registry.list_devices());
        if (chosen) {
            target = chosen->serial;
            console().info("Using device: " + chosen->serial);
        } else if (bridge_.available()) {
            console().warn("No ready Android devices found.");
        }
    }

    std::optional<std::string> app_id = options_.app_id;
    if (!app_id) {
        app_id = read_app_id(options_.project_dir);
    }

    bool degraded = false;
    LogcatMode mode = resolve_logcat_mode(options_.logcat_mode, options_.logcat_all,
                                          app_id.has_value(), degraded);
    if (degraded && options_.logcat) {
        console().warn("appId not found; showing all logs.");
    }

    return resolve_session_config(options_, port, std::move(target), std::move(app_id), mode, timings_);
}

int Session::run() {
    const SessionConfig config = resolve();
    const SessionTimings &t = config.timings;

    console().info("livereload session " + session_id_);

    console().info("Starting Vite dev server...");
    ManagedProcess *dev = supervisor_.spawn("dev", commands_.dev_server(config), config.project_dir, t.dev_grace);
    if (dev) {
        console().info("Waiting for Vite on " + std::string(kLoopbackHost) + ":" + std::to_string(config.port) + "...");
        bool ready = ProcessSupervisor::wait_for_port_ready(kLoopbackHost, config.port,
                                                            t.port_ready_timeout, stop_, t.poll_interval);
        if (!ready && !stop_) {
            console().warn("dev server not ready yet, continuing anyway.");
        }
    }

    auto pid_state = std::make_shared<AppPidState>();
    if (config.logcat_enabled && !stop_) {
        LogFilterPipeline pipeline(bridge_, supervisor_, config.target, config.project_dir);
        pipeline.attach(config.logcat_mode, config.logcat_tags, pid_state, t.logcat_grace);
    }

    if (!stop_) {
        console().info("Starting Capacitor run...");
        supervisor_.spawn("cap", commands_.app_runner(config), config.project_dir, t.runner_grace);
    }

    // Only the app filter needs the pid; console mode must never block here.
    if (config.logcat_enabled && config.logcat_mode == LogcatMode::App && config.app_id &&
        bridge_.available() && !stop_) {
        console().info("Waiting for app process for logcat (app mode)...");
        PidDiscovery discovery(bridge_, config.target);
        auto pid = discovery.wait_for_app_pid(*config.app_id, t.pid_timeout, stop_, t.pid_interval);
        pid_state->set(pid);
        if (pid) {
            console().info("App PID: " + std::to_string(*pid));
        } else if (!stop_) {
            console().warn("app pid not found; logcat may be noisy.");
        }
    }

    if (config.devtools && !stop_) {
        DebugBridgeOptions opts;
        opts.discovery_attempts = t.discovery_attempts;
        opts.discovery_interval = t.discovery_interval;
        opts.connect_timeout = t.ws_connect_timeout;
        opts.stop_grace = t.bridge_grace;

        console().info("Starting Chrome DevTools Protocol console capture...");
        debug_bridge_ = std::make_unique<DebugBridge>(bridge_, config.target, opts);
        if (!debug_bridge_->start()) {
            debug_bridge_.reset();
        }
    }

    if (!stop_) {
        console().info("Live reload running. Logs will appear here (Ctrl+C to stop).");
    }
    while (!stop_) {
        supervisor_.poll();
        sleep_unless_stopped(t.poll_interval, stop_);
    }

    teardown();
    return 0;
}

void Session::teardown() {
    if (debug_bridge_) {
        debug_bridge_->stop();
        debug_bridge_.reset();
    }
    if (supervisor_.alive_count() > 0) {
        console().info("Stopping " + std::to_string(supervisor_.alive_count()) + " process(es)...");
    }
    supervisor_.shutdown();
}

}  // namespace livereload
