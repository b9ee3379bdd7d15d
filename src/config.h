#ifndef LIVERELOAD_CONFIG_H
#define LIVERELOAD_CONFIG_H

#include "log_filter.h"

#include <chrono>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace livereload {

constexpr int kDefaultDevPort = 5173;
constexpr const char *kLoopbackHost = "127.0.0.1";
constexpr const char *kProjectDescriptor = "capacitor.config.json";

enum class ConnectionMode {
    Usb,
    Wifi,
};

// Command line as given by the user.
struct Options {
    ConnectionMode mode = ConnectionMode::Usb;
    std::string host;
    int port = kDefaultDevPort;
    std::optional<std::string> target;
    std::optional<std::string> app_id;
    bool logcat = true;
    LogcatMode logcat_mode = LogcatMode::Console;
    std::vector<std::string> logcat_tags;
    bool logcat_all = false;
    bool devtools = false;
    std::string project_dir = ".";
    bool check_deps = false;
    bool help = false;
};

void usage(std::ostream &out);

// Returns false with error set on an unknown flag, a missing or invalid
// value, or wifi mode without --host.
bool parse_args(int argc, char **argv, Options &opts, std::string &error);

// Top-level "appId" of the project descriptor; absent or unreadable files
// yield std::nullopt.
std::optional<std::string> read_app_id(const std::string &project_dir);

struct SessionTimings {
    int port_attempts = 20;
    std::chrono::milliseconds port_ready_timeout{30000};
    std::chrono::milliseconds poll_interval{500};
    std::chrono::milliseconds pid_timeout{60000};
    std::chrono::milliseconds pid_interval{1000};
    int discovery_attempts = 30;
    std::chrono::milliseconds discovery_interval{1000};
    std::chrono::milliseconds ws_connect_timeout{10000};
    std::chrono::milliseconds logcat_grace{5000};
    std::chrono::milliseconds dev_grace{10000};
    std::chrono::milliseconds runner_grace{10000};
    std::chrono::milliseconds bridge_grace{2000};
};

// Resolved once at startup and never modified afterwards.
struct SessionConfig {
    ConnectionMode mode = ConnectionMode::Usb;
    std::string runner_host;
    int preferred_port = kDefaultDevPort;
    int port = kDefaultDevPort;
    std::optional<std::string> target;
    std::optional<std::string> app_id;
    bool logcat_enabled = true;
    LogcatMode logcat_mode = LogcatMode::Console;
    std::vector<std::string> logcat_tags;
    bool devtools = false;
    std::string project_dir;
    SessionTimings timings;
};

// --logcat-all forces All; App without an application id degrades to All
// and sets degraded.
LogcatMode resolve_logcat_mode(LogcatMode requested, bool force_all, bool have_app_id, bool &degraded);

SessionConfig resolve_session_config(const Options &opts, int port,
                                     std::optional<std::string> target,
                                     std::optional<std::string> app_id,
                                     LogcatMode logcat_mode,
                                     const SessionTimings &timings);

std::vector<std::string> dev_server_command(const SessionConfig &config);
std::vector<std::string> app_runner_command(const SessionConfig &config);

}  // namespace livereload

#endif  // LIVERELOAD_CONFIG_H
