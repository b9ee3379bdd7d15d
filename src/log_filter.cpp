#include "log_filter.h"

#include "common.h"

#include <utility>

namespace livereload {

std::optional<LogcatMode> parse_logcat_mode(const std::string &name) {
    if (name == "console") return LogcatMode::Console;
    if (name == "app") return LogcatMode::App;
    if (name == "all") return LogcatMode::All;
    return std::nullopt;
}

const char *logcat_mode_name(LogcatMode mode) {
    switch (mode) {
        case LogcatMode::Console: return "console";
        case LogcatMode::App: return "app";
        case LogcatMode::All: return "all";
    }
    return "unknown";
}

void AppPidState::set(std::optional<int> pid) {
    std::lock_guard<std::mutex> lock(mutex_);
    pid_ = pid;
}

std::optional<int> AppPidState::get() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pid_;
}

const std::vector<std::string> &console_tags() {
    static const std::vector<std::string> tags{
        "CAPACITOR",
        "CHROMIUM",
        "CONSOLE",
        "WEBVIEW",
        "SYSTEMWEBCHROMECLIENT",
    };
    return tags;
}

bool is_console_line(const std::string &line) {
    std::string upper = to_upper(line);
    for (const auto &tag : console_tags()) {
        if (upper.find(tag) != std::string::npos) {
            return true;
        }
    }
    return false;
}

std::optional<int> parse_threadtime_pid(const std::string &line) {
    auto parts = split_words(line);
    if (parts.size() < 5) {
        return std::nullopt;
    }
    const std::string &field = parts[2];
    if (field.empty() || field.size() > 9) {
        return std::nullopt;
    }
    int pid = 0;
    for (char c : field) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        pid = pid * 10 + (c - '0');
    }
    return pid;
}

LineFilter make_line_filter(LogcatMode mode, std::shared_ptr<const AppPidState> pid_state) {
    switch (mode) {
        case LogcatMode::Console:
            // No pid filtering here: the web renderer usually runs in its own
            // sandboxed process, so the app pid would hide its console lines.
            return [](const std::string &line) { return is_console_line(line); };
        case LogcatMode::App:
            return [pid_state](const std::string &line) {
                std::optional<int> pid = pid_state ? pid_state->get() : std::nullopt;
                if (!pid) {
                    return true;
                }
                return parse_threadtime_pid(line) == pid;
            };
        case LogcatMode::All:
            break;
    }
    return nullptr;
}

std::vector<std::string> logcat_stream_args(LogcatMode mode,
                                            const std::vector<std::string> &tags,
                                            const std::optional<std::string> &serial) {
    std::vector<std::string> args{"logcat", "-v", "threadtime"};
    if (mode != LogcatMode::All && !tags.empty()) {
        args.push_back("-s");
        args.insert(args.end(), tags.begin(), tags.end());
    }
    return with_serial(serial, args);
}

LogFilterPipeline::LogFilterPipeline(DeviceBridge &bridge, ProcessSupervisor &supervisor,
                                     std::optional<std::string> serial, std::string cwd)
    : bridge_(bridge), supervisor_(supervisor), serial_(std::move(serial)), cwd_(std::move(cwd)) {}

ManagedProcess *LogFilterPipeline::attach(LogcatMode mode,
                                          const std::vector<std::string> &tags,
                                          std::shared_ptr<const AppPidState> pid_state,
                                          std::chrono::milliseconds grace) {
    if (!bridge_.available()) {
        console().warn(bridge_.name() + " not found in PATH. Logcat disabled.");
        return nullptr;
    }

    // Stale entries from earlier sessions would otherwise be replayed.
    CommandResult cleared = bridge_.run(with_serial(serial_, {"logcat", "-c"}), kBridgeShortTimeout);
    if (cleared.timed_out) {
        console().warn("clearing the device log buffer timed out.");
    }

    console().info("Starting " + bridge_.name() + " logcat (" + logcat_mode_name(mode) + " mode)...");
    auto argv = bridge_.command_line(logcat_stream_args(mode, tags, serial_));
    ManagedProcess *proc = supervisor_.spawn("logcat", argv, cwd_, grace,
                                             make_line_filter(mode, std::move(pid_state)));
    if (!proc) {
        console().warn("failed to start " + bridge_.name() + " logcat.");
    }
    return proc;
}

}  // namespace livereload
