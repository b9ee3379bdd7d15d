#ifndef LIVERELOAD_LOG_FILTER_H
#define LIVERELOAD_LOG_FILTER_H

#include "device_bridge.h"
#include "process_supervisor.h"

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace livereload {

enum class LogcatMode {
    Console,
    App,
    All,
};

std::optional<LogcatMode> parse_logcat_mode(const std::string &name);
const char *logcat_mode_name(LogcatMode mode);

// Single-slot pid cell: written by pid discovery, read by the app-mode
// filter on the log pump thread.
class AppPidState {
public:
    void set(std::optional<int> pid);
    std::optional<int> get() const;

private:
    mutable std::mutex mutex_;
    std::optional<int> pid_;
};

// Sources that carry web-runtime console output.
const std::vector<std::string> &console_tags();

bool is_console_line(const std::string &line);

// Pid field of a "threadtime" line: "MM-DD HH:MM:SS.mmm PID TID LEVEL TAG: msg".
std::optional<int> parse_threadtime_pid(const std::string &line);

// Predicate for a mode; empty for LogcatMode::All. The app-mode predicate
// passes everything until a pid is known.
LineFilter make_line_filter(LogcatMode mode, std::shared_ptr<const AppPidState> pid_state);

// Arguments after the bridge executable for the continuous log stream.
std::vector<std::string> logcat_stream_args(LogcatMode mode,
                                            const std::vector<std::string> &tags,
                                            const std::optional<std::string> &serial);

class LogFilterPipeline {
public:
    LogFilterPipeline(DeviceBridge &bridge, ProcessSupervisor &supervisor,
                      std::optional<std::string> serial, std::string cwd);

    // Clears the device log buffer and starts the filtered stream under the
    // "logcat" label. Returns nullptr if the stream could not be started.
    ManagedProcess *attach(LogcatMode mode,
                           const std::vector<std::string> &tags,
                           std::shared_ptr<const AppPidState> pid_state,
                           std::chrono::milliseconds grace);

private:
    DeviceBridge &bridge_;
    ProcessSupervisor &supervisor_;
    std::optional<std::string> serial_;
    std::string cwd_;
};

}  // namespace livereload

#endif  // LIVERELOAD_LOG_FILTER_H
