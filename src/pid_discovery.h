#ifndef LIVERELOAD_PID_DISCOVERY_H
#define LIVERELOAD_PID_DISCOVERY_H

#include "device_bridge.h"

#include <atomic>
#include <chrono>
#include <optional>
#include <string>
#include <utility>

namespace livereload {

// First token of "pidof" output, if it is a positive integer.
std::optional<int> parse_pidof_output(const std::string &output);

class PidDiscovery {
public:
    PidDiscovery(DeviceBridge &bridge, std::optional<std::string> serial)
        : bridge_(bridge), serial_(std::move(serial)) {}

    std::optional<int> query_pid(const std::string &app_id);

    // Polls query_pid() every interval until found, timeout, or stop.
    std::optional<int> wait_for_app_pid(const std::string &app_id,
                                        std::chrono::milliseconds timeout,
                                        const std::atomic<bool> &stop,
                                        std::chrono::milliseconds interval = std::chrono::seconds(1));

private:
    DeviceBridge &bridge_;
    std::optional<std::string> serial_;
};

}  // namespace livereload

#endif  // LIVERELOAD_PID_DISCOVERY_H
