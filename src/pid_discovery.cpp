#include "pid_discovery.h"

#include "common.h"
#include "worker.h"

#include <cerrno>
#include <cstdlib>

namespace livereload {

std::optional<int> parse_pidof_output(const std::string &output) {
    auto parts = split_words(output);
    if (parts.empty()) {
        return std::nullopt;
    }
    const char *begin = parts[0].c_str();
    char *end = nullptr;
    errno = 0;
    long pid = std::strtol(begin, &end, 10);
    if (errno != 0 || end == begin || *end != '\0' || pid <= 0 || pid > 0x7fffffff) {
        return std::nullopt;
    }
    return static_cast<int>(pid);
}

std::optional<int> PidDiscovery::query_pid(const std::string &app_id) {
    CommandResult r = bridge_.run(with_serial(serial_, {"shell", "pidof", "-s", app_id}), kBridgeTimeout);
    if (!r.launched || r.timed_out) {
        return std::nullopt;
    }
    return parse_pidof_output(r.output);
}

std::optional<int> PidDiscovery::wait_for_app_pid(const std::string &app_id,
                                                  std::chrono::milliseconds timeout,
                                                  const std::atomic<bool> &stop,
                                                  std::chrono::milliseconds interval) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!stop && std::chrono::steady_clock::now() < deadline) {
        if (auto pid = query_pid(app_id)) {
            return pid;
        }
        if (!sleep_unless_stopped(interval, stop)) {
            break;
        }
    }
    return std::nullopt;
}

}  // namespace livereload
