#ifndef LIVERELOAD_PROCESS_SUPERVISOR_H
#define LIVERELOAD_PROCESS_SUPERVISOR_H

#include "worker.h"

#include <sys/types.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace livereload {

using LineFilter = std::function<bool(const std::string &line)>;

struct ManagedProcess {
    std::string label;
    std::vector<std::string> command_line;
    std::string working_dir;
    std::chrono::milliseconds grace{0};

    // -1 once the child has been reaped.
    pid_t pid = -1;
    int exit_code = 0;
    bool exited = false;
    bool terminated = false;

    Worker output_thread;

    bool alive() const { return pid > 0; }
};

// Owns every child process of the session. Processes are kept in spawn order
// and torn down in reverse; the destructor performs the same teardown so no
// exit path leaks a child.
class ProcessSupervisor {
public:
    explicit ProcessSupervisor(std::map<std::string, std::string> child_env = {});
    ~ProcessSupervisor();

    ProcessSupervisor(const ProcessSupervisor &) = delete;
    ProcessSupervisor &operator=(const ProcessSupervisor &) = delete;

    // Starts commandLine with stdout/stderr merged and pumps every line to
    // the console as "[label] line". filter, when set, decides which lines
    // are printed. Returns nullptr if the process could not be started.
    ManagedProcess *spawn(const std::string &label,
                          const std::vector<std::string> &command_line,
                          const std::string &cwd,
                          std::chrono::milliseconds grace,
                          LineFilter filter = nullptr);

    // Reaps children that exited on their own. Each exit is logged and the
    // handle cleared; the session is not affected. Returns the number reaped.
    int poll();

    // SIGTERM to the process group, wait up to the grace period, SIGKILL.
    // Also joins (or abandons) the output pump.
    void terminate(ManagedProcess &process);

    // Terminates every process in reverse spawn order.
    void shutdown();

    size_t alive_count() const;
    const std::vector<std::unique_ptr<ManagedProcess>> &processes() const { return processes_; }

    static bool wait_for_port_ready(const std::string &host, int port,
                                    std::chrono::milliseconds timeout,
                                    const std::atomic<bool> &stop,
                                    std::chrono::milliseconds interval = std::chrono::milliseconds(500));

private:
    std::map<std::string, std::string> child_env_;
    std::vector<std::unique_ptr<ManagedProcess>> processes_;
};

// Pumps fd line by line until EOF or stop; closes fd on return.
void pump_lines(int fd, const std::string &prefix, const LineFilter &filter,
                const std::atomic<bool> &stop);

}  // namespace livereload

#endif  // LIVERELOAD_PROCESS_SUPERVISOR_H
