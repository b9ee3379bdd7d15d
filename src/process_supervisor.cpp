#include "process_supervisor.h"

#include "command.h"
#include "common.h"
#include "port_allocator.h"

#include <errno.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cstring>
#include <thread>
#include <utility>

namespace livereload {

namespace {

constexpr std::chrono::milliseconds kPumpPollInterval{200};
constexpr std::chrono::milliseconds kPumpDrainWindow{500};
constexpr std::chrono::milliseconds kPumpJoinWindow{1000};
constexpr std::chrono::milliseconds kReapInterval{50};

bool reap(pid_t pid, int &status) {
    pid_t w = waitpid(pid, &status, WNOHANG);
    if (w == pid) {
        return true;
    }
    if (w < 0 && errno == ECHILD) {
        status = 0;
        return true;
    }
    return false;
}

}  // namespace

void pump_lines(int fd, const std::string &prefix, const LineFilter &filter,
                const std::atomic<bool> &stop) {
    set_nonblocking(fd);

    auto emit = [&](const std::string &line) {
        if (line.empty()) {
            return;
        }
        if (filter && !filter(line)) {
            return;
        }
        console().line(prefix + line);
    };

    std::string pending;
    char buf[4096];
    bool eof = false;

    while (!eof && !stop) {
        pollfd pfd{fd, POLLIN, 0};
        int rc = ::poll(&pfd, 1, static_cast<int>(kPumpPollInterval.count()));
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            console().line(prefix + "Error reading stream: " + strerror(errno));
            break;
        }
        if (rc == 0) {
            continue;
        }

        while (true) {
            ssize_t n = read(fd, buf, sizeof(buf));
            if (n > 0) {
                pending.append(buf, static_cast<size_t>(n));
                continue;
            }
            if (n == 0) {
                eof = true;
            } else if (errno == EINTR) {
                continue;
            } else if (errno != EAGAIN && errno != EWOULDBLOCK) {
                console().line(prefix + "Error reading stream: " + strerror(errno));
                eof = true;
            }
            break;
        }

        size_t pos;
        // A bare \r ends a line too; progress output rewrites one line with it.
        while ((pos = pending.find_first_of("\r\n")) != std::string::npos) {
            emit(pending.substr(0, pos));
            pending.erase(0, pos + 1);
        }
    }

    if (!pending.empty()) {
        emit(pending);
    }
    close(fd);
}

ProcessSupervisor::ProcessSupervisor(std::map<std::string, std::string> child_env)
    : child_env_(std::move(child_env)) {}

ProcessSupervisor::~ProcessSupervisor() {
    shutdown();
}

ManagedProcess *ProcessSupervisor::spawn(const std::string &label,
                                         const std::vector<std::string> &command_line,
                                         const std::string &cwd,
                                         std::chrono::milliseconds grace,
                                         LineFilter filter) {
    ChildProcess child;
    std::string error;
    if (!spawn_piped(command_line, cwd, child_env_, child, error)) {
        console().warn("failed to start " + label + " (" + describe_command(command_line) + "): " + error);
        return nullptr;
    }

    auto proc = std::make_unique<ManagedProcess>();
    proc->label = label;
    proc->command_line = command_line;
    proc->working_dir = cwd;
    proc->grace = grace;
    proc->pid = child.pid;

    int fd = child.output_fd;
    std::string prefix = "[" + label + "] ";
    proc->output_thread.start([fd, prefix, filter](const std::atomic<bool> &stop) {
        pump_lines(fd, prefix, filter, stop);
    });

    processes_.push_back(std::move(proc));
    return processes_.back().get();
}

int ProcessSupervisor::poll() {
    int reaped = 0;
    for (auto &p : processes_) {
        if (!p->alive() || p->terminated) {
            continue;
        }
        int status = 0;
        if (!reap(p->pid, status)) {
            continue;
        }
        p->exit_code = decode_wait_status(status);
        p->exited = true;
        p->pid = -1;
        ++reaped;
        console().line("[" + p->label + "] process exited with code " +
                       std::to_string(p->exit_code) + "; keeping session alive.");
    }
    return reaped;
}

void ProcessSupervisor::terminate(ManagedProcess &p) {
    if (p.terminated) {
        return;
    }
    p.terminated = true;

    if (p.alive()) {
        // Signal the group first so helpers started by the command go too.
        kill(-p.pid, SIGTERM);
        kill(p.pid, SIGTERM);

        int status = 0;
        bool reaped = false;
        auto deadline = std::chrono::steady_clock::now() + p.grace;
        while (!(reaped = reap(p.pid, status)) && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(kReapInterval);
        }

        if (!reaped) {
            console().line("[" + p.label + "] did not exit within " +
                           std::to_string(p.grace.count()) + "ms; killing.");
            kill(-p.pid, SIGKILL);
            kill(p.pid, SIGKILL);
            while (waitpid(p.pid, &status, 0) < 0 && errno == EINTR) {
            }
        }

        p.exit_code = decode_wait_status(status);
        p.exited = true;
        p.pid = -1;
    }

    // Give the pump a moment to print what the process wrote last.
    auto drain_until = std::chrono::steady_clock::now() + kPumpDrainWindow;
    while (!p.output_thread.finished() && std::chrono::steady_clock::now() < drain_until) {
        std::this_thread::sleep_for(kReapInterval);
    }
    p.output_thread.request_stop();
    p.output_thread.join_for(kPumpJoinWindow);
}

void ProcessSupervisor::shutdown() {
    for (auto it = processes_.rbegin(); it != processes_.rend(); ++it) {
        terminate(**it);
    }
}

size_t ProcessSupervisor::alive_count() const {
    size_t n = 0;
    for (const auto &p : processes_) {
        if (p->alive()) {
            ++n;
        }
    }
    return n;
}

bool ProcessSupervisor::wait_for_port_ready(const std::string &host, int port,
                                            std::chrono::milliseconds timeout,
                                            const std::atomic<bool> &stop,
                                            std::chrono::milliseconds interval) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!stop) {
        if (can_connect(host, port, std::chrono::milliseconds(1000))) {
            return true;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        if (!sleep_unless_stopped(interval, stop)) {
            return false;
        }
    }
    return false;
}

}  // namespace livereload
