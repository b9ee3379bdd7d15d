#ifndef _GNU_SOURCE
#define _GNU_SOURCE
#endif

#include "command.h"

#include "common.h"

#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <cstring>
#include <sstream>
#include <thread>

extern "C" char **environ;

namespace livereload {

namespace {

std::vector<std::string> build_env(const std::map<std::string, std::string> &overrides) {
    std::map<std::string, std::string> merged;
    for (char **e = environ; *e; ++e) {
        std::string entry(*e);
        auto eq = entry.find('=');
        if (eq != std::string::npos) {
            merged[entry.substr(0, eq)] = entry.substr(eq + 1);
        }
    }
    for (const auto &kv : overrides) {
        merged[kv.first] = kv.second;
    }
    std::vector<std::string> result;
    result.reserve(merged.size());
    for (const auto &kv : merged) {
        result.push_back(kv.first + "=" + kv.second);
    }
    return result;
}

std::vector<char *> c_ptrs(std::vector<std::string> &strs) {
    std::vector<char *> ptrs;
    ptrs.reserve(strs.size() + 1);
    for (auto &s : strs) {
        ptrs.push_back(s.data());
    }
    ptrs.push_back(nullptr);
    return ptrs;
}

}  // namespace

bool spawn_piped(const std::vector<std::string> &argv,
                 const std::string &cwd,
                 const std::map<std::string, std::string> &env_overrides,
                 ChildProcess &child,
                 std::string &error) {
    if (argv.empty()) {
        error = "empty command line";
        return false;
    }

    // Everything the child touches is prepared before fork.
    std::vector<std::string> args = argv;
    auto argv_ptrs = c_ptrs(args);
    auto env_strs = build_env(env_overrides);
    auto envp = c_ptrs(env_strs);

    int pipefd[2];
    if (pipe2(pipefd, O_CLOEXEC) < 0) {
        error = std::string("pipe: ") + strerror(errno);
        return false;
    }
    // Carries errno back if exec fails; closed by a successful exec.
    int errpipe[2];
    if (pipe2(errpipe, O_CLOEXEC) < 0) {
        error = std::string("pipe: ") + strerror(errno);
        close(pipefd[0]);
        close(pipefd[1]);
        return false;
    }

    pid_t pid = fork();
    if (pid == 0) {
        setpgid(0, 0);
        signal(SIGPIPE, SIG_DFL);
        signal(SIGINT, SIG_DFL);
        signal(SIGTERM, SIG_DFL);
        sigset_t empty;
        sigemptyset(&empty);
        sigprocmask(SIG_SETMASK, &empty, nullptr);

        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }
        dup2(pipefd[1], STDOUT_FILENO);
        dup2(pipefd[1], STDERR_FILENO);

        if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
            int err = errno;
            ssize_t n = write(errpipe[1], &err, sizeof(err));
            (void)n;
            _exit(127);
        }
        execvpe(argv_ptrs[0], argv_ptrs.data(), envp.data());
        int err = errno;
        ssize_t n = write(errpipe[1], &err, sizeof(err));
        (void)n;
        _exit(127);
    }

    close(pipefd[1]);
    close(errpipe[1]);

    if (pid < 0) {
        error = std::string("fork: ") + strerror(errno);
        close(pipefd[0]);
        close(errpipe[0]);
        return false;
    }

    setpgid(pid, pid);

    int child_errno = 0;
    ssize_t n;
    do {
        n = read(errpipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close(errpipe[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        int status = 0;
        waitpid(pid, &status, 0);
        close(pipefd[0]);
        error = argv[0] + ": " + strerror(child_errno);
        return false;
    }

    child.pid = pid;
    child.output_fd = pipefd[0];
    return true;
}

CommandResult run_command(const std::vector<std::string> &argv,
                          const std::string &cwd,
                          std::chrono::milliseconds timeout) {
    CommandResult result;
    ChildProcess child;
    std::string error;
    if (!spawn_piped(argv, cwd, {}, child, error)) {
        result.output = error;
        return result;
    }
    result.launched = true;

    set_nonblocking(child.output_fd);
    auto deadline = std::chrono::steady_clock::now() + timeout;
    bool eof = false;
    bool reaped = false;
    int status = 0;
    std::chrono::steady_clock::time_point reaped_at;
    char buf[4096];

    while (!(eof && reaped)) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            result.timed_out = true;
            break;
        }

        if (!eof) {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
            pollfd pfd{child.output_fd, POLLIN, 0};
            int wait_ms = static_cast<int>(std::min<long long>(left.count(), 100));
            int rc = poll(&pfd, 1, wait_ms);
            if (rc < 0 && errno != EINTR) {
                eof = true;
            } else if (rc > 0) {
                while (true) {
                    ssize_t r = read(child.output_fd, buf, sizeof(buf));
                    if (r > 0) {
                        result.output.append(buf, static_cast<size_t>(r));
                        continue;
                    }
                    if (r == 0) {
                        eof = true;
                    } else if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
                        eof = true;
                    }
                    break;
                }
            }
        } else {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }

        if (!reaped) {
            pid_t w = waitpid(child.pid, &status, WNOHANG);
            if (w == child.pid || (w < 0 && errno == ECHILD)) {
                reaped = true;
                reaped_at = std::chrono::steady_clock::now();
            }
        } else if (!eof && std::chrono::steady_clock::now() - reaped_at > std::chrono::milliseconds(250)) {
            // A daemonized grandchild can keep the pipe open after we are done.
            eof = true;
        }
    }

    if (result.timed_out) {
        kill(-child.pid, SIGKILL);
        kill(child.pid, SIGKILL);
        if (!reaped) {
            waitpid(child.pid, &status, 0);
        }
    } else {
        result.exit_code = decode_wait_status(status);
    }

    close(child.output_fd);
    return result;
}

int decode_wait_status(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return -WTERMSIG(status);
    }
    return -1;
}

std::string describe_command(const std::vector<std::string> &argv) {
    std::ostringstream oss;
    for (size_t i = 0; i < argv.size(); ++i) {
        if (i > 0) oss << " ";
        oss << argv[i];
    }
    return oss.str();
}

}  // namespace livereload
