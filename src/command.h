#ifndef LIVERELOAD_COMMAND_H
#define LIVERELOAD_COMMAND_H

#include <sys/types.h>

#include <chrono>
#include <map>
#include <string>
#include <vector>

namespace livereload {

struct CommandResult {
    bool launched = false;
    bool timed_out = false;
    int exit_code = -1;
    std::string output;

    bool ok() const { return launched && !timed_out && exit_code == 0; }
};

struct ChildProcess {
    pid_t pid = -1;
    int output_fd = -1;
};

// Forks and execs argv (PATH lookup) in its own process group, with stdout
// and stderr merged into a pipe whose read end is returned in output_fd.
// stdin is /dev/null. Returns false with error set if the pipe, fork or exec
// failed; an exec failure is reported synchronously.
bool spawn_piped(const std::vector<std::string> &argv,
                 const std::string &cwd,
                 const std::map<std::string, std::string> &env_overrides,
                 ChildProcess &child,
                 std::string &error);

// Runs argv to completion, capturing merged output. The child's process group
// is killed once timeout elapses.
CommandResult run_command(const std::vector<std::string> &argv,
                          const std::string &cwd,
                          std::chrono::milliseconds timeout);

// Decodes a waitpid() status: exit code, or -signal for a signal death.
int decode_wait_status(int status);

std::string describe_command(const std::vector<std::string> &argv);

}  // namespace livereload

#endif  // LIVERELOAD_COMMAND_H
