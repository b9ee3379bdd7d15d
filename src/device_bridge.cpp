#include "device_bridge.h"

#include "common.h"

#include <utility>

namespace livereload {

std::vector<std::string> with_serial(const std::optional<std::string> &serial,
                                     std::vector<std::string> args) {
    if (!serial || serial->empty()) {
        return args;
    }
    std::vector<std::string> out{"-s", *serial};
    out.insert(out.end(), args.begin(), args.end());
    return out;
}

AdbBridge::AdbBridge(std::string adb, std::string cwd)
    : adb_(std::move(adb)), cwd_(std::move(cwd)), available_(command_exists(adb_)) {}

CommandResult AdbBridge::run(const std::vector<std::string> &args,
                             std::chrono::milliseconds timeout) {
    if (!available_) {
        CommandResult r;
        r.output = adb_ + " not found in PATH";
        return r;
    }
    return run_command(command_line(args), cwd_, timeout);
}

std::vector<std::string> AdbBridge::command_line(const std::vector<std::string> &args) const {
    std::vector<std::string> argv{adb_};
    argv.insert(argv.end(), args.begin(), args.end());
    return argv;
}

}  // namespace livereload
