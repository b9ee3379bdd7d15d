#include "common.h"
#include "config.h"
#include "device_bridge.h"
#include "session.h"
#include "stop_signals.h"

#include <signal.h>
#include <unistd.h>

#include <iostream>
#include <string>

namespace {

std::string current_dir() {
    char buf[4096];
    if (getcwd(buf, sizeof(buf)) == nullptr) {
        return ".";
    }
    return buf;
}

}  // namespace

int main(int argc, char **argv) {
    signal(SIGPIPE, SIG_IGN);

    livereload::Options opts;
    opts.project_dir = current_dir();
    std::string error;
    if (!livereload::parse_args(argc, argv, opts, error)) {
        livereload::console().error(error);
        livereload::usage(std::cerr);
        return 2;
    }
    if (opts.help) {
        livereload::usage(std::cout);
        return 0;
    }

    auto deps = livereload::check_dependencies();
    if (opts.check_deps) {
        std::cout << livereload::deps_report(deps);
        return livereload::required_deps_satisfied(deps) ? 0 : 2;
    }
    for (const auto &d : deps) {
        if (d.required && !d.available) {
            livereload::console().error(d.name + " not found in PATH.");
            return 2;
        }
    }

    livereload::install_stop_handlers();

    livereload::AdbBridge adb("adb", opts.project_dir);
    livereload::Session session(opts, adb, livereload::stop_flag());
    return session.run();
}
