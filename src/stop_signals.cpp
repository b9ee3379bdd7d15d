#include "stop_signals.h"

#include "common.h"

#include <signal.h>

#include <cerrno>
#include <cstring>
#include <string>

namespace livereload {

const std::array<int, 4> kStopSignals{SIGINT, SIGTERM, SIGHUP, SIGQUIT};

namespace {

std::atomic<bool> g_stop{false};

void handle_stop(int) {
    g_stop = true;
}

}  // namespace

std::atomic<bool> &stop_flag() {
    return g_stop;
}

bool install_stop_handlers() {
    bool ok = true;
    for (int sig : kStopSignals) {
        if (signal(sig, handle_stop) == SIG_ERR) {
            console().warn(std::string("cannot handle ") + strsignal(sig) + ": " + strerror(errno));
            ok = false;
        }
    }
    return ok;
}

}  // namespace livereload
