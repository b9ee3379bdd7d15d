#ifndef LIVERELOAD_STOP_SIGNALS_H
#define LIVERELOAD_STOP_SIGNALS_H

#include <array>
#include <atomic>

namespace livereload {

// Signals that end the session. Children run in their own process groups, so
// a terminal hangup only reaches them through the session teardown.
extern const std::array<int, 4> kStopSignals;

// Process-wide flag set by the stop handlers.
std::atomic<bool> &stop_flag();

// Installs a handler for every stop signal. Returns false if one could not
// be installed.
bool install_stop_handlers();

}  // namespace livereload

#endif  // LIVERELOAD_STOP_SIGNALS_H
