#ifndef LIVERELOAD_PORT_ALLOCATOR_H
#define LIVERELOAD_PORT_ALLOCATOR_H

#include <chrono>
#include <string>

namespace livereload {

constexpr int kDefaultPortAttempts = 20;

// Returns the first port in [preferred, preferred + attempts) that can be
// bound on host, or preferred itself when every candidate is taken.
int find_free_port(const std::string &host, int preferred, int attempts = kDefaultPortAttempts);

bool port_is_free(const std::string &host, int port);

// Single TCP connect probe, bounded by timeout.
bool can_connect(const std::string &host, int port, std::chrono::milliseconds timeout);

}  // namespace livereload

#endif  // LIVERELOAD_PORT_ALLOCATOR_H
