#ifndef LIVERELOAD_WORKER_H
#define LIVERELOAD_WORKER_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>

namespace livereload {

// A background thread with a cancellation flag and a bounded join.
//
// The body receives the flag and is expected to poll it. join_for() waits up
// to the given time for the body to return; if it does not, the thread is
// detached and left to finish on its own. State shared with the thread is
// reference counted so an abandoned thread never touches freed memory owned
// by the Worker itself.
class Worker {
public:
    using Body = std::function<void(const std::atomic<bool> &stop)>;

    Worker() = default;
    ~Worker();

    Worker(const Worker &) = delete;
    Worker &operator=(const Worker &) = delete;

    bool start(Body body);
    void request_stop();
    bool finished() const;

    // Returns true if the thread was joined, false if it was abandoned.
    bool join_for(std::chrono::milliseconds timeout);

private:
    struct State {
        std::atomic<bool> stop{false};
        std::mutex mutex;
        std::condition_variable cv;
        bool done = false;
    };

    std::shared_ptr<State> state_;
    std::thread thread_;
};

// Sleeps in short slices; returns false as soon as stop is set.
bool sleep_unless_stopped(std::chrono::milliseconds duration, const std::atomic<bool> &stop);

}  // namespace livereload

#endif  // LIVERELOAD_WORKER_H
