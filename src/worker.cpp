#include "worker.h"

#include <algorithm>
#include <utility>

namespace livereload {

Worker::~Worker() {
    request_stop();
    join_for(std::chrono::milliseconds(0));
}

bool Worker::start(Body body) {
    if (thread_.joinable()) {
        return false;
    }
    state_ = std::make_shared<State>();
    auto state = state_;
    thread_ = std::thread([state, body = std::move(body)]() {
        body(state->stop);
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            state->done = true;
        }
        state->cv.notify_all();
    });
    return true;
}

void Worker::request_stop() {
    if (state_) {
        state_->stop = true;
    }
}

bool Worker::finished() const {
    if (!state_) {
        return true;
    }
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->done;
}

bool Worker::join_for(std::chrono::milliseconds timeout) {
    if (!thread_.joinable()) {
        return true;
    }

    bool done = false;
    {
        std::unique_lock<std::mutex> lock(state_->mutex);
        done = state_->cv.wait_for(lock, timeout, [this]() { return state_->done; });
    }

    if (done) {
        thread_.join();
        return true;
    }
    thread_.detach();
    return false;
}

bool sleep_unless_stopped(std::chrono::milliseconds duration, const std::atomic<bool> &stop) {
    constexpr std::chrono::milliseconds kSlice{50};
    auto deadline = std::chrono::steady_clock::now() + duration;
    while (!stop) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return true;
        }
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(left, kSlice));
    }
    return false;
}

}  // namespace livereload
