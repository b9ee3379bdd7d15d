#include <gtest/gtest.h>

#include "worker.h"

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

using namespace livereload;

TEST(Worker, JoinsBodyThatObservesStop) {
    auto iterations = std::make_shared<std::atomic<int>>(0);
    Worker worker;
    ASSERT_TRUE(worker.start([iterations](const std::atomic<bool> &stop) {
        while (!stop) {
            ++*iterations;
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
    }));
    EXPECT_FALSE(worker.start([](const std::atomic<bool> &) {}));

    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    EXPECT_FALSE(worker.finished());
    worker.request_stop();
    EXPECT_TRUE(worker.join_for(std::chrono::seconds(2)));
    EXPECT_TRUE(worker.finished());
    EXPECT_GT(iterations->load(), 0);
}

TEST(Worker, AbandonsBodyThatOverrunsGrace) {
    auto done = std::make_shared<std::atomic<bool>>(false);
    Worker worker;
    worker.start([done](const std::atomic<bool> &) {
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        *done = true;
    });

    auto started = std::chrono::steady_clock::now();
    worker.request_stop();
    EXPECT_FALSE(worker.join_for(std::chrono::milliseconds(20)));
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::milliseconds(250));
    EXPECT_FALSE(*done);

    std::this_thread::sleep_for(std::chrono::milliseconds(500));
    EXPECT_TRUE(*done);
}

TEST(Worker, SleepEndsEarlyOnStop) {
    std::atomic<bool> stop{false};
    EXPECT_TRUE(sleep_unless_stopped(std::chrono::milliseconds(20), stop));

    std::thread setter([&stop]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        stop = true;
    });
    auto started = std::chrono::steady_clock::now();
    EXPECT_FALSE(sleep_unless_stopped(std::chrono::seconds(10), stop));
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(2));
    setter.join();
}
