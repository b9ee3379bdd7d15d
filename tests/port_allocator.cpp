#include <gtest/gtest.h>

#include "port_allocator.h"
#include "test_support.h"

#include <unistd.h>

#include <chrono>

using namespace livereload;
using livereload::test::listen_loopback;

TEST(PortAllocator, ReturnsPreferredPortWhenFree) {
    int port = 0;
    int fd = listen_loopback(port);
    ASSERT_GE(fd, 0);
    close(fd);

    EXPECT_TRUE(port_is_free("127.0.0.1", port));
    EXPECT_EQ(find_free_port("127.0.0.1", port, 1), port);
}

TEST(PortAllocator, SkipsPortWithListener) {
    int port = 0;
    int fd = listen_loopback(port);
    ASSERT_GE(fd, 0);
    if (port >= 65535 || !port_is_free("127.0.0.1", port + 1)) {
        close(fd);
        GTEST_SKIP() << "neighbouring port is in use";
    }

    EXPECT_FALSE(port_is_free("127.0.0.1", port));
    EXPECT_EQ(find_free_port("127.0.0.1", port, 2), port + 1);
    close(fd);
}

TEST(PortAllocator, FallsBackToPreferredWhenEveryCandidateIsTaken) {
    int first = 0;
    int fd1 = listen_loopback(first);
    ASSERT_GE(fd1, 0);
    int second = first + 1;
    int fd2 = listen_loopback(second);
    if (fd2 < 0) {
        close(fd1);
        GTEST_SKIP() << "could not occupy two adjacent ports";
    }

    EXPECT_EQ(find_free_port("127.0.0.1", first, 2), first);
    EXPECT_EQ(find_free_port("127.0.0.1", first, 1), first);

    close(fd2);
    close(fd1);
}

TEST(PortAllocator, ConnectProbeSeesListener) {
    int port = 0;
    int fd = listen_loopback(port);
    ASSERT_GE(fd, 0);
    EXPECT_TRUE(can_connect("127.0.0.1", port, std::chrono::milliseconds(500)));
    close(fd);

    EXPECT_FALSE(can_connect("127.0.0.1", port, std::chrono::milliseconds(500)));
}
