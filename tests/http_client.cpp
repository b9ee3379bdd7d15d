#include <gtest/gtest.h>

#include "debug_bridge.h"
#include "http_client.h"
#include "test_support.h"

#include <sys/socket.h>
#include <unistd.h>

#include <chrono>
#include <thread>

using namespace livereload;
using livereload::test::listen_loopback;
using livereload::test::read_until;

TEST(HttpClient, ParsesContentLengthBody) {
    HttpResponse resp;
    ASSERT_TRUE(parse_http_response("HTTP/1.1 200 OK\r\nContent-Type: application/json\r\n"
                                    "Content-Length: 2\r\n\r\n[]trailing",
                                    resp));
    EXPECT_EQ(resp.status, 200);
    EXPECT_EQ(resp.body, "[]");
    EXPECT_EQ(header_value(resp.headers, "content-type"), "application/json");
    EXPECT_EQ(header_value(resp.headers, "CONTENT-LENGTH"), "2");
    EXPECT_EQ(header_value(resp.headers, "x-missing"), "");
}

TEST(HttpClient, DecodesChunkedBody) {
    HttpResponse resp;
    ASSERT_TRUE(parse_http_response("HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n"
                                    "4\r\n[{\"a\r\n5;ext=1\r\n\":1}]\r\n0\r\n\r\n",
                                    resp));
    EXPECT_EQ(resp.body, "[{\"a\":1}]");
}

TEST(HttpClient, RejectsMalformedStatusLine) {
    HttpResponse resp;
    EXPECT_FALSE(parse_http_response("garbage\r\n\r\n", resp));
    EXPECT_FALSE(parse_http_response("HTTP/1.1 abc\r\n\r\n", resp));
}

// The server keeps the connection open after replying, as DevTools does.
TEST(HttpClient, FetchesDebuggerUrlFromListing) {
    int port = 0;
    int listener = listen_loopback(port);
    ASSERT_GE(listener, 0);

    std::string request;
    std::thread server([listener, &request]() {
        int fd = accept(listener, nullptr, nullptr);
        if (fd < 0) {
            return;
        }
        read_until(fd, request, "\r\n\r\n");
        const std::string body =
            R"([{"type":"page","webSocketDebuggerUrl":"ws://127.0.0.1:9222/devtools/page/XYZ"}])";
        std::string reply = "HTTP/1.1 200 OK\r\nContent-Type: application/json; charset=UTF-8\r\n"
                            "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n" + body;
        write_all(fd, reply);
        char buf[64];
        while (recv(fd, buf, sizeof(buf), 0) > 0) {
        }
        close(fd);
    });

    auto url = fetch_debugger_url("127.0.0.1", port, std::chrono::milliseconds(3000));
    server.join();
    close(listener);

    ASSERT_TRUE(url.has_value());
    EXPECT_EQ(*url, "ws://127.0.0.1:9222/devtools/page/XYZ");
    EXPECT_EQ(request.rfind("GET /json HTTP/1.1\r\n", 0), 0u);
}

TEST(HttpClient, ConnectFailureReportsError) {
    int port = 0;
    int listener = listen_loopback(port);
    ASSERT_GE(listener, 0);
    close(listener);

    HttpResponse resp;
    std::string error;
    EXPECT_FALSE(http_get("127.0.0.1", port, "/json", std::chrono::milliseconds(500), resp, error));
    EXPECT_FALSE(error.empty());
}
