#ifndef LIVERELOAD_WEBSOCKET_H
#define LIVERELOAD_WEBSOCKET_H

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace livereload {

struct WsUrl {
    std::string host;
    int port = 80;
    std::string path = "/";
};

// Accepts ws://host[:port][/path]. wss is not supported.
bool parse_ws_url(const std::string &url, WsUrl &out);

enum class RecvStatus {
    Message,
    Timeout,
    Closed,
    Error,
};

// Message-level view of a WebSocket used by the debug bridge.
class WebSocketConnection {
public:
    virtual ~WebSocketConnection() = default;

    virtual bool send_text(const std::string &payload, std::string &error) = 0;

    // Waits up to timeout for one complete text or binary message.
    virtual RecvStatus receive(std::string &message, std::chrono::milliseconds timeout,
                               std::string &error) = 0;

    virtual void close() = 0;
};

namespace ws {

constexpr uint8_t kContinuation = 0x0;
constexpr uint8_t kText = 0x1;
constexpr uint8_t kBinary = 0x2;
constexpr uint8_t kClose = 0x8;
constexpr uint8_t kPing = 0x9;
constexpr uint8_t kPong = 0xA;

struct Frame {
    bool fin = true;
    uint8_t opcode = kText;
    std::string payload;
};

enum class ParseResult {
    Complete,
    Incomplete,
    Invalid,
};

std::string encode_client_frame(uint8_t opcode, const std::string &payload, const uint8_t mask[4]);

// Parses one frame from the front of buf. consumed is set on Complete.
ParseResult parse_frame(const std::string &buf, Frame &frame, size_t &consumed);

}  // namespace ws

// RFC 6455 client over a plain TCP socket.
class WebSocketClient : public WebSocketConnection {
public:
    // Performs the HTTP upgrade. origin, when set, is sent as the Origin
    // header; otherwise no Origin header is sent at all.
    static std::unique_ptr<WebSocketClient> connect(const WsUrl &url,
                                                    const std::optional<std::string> &origin,
                                                    std::chrono::milliseconds timeout,
                                                    std::string &error);

private:
    struct Passkey {
        explicit Passkey() = default;
    };

public:
    // Only connect() can name a Passkey.
    WebSocketClient(Passkey, int fd, std::string buffered);
    ~WebSocketClient() override;

    WebSocketClient(const WebSocketClient &) = delete;
    WebSocketClient &operator=(const WebSocketClient &) = delete;

    bool send_text(const std::string &payload, std::string &error) override;
    RecvStatus receive(std::string &message, std::chrono::milliseconds timeout,
                       std::string &error) override;
    void close() override;

private:
    bool send_frame(uint8_t opcode, const std::string &payload, std::string &error);

    int fd_;
    std::string inbuf_;
    std::string fragments_;
    bool in_fragment_ = false;
    bool closed_ = false;
};

}  // namespace livereload

#endif  // LIVERELOAD_WEBSOCKET_H
