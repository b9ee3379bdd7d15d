#include "websocket.h"

#include "common.h"
#include "http_client.h"

#include <uuid/uuid.h>

#include <errno.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cstring>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace livereload {

namespace {

constexpr size_t kMaxHandshakeBytes = 16 * 1024;
constexpr uint64_t kMaxFramePayload = 64ULL * 1024 * 1024;

void random_bytes(uint8_t *out, size_t len) {
    while (len > 0) {
        uuid_t u;
        uuid_generate_random(u);
        size_t take = std::min(len, sizeof(uuid_t));
        std::memcpy(out, u, take);
        out += take;
        len -= take;
    }
}

}  // namespace

bool parse_ws_url(const std::string &url, WsUrl &out) {
    const std::string scheme = "ws://";
    if (url.compare(0, scheme.size(), scheme) != 0) {
        return false;
    }
    std::string rest = url.substr(scheme.size());
    auto slash = rest.find('/');
    std::string authority = rest.substr(0, slash);
    out.path = slash == std::string::npos ? "/" : rest.substr(slash);
    if (authority.empty()) {
        return false;
    }

    auto colon = authority.rfind(':');
    if (colon != std::string::npos && authority.find(']') == std::string::npos) {
        out.host = authority.substr(0, colon);
        try {
            out.port = std::stoi(authority.substr(colon + 1));
        } catch (const std::exception &) {
            return false;
        }
    } else {
        out.host = authority;
        out.port = 80;
    }
    return !out.host.empty() && out.port > 0 && out.port <= 65535;
}

namespace ws {

std::string encode_client_frame(uint8_t opcode, const std::string &payload, const uint8_t mask[4]) {
    std::string frame;
    const size_t len = payload.size();
    frame.reserve(len + 14);
    frame.push_back(static_cast<char>(0x80 | opcode));
    if (len <= 125) {
        frame.push_back(static_cast<char>(0x80 | len));
    } else if (len <= 0xFFFF) {
        frame.push_back(static_cast<char>(0x80 | 126));
        frame.push_back(static_cast<char>((len >> 8) & 0xFF));
        frame.push_back(static_cast<char>(len & 0xFF));
    } else {
        frame.push_back(static_cast<char>(0x80 | 127));
        for (int i = 7; i >= 0; --i) {
            frame.push_back(static_cast<char>((static_cast<uint64_t>(len) >> (i * 8)) & 0xFF));
        }
    }
    for (int i = 0; i < 4; ++i) {
        frame.push_back(static_cast<char>(mask[i]));
    }
    for (size_t i = 0; i < len; ++i) {
        frame.push_back(static_cast<char>(payload[i] ^ static_cast<char>(mask[i % 4])));
    }
    return frame;
}

ParseResult parse_frame(const std::string &buf, Frame &frame, size_t &consumed) {
    if (buf.size() < 2) {
        return ParseResult::Incomplete;
    }
    auto byte = [&buf](size_t i) { return static_cast<uint8_t>(buf[i]); };

    uint8_t b0 = byte(0);
    uint8_t b1 = byte(1);
    if (b0 & 0x70) {
        return ParseResult::Invalid;
    }
    frame.fin = (b0 & 0x80) != 0;
    frame.opcode = b0 & 0x0F;
    bool masked = (b1 & 0x80) != 0;

    uint64_t len = b1 & 0x7F;
    size_t pos = 2;
    if (len == 126) {
        if (buf.size() < 4) return ParseResult::Incomplete;
        len = (static_cast<uint64_t>(byte(2)) << 8) | byte(3);
        pos = 4;
    } else if (len == 127) {
        if (buf.size() < 10) return ParseResult::Incomplete;
        len = 0;
        for (size_t i = 2; i < 10; ++i) {
            len = (len << 8) | byte(i);
        }
        pos = 10;
    }

    if (len > kMaxFramePayload) {
        return ParseResult::Invalid;
    }
    if ((frame.opcode & 0x8) && (len > 125 || !frame.fin)) {
        return ParseResult::Invalid;
    }

    uint8_t mask[4] = {0, 0, 0, 0};
    if (masked) {
        if (buf.size() < pos + 4) return ParseResult::Incomplete;
        for (size_t i = 0; i < 4; ++i) {
            mask[i] = byte(pos + i);
        }
        pos += 4;
    }

    if (buf.size() < pos + len) {
        return ParseResult::Incomplete;
    }

    frame.payload = buf.substr(pos, static_cast<size_t>(len));
    if (masked) {
        for (size_t i = 0; i < frame.payload.size(); ++i) {
            frame.payload[i] = static_cast<char>(frame.payload[i] ^ static_cast<char>(mask[i % 4]));
        }
    }
    consumed = pos + static_cast<size_t>(len);
    return ParseResult::Complete;
}

}  // namespace ws

std::unique_ptr<WebSocketClient> WebSocketClient::connect(const WsUrl &url,
                                                          const std::optional<std::string> &origin,
                                                          std::chrono::milliseconds timeout,
                                                          std::string &error) {
    int fd = connect_tcp(url.host, url.port, timeout, error);
    if (fd < 0) {
        return nullptr;
    }

    uint8_t key_bytes[16];
    random_bytes(key_bytes, sizeof(key_bytes));
    std::string key = base64_encode(key_bytes, sizeof(key_bytes));

    std::ostringstream oss;
    oss << "GET " << url.path << " HTTP/1.1\r\n"
        << "Host: " << url.host << ":" << url.port << "\r\n"
        << "Upgrade: websocket\r\n"
        << "Connection: Upgrade\r\n"
        << "Sec-WebSocket-Key: " << key << "\r\n"
        << "Sec-WebSocket-Version: 13\r\n";
    if (origin) {
        oss << "Origin: " << *origin << "\r\n";
    }
    oss << "\r\n";

    if (!write_all(fd, oss.str())) {
        error = std::string("handshake write failed: ") + strerror(errno);
        ::close(fd);
        return nullptr;
    }

    std::string raw;
    char buf[4096];
    while (raw.find("\r\n\r\n") == std::string::npos) {
        ssize_t n = recv(fd, buf, sizeof(buf), 0);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n == 0) {
            error = "connection closed during handshake";
            ::close(fd);
            return nullptr;
        }
        if (n < 0) {
            error = (errno == EAGAIN || errno == EWOULDBLOCK)
                        ? std::string("handshake timed out")
                        : std::string("handshake read failed: ") + strerror(errno);
            ::close(fd);
            return nullptr;
        }
        raw.append(buf, static_cast<size_t>(n));
        if (raw.size() > kMaxHandshakeBytes) {
            error = "handshake response too large";
            ::close(fd);
            return nullptr;
        }
    }

    auto header_end = raw.find("\r\n\r\n");
    std::string head = raw.substr(0, header_end);
    std::string status_line = head.substr(0, head.find("\r\n"));
    auto sp = status_line.find(' ');
    std::string status = sp == std::string::npos ? status_line : status_line.substr(sp + 1);
    if (status.compare(0, 3, "101") != 0) {
        error = "handshake status " + status;
        ::close(fd);
        return nullptr;
    }
    if (to_upper(header_value(head, "upgrade")) != "WEBSOCKET") {
        error = "handshake response missing websocket upgrade";
        ::close(fd);
        return nullptr;
    }

    return std::make_unique<WebSocketClient>(Passkey{}, fd, raw.substr(header_end + 4));
}

WebSocketClient::WebSocketClient(Passkey, int fd, std::string buffered)
    : fd_(fd), inbuf_(std::move(buffered)) {}

WebSocketClient::~WebSocketClient() {
    close();
}

bool WebSocketClient::send_frame(uint8_t opcode, const std::string &payload, std::string &error) {
    if (fd_ < 0 || closed_) {
        error = "connection is closed";
        return false;
    }
    uint8_t mask[4];
    random_bytes(mask, sizeof(mask));
    if (!write_all(fd_, ws::encode_client_frame(opcode, payload, mask))) {
        error = std::string("send failed: ") + strerror(errno);
        return false;
    }
    return true;
}

bool WebSocketClient::send_text(const std::string &payload, std::string &error) {
    return send_frame(ws::kText, payload, error);
}

RecvStatus WebSocketClient::receive(std::string &message, std::chrono::milliseconds timeout,
                                    std::string &error) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    char buf[8192];

    while (true) {
        ws::Frame frame;
        size_t consumed = 0;
        ws::ParseResult parsed = ws::parse_frame(inbuf_, frame, consumed);
        if (parsed == ws::ParseResult::Invalid) {
            error = "malformed frame";
            return RecvStatus::Error;
        }

        if (parsed == ws::ParseResult::Complete) {
            inbuf_.erase(0, consumed);
            switch (frame.opcode) {
                case ws::kPing: {
                    std::string pong_error;
                    if (!send_frame(ws::kPong, frame.payload, pong_error)) {
                        error = pong_error;
                        return RecvStatus::Error;
                    }
                    continue;
                }
                case ws::kPong:
                    continue;
                case ws::kClose: {
                    std::string ignored;
                    send_frame(ws::kClose, frame.payload.substr(0, 2), ignored);
                    closed_ = true;
                    error = "connection closed by peer";
                    return RecvStatus::Closed;
                }
                case ws::kText:
                case ws::kBinary:
                    if (in_fragment_) {
                        error = "new message inside a fragmented message";
                        return RecvStatus::Error;
                    }
                    if (frame.fin) {
                        message = std::move(frame.payload);
                        return RecvStatus::Message;
                    }
                    fragments_ = std::move(frame.payload);
                    in_fragment_ = true;
                    continue;
                case ws::kContinuation:
                    if (!in_fragment_) {
                        error = "unexpected continuation frame";
                        return RecvStatus::Error;
                    }
                    fragments_ += frame.payload;
                    if (frame.fin) {
                        message = std::move(fragments_);
                        fragments_.clear();
                        in_fragment_ = false;
                        return RecvStatus::Message;
                    }
                    continue;
                default:
                    error = "unknown opcode " + std::to_string(frame.opcode);
                    return RecvStatus::Error;
            }
        }

        if (fd_ < 0 || closed_) {
            error = "connection is closed";
            return RecvStatus::Closed;
        }

        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return RecvStatus::Timeout;
        }
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        pollfd pfd{fd_, POLLIN, 0};
        int rc = ::poll(&pfd, 1, static_cast<int>(left.count()));
        if (rc == 0) {
            return RecvStatus::Timeout;
        }
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            error = std::string("poll: ") + strerror(errno);
            return RecvStatus::Error;
        }

        ssize_t n = recv(fd_, buf, sizeof(buf), 0);
        if (n == 0) {
            closed_ = true;
            error = "connection closed";
            return RecvStatus::Closed;
        }
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
                continue;
            }
            error = std::string("recv: ") + strerror(errno);
            return RecvStatus::Error;
        }
        inbuf_.append(buf, static_cast<size_t>(n));
    }
}

void WebSocketClient::close() {
    if (fd_ < 0) {
        return;
    }
    if (!closed_) {
        // 1000: normal closure.
        std::string ignored;
        send_frame(ws::kClose, std::string("\x03\xe8", 2), ignored);
        closed_ = true;
    }
    ::close(fd_);
    fd_ = -1;
}

}  // namespace livereload
