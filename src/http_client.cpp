#include "http_client.h"

#include <arpa/inet.h>
#include <errno.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cstring>
#include <sstream>
#include <stdexcept>

namespace livereload {

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool decode_chunked(const std::string &in, std::string &out) {
    size_t pos = 0;
    while (pos < in.size()) {
        auto le = in.find("\r\n", pos);
        if (le == std::string::npos) return false;
        std::string size_line = in.substr(pos, le - pos);
        auto semi = size_line.find(';');
        if (semi != std::string::npos) size_line.erase(semi);
        size_t size = 0;
        try {
            size = std::stoul(size_line, nullptr, 16);
        } catch (const std::exception &) {
            return false;
        }
        pos = le + 2;
        if (size == 0) return true;
        if (pos + size > in.size()) return false;
        out.append(in, pos, size);
        pos += size + 2;
    }
    return false;
}

// True once headers and a Content-Length body have fully arrived, so a
// server that ignores "Connection: close" does not stall the read.
bool response_complete(const std::string &raw) {
    auto header_end = raw.find("\r\n\r\n");
    if (header_end == std::string::npos) {
        return false;
    }
    std::string cl = header_value(raw.substr(0, header_end), "content-length");
    if (cl.empty()) {
        return false;
    }
    try {
        return raw.size() - (header_end + 4) >= std::stoul(cl);
    } catch (const std::exception &) {
        return false;
    }
}

}  // namespace

int connect_tcp(const std::string &host, int port, std::chrono::milliseconds timeout, std::string &error) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo *res = nullptr;
    int rc = getaddrinfo(host.c_str(), std::to_string(port).c_str(), &hints, &res);
    if (rc != 0) {
        error = std::string("getaddrinfo: ") + gai_strerror(rc);
        return -1;
    }

    struct timeval tv{};
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);

    int fd = -1;
    error = "connection failed";
    for (addrinfo *p = res; p; p = p->ai_next) {
        fd = socket(p->ai_family, p->ai_socktype | SOCK_CLOEXEC, p->ai_protocol);
        if (fd < 0) {
            continue;
        }
        // SO_SNDTIMEO also bounds a blocking connect() on Linux.
        setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
        setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
        if (connect(fd, p->ai_addr, p->ai_addrlen) == 0) {
            break;
        }
        error = std::string("connect: ") + strerror(errno);
        close(fd);
        fd = -1;
    }

    freeaddrinfo(res);
    return fd;
}

bool write_all(int fd, const std::string &data) {
    size_t off = 0;
    while (off < data.size()) {
        ssize_t n = send(fd, data.data() + off, data.size() - off, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n <= 0) {
            return false;
        }
        off += static_cast<size_t>(n);
    }
    return true;
}

std::string header_value(const std::string &headers, const std::string &key) {
    std::string want = lower(key);
    std::istringstream iss(headers);
    std::string line;
    while (std::getline(iss, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        auto colon = line.find(':');
        if (colon == std::string::npos) {
            continue;
        }
        if (lower(line.substr(0, colon)) != want) {
            continue;
        }
        auto vs = line.find_first_not_of(" \t", colon + 1);
        if (vs == std::string::npos) {
            return "";
        }
        auto ve = line.find_last_not_of(" \t");
        return line.substr(vs, ve - vs + 1);
    }
    return "";
}

bool parse_http_response(const std::string &raw, HttpResponse &resp) {
    auto header_end = raw.find("\r\n\r\n");
    std::string head = header_end == std::string::npos ? raw : raw.substr(0, header_end);
    std::string rest = header_end == std::string::npos ? "" : raw.substr(header_end + 4);

    auto le = head.find("\r\n");
    std::string first = head.substr(0, le);
    auto sp1 = first.find(' ');
    if (sp1 == std::string::npos || first.compare(0, 5, "HTTP/") != 0) {
        return false;
    }
    try {
        resp.status = std::stoi(first.substr(sp1 + 1, 3));
    } catch (const std::exception &) {
        return false;
    }
    resp.headers = le == std::string::npos ? "" : head.substr(le + 2);

    if (lower(header_value(resp.headers, "transfer-encoding")) == "chunked") {
        std::string decoded;
        if (!decode_chunked(rest, decoded)) {
            return false;
        }
        resp.body = decoded;
        return true;
    }

    std::string cl = header_value(resp.headers, "content-length");
    if (!cl.empty()) {
        size_t len = 0;
        try {
            len = std::stoul(cl);
        } catch (const std::exception &) {
            return false;
        }
        if (rest.size() > len) {
            rest.resize(len);
        }
    }
    resp.body = rest;
    return true;
}

bool http_get(const std::string &host, int port, const std::string &path,
              std::chrono::milliseconds timeout, HttpResponse &resp, std::string &error) {
    int fd = connect_tcp(host, port, timeout, error);
    if (fd < 0) {
        return false;
    }

    std::ostringstream oss;
    oss << "GET " << path << " HTTP/1.1\r\n"
        << "Host: " << host << ":" << port << "\r\n"
        << "Accept: application/json\r\n"
        << "Connection: close\r\n"
        << "\r\n";
    if (!write_all(fd, oss.str())) {
        error = "write failed";
        close(fd);
        return false;
    }

    std::string raw;
    char buf[8192];
    while (true) {
        ssize_t n = read(fd, buf, sizeof(buf));
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0) {
            error = std::string("read: ") + strerror(errno);
            close(fd);
            return false;
        }
        if (n == 0) {
            break;
        }
        raw.append(buf, static_cast<size_t>(n));
        if (raw.size() > 4 * 1024 * 1024 || response_complete(raw)) {
            break;
        }
    }
    close(fd);

    if (!parse_http_response(raw, resp)) {
        error = "malformed HTTP response";
        return false;
    }
    return true;
}

}  // namespace livereload
