#ifndef LIVERELOAD_HTTP_CLIENT_H
#define LIVERELOAD_HTTP_CLIENT_H

#include <chrono>
#include <string>

namespace livereload {

struct HttpResponse {
    int status = 0;
    std::string headers;
    std::string body;
};

// Blocking TCP connect with the timeout applied to connect, send and receive.
// Returns the socket or -1 with error set.
int connect_tcp(const std::string &host, int port, std::chrono::milliseconds timeout, std::string &error);

bool write_all(int fd, const std::string &data);

// Case-insensitive header lookup in a raw header block; "" if absent.
std::string header_value(const std::string &headers, const std::string &key);

// Splits a raw response into status line, headers and body. Chunked bodies
// are decoded. Returns false if the status line is malformed.
bool parse_http_response(const std::string &raw, HttpResponse &resp);

// GET http://host:port/path with Connection: close.
bool http_get(const std::string &host, int port, const std::string &path,
              std::chrono::milliseconds timeout, HttpResponse &resp, std::string &error);

}  // namespace livereload

#endif  // LIVERELOAD_HTTP_CLIENT_H
