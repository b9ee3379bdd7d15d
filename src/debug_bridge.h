#ifndef LIVERELOAD_DEBUG_BRIDGE_H
#define LIVERELOAD_DEBUG_BRIDGE_H

#include "device_bridge.h"
#include "websocket.h"
#include "worker.h"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace livereload {

constexpr int kDevToolsPort = 9222;
constexpr const char *kDevToolsHost = "127.0.0.1";
constexpr const char *kDevToolsSocket = "localabstract:chrome_devtools_remote";

struct OriginVariant {
    std::optional<std::string> origin;
    std::string label;
};

// Handshake variants in the order they are tried: no Origin header, the
// inspector origin, then the loopback origin. Some WebView builds reject
// one or the other.
const std::vector<OriginVariant> &origin_fallbacks();

using WsConnector = std::function<std::unique_ptr<WebSocketConnection>(
    const std::string &url, const std::optional<std::string> &origin, std::string &error)>;

// One discovery attempt; the debugger URL of the page target, if any.
using TargetLookup = std::function<std::optional<std::string>()>;

struct NegotiationResult {
    std::unique_ptr<WebSocketConnection> connection;
    std::string label;
    std::string error;
    int attempts = 0;
};

// Tries each origin variant once, in order. On total failure the error of
// the last attempt is kept.
NegotiationResult negotiate_connection(const std::string &url, const WsConnector &connector);

// webSocketDebuggerUrl of the first "page" entry in a /json listing.
std::optional<std::string> select_page_target(const std::string &body);

std::optional<std::string> fetch_debugger_url(const std::string &host, int port,
                                              std::chrono::milliseconds timeout);

// Enables the Runtime and Log domains, then prints console events until
// stop is set or the connection fails. Returns true if ended by stop.
bool run_protocol_session(WebSocketConnection &connection, const std::atomic<bool> &stop,
                          std::chrono::milliseconds receive_timeout);

struct DebugBridgeOptions {
    int discovery_attempts = 30;
    std::chrono::milliseconds discovery_interval{1000};
    std::chrono::milliseconds http_timeout{5000};
    std::chrono::milliseconds connect_timeout{10000};
    std::chrono::milliseconds receive_timeout{1000};
    std::chrono::milliseconds stop_grace{2000};
};

class DebugBridge {
public:
    DebugBridge(DeviceBridge &bridge, std::optional<std::string> serial,
                DebugBridgeOptions options = {});
    ~DebugBridge();

    DebugBridge(const DebugBridge &) = delete;
    DebugBridge &operator=(const DebugBridge &) = delete;

    void set_connector(WsConnector connector) { connector_ = std::move(connector); }
    void set_target_lookup(TargetLookup lookup) { lookup_ = std::move(lookup); }

    // Forwards the device's DevTools socket to tcp:9222.
    bool forward_port();

    // Forwards the port and starts the worker. False if either step failed.
    bool start();

    // Starts only the worker; the port is assumed to be reachable already.
    bool start_worker();

    void stop();
    bool running() const { return !worker_.finished(); }

private:
    DeviceBridge &bridge_;
    std::optional<std::string> serial_;
    DebugBridgeOptions options_;
    WsConnector connector_;
    TargetLookup lookup_;
    Worker worker_;
};

}  // namespace livereload

#endif  // LIVERELOAD_DEBUG_BRIDGE_H
