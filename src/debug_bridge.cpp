#include "debug_bridge.h"

#include "cdp.h"
#include "common.h"
#include "http_client.h"

#include <nlohmann/json.hpp>

#include <utility>

namespace livereload {

using nlohmann::json;

const std::vector<OriginVariant> &origin_fallbacks() {
    static const std::vector<OriginVariant> variants{
        {std::nullopt, "no Origin"},
        {std::string("chrome://inspect"), "Origin chrome://inspect"},
        {std::string("http://localhost:9222"), "Origin http://localhost:9222"},
    };
    return variants;
}

NegotiationResult negotiate_connection(const std::string &url, const WsConnector &connector) {
    NegotiationResult result;
    for (const auto &variant : origin_fallbacks()) {
        ++result.attempts;
        std::string error;
        auto conn = connector(url, variant.origin, error);
        if (conn) {
            result.connection = std::move(conn);
            result.label = variant.label;
            result.error.clear();
            return result;
        }
        result.error = error.empty() ? "websocket connect failed" : error;
    }
    return result;
}

std::optional<std::string> select_page_target(const std::string &body) {
    json targets = json::parse(body, nullptr, false);
    if (targets.is_discarded() || !targets.is_array()) {
        return std::nullopt;
    }
    for (const auto &target : targets) {
        if (!target.is_object()) {
            continue;
        }
        auto type = target.find("type");
        if (type == target.end() || !type->is_string() || type->get<std::string>() != "page") {
            continue;
        }
        auto url = target.find("webSocketDebuggerUrl");
        if (url != target.end() && url->is_string()) {
            return url->get<std::string>();
        }
        return std::nullopt;
    }
    return std::nullopt;
}

std::optional<std::string> fetch_debugger_url(const std::string &host, int port,
                                              std::chrono::milliseconds timeout) {
    HttpResponse resp;
    std::string error;
    if (!http_get(host, port, "/json", timeout, resp, error)) {
        return std::nullopt;
    }
    if (resp.status < 200 || resp.status >= 300) {
        return std::nullopt;
    }
    return select_page_target(resp.body);
}

bool run_protocol_session(WebSocketConnection &connection, const std::atomic<bool> &stop,
                          std::chrono::milliseconds receive_timeout) {
    std::string error;
    if (!connection.send_text(cdp_request(1, "Runtime.enable"), error) ||
        !connection.send_text(cdp_request(2, "Log.enable"), error)) {
        console().line("[cdp] Error: " + error);
        return false;
    }

    while (!stop) {
        std::string message;
        switch (connection.receive(message, receive_timeout, error)) {
            case RecvStatus::Timeout:
                continue;
            case RecvStatus::Closed:
            case RecvStatus::Error:
                console().line("[cdp] Error: " + error);
                return false;
            case RecvStatus::Message:
                break;
        }

        if (message.empty()) {
            continue;
        }
        auto event = decode_cdp_message(message);
        if (!event) {
            console().line("[cdp] Error: malformed protocol message");
            return false;
        }
        if (auto text = format_cdp_event(*event)) {
            console().line(*text);
        }
    }
    return true;
}

DebugBridge::DebugBridge(DeviceBridge &bridge, std::optional<std::string> serial,
                         DebugBridgeOptions options)
    : bridge_(bridge), serial_(std::move(serial)), options_(options) {
    auto connect_timeout = options_.connect_timeout;
    connector_ = [connect_timeout](const std::string &url, const std::optional<std::string> &origin,
                                   std::string &error) -> std::unique_ptr<WebSocketConnection> {
        WsUrl parsed;
        if (!parse_ws_url(url, parsed)) {
            error = "unsupported debugger URL: " + url;
            return nullptr;
        }
        return WebSocketClient::connect(parsed, origin, connect_timeout, error);
    };

    auto http_timeout = options_.http_timeout;
    lookup_ = [http_timeout]() {
        return fetch_debugger_url(kDevToolsHost, kDevToolsPort, http_timeout);
    };
}

DebugBridge::~DebugBridge() {
    stop();
}

bool DebugBridge::forward_port() {
    if (!bridge_.available()) {
        console().warn(bridge_.name() + " not found in PATH. DevTools bridge disabled.");
        return false;
    }

    std::string local = "tcp:" + std::to_string(kDevToolsPort);
    CommandResult r = bridge_.run(with_serial(serial_, {"forward", local, kDevToolsSocket}), kBridgeTimeout);
    if (r.timed_out) {
        console().warn(bridge_.name() + " forward timed out (CDP).");
        return false;
    }
    if (!r.launched) {
        console().warn("Failed to set up CDP port forwarding.");
        return false;
    }
    if (r.exit_code != 0) {
        console().warn(bridge_.name() + " forward exited with code " + std::to_string(r.exit_code) + ": " +
                       trim_newlines(r.output));
    }
    return true;
}

bool DebugBridge::start() {
    if (!forward_port()) {
        return false;
    }
    return start_worker();
}

bool DebugBridge::start_worker() {
    // The worker owns copies of everything it touches so it can be
    // abandoned after stop() without referencing this object.
    WsConnector connector = connector_;
    TargetLookup lookup = lookup_;
    DebugBridgeOptions options = options_;

    return worker_.start([connector, lookup, options](const std::atomic<bool> &stop) {
        std::optional<std::string> url;
        for (int attempt = 0; attempt < options.discovery_attempts && !stop; ++attempt) {
            url = lookup();
            if (url) {
                break;
            }
            if (!sleep_unless_stopped(options.discovery_interval, stop)) {
                return;
            }
        }
        if (!url) {
            if (!stop) {
                console().line("[cdp] Warning: Could not connect to WebView DevTools. Console logs unavailable.");
            }
            return;
        }

        NegotiationResult negotiated = negotiate_connection(*url, connector);
        if (!negotiated.connection) {
            console().line("[cdp] Connection error: " + negotiated.error);
            return;
        }
        console().line("[cdp] Connected to WebView DevTools (" + negotiated.label + ")");

        run_protocol_session(*negotiated.connection, stop, options.receive_timeout);
        negotiated.connection->close();
    });
}

void DebugBridge::stop() {
    worker_.request_stop();
    if (!worker_.join_for(options_.stop_grace)) {
        console().warn("DevTools bridge did not stop in time; abandoning it.");
    }
}

}  // namespace livereload
