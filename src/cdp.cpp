#include "cdp.h"

#include <type_traits>

namespace livereload {

using nlohmann::json;

namespace {

std::string text_field(const json &obj, const char *key, const std::string &fallback) {
    if (!obj.is_object()) {
        return fallback;
    }
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        return fallback;
    }
    return it->is_string() ? it->get<std::string>() : it->dump();
}

const json &object_field(const json &obj, const char *key) {
    static const json empty = json::object();
    if (!obj.is_object()) {
        return empty;
    }
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_object()) {
        return empty;
    }
    return *it;
}

}  // namespace

std::string render_remote_object(const json &arg) {
    if (!arg.is_object()) {
        return arg.dump();
    }

    auto value = arg.find("value");
    if (value != arg.end() && !value->is_null()) {
        return value->is_string() ? value->get<std::string>() : value->dump();
    }

    std::string type = text_field(arg, "type", "");
    if (type == "object") {
        return text_field(arg, "description", text_field(arg, "className", "[object]"));
    }
    if (type == "undefined") {
        return "undefined";
    }
    return arg.dump();
}

std::optional<CdpEvent> decode_cdp_message(const std::string &text) {
    json msg = json::parse(text, nullptr, false);
    if (msg.is_discarded() || !msg.is_object()) {
        return std::nullopt;
    }

    std::string method = text_field(msg, "method", "");
    const json &params = object_field(msg, "params");

    if (method == "Runtime.consoleAPICalled") {
        ConsoleApiCalled event;
        event.type = text_field(params, "type", "log");
        auto args = params.find("args");
        if (args != params.end() && args->is_array()) {
            for (const auto &arg : *args) {
                event.args.push_back(render_remote_object(arg));
            }
        }
        return CdpEvent{std::move(event)};
    }

    if (method == "Log.entryAdded") {
        const json &entry = object_field(params, "entry");
        LogEntryAdded event;
        event.level = text_field(entry, "level", "info");
        event.text = text_field(entry, "text", "");
        return CdpEvent{std::move(event)};
    }

    return CdpEvent{Ignored{}};
}

std::optional<std::string> format_cdp_event(const CdpEvent &event) {
    return std::visit([](const auto &e) -> std::optional<std::string> {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, ConsoleApiCalled>) {
            std::string message;
            for (size_t i = 0; i < e.args.size(); ++i) {
                if (i > 0) message += ' ';
                message += e.args[i];
            }
            return "[console." + e.type + "] " + message;
        } else if constexpr (std::is_same_v<T, LogEntryAdded>) {
            return "[log." + e.level + "] " + e.text;
        } else {
            return std::nullopt;
        }
    }, event);
}

std::string cdp_request(int id, const std::string &method) {
    json req = {{"id", id}, {"method", method}};
    return req.dump();
}

}  // namespace livereload
