#ifndef LIVERELOAD_CDP_H
#define LIVERELOAD_CDP_H

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace livereload {

struct ConsoleApiCalled {
    std::string type = "log";
    std::vector<std::string> args;
};

struct LogEntryAdded {
    std::string level = "info";
    std::string text;
};

struct Ignored {};

using CdpEvent = std::variant<ConsoleApiCalled, LogEntryAdded, Ignored>;

// Decodes one DevTools protocol message. Unknown methods and responses map
// to Ignored; std::nullopt only when the text is not a JSON object.
std::optional<CdpEvent> decode_cdp_message(const std::string &text);

// Text form of a Runtime.RemoteObject as it appears in a console call.
std::string render_remote_object(const nlohmann::json &arg);

// "[console.<type>] a b c" or "[log.<level>] text"; std::nullopt for Ignored.
std::optional<std::string> format_cdp_event(const CdpEvent &event);

std::string cdp_request(int id, const std::string &method);

}  // namespace livereload

#endif  // LIVERELOAD_CDP_H
