#include "config.h"

#include "common.h"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <utility>

namespace livereload {

namespace {

bool parse_port(const std::string &text, int &port) {
    if (text.empty()) {
        return false;
    }
    char *end = nullptr;
    errno = 0;
    long v = std::strtol(text.c_str(), &end, 10);
    if (errno != 0 || *end != '\0' || v < 1 || v > 65535) {
        return false;
    }
    port = static_cast<int>(v);
    return true;
}

}  // namespace

void usage(std::ostream &out) {
    out << "Usage: livereload [options]\n"
           "\n"
           "Runs the web dev server and the native app runner against one port,\n"
           "streams device logs, and optionally bridges the WebView console.\n"
           "\n"
           "  --mode usb|wifi              connection mode (default usb)\n"
           "  --host <ip>                  host address, required for wifi mode\n"
           "  --port <n>                   preferred dev server port (default 5173)\n"
           "  --target <serial>            device serial from `adb devices`\n"
           "  --app-id <id>                application id (default: capacitor.config.json appId)\n"
           "  --no-logcat                  disable the device log stream\n"
           "  --logcat-mode console|app|all  log view (default console)\n"
           "  --logcat-tags \"<T1 T2>\"      space-separated log tags to include\n"
           "  --logcat-all                 show every log line (overrides --logcat-mode)\n"
           "  --devtools                   stream the WebView console over DevTools\n"
           "  --project-dir <dir>          project directory (default: current directory)\n"
           "  --check-deps                 report required tools and exit\n"
           "  --help                       show this help\n";
}

bool parse_args(int argc, char **argv, Options &opts, std::string &error) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        bool has_value = i + 1 < argc;

        if (arg == "--help" || arg == "-h") {
            opts.help = true;
            return true;
        } else if (arg == "--check-deps") {
            opts.check_deps = true;
        } else if (arg == "--no-logcat") {
            opts.logcat = false;
        } else if (arg == "--logcat-all") {
            opts.logcat_all = true;
        } else if (arg == "--devtools") {
            opts.devtools = true;
        } else if (arg == "--mode" || arg == "--host" || arg == "--port" || arg == "--target" ||
                   arg == "--app-id" || arg == "--logcat-mode" || arg == "--logcat-tags" ||
                   arg == "--project-dir") {
            if (!has_value) {
                error = arg + " requires a value";
                return false;
            }
            std::string value = argv[++i];

            if (arg == "--mode") {
                if (value == "usb") {
                    opts.mode = ConnectionMode::Usb;
                } else if (value == "wifi") {
                    opts.mode = ConnectionMode::Wifi;
                } else {
                    error = "invalid --mode '" + value + "' (expected usb or wifi)";
                    return false;
                }
            } else if (arg == "--host") {
                opts.host = value;
            } else if (arg == "--port") {
                if (!parse_port(value, opts.port)) {
                    error = "invalid --port '" + value + "'";
                    return false;
                }
            } else if (arg == "--target") {
                opts.target = value;
            } else if (arg == "--app-id") {
                opts.app_id = value;
            } else if (arg == "--logcat-mode") {
                auto mode = parse_logcat_mode(value);
                if (!mode) {
                    error = "invalid --logcat-mode '" + value + "' (expected console, app or all)";
                    return false;
                }
                opts.logcat_mode = *mode;
            } else if (arg == "--logcat-tags") {
                opts.logcat_tags = split_words(value);
            } else {
                opts.project_dir = value;
            }
        } else {
            error = "unknown argument '" + arg + "'";
            return false;
        }
    }

    if (opts.mode == ConnectionMode::Wifi && opts.host.empty() && !opts.check_deps) {
        error = "--host is required for wifi mode.";
        return false;
    }
    return true;
}

std::optional<std::string> read_app_id(const std::string &project_dir) {
    std::ifstream in(project_dir + "/" + kProjectDescriptor);
    if (!in) {
        return std::nullopt;
    }
    nlohmann::json doc = nlohmann::json::parse(in, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return std::nullopt;
    }
    auto it = doc.find("appId");
    if (it == doc.end() || !it->is_string() || it->get<std::string>().empty()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

LogcatMode resolve_logcat_mode(LogcatMode requested, bool force_all, bool have_app_id, bool &degraded) {
    degraded = false;
    if (force_all) {
        return LogcatMode::All;
    }
    if (requested == LogcatMode::App && !have_app_id) {
        degraded = true;
        return LogcatMode::All;
    }
    return requested;
}

SessionConfig resolve_session_config(const Options &opts, int port,
                                     std::optional<std::string> target,
                                     std::optional<std::string> app_id,
                                     LogcatMode logcat_mode,
                                     const SessionTimings &timings) {
    SessionConfig config;
    config.mode = opts.mode;
    config.runner_host = opts.mode == ConnectionMode::Wifi ? opts.host : "localhost";
    config.preferred_port = opts.port;
    config.port = port;
    config.target = std::move(target);
    config.app_id = std::move(app_id);
    config.logcat_enabled = opts.logcat;
    config.logcat_mode = logcat_mode;
    config.logcat_tags = opts.logcat_tags;
    config.devtools = opts.devtools;
    config.project_dir = opts.project_dir;
    config.timings = timings;
    return config;
}

std::vector<std::string> dev_server_command(const SessionConfig &config) {
    return {"npm", "run", "dev", "--", "--host", "0.0.0.0", "--strictPort",
            "--port", std::to_string(config.port)};
}

std::vector<std::string> app_runner_command(const SessionConfig &config) {
    std::string port = std::to_string(config.port);
    std::vector<std::string> cmd{"npx", "cap", "run", "android", "-l",
                                 "--host", config.runner_host, "--port", port};
    if (config.mode == ConnectionMode::Usb) {
        cmd.push_back("--forwardPorts");
        cmd.push_back(port + ":" + port);
    }
    if (config.target) {
        cmd.push_back("--target");
        cmd.push_back(*config.target);
    }
    return cmd;
}

}  // namespace livereload
