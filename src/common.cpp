#include "common.h"

#include <uuid/uuid.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fcntl.h>
#include <iostream>
#include <sstream>
#include <string>
#include <sys/types.h>
#include <unistd.h>

namespace livereload {

Console &Console::instance() {
    static Console console;
    return console;
}

Console::Console()
    : out_(&std::cout) {}

void Console::line(const std::string &text) {
    std::lock_guard<std::mutex> lock(mutex_);
    *out_ << text << '\n';
    out_->flush();
}

void Console::redirect(std::ostream *out) {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ = out ? out : &std::cout;
}

bool set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0) {
        return false;
    }
    return fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

std::string trim_newlines(const std::string &s) {
    auto e = s.find_last_not_of("\r\n");
    return (e == std::string::npos) ? "" : s.substr(0, e + 1);
}

std::vector<std::string> split_words(const std::string &s) {
    std::vector<std::string> result;
    std::istringstream iss(s);
    std::string tok;
    while (iss >> tok) {
        result.push_back(tok);
    }
    return result;
}

std::string to_upper(const std::string &s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

bool starts_with(const std::string &s, const std::string &prefix) {
    return s.rfind(prefix, 0) == 0;
}

bool command_exists(const std::string &name) {
    std::string cmd = "command -v ";
    cmd += name;
    cmd += " >/dev/null 2>&1";
    return system(cmd.c_str()) == 0;
}

std::vector<DepStatus> check_dependencies() {
    std::vector<DepStatus> deps;

    deps.push_back({"npm", "Required to start the dev server", command_exists("npm"), true});
    deps.push_back({"npx", "Required to launch the native app runner", command_exists("npx"), true});
    deps.push_back({"adb", "Device detection, logcat and DevTools forwarding", command_exists("adb"), false});

    return deps;
}

std::string deps_report(const std::vector<DepStatus> &deps) {
    std::ostringstream oss;
    for (const auto &d : deps) {
        oss << (d.available ? "  ok       " : (d.required ? "  MISSING  " : "  missing  "))
            << d.name << " - " << d.description
            << (d.required ? "" : " (optional)") << "\n";
    }
    return oss.str();
}

bool required_deps_satisfied(const std::vector<DepStatus> &deps) {
    return std::none_of(deps.begin(), deps.end(),
                        [](const DepStatus &d) { return d.required && !d.available; });
}

std::string generate_session_id() {
    uuid_t uuid;
    uuid_generate(uuid);
    char out[37] = {0};
    uuid_unparse_lower(uuid, out);
    return std::string(out);
}

std::string base64_encode(const uint8_t *data, size_t len) {
    static constexpr char kAlphabet[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
        "abcdefghijklmnopqrstuvwxyz"
        "0123456789+/";
    std::string encoded;
    encoded.reserve(((len + 2) / 3) * 4);
    size_t index = 0;
    while (index < len) {
        const size_t chunk = std::min<size_t>(3, len - index);
        uint32_t block = 0;
        for (size_t i = 0; i < chunk; ++i) {
            block |= static_cast<uint32_t>(data[index + i]) << (16 - static_cast<uint32_t>(i) * 8);
        }
        encoded.push_back(kAlphabet[(block >> 18) & 0x3F]);
        encoded.push_back(kAlphabet[(block >> 12) & 0x3F]);
        encoded.push_back(chunk >= 2 ? kAlphabet[(block >> 6) & 0x3F] : '=');
        encoded.push_back(chunk == 3 ? kAlphabet[block & 0x3F] : '=');
        index += chunk;
    }
    return encoded;
}

}  // namespace livereload
