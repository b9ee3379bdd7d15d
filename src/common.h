#ifndef LIVERELOAD_COMMON_H
#define LIVERELOAD_COMMON_H

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <ostream>
#include <string>
#include <vector>

namespace livereload {

constexpr const char *kSessionIdEnv = "LIVERELOAD_SESSION_ID";

// Line-oriented sink shared by every thread. A line is written and flushed
// under one lock so output from concurrent workers never interleaves mid-line.
class Console {
public:
    static Console &instance();

    void line(const std::string &text);
    void info(const std::string &text) { line(text); }
    void warn(const std::string &text) { line("Warning: " + text); }
    void error(const std::string &text) { line("Error: " + text); }

    // Pass nullptr to restore std::cout.
    void redirect(std::ostream *out);

private:
    Console();

    std::mutex mutex_;
    std::ostream *out_;
};

inline Console &console() { return Console::instance(); }

bool set_nonblocking(int fd);

std::string trim_newlines(const std::string &s);
std::vector<std::string> split_words(const std::string &s);
std::string to_upper(const std::string &s);
bool starts_with(const std::string &s, const std::string &prefix);

struct DepStatus {
    std::string name;
    std::string description;
    bool available;
    bool required;
};

bool command_exists(const std::string &name);
std::vector<DepStatus> check_dependencies();
std::string deps_report(const std::vector<DepStatus> &deps);
bool required_deps_satisfied(const std::vector<DepStatus> &deps);

std::string generate_session_id();
std::string base64_encode(const uint8_t *data, size_t len);

}  // namespace livereload

#endif  // LIVERELOAD_COMMON_H
