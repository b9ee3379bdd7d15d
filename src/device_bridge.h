#ifndef LIVERELOAD_DEVICE_BRIDGE_H
#define LIVERELOAD_DEVICE_BRIDGE_H

#include "command.h"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace livereload {

constexpr std::chrono::seconds kBridgeTimeout{10};
constexpr std::chrono::seconds kBridgeShortTimeout{5};

// The platform tool used to enumerate, inspect and forward ports to a device.
class DeviceBridge {
public:
    virtual ~DeviceBridge() = default;

    virtual bool available() const = 0;

    // Runs a bounded bridge invocation such as {"devices"}.
    virtual CommandResult run(const std::vector<std::string> &args,
                              std::chrono::milliseconds timeout) = 0;

    // Full command line for a long-running invocation (the log stream).
    virtual std::vector<std::string> command_line(const std::vector<std::string> &args) const = 0;

    virtual std::string name() const = 0;
};

// Prepends "-s <serial>" when a target is known.
std::vector<std::string> with_serial(const std::optional<std::string> &serial,
                                     std::vector<std::string> args);

class AdbBridge : public DeviceBridge {
public:
    AdbBridge(std::string adb, std::string cwd);

    bool available() const override { return available_; }
    CommandResult run(const std::vector<std::string> &args,
                      std::chrono::milliseconds timeout) override;
    std::vector<std::string> command_line(const std::vector<std::string> &args) const override;
    std::string name() const override { return adb_; }

private:
    std::string adb_;
    std::string cwd_;
    bool available_;
};

}  // namespace livereload

#endif  // LIVERELOAD_DEVICE_BRIDGE_H
