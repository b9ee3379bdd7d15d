#include "device_registry.h"

#include "common.h"

#include <sstream>

namespace livereload {

std::vector<Device> parse_device_list(const std::string &output) {
    std::vector<Device> devices;
    std::istringstream iss(output);
    std::string line;
    while (std::getline(iss, line)) {
        auto parts = split_words(line);
        if (parts.empty() || starts_with(parts[0], "List") || starts_with(parts[0], "*")) {
            continue;
        }
        if (parts.size() < 2 || parts[1] != "device") {
            continue;
        }
        Device d;
        d.serial = parts[0];
        d.is_emulator = starts_with(d.serial, "emulator-");
        devices.push_back(d);
    }
    return devices;
}

std::vector<Device> DeviceRegistry::list_devices() {
    if (!bridge_.available()) {
        console().warn(bridge_.name() + " not found in PATH. Device detection may fail.");
        return {};
    }

    CommandResult r = bridge_.run({"devices"}, kBridgeTimeout);
    if (r.timed_out) {
        console().warn("`" + bridge_.name() + " devices` timed out. Device detection disabled. "
                       "Unlock the phone and accept USB debugging prompt, or pass --target.");
        return {};
    }
    if (!r.launched) {
        console().warn("failed to run `" + bridge_.name() + " devices`: " + r.output);
        return {};
    }
    return parse_device_list(r.output);
}

std::optional<Device> DeviceRegistry::choose_target(const std::vector<Device> &devices) {
    if (devices.empty()) {
        return std::nullopt;
    }
    if (devices.size() == 1) {
        return devices.front();
    }
    for (const auto &d : devices) {
        if (!d.is_emulator) {
            return d;
        }
    }
    return devices.front();
}

}  // namespace livereload
