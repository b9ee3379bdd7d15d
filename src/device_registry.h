#ifndef LIVERELOAD_DEVICE_REGISTRY_H
#define LIVERELOAD_DEVICE_REGISTRY_H

#include "device_bridge.h"

#include <optional>
#include <string>
#include <vector>

namespace livereload {

struct Device {
    std::string serial;
    bool is_emulator = false;
};

// Parses "adb devices" output. Only entries in the ready ("device") state
// are returned.
std::vector<Device> parse_device_list(const std::string &output);

class DeviceRegistry {
public:
    explicit DeviceRegistry(DeviceBridge &bridge)
        : bridge_(bridge) {}

    // Never fails: bridge absence or timeout yields an empty list and a
    // warning on the console.
    std::vector<Device> list_devices();

    // Physical devices win over emulators; otherwise the first entry.
    static std::optional<Device> choose_target(const std::vector<Device> &devices);

private:
    DeviceBridge &bridge_;
};

}  // namespace livereload

#endif  // LIVERELOAD_DEVICE_REGISTRY_H
