#include "audio/input_device.hpp"

#include "core/errors.hpp"
#include "core/logging.hpp"

static const char* kTag = "Input Device";

static const DeviceInfo* find_input(const std::vector<DeviceInfo>& devices, int index) {
    if (index < 0) return nullptr;
    for (const auto& d : devices) {
        if (d.index == index && d.isInput()) return &d;
    }
    return nullptr;
}

std::vector<DeviceInfo> listInputDevices(const DeviceCatalog& catalog) {
    std::vector<DeviceInfo> out;
    for (auto& d : catalog.devices()) {
        if (d.isInput()) out.push_back(d);
    }
    return out;
}

DeviceInfo selectInputDevice(const DeviceCatalog& catalog, int requested) {
    const std::vector<DeviceInfo> devices = catalog.devices();

    if (requested >= 0) {
        if (const DeviceInfo* d = find_input(devices, requested)) {
            logInfo(kTag, "Using requested device " + std::to_string(d->index) + ": " + d->name);
            return *d;
        }
        logWarn(kTag, "Requested device " + std::to_string(requested) +
                      " is not an input device, trying the default");
    }

    if (const DeviceInfo* d = find_input(devices, catalog.defaultInputDevice())) {
        logInfo(kTag, "Using default input device " + std::to_string(d->index) + ": " + d->name);
        return *d;
    }

    logError(kTag, "Default input device not found. Printing all input devices:");
    const DeviceInfo* chosen = nullptr;
    for (const auto& d : devices) {
        if (!d.isInput()) continue;
        logInfo(kTag, "Device index: " + std::to_string(d.index) + ", Device name: " + d.name);
        if (!chosen) chosen = &d;
    }

    if (!chosen) throw NoInputDeviceError("No input devices found.");

    logInfo(kTag, "Falling back to device " + std::to_string(chosen->index) + ": " + chosen->name);
    return *chosen;
}
