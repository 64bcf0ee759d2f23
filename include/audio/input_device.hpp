#ifndef INPUT_DEVICE_HPP
#define INPUT_DEVICE_HPP

#include <string>
#include <vector>

struct DeviceInfo {
    int index = -1;
    std::string name;
    int maxInputChannels = 0;

    bool isInput() const { return maxInputChannels > 0; }
};

// Audio host device listing
class DeviceCatalog {
public:
    virtual ~DeviceCatalog() = default;

    // -1 when the host reports no default input
    virtual int defaultInputDevice() const = 0;
    virtual std::vector<DeviceInfo> devices() const = 0;
};

// Picks the capture device: the requested index if it is an input device,
// then the host default, then the first input device. Throws
// NoInputDeviceError when nothing qualifies.
DeviceInfo selectInputDevice(const DeviceCatalog& catalog, int requested = -1);

std::vector<DeviceInfo> listInputDevices(const DeviceCatalog& catalog);

#endif
