/**
 * test_input_device.cpp - Device selection and fallback
 */

// assert() is the checking mechanism, keep it in every build type
#undef NDEBUG

#include "audio/input_device.hpp"
#include "core/errors.hpp"
#include "support/fakes.hpp"

#include <cassert>
#include <iostream>

void test_default_device() {
    FakeCatalog catalog;
    catalog.defaultIndex = 2;
    catalog.list = {FakeCatalog::device(0, "mic a", 1), FakeCatalog::device(2, "mic b", 2)};

    assert(selectInputDevice(catalog).index == 2);
    std::cout << "[PASS] test_default_device" << std::endl;
}

void test_requested_device_wins() {
    FakeCatalog catalog;
    catalog.defaultIndex = 2;
    catalog.list = {FakeCatalog::device(0, "mic a", 1), FakeCatalog::device(2, "mic b", 2)};

    assert(selectInputDevice(catalog, 0).index == 0);
    // Unknown index falls back to the default
    assert(selectInputDevice(catalog, 9).index == 2);
    std::cout << "[PASS] test_requested_device_wins" << std::endl;
}

void test_fallback_to_first_input() {
    FakeCatalog catalog;
    catalog.defaultIndex = -1;
    catalog.list = {FakeCatalog::device(0, "hdmi", 0), FakeCatalog::device(1, "line in", 2),
                    FakeCatalog::device(2, "webcam", 1)};

    DeviceInfo d = selectInputDevice(catalog);
    assert(d.index == 1);
    assert(d.name == "line in");

    // Default pointing at an output device is treated as missing
    catalog.defaultIndex = 0;
    assert(selectInputDevice(catalog).index == 1);

    assert(listInputDevices(catalog).size() == 2);
    std::cout << "[PASS] test_fallback_to_first_input" << std::endl;
}

void test_no_input_device() {
    FakeCatalog catalog;
    catalog.list = {FakeCatalog::device(0, "hdmi", 0)};

    bool thrown = false;
    try {
        selectInputDevice(catalog);
    } catch (const NoInputDeviceError&) {
        thrown = true;
    }
    assert(thrown);
    std::cout << "[PASS] test_no_input_device" << std::endl;
}

int main() {
    std::cout << "=== Input Device Tests ===" << std::endl;

    test_default_device();
    test_requested_device_wins();
    test_fallback_to_first_input();
    test_no_input_device();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
