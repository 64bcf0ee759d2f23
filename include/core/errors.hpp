#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

// No usable microphone. Fatal at startup.
class NoInputDeviceError : public std::runtime_error {
public:
    explicit NoInputDeviceError(const std::string& what) : std::runtime_error(what) {}
};

// Speech model could not be loaded. Fatal at startup.
class EngineInitError : public std::runtime_error {
public:
    explicit EngineInitError(const std::string& what) : std::runtime_error(what) {}
};

class CaptureError : public std::runtime_error {
public:
    explicit CaptureError(const std::string& what) : std::runtime_error(what) {}
};

#endif
