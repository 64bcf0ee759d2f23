#ifndef PORTAUDIO_HOST_HPP
#define PORTAUDIO_HOST_HPP

#include "audio/input_device.hpp"

#include <portaudio.h>

// Throws CaptureError when e is not paNoError
void pa_check(PaError e, const char* msg);

// Pa_Initialize / Pa_Terminate pair. PortAudio reference-counts these,
// so several sessions may coexist.
class PortAudioSession {
public:
    PortAudioSession();
    ~PortAudioSession();

    PortAudioSession(const PortAudioSession&) = delete;
    PortAudioSession& operator=(const PortAudioSession&) = delete;
};

class PortAudioCatalog : public DeviceCatalog {
public:
    int defaultInputDevice() const override;
    std::vector<DeviceInfo> devices() const override;

private:
    PortAudioSession session_;
};

#endif
