#include "audio/portaudio_host.hpp"

#include "core/errors.hpp"

#include <string>

void pa_check(PaError e, const char* msg) {
    if (e != paNoError) {
        throw CaptureError(std::string(msg) + " (" + std::to_string((int)e) + "): " + Pa_GetErrorText(e));
    }
}

PortAudioSession::PortAudioSession() {
    pa_check(Pa_Initialize(), "Pa_Initialize");
}

PortAudioSession::~PortAudioSession() {
    Pa_Terminate();
}

int PortAudioCatalog::defaultInputDevice() const {
    const PaDeviceIndex idx = Pa_GetDefaultInputDevice();
    return idx == paNoDevice ? -1 : (int)idx;
}

std::vector<DeviceInfo> PortAudioCatalog::devices() const {
    std::vector<DeviceInfo> out;

    const PaDeviceIndex count = Pa_GetDeviceCount();
    if (count < 0) return out;

    for (PaDeviceIndex i = 0; i < count; ++i) {
        const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
        if (!info) continue;

        DeviceInfo d;
        d.index = (int)i;
        d.name = info->name ? info->name : "(unknown)";
        d.maxInputChannels = info->maxInputChannels;
        out.push_back(d);
    }
    return out;
}
