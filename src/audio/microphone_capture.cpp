#include "audio/microphone_capture.hpp"

#include "core/errors.hpp"
#include "core/logging.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <exception>
#include <string>
#include <utility>
#include <vector>

static const char* kTag = "Microphone";

// Constructor
MicrophoneCapture::MicrophoneCapture(UtteranceRecorder::Config config)
    : recorder_(config) {}

// Destructor
MicrophoneCapture::~MicrophoneCapture() {
    stopBackground();
}

PaStream* MicrophoneCapture::openStream(int device) {
    const UtteranceRecorder::Config& config = recorder_.config();

    PaStreamParameters inParams{};
    inParams.device = (PaDeviceIndex)device;

    const PaDeviceInfo* info = Pa_GetDeviceInfo(inParams.device);
    if (!info) throw CaptureError("Invalid input device " + std::to_string(device));

    inParams.channelCount = config.channels;
    inParams.sampleFormat = paInt16;
    inParams.suggestedLatency = info->defaultLowInputLatency;
    inParams.hostApiSpecificStreamInfo = nullptr;

    PaStream* stream = nullptr;
    pa_check(
        Pa_OpenStream(&stream, &inParams, nullptr,
                      config.sampleRate, config.framesPerBuffer,
                      paNoFlag, nullptr, nullptr),
        "Pa_OpenStream"
    );

    PaError e = Pa_StartStream(stream);
    if (e != paNoError) {
        Pa_CloseStream(stream);
        pa_check(e, "Pa_StartStream");
    }

    logDebug(kTag, std::string("Opened input device: ") + (info->name ? info->name : "(unknown)"));
    return stream;
}

void MicrophoneCapture::closeStream(PaStream* stream) {
    if (!stream) return;
    Pa_StopStream(stream);
    Pa_CloseStream(stream);
}

// Reads `seconds` of room noise and adapts the recorder thresholds
void MicrophoneCapture::calibrateAmbientNoise(int device, double seconds) {
    const UtteranceRecorder::Config& config = recorder_.config();
    const int buffers = std::max(1, (int)std::lround(seconds * config.sampleRate / config.framesPerBuffer));

    PaStream* stream = openStream(device);

    std::vector<int16_t> ambient;
    ambient.reserve((size_t)buffers * config.framesPerBuffer);
    std::vector<int16_t> buff(config.framesPerBuffer);

    try {
        for (int i = 0; i < buffers; ++i) {
            PaError e = Pa_ReadStream(stream, buff.data(), config.framesPerBuffer);
            if (e == paInputOverflowed) continue;
            pa_check(e, "Pa_ReadStream");
            ambient.insert(ambient.end(), buff.begin(), buff.end());
        }
    } catch (...) {
        closeStream(stream);
        throw;
    }
    closeStream(stream);

    const float level = recorder_.calibrate(ambient.data(), (int)ambient.size());

    char msg[128];
    std::snprintf(msg, sizeof(msg), "Ambient rms %.4f, start threshold %.4f, stop threshold %.4f",
                  level, recorder_.startThreshold(), recorder_.stopThreshold());
    logInfo(kTag, msg);
}

// Starts the capture thread. No-op if already capturing.
void MicrophoneCapture::startBackground(int device, SegmentCallback onSegment) {
    if (running_.load()) return;

    stream_ = openStream(device);
    callback_ = std::move(onSegment);
    recorder_.reset();

    running_ = true;
    thread_ = std::thread(&MicrophoneCapture::run, this);
    logInfo(kTag, "Listening in background on device " + std::to_string(device));
}

// Stops the capture thread and closes the stream
void MicrophoneCapture::stopBackground() {
    running_ = false;
    if (thread_.joinable()) thread_.join();

    if (stream_) {
        closeStream(stream_);
        stream_ = nullptr;
        logInfo(kTag, "Capture stopped");
    }
}

// Thread function reading the stream and cutting utterances
void MicrophoneCapture::run() {
    const int frames = recorder_.config().framesPerBuffer;
    std::vector<int16_t> buff(frames);

    while (running_.load()) {
        PaError e = Pa_ReadStream(stream_, buff.data(), frames);
        if (e == paInputOverflowed) {
            continue;
        }
        if (e != paNoError) {
            logError(kTag, std::string("Pa_ReadStream failed: ") + Pa_GetErrorText(e));
            running_ = false;
            break;
        }

        if (!recorder_.feed(buff.data(), frames)) continue;

        AudioSegment segment;
        segment.sampleRate = recorder_.config().sampleRate;
        segment.sequence = nextSequence_++;
        segment.pcm = recorder_.takeUtterance();

        char msg[96];
        std::snprintf(msg, sizeof(msg), "Segment #%llu captured (%.2fs)",
                      (unsigned long long)segment.sequence, segment.durationSeconds());
        logDebug(kTag, msg);

        try {
            if (callback_) callback_(std::move(segment));
        } catch (const std::exception& ex) {
            logError(kTag, std::string("segment callback threw: ") + ex.what());
        }
    }
}
