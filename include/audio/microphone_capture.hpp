#ifndef MICROPHONE_CAPTURE_HPP
#define MICROPHONE_CAPTURE_HPP

#include "audio/capture_source.hpp"
#include "audio/portaudio_host.hpp"
#include "audio/utterance_recorder.hpp"

#include <atomic>
#include <cstdint>
#include <thread>

// PortAudio capture on a dedicated thread. Each utterance found by the
// UtteranceRecorder is handed to the segment callback.
class MicrophoneCapture : public CaptureSource {
public:
    explicit MicrophoneCapture(UtteranceRecorder::Config config = UtteranceRecorder::Config());
    ~MicrophoneCapture() override;

    MicrophoneCapture(const MicrophoneCapture&) = delete;
    MicrophoneCapture& operator=(const MicrophoneCapture&) = delete;

    void calibrateAmbientNoise(int device, double seconds) override;

    void startBackground(int device, SegmentCallback onSegment) override;
    void stopBackground() override;
    bool isCapturing() const override { return running_.load(); }

private:
    PaStream* openStream(int device);
    void closeStream(PaStream* stream);
    void run();

    PortAudioSession session_;
    UtteranceRecorder recorder_;

    PaStream* stream_ = nullptr;
    SegmentCallback callback_;
    std::thread thread_;
    std::atomic<bool> running_{false};
    uint64_t nextSequence_ = 0;
};

#endif
