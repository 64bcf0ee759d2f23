#ifndef CAPTURE_SOURCE_HPP
#define CAPTURE_SOURCE_HPP

#include "audio/audio_segment.hpp"

#include <functional>

// Background microphone capture delivering one AudioSegment per utterance.
class CaptureSource {
public:
    // Invoked from the capture thread. Must return quickly.
    using SegmentCallback = std::function<void(AudioSegment segment)>;

    virtual ~CaptureSource() = default;

    // One-time ambient noise measurement used to tune voice detection
    virtual void calibrateAmbientNoise(int device, double seconds) = 0;

    virtual void startBackground(int device, SegmentCallback onSegment) = 0;
    virtual void stopBackground() = 0;
    virtual bool isCapturing() const = 0;
};

#endif
