#ifndef SPEECH_ENGINE_HPP
#define SPEECH_ENGINE_HPP

#include "audio/audio_segment.hpp"

#include <string>
#include <vector>

struct TranscriptEntry {
    double start = 0.0;   // seconds from segment start
    double end = 0.0;
    std::string text;
};

struct DecodeOptions {
    std::string language = "en";
    int beamSize = 5;
    bool vadFilter = true;
};

// Batch speech-to-text backend. One call per captured utterance.
class SpeechEngine {
public:
    virtual ~SpeechEngine() = default;

    // May throw; the worker treats a throw as a failed segment.
    virtual std::vector<TranscriptEntry> transcribe(const AudioSegment& segment,
                                                    const DecodeOptions& options) = 0;
};

#endif
