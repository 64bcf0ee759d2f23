#ifndef WHISPER_STT_HPP
#define WHISPER_STT_HPP

#include "stt/speech_engine.hpp"

#include <mutex>
#include <string>
#include <vector>

struct whisper_context;

class WhisperSTT : public SpeechEngine {
public:
    struct Params {
        bool useGpu = true;
        int threads = 4;

        // Segments whose no-speech probability exceeds this are dropped
        float noSpeechThreshold = 0.6f;

        // Frame rms under which audio counts as silence for the vad filter
        float silenceRms = 0.01f;
    };

    // Throws EngineInitError if the model cannot be loaded
    WhisperSTT(const std::string& modelPath, Params params);
    ~WhisperSTT() override;

    WhisperSTT(const WhisperSTT&) = delete;
    WhisperSTT& operator=(const WhisperSTT&) = delete;

    std::vector<TranscriptEntry> transcribe(const AudioSegment& segment,
                                            const DecodeOptions& options) override;

private:
    whisper_context* context_ = nullptr;
    Params params_;
    std::mutex mutex_;
};

#endif
