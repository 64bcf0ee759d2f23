#ifndef AUDIO_SEGMENT_HPP
#define AUDIO_SEGMENT_HPP

#include <cstdint>
#include <vector>

// One voice-activity-delimited utterance, 32-bit float mono PCM.
struct AudioSegment {
    std::vector<float> pcm;
    int sampleRate = 16000;
    uint64_t sequence = 0;

    double durationSeconds() const {
        return sampleRate > 0 ? (double)pcm.size() / sampleRate : 0.0;
    }
};

#endif
