#ifndef SILENCE_TRIM_HPP
#define SILENCE_TRIM_HPP

#include <cstddef>
#include <vector>

// Sample range [begin, end) left after dropping leading and trailing
// frames whose rms is below the threshold. begin == end for all-silent input.
struct VoicedRange {
    size_t begin = 0;
    size_t end = 0;

    bool empty() const { return begin >= end; }
    size_t size() const { return empty() ? 0 : end - begin; }
};

VoicedRange findVoicedRange(const std::vector<float>& pcm, int sampleRate,
                            float thresholdRms = 0.01f, int frameMs = 30);

#endif
