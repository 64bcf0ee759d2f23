#include "audio/silence_trim.hpp"

#include <algorithm>
#include <cmath>

static float frame_rms(const std::vector<float>& pcm, size_t from, size_t to) {
    double acc = 0.0;
    for (size_t i = from; i < to; ++i) acc += (double)pcm[i] * (double)pcm[i];
    return (float)std::sqrt(acc / std::max<size_t>(1, to - from));
}

VoicedRange findVoicedRange(const std::vector<float>& pcm, int sampleRate,
                            float thresholdRms, int frameMs) {
    VoicedRange range;
    if (pcm.empty() || sampleRate <= 0) return range;

    const size_t frame = std::max<size_t>(1, (size_t)sampleRate * frameMs / 1000);
    const size_t n = pcm.size();

    size_t first = n;
    size_t last = 0;
    for (size_t at = 0; at < n; at += frame) {
        const size_t to = std::min(n, at + frame);
        if (frame_rms(pcm, at, to) >= thresholdRms) {
            if (first == n) first = at;
            last = to;
        }
    }

    if (first == n) return range;

    // Keep one frame of margin on each side
    range.begin = first >= frame ? first - frame : 0;
    range.end = std::min(n, last + frame);
    return range;
}
