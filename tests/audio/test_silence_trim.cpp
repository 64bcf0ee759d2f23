/**
 * test_silence_trim.cpp - Voiced range detection used by the vad filter
 */

// assert() is the checking mechanism, keep it in every build type
#undef NDEBUG

#include "audio/silence_trim.hpp"

#include <cassert>
#include <iostream>
#include <vector>

void test_all_silent() {
    std::vector<float> pcm(16000, 0.0f);
    assert(findVoicedRange(pcm, 16000).empty());
    assert(findVoicedRange(std::vector<float>(), 16000).empty());

    std::cout << "[PASS] test_all_silent" << std::endl;
}

void test_trims_edges() {
    // 0.5 s silence, 0.5 s voice, 0.5 s silence
    std::vector<float> pcm(24000, 0.0f);
    for (size_t i = 8000; i < 16000; ++i) pcm[i] = (i % 2) ? 0.2f : -0.2f;

    VoicedRange r = findVoicedRange(pcm, 16000, 0.01f, 30);
    const size_t frame = 480;
    assert(!r.empty());
    assert(r.begin <= 8000 && r.begin + 2 * frame >= 8000);
    assert(r.end >= 16000 && r.end <= 16000 + 2 * frame);

    std::cout << "[PASS] test_trims_edges" << std::endl;
}

void test_voice_at_boundaries() {
    std::vector<float> pcm(4800, 0.3f);
    VoicedRange r = findVoicedRange(pcm, 16000);
    assert(r.begin == 0);
    assert(r.end == pcm.size());

    std::cout << "[PASS] test_voice_at_boundaries" << std::endl;
}

int main() {
    std::cout << "=== Silence Trim Tests ===" << std::endl;

    test_all_silent();
    test_trims_edges();
    test_voice_at_boundaries();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
