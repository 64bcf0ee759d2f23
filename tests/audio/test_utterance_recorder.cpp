/**
 * test_utterance_recorder.cpp - Energy VAD segmentation and ambient calibration
 */

// assert() is the checking mechanism, keep it in every build type
#undef NDEBUG

#include "audio/utterance_recorder.hpp"

#include <cassert>
#include <iostream>
#include <vector>

static const int kFrames = 160;   // 10 ms at 16 kHz

static bool feed_level(UtteranceRecorder& rec, int16_t level, int buffers) {
    std::vector<int16_t> buf(kFrames, level);
    bool done = false;
    for (int i = 0; i < buffers && !done; ++i) done = rec.feed(buf.data(), kFrames);
    return done;
}

void test_utterance_boundaries() {
    UtteranceRecorder rec{UtteranceRecorder::Config()};

    bool done = feed_level(rec, 0, 20);
    assert(!done);
    assert(!rec.isListening());

    done = feed_level(rec, 3000, 30);
    assert(!done);
    assert(rec.isListening());

    // 800 ms of silence closes the utterance
    done = feed_level(rec, 0, 79);
    assert(!done);
    done = feed_level(rec, 0, 1);
    assert(done);
    assert(rec.hasUtterance());

    // 250 ms pre-roll + 22 loud buffers + 80 silent buffers
    assert(rec.utterance().size() == 4000 + 22 * kFrames + 80 * kFrames);

    std::vector<float> pcm = rec.takeUtterance();
    assert(pcm.size() == 20320);
    assert(!rec.hasUtterance());
    assert(rec.utterance().empty());

    std::cout << "[PASS] test_utterance_boundaries" << std::endl;
}

void test_max_length_cut() {
    UtteranceRecorder::Config config;
    config.maxUtteranceMs = 200;
    UtteranceRecorder rec(config);

    bool done = feed_level(rec, 3000, 8);
    assert(!done);
    assert(rec.isListening());
    done = feed_level(rec, 3000, 20);
    assert(done);
    assert(rec.hasUtterance());

    std::cout << "[PASS] test_max_length_cut" << std::endl;
}

void test_calibration_raises_thresholds() {
    UtteranceRecorder rec{UtteranceRecorder::Config()};

    std::vector<int16_t> ambient(16000, 1000);
    float level = rec.calibrate(ambient.data(), (int)ambient.size());
    assert(level > 0.030f && level < 0.031f);
    assert(rec.startThreshold() > 0.045f);
    assert(rec.stopThreshold() > 0.036f);
    assert(rec.stopThreshold() <= rec.startThreshold());

    // Room noise alone no longer opens an utterance
    bool done = feed_level(rec, 1000, 50);
    assert(!done);
    assert(!rec.isListening());

    done = feed_level(rec, 3000, 10);
    assert(!done);
    assert(rec.isListening());

    std::cout << "[PASS] test_calibration_raises_thresholds" << std::endl;
}

void test_quiet_room_keeps_floors() {
    UtteranceRecorder::Config config;
    UtteranceRecorder rec(config);

    std::vector<int16_t> ambient(16000, 0);
    rec.calibrate(ambient.data(), (int)ambient.size());
    assert(rec.startThreshold() == config.vadStartRms);
    assert(rec.stopThreshold() == config.vadStopRms);

    std::cout << "[PASS] test_quiet_room_keeps_floors" << std::endl;
}

int main() {
    std::cout << "=== UtteranceRecorder Tests ===" << std::endl;

    test_utterance_boundaries();
    test_max_length_cut();
    test_calibration_raises_thresholds();
    test_quiet_room_keeps_floors();

    std::cout << "\nAll tests passed!" << std::endl;
    return 0;
}
