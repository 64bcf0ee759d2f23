#include "audio/utterance_recorder.hpp"

#include <cmath>
#include <algorithm>
#include <utility>

// Constructor
UtteranceRecorder::UtteranceRecorder(Config config)
    : config_(config), startRms_(config.vadStartRms), stopRms_(config.vadStopRms) {
    msPerBuffer_ = (int)std::lround(1000.0 * config_.framesPerBuffer / config_.sampleRate);
    preRoll_.reserve((config_.preRollMs * config_.sampleRate) / 1000);
    utterance_.reserve((config_.maxUtteranceMs * config_.sampleRate) / 1000);
}

// Resets recording variables
void UtteranceRecorder::reset() {
    listening_ = false;
    finished_ = false;
    speechMs_ = 0;
    silenceMs_ = 0;
    totalMs_ = 0;
    preRoll_.clear();
    utterance_.clear();
}

std::vector<float> UtteranceRecorder::takeUtterance() {
    std::vector<float> out = std::move(utterance_);
    utterance_ = std::vector<float>();
    utterance_.reserve((config_.maxUtteranceMs * config_.sampleRate) / 1000);
    reset();
    return out;
}

float UtteranceRecorder::rms(const float* x, int n) const {
    double acc = 0.0;
    for (int i = 0; i < n; ++i) acc += (double)x[i] * (double)x[i];
    acc /= std::max(1, n);
    return (float)std::sqrt(acc);
}

float UtteranceRecorder::calibrate(const int16_t* samples, int frames) {
    std::vector<float> x(std::max(0, frames));
    for (int i = 0; i < frames; ++i) x[i] = (float)samples[i] / 32768.0f;

    const float ambient = rms(x.data(), frames);
    startRms_ = std::max(config_.vadStartRms, ambient * config_.dynamicStartRatio);
    stopRms_ = std::max(config_.vadStopRms, ambient * config_.dynamicStopRatio);

    // Keep hysteresis: stop must not exceed start
    stopRms_ = std::min(stopRms_, startRms_);
    return ambient;
}

void UtteranceRecorder::pushPreRoll(const float* x, int n) {
    const int maxPre = (config_.preRollMs * config_.sampleRate) / 1000;
    preRoll_.insert(preRoll_.end(), x, x + n);
    if ((int)preRoll_.size() > maxPre) {
        const int extra = (int)preRoll_.size() - maxPre;
        preRoll_.erase(preRoll_.begin(), preRoll_.begin() + extra);
    }
}

bool UtteranceRecorder::feed(const int16_t* samples, int frames) {
    if (finished_) return true;

    std::vector<float> frames_float(frames);
    for (int i = 0; i < frames; ++i) frames_float[i] = (float)samples[i] / 32768.0f;

    const float r = rms(frames_float.data(), frames);

    if (!listening_) {
        pushPreRoll(frames_float.data(), frames);
        if (r >= startRms_) {
            speechMs_ += msPerBuffer_;
            if (speechMs_ >= config_.startHangMs) {
                listening_ = true;
                totalMs_ = 0;
                utterance_.insert(utterance_.end(), preRoll_.begin(), preRoll_.end());
                preRoll_.clear();
                silenceMs_ = 0;
            }
        } else {
            speechMs_ = 0;
        }
    } else {
        utterance_.insert(utterance_.end(), frames_float.begin(), frames_float.end());
        totalMs_ += msPerBuffer_;

        if (r <= stopRms_) {
            silenceMs_ += msPerBuffer_;
            if (silenceMs_ >= config_.stopHangMs) {
                finished_ = true;
                listening_ = false;
                return true;
            }
        } else {
            silenceMs_ = 0;
        }

        if (totalMs_ >= config_.maxUtteranceMs) {
            finished_ = true;
            listening_ = false;
            return true;
        }
    }

    return false;
}
