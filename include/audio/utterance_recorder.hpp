#ifndef UTTERANCE_RECORDER_HPP
#define UTTERANCE_RECORDER_HPP

#include <vector>
#include <cstdint>

class UtteranceRecorder {
public:
    struct Config {
        int sampleRate = 16000;
        int channels = 1;

        int framesPerBuffer = 160;

        // Threshold floors. calibrate() may raise them, never lower them.
        float vadStartRms = 0.014f;
        float vadStopRms = 0.011f;
        int startHangMs = 80;
        int stopHangMs = 800;

        int maxUtteranceMs = 12000;
        int preRollMs = 250;

        // Thresholds after calibration = ambient rms * ratio
        float dynamicStartRatio = 1.5f;
        float dynamicStopRatio = 1.2f;
    };

    explicit UtteranceRecorder(Config config);

    // Returns true once an utterance is complete
    bool feed(const int16_t* samples, int frames);

    // Measures ambient noise and adapts the start/stop thresholds.
    // Returns the measured rms.
    float calibrate(const int16_t* samples, int frames);

    bool isListening() const { return listening_; }
    bool hasUtterance() const { return finished_; }

    const std::vector<float>& utterance() const { return utterance_; }

    // Moves the finished utterance out and resets for the next one
    std::vector<float> takeUtterance();

    float startThreshold() const { return startRms_; }
    float stopThreshold() const { return stopRms_; }
    const Config& config() const { return config_; }

    void reset();

private:
    Config config_;

    bool listening_ = false;
    bool finished_ = false;

    float startRms_ = 0.0f;
    float stopRms_ = 0.0f;

    int msPerBuffer_ = 0;
    int speechMs_ = 0;
    int silenceMs_ = 0;
    int totalMs_ = 0;

    std::vector<float> preRoll_;
    std::vector<float> utterance_;

    float rms(const float* x, int n) const;
    void pushPreRoll(const float* x, int n);

};

#endif
