#ifndef APP_CONFIG_HPP
#define APP_CONFIG_HPP

#include <chrono>
#include <string>

struct AppConfig {
    // Engine
    std::string modelPath = "models/whisper/ggml-medium.en.bin";
    std::string language = "en";
    bool useGpu = true;
    int threads = 4;
    int beamSize = 5;
    bool vadFilter = true;

    // Capture
    int deviceIndex = -1;          // -1 = default input, falling back to the first input device
    double calibrationSeconds = 1.0;

    // Pipeline
    std::string stopKeyword = "stop";
    std::chrono::milliseconds pollInterval{1000};
    std::chrono::milliseconds workerPacing{250};

    std::string logLevel = "INFO";
};

// Overrides fields of base from MICSCRIBE_* environment variables.
// Throws std::invalid_argument on a malformed numeric or boolean value.
AppConfig loadConfigFromEnv(AppConfig base = AppConfig());

#endif
