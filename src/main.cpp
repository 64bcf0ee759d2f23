#include "app/transcription_controller.hpp"
#include "audio/microphone_capture.hpp"
#include "audio/portaudio_host.hpp"
#include "core/app_config.hpp"
#include "core/logging.hpp"
#include "stt/whisper_stt.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstring>
#include <exception>
#include <iostream>
#include <memory>
#include <string>

static std::atomic<bool> g_running{true};
static void on_signal(int) { g_running.store(false); }

static int list_devices() {
    PortAudioCatalog catalog;
    const int def = catalog.defaultInputDevice();
    for (const auto& d : listInputDevices(catalog)) {
        std::cout << (d.index == def ? "* " : "  ") << d.index << ": " << d.name
                  << " (" << d.maxInputChannels << " ch)\n";
    }
    return 0;
}

int main(int argc, char* argv[]) {
    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    try {
        if (argc > 1 && std::strcmp(argv[1], "--list-devices") == 0) {
            return list_devices();
        }
        if (argc > 1) {
            std::cerr << "usage: " << argv[0] << " [--list-devices]\n";
            return 2;
        }

        const AppConfig app = loadConfigFromEnv();
        setLogLevel(parseLogLevel(app.logLevel));

        TranscriptionController::Config config;
        config.deviceIndex = app.deviceIndex;
        config.calibrationSeconds = app.calibrationSeconds;
        config.stopKeyword = app.stopKeyword;
        config.pollInterval = app.pollInterval;
        config.transcriber.language = app.language;
        config.transcriber.beamSize = app.beamSize;
        config.transcriber.vadFilter = app.vadFilter;
        config.transcriber.pacing = app.workerPacing;

        WhisperSTT::Params params;
        params.useGpu = app.useGpu;
        params.threads = app.threads;

        PortAudioCatalog catalog;
        MicrophoneCapture microphone;

        TranscriptionController controller(config, catalog, [&]() -> std::unique_ptr<SpeechEngine> {
            return std::make_unique<WhisperSTT>(app.modelPath, params);
        }, microphone);

        std::cout << "Ready!\n" << std::endl;

        controller.runPollLoop([](const std::string& text) {
            std::cout << "You said:  " << text << std::endl;
        }, &g_running);

        if (!controller.waitForWorker(std::chrono::seconds(5))) {
            logWarn("micscribe", "Transcriber still busy, exiting once it finishes");
        }
    } catch (const std::exception& e) {
        std::cerr << "[micscribe] [ERROR] " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
