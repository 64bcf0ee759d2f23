#ifndef TRANSCRIPTION_CONTROLLER_HPP
#define TRANSCRIPTION_CONTROLLER_HPP

#include "audio/capture_source.hpp"
#include "audio/input_device.hpp"
#include "pipeline/result_box.hpp"
#include "pipeline/transcriber.hpp"
#include "pipeline/work_queue.hpp"
#include "stt/speech_engine.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

// Capture -> queue -> transcriber -> results. Started in full by the constructor.
class TranscriptionController {
public:
    struct Config {
        int deviceIndex = -1;
        double calibrationSeconds = 1.0;

        // Case-insensitive substring that triggers stop() from the poll loop.
        // Empty disables keyword shutdown.
        std::string stopKeyword = "stop";
        std::chrono::milliseconds pollInterval{1000};

        Transcriber::Config transcriber;
    };

    using EngineFactory = std::function<std::unique_ptr<SpeechEngine>()>;
    using TextHandler = std::function<void(const std::string& text)>;

    TranscriptionController(Config config, const DeviceCatalog& catalog,
                            EngineFactory makeEngine, CaptureSource& capture);
    ~TranscriptionController();

    TranscriptionController(const TranscriptionController&) = delete;
    TranscriptionController& operator=(const TranscriptionController&) = delete;

    // Clears the listening flag, queues the shutdown item and stops capture.
    // Does not wait for the worker. Safe to call more than once.
    void stop();

    bool isListening() const { return listening_.load(); }

    // Newest unread transcription, empty if none
    std::string pollLatest();

    // Polls until stop() or until `keepRunning` is cleared (then stops).
    void runPollLoop(const TextHandler& onText, const std::atomic<bool>* keepRunning = nullptr);

    // Bounded wait for the worker to exit after stop()
    bool waitForWorker(std::chrono::milliseconds timeout);

    std::vector<TranscriptEntry> transcript() const { return results_.snapshot(); }
    const DeviceInfo& device() const { return device_; }
    size_t segmentsProcessed() const { return transcriber_->segmentsProcessed(); }
    size_t segmentsDropped() const { return transcriber_->segmentsFailed(); }
    Transcriber::State workerState() const { return transcriber_->state(); }

    static bool containsKeyword(const std::string& text, const std::string& keyword);

private:
    void onSegment(AudioSegment segment);
    void logTranscript() const;

    Config config_;
    CaptureSource& capture_;
    DeviceInfo device_;

    WorkQueue queue_;
    ResultBox results_;
    std::atomic<bool> listening_{false};

    std::unique_ptr<SpeechEngine> engine_;
    std::unique_ptr<Transcriber> transcriber_;
};

#endif
