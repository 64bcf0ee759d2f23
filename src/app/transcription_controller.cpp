#include "app/transcription_controller.hpp"

#include "core/errors.hpp"
#include "core/logging.hpp"

#include <algorithm>
#include <cctype>
#include <memory>
#include <sstream>
#include <thread>
#include <utility>

static const char* kTag = "Controller";

static std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return (char)std::tolower(c); });
    return s;
}

// Constructor
TranscriptionController::TranscriptionController(Config config, const DeviceCatalog& catalog,
                                                 EngineFactory makeEngine, CaptureSource& capture)
    : config_(std::move(config)), capture_(capture) {
    device_ = selectInputDevice(catalog, config_.deviceIndex);

    engine_ = makeEngine ? makeEngine() : nullptr;
    if (!engine_) throw EngineInitError("speech engine factory returned no engine");

    listening_ = true;
    transcriber_ = std::make_unique<Transcriber>(config_.transcriber, queue_, results_, *engine_, listening_);
    transcriber_->start();

    try {
        capture_.calibrateAmbientNoise(device_.index, config_.calibrationSeconds);
        capture_.startBackground(device_.index, [this](AudioSegment segment) {
            onSegment(std::move(segment));
        });
    } catch (...) {
        listening_ = false;
        queue_.push(WorkItem::shutdown());
        transcriber_->join();
        throw;
    }

    logInfo(kTag, "Ready!");
}

// Destructor
TranscriptionController::~TranscriptionController() {
    if (listening_.load()) stop();
    capture_.stopBackground();
}

// Capture callback. Only enqueues.
void TranscriptionController::onSegment(AudioSegment segment) {
    if (!listening_.load()) return;
    queue_.push(WorkItem::of(std::move(segment)));
}

void TranscriptionController::logTranscript() const {
    std::ostringstream oss;
    oss << "Transcription:\n [";
    const std::vector<std::string> texts = results_.texts();
    for (size_t i = 0; i < texts.size(); ++i) {
        if (i) oss << ", ";
        oss << "'" << texts[i] << "'";
    }
    oss << "]";
    logInfo(kTag, oss.str());
}

void TranscriptionController::stop() {
    logInfo(kTag, "Stopping...");
    logTranscript();

    listening_ = false;
    queue_.push(WorkItem::shutdown());
    capture_.stopBackground();
}

std::string TranscriptionController::pollLatest() {
    return results_.takeLast();
}

bool TranscriptionController::containsKeyword(const std::string& text, const std::string& keyword) {
    if (keyword.empty()) return false;
    return to_lower(text).find(to_lower(keyword)) != std::string::npos;
}

void TranscriptionController::runPollLoop(const TextHandler& onText, const std::atomic<bool>* keepRunning) {
    while (listening_.load()) {
        if (keepRunning && !keepRunning->load()) {
            stop();
            break;
        }

        std::string text = pollLatest();
        if (!text.empty()) {
            if (onText) onText(text);
            if (containsKeyword(text, config_.stopKeyword)) {
                stop();
                break;
            }
        }

        std::this_thread::sleep_for(config_.pollInterval);
    }
}

bool TranscriptionController::waitForWorker(std::chrono::milliseconds timeout) {
    return transcriber_->waitFor(timeout);
}
