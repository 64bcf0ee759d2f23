#include "pipeline/transcriber.hpp"

#include "core/logging.hpp"

#include <cstdio>
#include <exception>
#include <utility>

static const char* kTag = "Transcriber";

// Constructor
Transcriber::Transcriber(Config config, WorkQueue& queue, ResultBox& results,
                         SpeechEngine& engine, const std::atomic<bool>& listening)
    : config_(std::move(config)), queue_(queue), results_(results),
      engine_(engine), listening_(listening) {}

// Destructor. Unblocks a worker still waiting on the queue before joining.
Transcriber::~Transcriber() {
    if (!thread_.joinable()) return;
    if (state() != State::Stopped) queue_.push(WorkItem::shutdown());
    thread_.join();
}

// Starts the worker thread. No-op once started.
void Transcriber::start() {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ != State::Idle) return;
        state_ = State::Running;
    }
    state_cv_.notify_all();
    thread_ = std::thread(&Transcriber::run, this);
}

bool Transcriber::waitFor(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(state_mutex_);
    return state_cv_.wait_for(lock, timeout, [this] { return state_ == State::Stopped; });
}

void Transcriber::join() {
    if (thread_.joinable()) thread_.join();
}

Transcriber::State Transcriber::state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

const char* Transcriber::stateName(State s) {
    switch (s) {
        case State::Idle: return "idle";
        case State::Running: return "running";
        case State::Draining: return "draining";
        case State::Stopped: return "stopped";
    }
    return "unknown";
}

void Transcriber::setState(State s) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        state_ = s;
    }
    state_cv_.notify_all();
}

// Transcribes one segment and publishes each recognized entry
void Transcriber::process(const AudioSegment& segment) {
    DecodeOptions options;
    options.language = config_.language;
    options.beamSize = config_.beamSize;
    options.vadFilter = config_.vadFilter;

    std::vector<TranscriptEntry> entries;
    try {
        entries = engine_.transcribe(segment, options);
    } catch (const std::exception& e) {
        failed_++;
        logError(kTag, "segment #" + std::to_string(segment.sequence) +
                       " dropped: " + e.what());
        return;
    }

    for (auto& entry : entries) {
        char stamp[64];
        std::snprintf(stamp, sizeof(stamp), "[%.2fs -> %.2fs] ", entry.start, entry.end);
        logInfo(kTag, stamp + entry.text);
        results_.publish(std::move(entry));
    }
    processed_++;
}

// Thread function draining the queue until shutdown
void Transcriber::run() {
    logDebug(kTag, "worker started");

    while (listening_.load()) {
        WorkItem item = queue_.pop();

        if (item.isShutdown()) {
            setState(State::Draining);
            break;
        }

        process(item.segment);

        if (config_.pacing.count() > 0) {
            std::this_thread::sleep_for(config_.pacing);
        }
    }

    setState(State::Stopped);
    logDebug(kTag, "worker stopped after " + std::to_string(processed_.load()) + " segment(s)");
}
