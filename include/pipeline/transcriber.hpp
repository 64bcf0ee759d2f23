#ifndef TRANSCRIBER_HPP
#define TRANSCRIBER_HPP

#include "pipeline/result_box.hpp"
#include "pipeline/work_queue.hpp"
#include "stt/speech_engine.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <string>
#include <thread>

// Single worker draining the WorkQueue into the ResultBox.
// Exits on the shutdown item or once `listening` is cleared.
class Transcriber {
public:
    struct Config {
        std::string language = "en";
        int beamSize = 5;
        bool vadFilter = true;

        // Delay after each segment
        std::chrono::milliseconds pacing{250};
    };

    enum class State {
        Idle,
        Running,
        Draining,   // shutdown item seen
        Stopped,
    };

    Transcriber(Config config, WorkQueue& queue, ResultBox& results,
                SpeechEngine& engine, const std::atomic<bool>& listening);
    ~Transcriber();

    Transcriber(const Transcriber&) = delete;
    Transcriber& operator=(const Transcriber&) = delete;

    void start();

    // Waits up to timeout for the worker to reach Stopped.
    bool waitFor(std::chrono::milliseconds timeout);
    void join();

    State state() const;
    size_t segmentsProcessed() const { return processed_.load(); }
    size_t segmentsFailed() const { return failed_.load(); }

    static const char* stateName(State s);

private:
    void run();
    void process(const AudioSegment& segment);
    void setState(State s);

    Config config_;
    WorkQueue& queue_;
    ResultBox& results_;
    SpeechEngine& engine_;
    const std::atomic<bool>& listening_;

    std::thread thread_;
    std::atomic<size_t> processed_{0};
    std::atomic<size_t> failed_{0};

    mutable std::mutex state_mutex_;
    std::condition_variable state_cv_;
    State state_ = State::Idle;
};

#endif
