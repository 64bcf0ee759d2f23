#ifndef RESULT_BOX_HPP
#define RESULT_BOX_HPP

#include "stt/speech_engine.hpp"

#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

// Append-only transcript plus a read cursor for the single polling consumer.
// takeLast() hands out the newest entry once; entries published between two
// reads are still in the transcript but only the newest is delivered.
class ResultBox {
public:
    ResultBox() = default;

    ResultBox(const ResultBox&) = delete;
    ResultBox& operator=(const ResultBox&) = delete;

    void publish(TranscriptEntry entry);

    // Newest unread text, or empty if nothing was published since the last call.
    std::string takeLast();

    std::vector<TranscriptEntry> snapshot() const;
    std::vector<std::string> texts() const;
    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::vector<TranscriptEntry> log_;
    size_t readCursor_ = 0;
};

#endif
