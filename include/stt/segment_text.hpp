#ifndef SEGMENT_TEXT_HPP
#define SEGMENT_TEXT_HPP

#include "stt/speech_engine.hpp"

#include <cstdint>
#include <string>

std::string trimSegmentText(const std::string& s);

// Empty text and whisper's "[BLANK_AUDIO]" marker
bool isBlankSegment(const std::string& trimmed);

// Builds an entry from decoder output. t0/t1 are in 10 ms units, relative to
// the decoded slice that started `offsetSeconds` into the segment.
// Returns false when the text is blank and the entry should be skipped.
bool makeTranscriptEntry(const char* raw, int64_t t0, int64_t t1, double offsetSeconds,
                         TranscriptEntry& out);

#endif
