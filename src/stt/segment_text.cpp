#include "stt/segment_text.hpp"

#include <cctype>
#include <utility>

std::string trimSegmentText(const std::string& s) {
    size_t a = 0, b = s.size();
    while (a < b && std::isspace((unsigned char)s[a])) a++;
    while (b > a && std::isspace((unsigned char)s[b - 1])) b--;
    return s.substr(a, b - a);
}

bool isBlankSegment(const std::string& trimmed) {
    return trimmed.empty() || trimmed == "[BLANK_AUDIO]";
}

bool makeTranscriptEntry(const char* raw, int64_t t0, int64_t t1, double offsetSeconds,
                         TranscriptEntry& out) {
    std::string text = trimSegmentText(raw ? raw : "");
    if (isBlankSegment(text)) return false;

    out.start = offsetSeconds + t0 * 0.01;
    out.end = offsetSeconds + t1 * 0.01;
    out.text = std::move(text);
    return true;
}
