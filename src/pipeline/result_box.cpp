#include "pipeline/result_box.hpp"

#include <utility>

void ResultBox::publish(TranscriptEntry entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    log_.push_back(std::move(entry));
}

std::string ResultBox::takeLast() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (readCursor_ >= log_.size()) return {};

    readCursor_ = log_.size();
    return log_.back().text;
}

std::vector<TranscriptEntry> ResultBox::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return log_;
}

std::vector<std::string> ResultBox::texts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> out;
    out.reserve(log_.size());
    for (const auto& e : log_) out.push_back(e.text);
    return out;
}

size_t ResultBox::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return log_.size();
}
