#ifndef WORK_QUEUE_HPP
#define WORK_QUEUE_HPP

#include "audio/audio_segment.hpp"

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <utility>

struct WorkItem {
    enum class Kind { Segment, Shutdown };

    Kind kind = Kind::Segment;
    AudioSegment segment;

    static WorkItem shutdown() {
        WorkItem item;
        item.kind = Kind::Shutdown;
        return item;
    }

    static WorkItem of(AudioSegment segment) {
        WorkItem item;
        item.segment = std::move(segment);
        return item;
    }

    bool isShutdown() const { return kind == Kind::Shutdown; }
};

// Unbounded FIFO between the capture callback and the transcriber.
// push() never blocks on capacity; pop() blocks until an item is available.
class WorkQueue {
public:
    WorkQueue() = default;

    WorkQueue(const WorkQueue&) = delete;
    WorkQueue& operator=(const WorkQueue&) = delete;

    void push(WorkItem item);
    WorkItem pop();

    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<WorkItem> items_;
};

#endif
