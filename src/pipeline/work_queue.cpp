#include "pipeline/work_queue.hpp"

#include <utility>

void WorkQueue::push(WorkItem item) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        items_.push_back(std::move(item));
    }
    cv_.notify_one();
}

WorkItem WorkQueue::pop() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return !items_.empty(); });

    WorkItem item = std::move(items_.front());
    items_.pop_front();
    return item;
}

size_t WorkQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
}
