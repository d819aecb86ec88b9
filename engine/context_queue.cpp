#include "engine/context_queue.hpp"
#include "logger.hpp"

#include <algorithm>

ContextInjectionQueue::ContextInjectionQueue(size_t capacity)
    : capacity_(std::max<size_t>(1, capacity)) {}

void ContextInjectionQueue::push(std::string text) {
    ContextMessage msg{std::move(text), std::chrono::steady_clock::now()};

    bool dropped = false;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        items_.push_back(std::move(msg));
        if (items_.size() > capacity_) {
            items_.pop_front();
            ++evicted_;
            dropped = true;
        }
    }
    if (dropped) LOG_TRACE("Context", "Queue full, evicted oldest entry");
}

std::vector<ContextMessage> ContextInjectionQueue::takeLocked(size_t max) {
    size_t n = std::min(max, items_.size());
    std::vector<ContextMessage> out;
    out.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        out.push_back(std::move(items_.front()));
        items_.pop_front();
    }
    return out;
}

std::vector<ContextMessage> ContextInjectionQueue::drain(size_t max) {
    std::lock_guard<std::mutex> lock(mtx_);
    return takeLocked(max);
}

std::vector<ContextMessage> ContextInjectionQueue::tryDrain(size_t max) {
    std::unique_lock<std::mutex> lock(mtx_, std::try_to_lock);
    if (!lock.owns_lock()) return {};
    return takeLocked(max);
}

size_t ContextInjectionQueue::size() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return items_.size();
}

uint64_t ContextInjectionQueue::evicted() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return evicted_;
}

void ContextInjectionQueue::clear() {
    std::lock_guard<std::mutex> lock(mtx_);
    items_.clear();
}
