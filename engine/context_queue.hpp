#pragma once
#include <chrono>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

struct ContextMessage {
    std::string text;
    std::chrono::steady_clock::time_point enqueued{};
};

// ------------------------------------------------------------
// ContextInjectionQueue
// Bounded side channel for advisory text (persona prompt, history, host
// hints). push() never waits for a consumer and never fails: at capacity
// the oldest entry is evicted. The audio loop drains with tryDrain(), which
// gives up instead of waiting when a producer holds the lock.
// ------------------------------------------------------------
class ContextInjectionQueue {
public:
    explicit ContextInjectionQueue(size_t capacity);

    void push(std::string text);

    // Up to max entries, oldest first.
    std::vector<ContextMessage> drain(size_t max);
    std::vector<ContextMessage> tryDrain(size_t max);

    size_t size() const;
    size_t capacity() const { return capacity_; }
    uint64_t evicted() const;
    void clear();

private:
    std::vector<ContextMessage> takeLocked(size_t max);

    const size_t capacity_;
    mutable std::mutex mtx_;
    std::deque<ContextMessage> items_;
    uint64_t evicted_ = 0;
};
