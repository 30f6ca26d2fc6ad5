#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>

namespace beacontrack {

enum QueuePushResult { QUEUE_PUSHED, QUEUE_DROPPED_OLDEST, QUEUE_CLOSED };

// Fixed-capacity FIFO between tasks. A push into a full queue evicts the
// oldest entry so producers never block; pop waits up to a timeout.
template <typename T>
class BoundedQueue {
private:
    mutable std::mutex queueMutex;
    std::condition_variable notEmpty;
    std::deque<T> items;
    size_t capacity;
    bool closed;

public:
    explicit BoundedQueue(size_t capacity) : capacity(capacity > 0 ? capacity : 1), closed(false) {}

    // A closed queue rejects the item.
    QueuePushResult push(T item) {
        QueuePushResult result = QUEUE_PUSHED;
        {
            std::lock_guard<std::mutex> lock(queueMutex);
            if (closed) return QUEUE_CLOSED;
            if (items.size() >= capacity) {
                items.pop_front();
                result = QUEUE_DROPPED_OLDEST;
            }
            items.push_back(std::move(item));
        }
        notEmpty.notify_one();
        return result;
    }

    // False on timeout, or once the queue is closed and drained.
    bool pop(T &out, uint32_t timeoutMs) {
        std::unique_lock<std::mutex> lock(queueMutex);
        notEmpty.wait_for(lock, std::chrono::milliseconds(timeoutMs),
                          [this] { return !items.empty() || closed; });
        if (items.empty()) return false;
        out = std::move(items.front());
        items.pop_front();
        return true;
    }

    bool tryPop(T &out) {
        std::lock_guard<std::mutex> lock(queueMutex);
        if (items.empty()) return false;
        out = std::move(items.front());
        items.pop_front();
        return true;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(queueMutex);
            closed = true;
        }
        notEmpty.notify_all();
    }

    bool isClosed() const {
        std::lock_guard<std::mutex> lock(queueMutex);
        return closed;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(queueMutex);
        return items.size();
    }
};

}  // namespace beacontrack
