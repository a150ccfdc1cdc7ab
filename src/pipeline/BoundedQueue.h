#pragma once
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <queue>

// Thread-safe bounded queue between a producer and a consumer.
// push blocks while full; pop blocks while empty until stop() is called.
template <typename T>
class BoundedQueue {
public:
    explicit BoundedQueue(size_t maxItems = 8) : maxItems(maxItems == 0 ? 1 : maxItems) {}

    /** Returns false if the queue was stopped before the item could be queued. */
    bool push(T item) {
        std::unique_lock<std::mutex> lock(mu);
        cvFull.wait(lock, [&] { return items.size() < maxItems || stopped; });
        if (stopped) return false;
        items.push(std::move(item));
        lock.unlock();
        cvEmpty.notify_one();
        return true;
    }

    bool pop(T& out) {
        std::unique_lock<std::mutex> lock(mu);
        cvEmpty.wait(lock, [&] { return !items.empty() || stopped; });
        if (items.empty()) return false;
        out = std::move(items.front());
        items.pop();
        lock.unlock();
        cvFull.notify_one();
        return true;
    }

    /** Like pop, but gives up after the timeout. */
    template <typename Rep, typename Period>
    bool popFor(T& out, std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(mu);
        if (!cvEmpty.wait_for(lock, timeout, [&] { return !items.empty() || stopped; })) return false;
        if (items.empty()) return false;
        out = std::move(items.front());
        items.pop();
        lock.unlock();
        cvFull.notify_one();
        return true;
    }

    // Items already queued are still drained by pop.
    void stop() {
        {
            std::lock_guard<std::mutex> lock(mu);
            stopped = true;
        }
        cvEmpty.notify_all();
        cvFull.notify_all();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mu);
        return items.size();
    }

    size_t capacity() const { return maxItems; }

private:
    size_t maxItems;
    std::queue<T> items;
    mutable std::mutex mu;
    std::condition_variable cvEmpty;
    std::condition_variable cvFull;
    bool stopped = false;
};
