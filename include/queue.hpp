#ifndef QUEUE_HPP
#define QUEUE_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>

namespace camrec {

/**
 * @file queue.hpp
 * @brief Bounded queue shared by the ingest fan-out, writers, and dispatcher lanes.
 */

/**
 * @brief Thread-safe bounded queue used between pipeline stages.
 * @threading Multiple producers and consumers push/pop concurrently.
 * @ownership Queue owns its elements until popped.
 *
 * Producers on the ingest path never block: they use pushDropOldest(), which
 * evicts the oldest element when the queue is full and reports the eviction.
 */
template<typename T>
class ThreadSafeQueue {
public:
    enum class PopResult { Item, Timeout, Stopped };

    /**
     * @brief Construct queue with bounded capacity.
     * @param capacity Maximum number of elements held at once.
     */
    explicit ThreadSafeQueue(size_t capacity = 8);

    /**
     * @brief Push an item, blocking while the queue is full when @p wait is true.
     * @return False when the queue was stopped or is full in non-waiting mode.
     */
    bool push(T item, bool wait = true);

    /**
     * @brief Push without blocking, discarding the oldest element if full.
     * @return True when an older element was discarded to make room.
     */
    bool pushDropOldest(T item);

    /**
     * @brief Pop next item from queue.
     * @param wait Block for data when true; otherwise fail fast on empty queue.
     * @return False after stop() once the queue is drained.
     */
    bool pop(T& item, bool wait = true);

    /**
     * @brief Pop with a bounded wait.
     *
     * Remaining items are still delivered after stop(); Stopped is returned
     * only once the queue is empty.
     */
    template<typename Rep, typename Period>
    PopResult popFor(T& item, const std::chrono::duration<Rep, Period>& timeout);

    bool tryPop(T& item);

    size_t size() const;
    bool empty() const;
    size_t capacity() const { return capacity_; }

    /**
     * @brief Remove all elements without waking producers/consumers.
     */
    void clear();

    /**
     * @brief Stop queue and wake all waiters so they can exit gracefully.
     */
    void stop();
    bool stopped() const { return stopped_.load(); }

private:
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::deque<T> queue_;
    size_t capacity_;
    std::atomic<bool> stopped_;
};

template<typename T>
ThreadSafeQueue<T>::ThreadSafeQueue(size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity), stopped_(false) {}

template<typename T>
bool ThreadSafeQueue<T>::push(T item, bool wait) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (wait) {
        not_full_.wait(lock, [&]{ return stopped_.load() || queue_.size() < capacity_; });
        if (stopped_) return false;
    } else if (stopped_ || queue_.size() >= capacity_) {
        return false;
    }
    queue_.push_back(std::move(item));
    not_empty_.notify_one();
    return true;
}

template<typename T>
bool ThreadSafeQueue<T>::pushDropOldest(T item) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopped_) return false;
    bool dropped = false;
    while (queue_.size() >= capacity_) {
        queue_.pop_front();
        dropped = true;
    }
    queue_.push_back(std::move(item));
    not_empty_.notify_one();
    return dropped;
}

template<typename T>
bool ThreadSafeQueue<T>::pop(T& item, bool wait) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (wait) {
        not_empty_.wait(lock, [&]{ return stopped_.load() || !queue_.empty(); });
        if (stopped_ && queue_.empty()) return false;
    } else if (queue_.empty()) {
        return false;
    }
    item = std::move(queue_.front());
    queue_.pop_front();
    not_full_.notify_one();
    return true;
}

template<typename T>
template<typename Rep, typename Period>
typename ThreadSafeQueue<T>::PopResult
ThreadSafeQueue<T>::popFor(T& item, const std::chrono::duration<Rep, Period>& timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    bool ready = not_empty_.wait_for(lock, timeout,
                                     [&]{ return stopped_.load() || !queue_.empty(); });
    if (!queue_.empty()) {
        item = std::move(queue_.front());
        queue_.pop_front();
        not_full_.notify_one();
        return PopResult::Item;
    }
    if (ready && stopped_) return PopResult::Stopped;
    return PopResult::Timeout;
}

template<typename T>
bool ThreadSafeQueue<T>::tryPop(T& item) {
    return pop(item, false);
}

template<typename T>
size_t ThreadSafeQueue<T>::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

template<typename T>
bool ThreadSafeQueue<T>::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.empty();
}

template<typename T>
void ThreadSafeQueue<T>::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.clear();
}

template<typename T>
void ThreadSafeQueue<T>::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopped_.store(true);
    }
    not_empty_.notify_all();
    not_full_.notify_all();
}

} // namespace camrec

#endif // QUEUE_HPP
