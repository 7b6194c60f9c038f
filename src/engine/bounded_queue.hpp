#pragma once
#include <queue>
#include <mutex>
#include <chrono>
#include <stdexcept>
#include <condition_variable>

// Fixed-capacity FIFO shared between threads. Producers block while it is full,
// consumers block while it is empty. Closing wakes everyone: pushes fail from then
// on, pops keep draining what is left.
template <typename T>
class BoundedQueue
{
public:
    explicit BoundedQueue(size_t capacity) : capacity_(capacity)
    {
        if (capacity_ == 0)
        {
            throw std::invalid_argument("BoundedQueue capacity must be greater than zero");
        }
    }

    BoundedQueue(const BoundedQueue &) = delete;
    BoundedQueue &operator=(const BoundedQueue &) = delete;

    // Blocks until there is room. Returns false if the queue was closed.
    bool push(T &&item)
    {
        std::unique_lock<std::mutex> lock(mutex_);
        not_full_.wait(lock, [this]
                       { return closed_ || queue_.size() < capacity_; });
        if (closed_)
            return false;

        queue_.push(std::move(item));
        not_empty_.notify_one();
        return true;
    }

    // Waits up to timeout_ms for room. On false the item is left untouched with the caller.
    bool push(T &&item, int timeout_ms)
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!not_full_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                                [this]
                                { return closed_ || queue_.size() < capacity_; }))
        {
            return false;
        }
        if (closed_)
            return false;

        queue_.push(std::move(item));
        not_empty_.notify_one();
        return true;
    }

    // Waits up to timeout_ms for an item. False on timeout or when closed and empty.
    bool pop(T &item, int timeout_ms = 100)
    {
        std::unique_lock<std::mutex> lock(mutex_);

        if (!not_empty_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                                 [this]
                                 { return closed_ || !queue_.empty(); }))
        {
            return false;
        }
        if (queue_.empty())
            return false;

        item = std::move(queue_.front());
        queue_.pop();
        not_full_.notify_one();
        return true;
    }

    void close()
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    bool isClosed() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    // Closed and nothing left to pop
    bool isDrained() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_ && queue_.empty();
    }

    size_t size() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    size_t capacity() const { return capacity_; }

private:
    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::queue<T> queue_;
    bool closed_ = false;
};
