#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <utility>

namespace checkend::utils
{

// Fixed-capacity FIFO shared by any number of producers and consumers.
// Producers never block: tryPush() fails once capacity is reached or the queue is closed.
template <typename T>
class BoundedQueue
{
public:
    explicit BoundedQueue(std::size_t capacity)
        : capacity_(capacity)
    {
    }

    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;

    bool tryPush(T item)
    {
        {
            std::lock_guard<std::mutex> lock(m_);
            if (closed_ || q_.size() >= capacity_)
                return false;
            q_.push_back(std::move(item));
        }
        not_empty_.notify_one();
        return true;
    }

    bool tryPop(T& out)
    {
        std::lock_guard<std::mutex> lock(m_);
        if (q_.empty())
            return false;
        out = std::move(q_.front());
        q_.pop_front();
        return true;
    }

    // Waits up to `timeout` for an item.
    template <typename Rep, typename Period>
    bool popFor(T& out, std::chrono::duration<Rep, Period> timeout)
    {
        std::unique_lock<std::mutex> lock(m_);
        if (!not_empty_.wait_for(lock, timeout, [this] { return !q_.empty(); }))
            return false;
        out = std::move(q_.front());
        q_.pop_front();
        return true;
    }

    bool empty() const
    {
        std::lock_guard<std::mutex> lock(m_);
        return q_.empty();
    }

    std::size_t size() const
    {
        std::lock_guard<std::mutex> lock(m_);
        return q_.size();
    }

    std::size_t capacity() const { return capacity_; }

    // Rejects all further pushes. Items already queued can still be popped.
    void close()
    {
        std::lock_guard<std::mutex> lock(m_);
        closed_ = true;
    }

    bool isClosed() const
    {
        std::lock_guard<std::mutex> lock(m_);
        return closed_;
    }

    // Discards everything queued; returns how many items were dropped.
    std::size_t clear()
    {
        std::lock_guard<std::mutex> lock(m_);
        const std::size_t dropped = q_.size();
        q_.clear();
        return dropped;
    }

private:
    mutable std::mutex m_;
    std::condition_variable not_empty_;
    std::deque<T> q_;
    const std::size_t capacity_;
    bool closed_ = false;
};

} // namespace checkend::utils
