#pragma once

#include "config/Configuration.hpp"
#include "notice/Notice.hpp"
#include "transport/Client.hpp"
#include "utils/BoundedQueue.hpp"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <thread>

namespace checkend::delivery
{

/**
 * @brief Background sender draining a bounded queue of notices.
 *
 * One thread consumes the queue and calls the Client, applying bounded retries for server and
 * transport failures, an adaptive throttle delay between attempts and a hard cooldown after
 * HTTP 429. enqueue() never blocks; a full queue drops the notice.
 *
 * A Worker starts running on construction and cannot be restarted once stopped.
 */
class Worker
{
public:
    static constexpr int kMaxAttempts = 3;
    static constexpr long long kRetryDelaysMs[kMaxAttempts] = { 100, 200, 400 };
    static constexpr double kThrottleFactor = 1.05;
    static constexpr long long kThrottleSeedMs = 100;
    static constexpr long long kMaxThrottleMs = 100000;
    static constexpr long long kThrottleFloorMs = 10;
    static constexpr long long kDefaultRateLimitMs = 60000;
    static constexpr long long kPollIntervalMs = 100;
    static constexpr long long kRateLimitSliceMs = 1000;
    static constexpr long long kFlushPollMs = 50;
    static constexpr int kDefaultFlushTimeoutMs = 30000;

    Worker(std::shared_ptr<const transport::Client> client, std::size_t max_queue_size, int shutdown_timeout_ms);
    Worker(std::shared_ptr<const transport::Client> client, const Configuration& cfg);
    ~Worker();

    Worker(const Worker&) = delete;
    Worker& operator=(const Worker&) = delete;

    /// False when stopped or when the queue is full; the notice is dropped in both cases.
    bool enqueue(NoticePtr notice);

    /// Waits until the queue is empty or `timeout_ms` elapses. Sends already in flight may still
    /// be running on return. Returns whether the queue drained.
    bool flush(int timeout_ms = kDefaultFlushTimeoutMs);

    /// Lets the sender drain for up to the shutdown grace period, then aborts it. Idempotent.
    void stop();

    bool isRunning() const { return running_.load(); }
    std::size_t queueSize() const { return queue_.size(); }
    bool isRateLimited() const;
    long long currentThrottleDelayMs() const { return throttle_delay_ms_.load(); }

private:
    void run();
    void sendWithRetry(const NoticePtr& notice);
    void increaseThrottle();
    void decreaseThrottle();

    /// Sleeps for `ms` unless aborted first. Returns false when aborted.
    bool sleepFor(long long ms);

    static long long nowMs();

    std::shared_ptr<const transport::Client> client_;
    utils::BoundedQueue<NoticePtr> queue_;
    const int shutdown_timeout_ms_;

    std::atomic<bool> running_{ true };
    std::atomic<bool> abort_{ false };
    std::atomic<long long> throttle_delay_ms_{ 0 };
    std::atomic<long long> rate_limited_until_ms_{ 0 }; // steady clock; 0 = not limited

    std::mutex state_mtx_;
    std::condition_variable state_cv_;
    bool finished_ = false;

    std::mutex stop_mtx_;
    std::thread thread_;
};

} // namespace checkend::delivery
