#include "Worker.hpp"

#include "log/LogManager.hpp"

#include <algorithm>
#include <chrono>
#include <limits>

namespace checkend::delivery
{

Worker::Worker(std::shared_ptr<const transport::Client> client, std::size_t max_queue_size, int shutdown_timeout_ms)
    : client_(std::move(client))
    , queue_(max_queue_size)
    , shutdown_timeout_ms_(shutdown_timeout_ms)
{
    thread_ = std::thread([this] { run(); });
}

Worker::Worker(std::shared_ptr<const transport::Client> client, const Configuration& cfg)
    : Worker(std::move(client), cfg.max_queue_size, cfg.shutdown_timeout_ms)
{
}

Worker::~Worker() { stop(); }

long long Worker::nowMs()
{
    using namespace std::chrono;
    return duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count();
}

bool Worker::enqueue(NoticePtr notice)
{
    if (!notice || !running_.load())
        return false;

    if (!queue_.tryPush(std::move(notice)))
    {
        // Closed means stop() won the race with this caller.
        if (queue_.isClosed())
            return false;
        CHECKEND_LOG_WARN << "Notice queue is full (" << queue_.capacity() << "), dropping notice";
        return false;
    }
    return true;
}

bool Worker::flush(int timeout_ms)
{
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(std::max(timeout_ms, 0));
    while (!queue_.empty())
    {
        if (std::chrono::steady_clock::now() >= deadline)
        {
            CHECKEND_LOG_WARN << "Flush timed out with " << queue_.size() << " notice(s) pending";
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(kFlushPollMs));
    }
    return true;
}

void Worker::stop()
{
    std::lock_guard<std::mutex> guard(stop_mtx_);
    running_.store(false);
    queue_.close();
    if (!thread_.joinable())
        return;

    {
        std::unique_lock<std::mutex> lock(state_mtx_);
        const bool drained = state_cv_.wait_for(lock, std::chrono::milliseconds(std::max(shutdown_timeout_ms_, 0)),
                                                [this] { return finished_; });
        if (!drained)
        {
            abort_.store(true);
            CHECKEND_LOG_WARN << "Worker did not drain within " << shutdown_timeout_ms_ << "ms, aborting";
        }
    }
    state_cv_.notify_all();
    thread_.join();

    if (const std::size_t dropped = queue_.clear())
        CHECKEND_LOG_WARN << "Dropped " << dropped << " undelivered notice(s) on shutdown";
    CHECKEND_LOG_DEBUG << "Worker stopped";
}

bool Worker::isRateLimited() const
{
    const long long until = rate_limited_until_ms_.load();
    return until != 0 && nowMs() < until;
}

bool Worker::sleepFor(long long ms)
{
    if (ms <= 0)
        return !abort_.load();
    std::unique_lock<std::mutex> lock(state_mtx_);
    return !state_cv_.wait_for(lock, std::chrono::milliseconds(ms), [this] { return abort_.load(); });
}

void Worker::run()
{
    while (!abort_.load())
    {
        // Closed queues take no more pushes, so empty is final.
        if (queue_.isClosed() && queue_.empty())
            break;

        long long until = rate_limited_until_ms_.load();
        if (until != 0)
        {
            const long long remaining = until - nowMs();
            if (remaining > 0)
            {
                sleepFor(std::min(remaining, kRateLimitSliceMs));
                continue;
            }
            if (rate_limited_until_ms_.compare_exchange_strong(until, 0))
                CHECKEND_LOG_INFO << "Rate limit cooldown over, resuming delivery";
        }

        const long long throttle = throttle_delay_ms_.load();
        if (throttle > 0 && !sleepFor(throttle))
            break;

        NoticePtr notice;
        if (queue_.popFor(notice, std::chrono::milliseconds(kPollIntervalMs)))
            sendWithRetry(notice);
    }

    {
        std::lock_guard<std::mutex> lock(state_mtx_);
        finished_ = true;
    }
    state_cv_.notify_all();
}

void Worker::sendWithRetry(const NoticePtr& notice)
{
    for (int attempt = 0; attempt < kMaxAttempts; ++attempt)
    {
        if (abort_.load())
            return;

        const transport::Response response = client_->send(*notice, &abort_);

        if (response.isSuccess())
        {
            decreaseThrottle();
            CHECKEND_LOG_DEBUG << "Notice delivered: " << notice->error_class;
            return;
        }

        if (response.isRateLimited())
        {
            const long long cooldown = response.retryDelayFor(kDefaultRateLimitMs);
            const long long now = nowMs();
            rate_limited_until_ms_.store(cooldown > std::numeric_limits<long long>::max() - now
                                             ? std::numeric_limits<long long>::max()
                                             : now + cooldown);
            increaseThrottle();
            CHECKEND_LOG_WARN << "Rate limited by collector, pausing for " << cooldown << "ms";
            // Back of the queue; the cooldown in run() paces the next try.
            if (!queue_.tryPush(notice))
            {
                if (queue_.isClosed())
                    CHECKEND_LOG_WARN << "Worker stopping, dropping rate limited notice";
                else
                    CHECKEND_LOG_WARN << "Queue full while re-queueing rate limited notice, dropping it";
            }
            return;
        }

        if (response.isClientError())
        {
            CHECKEND_LOG_WARN << "Notice rejected, not retrying: " << transport::describe(response);
            return;
        }

        increaseThrottle();
        if (attempt + 1 < kMaxAttempts)
        {
            CHECKEND_LOG_DEBUG << "Attempt " << (attempt + 1) << " failed (" << transport::describe(response)
                               << "), retrying";
            if (!sleepFor(kRetryDelaysMs[attempt]))
                return;
        }
        else
        {
            CHECKEND_LOG_ERROR << "Giving up on notice after " << kMaxAttempts
                               << " attempts: " << transport::describe(response);
        }
    }
}

void Worker::increaseThrottle()
{
    long long current = throttle_delay_ms_.load();
    long long next;
    do
    {
        next = current == 0 ? kThrottleSeedMs
                            : std::min(static_cast<long long>(static_cast<double>(current) * kThrottleFactor),
                                       kMaxThrottleMs);
    } while (!throttle_delay_ms_.compare_exchange_weak(current, next));
}

void Worker::decreaseThrottle()
{
    long long current = throttle_delay_ms_.load();
    long long next;
    do
    {
        if (current == 0)
            return;
        next = static_cast<long long>(static_cast<double>(current) / kThrottleFactor);
        if (next < kThrottleFloorMs)
            next = 0;
    } while (!throttle_delay_ms_.compare_exchange_weak(current, next));
}

} // namespace checkend::delivery
