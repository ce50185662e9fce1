#include <catch2/catch_test_macros.hpp>

#include "delivery/Worker.hpp"
#include "log/LogManager.hpp"
#include "transport/Client.hpp"
#include "../utils/log_capture.hpp"
#include "../utils/mock_http.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

using namespace checkend;
using namespace std::chrono_literals;
using delivery::Worker;
using test_utils::MockResponses;
using test_utils::RecordingHttpTransport;
using test_utils::waitFor;

namespace {

Configuration workerConfig() {
    Configuration cfg;
    cfg.api_key = "test-key";
    cfg.endpoint = "https://example.test";
    return cfg;
}

NoticePtr makeNotice(const std::string& message = "boom") {
    auto n = std::make_shared<Notice>();
    n->error_class = "std::runtime_error";
    n->message = message;
    n->environment = "test";
    return n;
}

// Holds every request until open() is called.
class GateHttpTransport : public RecordingHttpTransport {
public:
    checkend::transport::HttpResponse post(const checkend::transport::HttpRequest& request) override {
        {
            std::unique_lock<std::mutex> lock(m_);
            ++waiting_;
            cv_.notify_all();
            cv_.wait(lock, [this] { return open_; });
        }
        return RecordingHttpTransport::post(request);
    }

    void open() {
        std::lock_guard<std::mutex> lock(m_);
        open_ = true;
        cv_.notify_all();
    }

    bool waitForWaiting(int n) {
        std::unique_lock<std::mutex> lock(m_);
        return cv_.wait_for(lock, 5s, [&] { return waiting_ >= n; });
    }

private:
    std::mutex m_;
    std::condition_variable cv_;
    bool open_ = false;
    int waiting_ = 0;
};

}  // namespace

TEST_CASE("Worker delivers queued notices", "[delivery][worker]") {
    auto http = std::make_shared<RecordingHttpTransport>();
    auto client = std::make_shared<transport::Client>(workerConfig(), http);
    Worker worker(client, 10, 1000);

    REQUIRE(worker.isRunning());
    REQUIRE(worker.enqueue(makeNotice("first")));
    REQUIRE(worker.enqueue(makeNotice("second")));

    REQUIRE(worker.flush(5000));
    REQUIRE(waitFor([&] { return http->requestCount() == 2; }));

    const auto requests = http->requests();
    REQUIRE(requests[0].request.body.find("\"message\":\"first\"") != std::string::npos);
    REQUIRE(requests[1].request.body.find("\"message\":\"second\"") != std::string::npos);
    REQUIRE(worker.currentThrottleDelayMs() == 0);
}

TEST_CASE("Worker queue is bounded", "[delivery][worker]") {
    auto http = std::make_shared<GateHttpTransport>();
    auto client = std::make_shared<transport::Client>(workerConfig(), http);
    constexpr std::size_t kCapacity = 3;
    Worker worker(client, kCapacity, 2000);

    // Park the sender on an in-flight request so nothing drains.
    REQUIRE(worker.enqueue(makeNotice("plug")));
    REQUIRE(http->waitForWaiting(1));

    for (std::size_t i = 0; i < kCapacity; ++i)
        REQUIRE(worker.enqueue(makeNotice()));
    REQUIRE(worker.queueSize() == kCapacity);

    REQUIRE_FALSE(worker.enqueue(makeNotice("overflow")));
    REQUIRE(worker.queueSize() == kCapacity);

    http->open();
    REQUIRE(worker.flush(5000));
    REQUIRE(waitFor([&] { return http->requestCount() == kCapacity + 1; }));
}

TEST_CASE("Worker rejects notices after stop", "[delivery][worker]") {
    auto http = std::make_shared<RecordingHttpTransport>();
    auto client = std::make_shared<transport::Client>(workerConfig(), http);
    Worker worker(client, 10, 1000);

    worker.stop();
    REQUIRE_FALSE(worker.isRunning());
    REQUIRE_FALSE(worker.enqueue(makeNotice()));
    REQUIRE(worker.queueSize() == 0);

    // Idempotent
    worker.stop();
    REQUIRE(http->requestCount() == 0);
}

TEST_CASE("Worker drains the queue on stop", "[delivery][worker]") {
    auto http = std::make_shared<RecordingHttpTransport>();
    auto client = std::make_shared<transport::Client>(workerConfig(), http);
    Worker worker(client, 10, 5000);

    for (int i = 0; i < 5; ++i)
        REQUIRE(worker.enqueue(makeNotice()));
    worker.stop();

    REQUIRE(http->requestCount() == 5);
    REQUIRE(worker.queueSize() == 0);
}

TEST_CASE("Worker retries server errors a bounded number of times", "[delivery][worker]") {
    auto http = std::make_shared<RecordingHttpTransport>();
    http->setDefaultResponse(MockResponses::server_error());
    auto client = std::make_shared<transport::Client>(workerConfig(), http);
    Worker worker(client, 10, 1000);

    REQUIRE(worker.enqueue(makeNotice()));
    REQUIRE(waitFor([&] { return http->requestCount() == 3; }));
    REQUIRE(waitFor([&] { return worker.currentThrottleDelayMs() == 110; }));

    std::this_thread::sleep_for(1000ms);
    REQUIRE(http->requestCount() == 3);
    REQUIRE(worker.queueSize() == 0);

    const auto requests = http->requests();
    REQUIRE(requests[1].at - requests[0].at >= 100ms);
    REQUIRE(requests[2].at - requests[1].at >= 200ms);

    SECTION("Success gradually lowers the throttle") {
        http->setDefaultResponse(MockResponses::created());
        REQUIRE(worker.enqueue(makeNotice()));
        REQUIRE(waitFor([&] { return worker.currentThrottleDelayMs() == 104; }));
    }
}

TEST_CASE("Worker treats transport failures like server errors", "[delivery][worker]") {
    auto http = std::make_shared<RecordingHttpTransport>();
    http->simulateNetworkError("Connection refused");
    auto client = std::make_shared<transport::Client>(workerConfig(), http);
    Worker worker(client, 10, 1000);

    REQUIRE(worker.enqueue(makeNotice()));
    REQUIRE(waitFor([&] { return http->requestCount() == 3; }));
    std::this_thread::sleep_for(800ms);
    REQUIRE(http->requestCount() == 3);
    REQUIRE(worker.currentThrottleDelayMs() > 0);
}

TEST_CASE("Worker drops client errors without retry", "[delivery][worker]") {
    auto http = std::make_shared<RecordingHttpTransport>();
    http->setDefaultResponse(MockResponses::not_found());
    auto client = std::make_shared<transport::Client>(workerConfig(), http);
    Worker worker(client, 10, 1000);

    REQUIRE(worker.enqueue(makeNotice()));
    REQUIRE(waitFor([&] { return http->requestCount() == 1; }));
    std::this_thread::sleep_for(700ms);

    REQUIRE(http->requestCount() == 1);
    REQUIRE(worker.queueSize() == 0);
    REQUIRE(worker.currentThrottleDelayMs() == 0);
}

TEST_CASE("Worker honours the rate limit cooldown", "[delivery][worker]") {
    auto http = std::make_shared<RecordingHttpTransport>();
    http->enqueueResponse(MockResponses::rate_limited("1"));
    auto client = std::make_shared<transport::Client>(workerConfig(), http);
    Worker worker(client, 10, 1000);

    REQUIRE(worker.enqueue(makeNotice("limited")));
    REQUIRE(waitFor([&] { return http->requestCount() == 1; }));
    REQUIRE(waitFor([&] { return worker.isRateLimited(); }, 1000ms));
    REQUIRE(worker.currentThrottleDelayMs() == 100);

    // Re-queued, not dropped
    REQUIRE(waitFor([&] { return http->requestCount() == 2; }, 5000ms));
    const auto requests = http->requests();
    REQUIRE(requests[1].at - requests[0].at >= 1000ms);
    REQUIRE(requests[1].request.body == requests[0].request.body);
    REQUIRE_FALSE(worker.isRateLimited());
}

TEST_CASE("Worker stop is bounded while rate limited", "[delivery][worker]") {
    auto http = std::make_shared<RecordingHttpTransport>();
    http->setDefaultResponse(MockResponses::rate_limited_without_hint());
    auto client = std::make_shared<transport::Client>(workerConfig(), http);
    Worker worker(client, 10, 300);

    REQUIRE(worker.enqueue(makeNotice()));
    REQUIRE(waitFor([&] { return worker.isRateLimited(); }));

    const auto started = std::chrono::steady_clock::now();
    worker.stop();
    REQUIRE(std::chrono::steady_clock::now() - started < 3s);
    REQUIRE(http->requestCount() == 1);
    REQUIRE(worker.queueSize() == 0);
}

TEST_CASE("Worker logs dropped notices", "[delivery][worker][log]") {
    test_utils::LogCapture capture;
    test_utils::ScopedLogTarget target(&capture, plog::debug);

    {
        auto http = std::make_shared<GateHttpTransport>();
        auto client = std::make_shared<transport::Client>(workerConfig(), http);
        Worker worker(client, 1, 1000);

        REQUIRE(worker.enqueue(makeNotice("plug")));
        REQUIRE(http->waitForWaiting(1));
        REQUIRE(worker.enqueue(makeNotice()));
        REQUIRE_FALSE(worker.enqueue(makeNotice()));
        http->open();
    }

    REQUIRE(capture.contains("queue is full", plog::warning));
}

TEST_CASE("Worker keeps a huge Retry-After cooldown", "[delivery][worker]") {
    auto http = std::make_shared<RecordingHttpTransport>();
    http->enqueueResponse(MockResponses::rate_limited("9223372036854775"));
    auto client = std::make_shared<transport::Client>(workerConfig(), http);
    Worker worker(client, 10, 300);

    REQUIRE(worker.enqueue(makeNotice()));
    REQUIRE(waitFor([&] { return worker.isRateLimited(); }));
    std::this_thread::sleep_for(300ms);
    REQUIRE(worker.isRateLimited());
    REQUIRE(http->requestCount() == 1);

    const auto started = std::chrono::steady_clock::now();
    worker.stop();
    REQUIRE(std::chrono::steady_clock::now() - started < 3s);
}

TEST_CASE("Worker delivers every notice it accepted while stopping", "[delivery][worker]") {
    auto http = std::make_shared<RecordingHttpTransport>();
    auto client = std::make_shared<transport::Client>(workerConfig(), http);
    Worker worker(client, 1000, 5000);

    std::atomic<bool> go{ false };
    std::atomic<int> accepted{ 0 };
    std::vector<std::thread> producers;
    for (int i = 0; i < 4; ++i) {
        producers.emplace_back([&] {
            while (!go.load())
                std::this_thread::yield();
            for (int j = 0; j < 50; ++j) {
                if (worker.enqueue(makeNotice()))
                    ++accepted;
            }
        });
    }

    go.store(true);
    std::this_thread::sleep_for(1ms);
    worker.stop();
    for (auto& t : producers)
        t.join();

    REQUIRE(worker.queueSize() == 0);
    REQUIRE(http->requestCount() == static_cast<std::size_t>(accepted.load()));
}

TEST_CASE("Worker drops a rate limited notice when the queue is full", "[delivery][worker][log]") {
    test_utils::LogCapture capture;
    test_utils::ScopedLogTarget target(&capture, plog::debug);

    auto http = std::make_shared<GateHttpTransport>();
    http->enqueueResponse(MockResponses::rate_limited("1"));
    auto client = std::make_shared<transport::Client>(workerConfig(), http);
    Worker worker(client, 1, 1000);

    REQUIRE(worker.enqueue(makeNotice("plug")));
    REQUIRE(http->waitForWaiting(1));
    REQUIRE(worker.enqueue(makeNotice("waiting")));
    http->open();

    REQUIRE(waitFor([&] { return capture.contains("re-queueing", plog::warning); }));
    REQUIRE(worker.isRateLimited());
    REQUIRE(worker.queueSize() == 1);
    worker.stop();
}

TEST_CASE("Worker stop interrupts the retry delay", "[delivery][worker]") {
    auto http = std::make_shared<RecordingHttpTransport>();
    http->setDefaultResponse(MockResponses::server_error());
    auto client = std::make_shared<transport::Client>(workerConfig(), http);
    Worker worker(client, 10, 50);

    REQUIRE(worker.enqueue(makeNotice()));
    REQUIRE(waitFor([&] { return http->requestCount() == 1; }));

    const auto started = std::chrono::steady_clock::now();
    worker.stop();
    REQUIRE(std::chrono::steady_clock::now() - started < 1s);
    REQUIRE(http->requestCount() < 3);
    REQUIRE(worker.queueSize() == 0);
}
