#include "mock_http.hpp"

#include <thread>

namespace test_utils {

checkend::transport::HttpResponse RecordingHttpTransport::post(const checkend::transport::HttpRequest& request) {
    MockResponse mock;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        requests_.push_back({ request, std::chrono::steady_clock::now() });
        if (simulate_error_) {
            mock.has_error = true;
            mock.error_message = error_message_;
        } else if (!scripted_.empty()) {
            mock = scripted_.front();
            scripted_.pop_front();
        } else {
            mock = default_response_;
        }
    }

    checkend::transport::HttpResponse hr;
    if (mock.has_error) {
        hr.error = mock.error_message.empty() ? "network error" : mock.error_message;
        return hr;
    }
    hr.status_code = mock.status_code;
    hr.text = mock.body;
    hr.headers = mock.headers;
    return hr;
}

void RecordingHttpTransport::enqueueResponse(const MockResponse& response) {
    std::lock_guard<std::mutex> lock(mtx_);
    scripted_.push_back(response);
}

void RecordingHttpTransport::setDefaultResponse(const MockResponse& response) {
    std::lock_guard<std::mutex> lock(mtx_);
    default_response_ = response;
}

void RecordingHttpTransport::simulateNetworkError(const std::string& error_msg) {
    std::lock_guard<std::mutex> lock(mtx_);
    simulate_error_ = true;
    error_message_ = error_msg;
}

std::vector<RecordedRequest> RecordingHttpTransport::requests() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return requests_;
}

std::size_t RecordingHttpTransport::requestCount() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return requests_.size();
}

void RecordingHttpTransport::clear() {
    std::lock_guard<std::mutex> lock(mtx_);
    scripted_.clear();
    requests_.clear();
    simulate_error_ = false;
    error_message_.clear();
    default_response_ = MockResponses::created();
}

MockResponse MockResponses::created() {
    MockResponse response;
    response.status_code = 201;
    response.body = R"({"id":123})";
    return response;
}

MockResponse MockResponses::rate_limited(const std::string& retry_after) {
    MockResponse response;
    response.status_code = 429;
    response.body = R"({"error":"rate limited"})";
    response.headers.push_back({ "Retry-After", retry_after });
    return response;
}

MockResponse MockResponses::rate_limited_without_hint() {
    MockResponse response;
    response.status_code = 429;
    response.body = R"({"error":"rate limited"})";
    return response;
}

MockResponse MockResponses::server_error() {
    MockResponse response;
    response.status_code = 500;
    response.body = "Internal Server Error";
    return response;
}

MockResponse MockResponses::not_found() {
    MockResponse response;
    response.status_code = 404;
    response.body = "Not Found";
    return response;
}

MockResponse MockResponses::unauthorized() {
    MockResponse response;
    response.status_code = 401;
    response.body = R"({"error":"invalid ingestion key"})";
    return response;
}

MockResponse MockResponses::network_error() {
    MockResponse response;
    response.has_error = true;
    response.error_message = "Couldn't connect to server";
    return response;
}

bool waitFor(const std::function<bool()>& predicate, std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!predicate()) {
        if (std::chrono::steady_clock::now() >= deadline)
            return predicate();
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return true;
}

}  // namespace test_utils
