#pragma once

#include <toolhost/http/i_http_client.hpp>

#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace toolhost {
namespace testing {

// ---------------------------------------------------------------------------
// MockHttpClient: hand-written mock for offline unit testing.
//
// Usage:
//   MockHttpClient mock;
//   mock.Enqueue(Result<HttpResponse, Error>::Ok({200, {}, "hello"}));
//   auto result = mock.Send({"GET", "http://example.test/"});
//   CHECK(mock.CallCount() == 1);
//   CHECK(mock.Calls()[0].url == "http://example.test/");
//
// Responses are consumed FIFO. If the queue is empty when Send() is called,
// the mock returns a descriptive error rather than crashing.
// ---------------------------------------------------------------------------
class MockHttpClient : public IHttpClient {
public:
    MockHttpClient() = default;

    void Enqueue(Result<HttpResponse, Error> response) {
        std::lock_guard<std::mutex> lock(mutex_);
        responses_.push_back(std::move(response));
    }

    Result<HttpResponse, Error> Send(const HttpRequest& request) override {
        std::lock_guard<std::mutex> lock(mutex_);
        calls_.push_back(request);
        if (responses_.empty()) {
            return Result<HttpResponse, Error>::Err(Error{
                "MockHttpClient", request.url, std::nullopt,
                "no canned response queued", ErrorCategory::Internal});
        }
        auto response = std::move(responses_.front());
        responses_.pop_front();
        return response;
    }

    [[nodiscard]] std::size_t CallCount() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_.size();
    }

    [[nodiscard]] std::vector<HttpRequest> Calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return calls_;
    }

private:
    mutable std::mutex mutex_;
    std::deque<Result<HttpResponse, Error>> responses_;
    std::vector<HttpRequest> calls_;
};

} // namespace testing
} // namespace toolhost
