#pragma once
#include <string>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>
#include <condition_variable>
#include "../interfaces/IHttpFetcher.hpp"

// Forward declare CURLM
typedef void CURLM;

namespace Cadenza {

// All transfers share one curl multi handle driven by a single worker thread.
// Callbacks run on that worker thread and must not block on another fetch.
class HttpFetcher : public IHttpFetcher {
public:
    HttpFetcher();
    ~HttpFetcher() override;

    // Non-copyable
    HttpFetcher(const HttpFetcher&) = delete;
    HttpFetcher& operator=(const HttpFetcher&) = delete;

    void Fetch(HttpRequest request, Callback cb) override;
    FetchResult FetchSync(const HttpRequest& request) override;

private:
    void Run();
    void FailActiveTransfers(const std::string& reason);

    CURLM* multi_handle_ = nullptr;
    std::thread worker_thread_;
    std::mutex queue_mutex_;
    std::condition_variable cv_;
    bool stop_ = false;

    struct Request {
        HttpRequest request;
        Callback callback;
    };
    std::vector<Request> pending_requests_;
    std::vector<void*> active_handles_; // CURL* owned by the worker thread
};

}
