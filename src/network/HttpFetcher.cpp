#include "HttpFetcher.hpp"
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <curl/curl.h>
#include <algorithm>
#include <future>
#include <stdexcept>
#include <vector>
#include "../../config/Config.hpp"
#include "../utils/Logger.hpp"

namespace {

// Context for a single cURL easy handle transfer
struct TransferContext {
    std::string buffer;
    size_t max_bytes = 0;
    bool truncated = false;
    Cadenza::IHttpFetcher::Callback callback;
    curl_slist* headers = nullptr;
    char error_buffer[CURL_ERROR_SIZE] = {0};

    ~TransferContext() {
        if (headers) curl_slist_free_all(headers);
    }
};

size_t WriteCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    const size_t chunk = size * nmemb;
    auto* ctx = static_cast<TransferContext*>(userp);
    if (!ctx) return 0;

    size_t current_size = ctx->buffer.size();
    if (current_size >= ctx->max_bytes) {
        ctx->truncated = true;
        return chunk; // Still need to "receive" it to complete the transfer
    }

    size_t remaining_space = ctx->max_bytes - current_size;
    size_t to_copy = std::min(chunk, remaining_space);

    if (to_copy > 0) {
        try {
            ctx->buffer.append(static_cast<char*>(contents), to_copy);
        } catch (const std::bad_alloc&) {
            return 0; // Aborts the transfer with CURLE_WRITE_ERROR
        }
    }

    if (to_copy < chunk) {
        ctx->truncated = true;
    }

    return chunk;
}

// Helper to create and configure a cURL easy handle
CURL* CreateEasyHandle(const Cadenza::HttpRequest& req, TransferContext* transfer_ctx) {
    CURL* curl = curl_easy_init();
    if (!curl) return nullptr;

    const auto& config = Cadenza::Config::GetInstance();
    long timeout_ms = req.timeout_ms > 0 ? req.timeout_ms : config.http_timeout_ms;

    curl_easy_setopt(curl, CURLOPT_URL, req.url.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, transfer_ctx);
    curl_easy_setopt(curl, CURLOPT_USERAGENT, config.http_user_agent.c_str());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, config.http_max_redirects);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeout_ms);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, std::min(timeout_ms, 5000L));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_ACCEPT_ENCODING, "gzip, deflate");
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, transfer_ctx->error_buffer);
    curl_easy_setopt(curl, CURLOPT_PRIVATE, transfer_ctx);

    long allowed_protocols = CURLPROTO_HTTP | CURLPROTO_HTTPS;
    curl_easy_setopt(curl, CURLOPT_PROTOCOLS, allowed_protocols);
    curl_easy_setopt(curl, CURLOPT_REDIR_PROTOCOLS, allowed_protocols);

    for (const auto& h : req.headers) {
        transfer_ctx->headers = curl_slist_append(transfer_ctx->headers, h.c_str());
    }
    if (transfer_ctx->headers) {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, transfer_ctx->headers);
    }

    if (req.use_range && transfer_ctx->max_bytes > 0) {
        std::string range = "0-" + std::to_string(transfer_ctx->max_bytes - 1);
        curl_easy_setopt(curl, CURLOPT_RANGE, range.c_str());
    }

    return curl;
}

void InvokeCallback(TransferContext* ctx, Cadenza::FetchResult result) {
    if (!ctx->callback) return;
    try {
        ctx->callback(std::move(result));
    } catch (const std::exception& e) {
        Cadenza::Logger::Log(Cadenza::LogLevel::Error, "Exception in fetch callback: " + std::string(e.what()));
    }
}

} // anonymous namespace

namespace Cadenza {

HttpFetcher::HttpFetcher() {
    multi_handle_ = curl_multi_init();
    if (!multi_handle_) {
        throw std::runtime_error("Failed to initialize cURL multi handle");
    }
    worker_thread_ = std::thread(&HttpFetcher::Run, this);
}

HttpFetcher::~HttpFetcher() {
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        stop_ = true;
    }
    cv_.notify_one();
    if (worker_thread_.joinable()) {
        worker_thread_.join();
    }
    if (multi_handle_) {
        curl_multi_cleanup(multi_handle_);
    }
}

void HttpFetcher::Fetch(HttpRequest request, Callback cb) {
    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        if (stop_) {
            FetchResult result;
            result.error = "fetcher is shutting down";
            lock.unlock();
            if (cb) cb(std::move(result));
            return;
        }
        pending_requests_.push_back({std::move(request), std::move(cb)});
    }
    cv_.notify_one();
    if (multi_handle_) {
        curl_multi_wakeup(multi_handle_);
    }
}

FetchResult HttpFetcher::FetchSync(const HttpRequest& request) {
    auto promise = std::make_shared<std::promise<FetchResult>>();
    auto future = promise->get_future();
    Fetch(request, [promise](FetchResult result) {
        promise->set_value(std::move(result));
    });
    return future.get();
}

void HttpFetcher::FailActiveTransfers(const std::string& reason) {
    for (void* handle : active_handles_) {
        CURL* easy_handle = static_cast<CURL*>(handle);
        TransferContext* transfer_ctx = nullptr;
        curl_easy_getinfo(easy_handle, CURLINFO_PRIVATE, &transfer_ctx);
        curl_multi_remove_handle(multi_handle_, easy_handle);
        curl_easy_cleanup(easy_handle);
        if (transfer_ctx) {
            FetchResult result;
            result.error = reason;
            InvokeCallback(transfer_ctx, std::move(result));
            delete transfer_ctx;
        }
    }
    active_handles_.clear();
}

void HttpFetcher::Run() {
    Logger::Log(LogLevel::Debug, "HttpFetcher worker thread started.");
    const size_t default_max_bytes = Config::GetInstance().max_body_bytes;
    int still_running = 0;

    for (;;) {
        std::vector<Request> current_requests;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            cv_.wait(lock, [this, &still_running] { return stop_ || !pending_requests_.empty() || still_running > 0; });
            if (stop_) {
                current_requests.swap(pending_requests_);
                lock.unlock();
                for (auto& req : current_requests) {
                    FetchResult result;
                    result.error = "fetcher is shutting down";
                    TransferContext ctx;
                    ctx.callback = std::move(req.callback);
                    InvokeCallback(&ctx, std::move(result));
                }
                break;
            }
            std::swap(current_requests, pending_requests_);
        }

        for (auto& req : current_requests) {
            auto* transfer_ctx = new TransferContext();
            transfer_ctx->max_bytes = req.request.max_bytes > 0 ? req.request.max_bytes : default_max_bytes;
            transfer_ctx->callback = std::move(req.callback);
            CURL* easy_handle = CreateEasyHandle(req.request, transfer_ctx);
            if (easy_handle) {
                curl_multi_add_handle(multi_handle_, easy_handle);
                active_handles_.push_back(easy_handle);
                Logger::Log(LogLevel::Debug, "http", "Added easy handle for URL: " + req.request.url);
            } else {
                Logger::Log(LogLevel::Error, "http", "Failed to create cURL easy handle for: " + req.request.url);
                FetchResult result;
                result.error = "could not create transfer";
                InvokeCallback(transfer_ctx, std::move(result));
                delete transfer_ctx;
            }
        }

        curl_multi_perform(multi_handle_, &still_running);

        int msgs_in_queue;
        CURLMsg* msg;
        while ((msg = curl_multi_info_read(multi_handle_, &msgs_in_queue))) {
            if (msg->msg != CURLMSG_DONE) continue;
            CURL* easy_handle = msg->easy_handle;
            TransferContext* transfer_ctx = nullptr;
            curl_easy_getinfo(easy_handle, CURLINFO_PRIVATE, &transfer_ctx);

            FetchResult result;
            result.content = std::move(transfer_ctx->buffer);
            result.truncated = transfer_ctx->truncated;

            if (msg->data.result == CURLE_OK) {
                curl_easy_getinfo(easy_handle, CURLINFO_RESPONSE_CODE, &result.status_code);
                char* eff_url = nullptr;
                curl_easy_getinfo(easy_handle, CURLINFO_EFFECTIVE_URL, &eff_url);
                if (eff_url) result.effective_url = eff_url;
                char* content_type = nullptr;
                curl_easy_getinfo(easy_handle, CURLINFO_CONTENT_TYPE, &content_type);
                if (content_type) result.content_type = content_type;
            } else {
                result.timed_out = msg->data.result == CURLE_OPERATION_TIMEDOUT;
                result.error = transfer_ctx->error_buffer;
                if (result.error.empty()) {
                    result.error = curl_easy_strerror(msg->data.result);
                }
            }

            curl_multi_remove_handle(multi_handle_, easy_handle);
            curl_easy_cleanup(easy_handle);
            active_handles_.erase(std::remove(active_handles_.begin(), active_handles_.end(), easy_handle), active_handles_.end());

            InvokeCallback(transfer_ctx, std::move(result));
            delete transfer_ctx;
        }

        if (still_running > 0) {
            curl_multi_poll(multi_handle_, nullptr, 0, 1000, nullptr);
        }
    }

    FailActiveTransfers("fetcher is shutting down");
    Logger::Log(LogLevel::Debug, "HttpFetcher worker thread stopped.");
}

}
