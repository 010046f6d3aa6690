#pragma once
#include <string>
#include <vector>
#include <functional>

namespace Cadenza {

struct HttpRequest {
    std::string url;
    std::vector<std::string> headers; // "Name: value"
    size_t max_bytes = 0;             // 0 = use configured ceiling
    bool use_range = false;
    long timeout_ms = 0;              // 0 = use configured default
};

struct FetchResult {
    std::string content;
    long status_code = 0;
    std::string error;
    std::string effective_url;
    std::string content_type;
    bool truncated = false;
    bool timed_out = false;
};

class IHttpFetcher {
public:
    using Callback = std::function<void(FetchResult)>;
    virtual ~IHttpFetcher() = default;
    virtual void Fetch(HttpRequest request, Callback cb) = 0;
    // Blocks until the transfer completes or fails.
    virtual FetchResult FetchSync(const HttpRequest& request) = 0;
};

}

