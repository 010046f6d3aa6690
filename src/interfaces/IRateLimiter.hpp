#pragma once
#include <string>

namespace Cadenza {

// Throttles outbound scraping. Each host draws from its own allowance.
class IRateLimiter {
public:
    virtual ~IRateLimiter() = default;
    virtual bool TryAcquire(const std::string& host) = 0;
};

}
