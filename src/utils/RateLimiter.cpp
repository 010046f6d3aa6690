#include "RateLimiter.hpp"
#include <algorithm>

namespace Cadenza {

RateLimiter::RateLimiter(double rate_per_second, const IClock& clock)
    : rate(std::max(0.0, rate_per_second)), capacity(std::max(1.0, rate_per_second)), clock(clock) {}

bool RateLimiter::TryAcquire(const std::string& host) {
    std::lock_guard<std::mutex> lock(mutex);
    auto now = clock.Now();
    auto it = buckets.find(host);
    if (it == buckets.end()) {
        it = buckets.emplace(host, Bucket{capacity, now}).first;
    }

    Bucket& bucket = it->second;
    double time_passed = std::chrono::duration<double>(now - bucket.last_check).count();
    bucket.last_check = now;
    bucket.allowance = std::min(capacity, bucket.allowance + time_passed * rate);

    if (bucket.allowance >= 1.0) {
        bucket.allowance -= 1.0;
        return true;
    }
    return false;
}

size_t RateLimiter::TrackedHosts() const {
    std::lock_guard<std::mutex> lock(mutex);
    return buckets.size();
}

}
