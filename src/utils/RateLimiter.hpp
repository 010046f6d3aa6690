#pragma once
#include <mutex>
#include <string>
#include <unordered_map>
#include "../interfaces/IClock.hpp"
#include "../interfaces/IRateLimiter.hpp"

namespace Cadenza {
    // One token bucket per host, created full on first use. Burst size equals
    // the per-second rate (at least one token).
    class RateLimiter : public IRateLimiter {
    public:
        RateLimiter(double rate_per_second, const IClock& clock);
        bool TryAcquire(const std::string& host) override;

        // Hosts currently holding a bucket.
        size_t TrackedHosts() const;

    private:
        struct Bucket {
            double allowance;
            IClock::TimePoint last_check;
        };

        const double rate;
        const double capacity;
        const IClock& clock;
        mutable std::mutex mutex;
        std::unordered_map<std::string, Bucket> buckets;
    };
}
