#pragma once
#include <chrono>

namespace Cadenza {

// Time source for TTLs, cooldowns and backoff. Tests substitute a manual clock.
class IClock {
public:
    using TimePoint = std::chrono::steady_clock::time_point;
    virtual ~IClock() = default;
    virtual TimePoint Now() const = 0;
};

}

