#pragma once
#include "../interfaces/IClock.hpp"

namespace Cadenza {
    class SteadyClock : public IClock {
    public:
        TimePoint Now() const override { return std::chrono::steady_clock::now(); }

        static SteadyClock& Instance() {
            static SteadyClock instance;
            return instance;
        }
    };
}
