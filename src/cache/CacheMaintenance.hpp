#pragma once
#include <chrono>
#include <string>
#include "AdaptiveCache.hpp"
#include "../core/JobScheduler.hpp"

namespace Cadenza {
    // Runs AdaptiveCache::Optimize on the scheduler. Stopping it never touches
    // resolutions already in flight.
    class CacheMaintenance {
    public:
        CacheMaintenance(AdaptiveCache& cache, JobScheduler& scheduler, std::chrono::seconds interval);
        ~CacheMaintenance();

        CacheMaintenance(const CacheMaintenance&) = delete;
        CacheMaintenance& operator=(const CacheMaintenance&) = delete;

        void Start();
        void Stop();
        bool Running();

    private:
        static constexpr const char* kJobId = "cache-optimize";

        AdaptiveCache& cache_;
        JobScheduler& scheduler_;
        std::chrono::seconds interval_;
    };
}
