#include "CacheMaintenance.hpp"
#include "../utils/Logger.hpp"

namespace Cadenza {

CacheMaintenance::CacheMaintenance(AdaptiveCache& cache, JobScheduler& scheduler, std::chrono::seconds interval)
    : cache_(cache), scheduler_(scheduler), interval_(interval) {}

CacheMaintenance::~CacheMaintenance() {
    Stop();
}

void CacheMaintenance::Start() {
    scheduler_.SchedulePeriodic(kJobId, interval_, [this]() {
        cache_.Optimize();
    });
    Logger::Log(LogLevel::Info, "cache", "Optimization pass every " + std::to_string(interval_.count()) + "s");
}

void CacheMaintenance::Stop() {
    if (scheduler_.Cancel(kJobId)) {
        Logger::Log(LogLevel::Info, "cache", "Optimization pass stopped");
    }
}

bool CacheMaintenance::Running() {
    return scheduler_.IsScheduled(kJobId);
}

}
