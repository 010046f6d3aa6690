#include "AdaptiveCache.hpp"
#include "../utils/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <tuple>

namespace Cadenza {

const char* ToString(MemoryPressure level) {
    switch (level) {
        case MemoryPressure::Low:      return "low";
        case MemoryPressure::Medium:   return "medium";
        case MemoryPressure::High:     return "high";
        case MemoryPressure::Critical: return "critical";
    }
    return "low";
}

MemoryPressure PressureThresholds::Classify(double used_ratio) const {
    if (used_ratio >= critical) return MemoryPressure::Critical;
    if (used_ratio >= high) return MemoryPressure::High;
    if (used_ratio >= medium) return MemoryPressure::Medium;
    return MemoryPressure::Low;
}

AdaptiveCache::AdaptiveCache(AdaptiveCacheOptions options, const IClock& clock, IMemoryProbe& probe)
    : options_(std::move(options)),
      clock_(clock),
      probe_(probe),
      streams_(options_.stream, clock),
      metadata_(options_.metadata, clock),
      searches_(options_.search, clock) {}

std::array<CacheClassBase*, 3> AdaptiveCache::Classes() {
    return {&streams_, &metadata_, &searches_};
}

std::array<const CacheClassBase*, 3> AdaptiveCache::Classes() const {
    return {&streams_, &metadata_, &searches_};
}

void AdaptiveCache::RecordPeak() {
    size_t total = 0;
    for (const auto* c : Classes()) total += c->Bytes();
    std::lock_guard<std::mutex> lock(state_mutex_);
    peak_bytes_ = std::max(peak_bytes_, total);
}

std::optional<std::string> AdaptiveCache::GetStream(const std::string& source_url) {
    try {
        return streams_.Get(source_url);
    } catch (const std::exception& e) {
        Logger::Log(LogLevel::Warn, "cache", std::string("stream lookup failed: ") + e.what());
        return std::nullopt;
    }
}

bool AdaptiveCache::PutStream(const std::string& source_url, const std::string& stream_url) {
    try {
        bool stored = streams_.Put(source_url, stream_url);
        if (stored) RecordPeak();
        return stored;
    } catch (const std::exception& e) {
        Logger::Log(LogLevel::Warn, "cache", std::string("stream insert failed: ") + e.what());
        return false;
    }
}

bool AdaptiveCache::EraseStream(const std::string& source_url) {
    return streams_.Erase(source_url);
}

std::optional<Item> AdaptiveCache::GetMetadata(const std::string& track_id) {
    try {
        return metadata_.Get(track_id);
    } catch (const std::exception& e) {
        Logger::Log(LogLevel::Warn, "cache", std::string("metadata lookup failed: ") + e.what());
        return std::nullopt;
    }
}

bool AdaptiveCache::PutMetadata(const std::string& track_id, const Item& item) {
    try {
        bool stored = metadata_.Put(track_id, item);
        if (stored) RecordPeak();
        return stored;
    } catch (const std::exception& e) {
        Logger::Log(LogLevel::Warn, "cache", std::string("metadata insert failed: ") + e.what());
        return false;
    }
}

std::optional<std::vector<Item>> AdaptiveCache::GetSearch(const std::string& normalized_query) {
    try {
        return searches_.Get(normalized_query);
    } catch (const std::exception& e) {
        Logger::Log(LogLevel::Warn, "cache", std::string("search lookup failed: ") + e.what());
        return std::nullopt;
    }
}

bool AdaptiveCache::PutSearch(const std::string& normalized_query, const std::vector<Item>& items) {
    try {
        bool stored = searches_.Put(normalized_query, items);
        if (stored) RecordPeak();
        return stored;
    } catch (const std::exception& e) {
        Logger::Log(LogLevel::Warn, "cache", std::string("search insert failed: ") + e.what());
        return false;
    }
}

size_t AdaptiveCache::PurgeExpired() {
    size_t removed = 0;
    for (auto* c : Classes()) removed += c->PurgeExpired();
    return removed;
}

size_t AdaptiveCache::EvictLeastFrequent(size_t count) {
    struct Ranked {
        CacheClassBase* owner;
        EvictionCandidate candidate;
    };
    std::vector<Ranked> ranked;
    for (auto* c : Classes()) {
        for (auto& candidate : c->Candidates()) ranked.push_back({c, std::move(candidate)});
    }
    // Fewest accesses first; ties go to the entry idle the longest.
    std::sort(ranked.begin(), ranked.end(), [](const Ranked& a, const Ranked& b) {
        return std::tie(a.candidate.access_count, a.candidate.last_accessed) <
               std::tie(b.candidate.access_count, b.candidate.last_accessed);
    });

    size_t removed = 0;
    for (const auto& r : ranked) {
        if (removed >= count) break;
        if (r.owner->Evict(r.candidate.key)) ++removed;
    }
    return removed;
}

size_t AdaptiveCache::EvictFraction(double fraction) {
    size_t removed = 0;
    for (auto* c : Classes()) {
        size_t target = static_cast<size_t>(std::floor(static_cast<double>(c->Size()) * fraction));
        removed += c->EvictLeastRecentlyUsed(target);
    }
    return removed;
}

size_t AdaptiveCache::RespondToPressure(MemoryPressure level) {
    switch (level) {
        case MemoryPressure::Low:      return 0;
        case MemoryPressure::Medium:   return EvictLeastFrequent(options_.medium_evict_count);
        case MemoryPressure::High:     return EvictFraction(options_.high_evict_fraction);
        case MemoryPressure::Critical: return EvictFraction(options_.critical_evict_fraction);
    }
    return 0;
}

std::pair<MemoryPressure, std::optional<double>> AdaptiveCache::CurrentPressure() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    auto now = clock_.Now();
    if (last_probe_ && now - *last_probe_ < options_.probe_interval) {
        return {last_pressure_, last_ratio_};
    }
    last_probe_ = now;
    last_ratio_ = probe_.UsedRatio();
    last_pressure_ = last_ratio_ ? options_.thresholds.Classify(*last_ratio_) : MemoryPressure::Low;
    return {last_pressure_, last_ratio_};
}

OptimizeReport AdaptiveCache::Optimize() {
    OptimizeReport report;
    report.expired = PurgeExpired();
    std::tie(report.pressure, report.used_ratio) = CurrentPressure();
    report.evicted = RespondToPressure(report.pressure);
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        ++optimize_runs_;
    }

    std::string ratio = report.used_ratio ? std::to_string(static_cast<int>(*report.used_ratio * 100)) + "%" : std::string("unknown");
    LogLevel level = report.pressure >= MemoryPressure::High ? LogLevel::Warn : LogLevel::Debug;
    Logger::Log(level, "cache", "optimize: expired=" + std::to_string(report.expired) +
                " evicted=" + std::to_string(report.evicted) +
                " pressure=" + ToString(report.pressure) + " memory=" + ratio);
    return report;
}

AdaptiveCacheStats AdaptiveCache::Stats() const {
    AdaptiveCacheStats stats;
    uint64_t hits = 0, lookups = 0;
    for (const auto* c : Classes()) {
        auto s = c->Stats();
        stats.total_entries += s.entries;
        stats.total_bytes += s.bytes;
        hits += s.hits;
        lookups += s.hits + s.misses;
        stats.classes.push_back(std::move(s));
    }
    stats.hit_ratio = lookups > 0 ? static_cast<double>(hits) / static_cast<double>(lookups) : 0.0;
    std::lock_guard<std::mutex> lock(state_mutex_);
    stats.peak_bytes = std::max(peak_bytes_, stats.total_bytes);
    stats.last_pressure = last_pressure_;
    stats.optimize_runs = optimize_runs_;
    return stats;
}

void AdaptiveCache::Clear() {
    for (auto* c : Classes()) c->Clear();
}

}
