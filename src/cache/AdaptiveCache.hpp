#pragma once
#include <string>
#include <vector>
#include <optional>
#include <mutex>
#include <array>
#include "CacheClass.hpp"
#include "../interfaces/IClock.hpp"
#include "../interfaces/IMemoryProbe.hpp"
#include "../model/Item.hpp"

namespace Cadenza {
    enum class MemoryPressure {
        Low,
        Medium,
        High,
        Critical
    };

    const char* ToString(MemoryPressure level);

    struct PressureThresholds {
        double medium = 0.70;
        double high = 0.85;
        double critical = 0.95;

        MemoryPressure Classify(double used_ratio) const;
    };

    struct AdaptiveCacheOptions {
        CacheClassOptions stream{"stream", std::chrono::seconds(3600), 1000, 64 * 1024 * 1024};
        CacheClassOptions metadata{"metadata", std::chrono::seconds(7200), 5000, 128 * 1024 * 1024};
        CacheClassOptions search{"search", std::chrono::seconds(1800), 500, 64 * 1024 * 1024};
        PressureThresholds thresholds;
        std::chrono::seconds probe_interval{30};
        size_t medium_evict_count = 10;
        double high_evict_fraction = 0.25;
        double critical_evict_fraction = 0.50;
    };

    struct OptimizeReport {
        size_t expired = 0;
        size_t evicted = 0;
        MemoryPressure pressure = MemoryPressure::Low;
        std::optional<double> used_ratio;
    };

    struct AdaptiveCacheStats {
        std::vector<CacheClassStats> classes;
        size_t total_entries = 0;
        size_t total_bytes = 0;
        size_t peak_bytes = 0;
        double hit_ratio = 0.0;
        MemoryPressure last_pressure = MemoryPressure::Low;
        uint64_t optimize_runs = 0;
    };

    // Stream URLs keyed by source URL, metadata keyed by track id, search
    // results keyed by normalized query. Shared by every resolver and session;
    // each class locks independently and failures degrade to a miss.
    class AdaptiveCache {
    public:
        AdaptiveCache(AdaptiveCacheOptions options, const IClock& clock, IMemoryProbe& probe);

        std::optional<std::string> GetStream(const std::string& source_url);
        bool PutStream(const std::string& source_url, const std::string& stream_url);
        bool EraseStream(const std::string& source_url);

        std::optional<Item> GetMetadata(const std::string& track_id);
        bool PutMetadata(const std::string& track_id, const Item& item);

        std::optional<std::vector<Item>> GetSearch(const std::string& normalized_query);
        bool PutSearch(const std::string& normalized_query, const std::vector<Item>& items);

        // TTL purge across every class, then the memory-pressure response.
        OptimizeReport Optimize();

        size_t PurgeExpired();
        // Removes the `count` least frequently accessed entries across all classes.
        size_t EvictLeastFrequent(size_t count);
        // Removes floor(fraction * size) least recently used entries from each class.
        size_t EvictFraction(double fraction);
        // Applies the response for `level` without consulting the probe.
        size_t RespondToPressure(MemoryPressure level);

        // Reads the probe at most once per probe interval.
        std::pair<MemoryPressure, std::optional<double>> CurrentPressure();

        AdaptiveCacheStats Stats() const;
        void Clear();

        CacheClass<std::string>& Streams() { return streams_; }
        CacheClass<Item>& Metadata() { return metadata_; }
        CacheClass<std::vector<Item>>& Searches() { return searches_; }

    private:
        std::array<CacheClassBase*, 3> Classes();
        std::array<const CacheClassBase*, 3> Classes() const;
        void RecordPeak();

        AdaptiveCacheOptions options_;
        const IClock& clock_;
        IMemoryProbe& probe_;
        CacheClass<std::string> streams_;
        CacheClass<Item> metadata_;
        CacheClass<std::vector<Item>> searches_;

        mutable std::mutex state_mutex_;
        size_t peak_bytes_ = 0;
        uint64_t optimize_runs_ = 0;
        MemoryPressure last_pressure_ = MemoryPressure::Low;
        std::optional<double> last_ratio_;
        std::optional<IClock::TimePoint> last_probe_;
    };
}
