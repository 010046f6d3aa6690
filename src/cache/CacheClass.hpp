#pragma once
#include <string>
#include <optional>
#include <list>
#include <unordered_map>
#include <vector>
#include <chrono>
#include <mutex>
#include <functional>
#include <cstdint>
#include <iterator>
#include <nlohmann/json.hpp>
#include "../interfaces/IClock.hpp"

namespace Cadenza {
    struct CacheClassOptions {
        std::string name;
        std::chrono::seconds ttl{3600};
        size_t max_entries = 1000;
        size_t max_bytes = 64 * 1024 * 1024;
    };

    struct CacheClassStats {
        std::string name;
        size_t entries = 0;
        size_t bytes = 0;
        uint64_t hits = 0;
        uint64_t misses = 0;
        uint64_t evictions = 0;
        uint64_t expirations = 0;
        uint64_t rejected = 0;
    };

    // What the cross-class eviction passes need to know about one entry.
    struct EvictionCandidate {
        std::string key;
        uint64_t access_count = 0;
        IClock::TimePoint last_accessed;
    };

    // Type-erased view used by AdaptiveCache to run TTL and pressure passes
    // over classes holding different value types.
    class CacheClassBase {
    public:
        virtual ~CacheClassBase() = default;
        virtual const std::string& Name() const = 0;
        virtual size_t PurgeExpired() = 0;
        virtual size_t EvictLeastRecentlyUsed(size_t count) = 0;
        virtual bool Evict(const std::string& key) = 0;
        virtual std::vector<EvictionCandidate> Candidates() const = 0;
        virtual size_t Size() const = 0;
        virtual size_t Bytes() const = 0;
        virtual CacheClassStats Stats() const = 0;
        virtual void Clear() = 0;
    };

    // One TTL + LRU class of the adaptive cache. Most recently used entries sit
    // at the front of the list.
    template <typename T>
    class CacheClass : public CacheClassBase {
    public:
        using Sizer = std::function<size_t(const std::string&, const T&)>;

        CacheClass(CacheClassOptions options, const IClock& clock, Sizer sizer = EstimateSize)
            : options_(std::move(options)), clock_(clock), sizer_(std::move(sizer)) {}

        // Serialized JSON length plus key and bookkeeping overhead.
        static size_t EstimateSize(const std::string& key, const T& value) {
            nlohmann::json j = value;
            return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace).size() + key.size() + kEntryOverhead;
        }

        std::optional<T> Get(const std::string& key) {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = map_.find(key);
            if (it == map_.end()) {
                ++stats_.misses;
                return std::nullopt;
            }

            auto now = clock_.Now();
            if (IsExpired(*it->second, now)) {
                EraseUnlocked(it->second);
                ++stats_.expirations;
                ++stats_.misses;
                return std::nullopt;
            }

            list_.splice(list_.begin(), list_, it->second);
            it->second->last_accessed = now;
            ++it->second->access_count;
            ++stats_.hits;
            return it->second->value;
        }

        // Returns false when the value alone exceeds the class byte ceiling.
        bool Put(const std::string& key, T value) {
            const size_t size = sizer_(key, value);
            std::lock_guard<std::mutex> lock(mutex_);
            if (size > options_.max_bytes || options_.max_entries == 0) {
                ++stats_.rejected;
                return false;
            }

            auto it = map_.find(key);
            if (it != map_.end()) {
                EraseUnlocked(it->second);
            }

            auto now = clock_.Now();
            if (map_.size() >= options_.max_entries || bytes_ + size > options_.max_bytes) {
                stats_.expirations += PurgeExpiredUnlocked(now);
            }
            while (!list_.empty() && (map_.size() >= options_.max_entries || bytes_ + size > options_.max_bytes)) {
                EraseUnlocked(std::prev(list_.end()));
                ++stats_.evictions;
            }

            list_.push_front(Entry{key, std::move(value), now, now, 0, size});
            map_[key] = list_.begin();
            bytes_ += size;
            return true;
        }

        bool Erase(const std::string& key) {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = map_.find(key);
            if (it == map_.end()) return false;
            EraseUnlocked(it->second);
            return true;
        }

        const std::string& Name() const override { return options_.name; }
        const CacheClassOptions& Options() const { return options_; }

        size_t PurgeExpired() override {
            std::lock_guard<std::mutex> lock(mutex_);
            size_t removed = PurgeExpiredUnlocked(clock_.Now());
            stats_.expirations += removed;
            return removed;
        }

        size_t EvictLeastRecentlyUsed(size_t count) override {
            std::lock_guard<std::mutex> lock(mutex_);
            size_t removed = 0;
            while (removed < count && !list_.empty()) {
                EraseUnlocked(std::prev(list_.end()));
                ++removed;
            }
            stats_.evictions += removed;
            return removed;
        }

        bool Evict(const std::string& key) override {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = map_.find(key);
            if (it == map_.end()) return false;
            EraseUnlocked(it->second);
            ++stats_.evictions;
            return true;
        }

        std::vector<EvictionCandidate> Candidates() const override {
            std::lock_guard<std::mutex> lock(mutex_);
            std::vector<EvictionCandidate> out;
            out.reserve(list_.size());
            for (const auto& e : list_) {
                out.push_back({e.key, e.access_count, e.last_accessed});
            }
            return out;
        }

        size_t Size() const override {
            std::lock_guard<std::mutex> lock(mutex_);
            return map_.size();
        }

        size_t Bytes() const override {
            std::lock_guard<std::mutex> lock(mutex_);
            return bytes_;
        }

        CacheClassStats Stats() const override {
            std::lock_guard<std::mutex> lock(mutex_);
            CacheClassStats s = stats_;
            s.name = options_.name;
            s.entries = map_.size();
            s.bytes = bytes_;
            return s;
        }

        void Clear() override {
            std::lock_guard<std::mutex> lock(mutex_);
            list_.clear();
            map_.clear();
            bytes_ = 0;
        }

        // Keys from most to least recently used.
        std::vector<std::string> Keys() const {
            std::lock_guard<std::mutex> lock(mutex_);
            std::vector<std::string> out;
            out.reserve(list_.size());
            for (const auto& e : list_) out.push_back(e.key);
            return out;
        }

    private:
        static constexpr size_t kEntryOverhead = 64;

        struct Entry {
            std::string key;
            T value;
            IClock::TimePoint created_at;
            IClock::TimePoint last_accessed;
            uint64_t access_count;
            size_t estimated_size;
        };
        using ListIt = typename std::list<Entry>::iterator;

        bool IsExpired(const Entry& e, IClock::TimePoint now) const {
            return now - e.created_at > options_.ttl;
        }

        void EraseUnlocked(ListIt it) {
            bytes_ -= it->estimated_size;
            map_.erase(it->key);
            list_.erase(it);
        }

        size_t PurgeExpiredUnlocked(IClock::TimePoint now) {
            size_t removed = 0;
            for (auto it = list_.begin(); it != list_.end();) {
                auto next = std::next(it);
                if (IsExpired(*it, now)) {
                    EraseUnlocked(it);
                    ++removed;
                }
                it = next;
            }
            return removed;
        }

        CacheClassOptions options_;
        const IClock& clock_;
        Sizer sizer_;
        mutable std::mutex mutex_;
        std::list<Entry> list_;
        std::unordered_map<std::string, ListIt> map_;
        size_t bytes_ = 0;
        CacheClassStats stats_;
    };
}
