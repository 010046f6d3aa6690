#pragma once
#include <deque>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <chrono>
#include "../interfaces/IClock.hpp"
#include "../model/Item.hpp"

namespace Cadenza {
    enum class LoopMode {
        Off,
        Track,
        Queue
    };

    const char* ToString(LoopMode mode);
    std::optional<LoopMode> LoopModeFromString(const std::string& s);

    enum class RecoveryBackoff {
        Flat,        // every failed item waits the base cooldown
        Exponential  // cooldown grows with the number of times an item was already recovered
    };

    struct QueuePolicy {
        size_t max_size = 100;
        size_t history_length = 50;
        int max_retries = 3;
        std::chrono::seconds recovery_cooldown{300};
        size_t recovery_batch = 3;
        int consecutive_failure_threshold = 3;
        RecoveryBackoff backoff = RecoveryBackoff::Flat;
        double backoff_multiplier = 2.0;
        std::chrono::seconds backoff_cap{3600};
    };

    struct RecoveryState {
        int consecutive_failures = 0;
        std::optional<IClock::TimePoint> last_failure_time;
        bool recovery_mode_active = false;
    };

    // `failed_items` is the quarantine: items whose retry count reached the
    // maximum, held aside until recovery re-admits them.
    struct QueueState {
        std::deque<Item> pending;
        std::optional<Item> current;
        std::deque<Item> history; // oldest first
        LoopMode loop_mode = LoopMode::Off;
        bool shuffle = false;
        std::unordered_map<std::string, int> failure_counts;
        std::vector<Item> failed_items;
        std::unordered_map<std::string, int> recovery_rounds;
    };

    // Everything one playback session owns, guarded by a single lock.
    struct SessionState {
        QueueState queue;
        RecoveryState recovery;
    };

    struct QueueSnapshot {
        std::vector<Item> pending;
        std::optional<Item> current;
        std::vector<Item> history;
        std::vector<Item> failed;
        LoopMode loop_mode = LoopMode::Off;
        bool shuffle = false;
        std::chrono::seconds total_duration{0};
    };

    // How a bulk add of playlist entries landed in the queue.
    struct PlaylistAddResult {
        std::string playlist_id;
        size_t found = 0;
        size_t added = 0;
        size_t held_back = 0; // quarantined URLs still cooling down
        bool truncated = false; // stopped at the queue limit
        bool shuffled = false;
    };

    struct QueueStats {
        size_t pending = 0;
        size_t history = 0;
        size_t failed = 0;
        size_t tracked_urls = 0;
        int total_retries = 0;
        int consecutive_failures = 0;
        bool recovery_mode_active = false;
    };
}
