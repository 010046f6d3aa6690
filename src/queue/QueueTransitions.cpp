#include "QueueTransitions.hpp"
#include "../model/Errors.hpp"
#include "../utils/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <unordered_set>

namespace Cadenza {

const char* ToString(LoopMode mode) {
    switch (mode) {
        case LoopMode::Off:   return "off";
        case LoopMode::Track: return "track";
        case LoopMode::Queue: return "queue";
    }
    return "off";
}

std::optional<LoopMode> LoopModeFromString(const std::string& s) {
    for (auto mode : {LoopMode::Off, LoopMode::Track, LoopMode::Queue}) {
        if (s == ToString(mode)) return mode;
    }
    return std::nullopt;
}

namespace QueueTransitions {

namespace {

void PushHistory(QueueState& q, const QueuePolicy& policy, Item item) {
    if (policy.history_length == 0) return;
    q.history.push_back(std::move(item));
    while (q.history.size() > policy.history_length) q.history.pop_front();
}

bool AtMax(const SessionState& state, const QueuePolicy& policy, const std::string& url) {
    return RetryCount(state, url) >= policy.max_retries;
}

bool CooldownElapsed(const SessionState& state, const QueuePolicy& policy, const std::string& url, IClock::TimePoint now) {
    const auto& last = state.recovery.last_failure_time;
    if (!last) return true;
    return now - *last >= RecoveryCooldown(state, policy, url);
}

// Takes the next playable item from pending, diverting quarantined ones.
// Bounded by the pending length at entry.
std::optional<Item> SelectCandidate(SessionState& state, const QueuePolicy& policy, std::mt19937& rng) {
    auto& q = state.queue;
    const size_t bound = q.pending.size();
    for (size_t i = 0; i < bound && !q.pending.empty(); ++i) {
        size_t index = 0;
        if (q.shuffle && q.pending.size() > 1) {
            std::uniform_int_distribution<size_t> dist(0, q.pending.size() - 1);
            index = dist(rng);
        }
        Item item = std::move(q.pending[index]);
        q.pending.erase(q.pending.begin() + static_cast<std::ptrdiff_t>(index));
        if (AtMax(state, policy, item.canonical_url)) {
            Logger::Log(LogLevel::Info, "queue", "Skipping quarantined item " + item.canonical_url);
            q.failed_items.push_back(std::move(item));
            continue;
        }
        return item;
    }
    return std::nullopt;
}

// Re-admits up to recovery_batch failed items whose cooldown has passed.
size_t Recover(SessionState& state, const QueuePolicy& policy, IClock::TimePoint now) {
    auto& q = state.queue;
    size_t moved = 0;
    for (auto it = q.failed_items.begin();
         it != q.failed_items.end() && moved < policy.recovery_batch && q.pending.size() < policy.max_size;) {
        if (!CooldownElapsed(state, policy, it->canonical_url, now)) {
            ++it;
            continue;
        }
        q.failure_counts.erase(it->canonical_url);
        ++q.recovery_rounds[it->canonical_url];
        Logger::Log(LogLevel::Info, "queue", "Recovery re-admits " + it->canonical_url +
                    " (round " + std::to_string(q.recovery_rounds[it->canonical_url]) + ")");
        q.pending.push_back(std::move(*it));
        it = q.failed_items.erase(it);
        ++moved;
    }
    return moved;
}

} // anonymous namespace

int RetryCount(const SessionState& state, const std::string& url) {
    auto it = state.queue.failure_counts.find(url);
    return it == state.queue.failure_counts.end() ? 0 : it->second;
}

std::chrono::seconds RecoveryCooldown(const SessionState& state, const QueuePolicy& policy, const std::string& url) {
    if (policy.backoff == RecoveryBackoff::Flat) return policy.recovery_cooldown;
    auto it = state.queue.recovery_rounds.find(url);
    int rounds = it == state.queue.recovery_rounds.end() ? 0 : it->second;
    double seconds = static_cast<double>(policy.recovery_cooldown.count()) * std::pow(policy.backoff_multiplier, rounds);
    double cap = static_cast<double>(policy.backoff_cap.count());
    return std::chrono::seconds(static_cast<long long>(std::min(seconds, cap)));
}

void Enqueue(SessionState& state, const QueuePolicy& policy, Item item, IClock::TimePoint now) {
    auto& q = state.queue;
    if (q.pending.size() >= policy.max_size) {
        throw QueueFullError("Queue is full (" + std::to_string(policy.max_size) + " items)");
    }

    const std::string& url = item.canonical_url;
    if (AtMax(state, policy, url)) {
        if (!CooldownElapsed(state, policy, url, now)) {
            throw QuarantinedItemError("Item has failed too often and is quarantined: " + url);
        }
        q.failure_counts.erase(url);
        ++q.recovery_rounds[url];
        q.failed_items.erase(std::remove_if(q.failed_items.begin(), q.failed_items.end(),
                                            [&url](const Item& f) { return f.canonical_url == url; }),
                             q.failed_items.end());
        Logger::Log(LogLevel::Info, "queue", "Re-admitting previously quarantined " + url);
    }
    q.pending.push_back(std::move(item));
}

std::optional<Item> Dequeue(SessionState& state, const QueuePolicy& policy, IClock::TimePoint now, std::mt19937& rng) {
    auto& q = state.queue;

    if (q.current) {
        Item prev = std::move(*q.current);
        q.current.reset();
        const bool at_max = AtMax(state, policy, prev.canonical_url);
        if (q.loop_mode == LoopMode::Track && !at_max) {
            q.current = prev;
            return prev;
        }
        if (at_max) {
            q.failed_items.push_back(std::move(prev));
        } else if (q.loop_mode == LoopMode::Queue) {
            // Goes round again after everything else.
            q.pending.push_back(std::move(prev));
        } else {
            PushHistory(q, policy, std::move(prev));
        }
    }

    auto candidate = SelectCandidate(state, policy, rng);
    if (!candidate && !q.failed_items.empty()) {
        if (!state.recovery.recovery_mode_active) {
            state.recovery.recovery_mode_active = true;
            Logger::Log(LogLevel::Warn, "queue", "Entering recovery mode: only quarantined items remain");
        }
        if (Recover(state, policy, now) == 0) {
            return std::nullopt;
        }
        candidate = SelectCandidate(state, policy, rng);
    }

    if (candidate) {
        q.current = candidate;
    }
    return candidate;
}

FailureOutcome ReportFailure(SessionState& state, const QueuePolicy& policy, const std::string& url, IClock::TimePoint now) {
    auto& q = state.queue;
    auto& r = state.recovery;
    const int count = ++q.failure_counts[url];
    ++r.consecutive_failures;
    r.last_failure_time = now;
    if (r.consecutive_failures >= policy.consecutive_failure_threshold && !r.recovery_mode_active) {
        r.recovery_mode_active = true;
        Logger::Log(LogLevel::Warn, "queue", "Entering recovery mode after " + std::to_string(r.consecutive_failures) + " consecutive failures");
    }

    if (!q.current || q.current->canonical_url != url) {
        return FailureOutcome::Counted;
    }
    Item item = std::move(*q.current);
    q.current.reset();
    if (count >= policy.max_retries) {
        Logger::Log(LogLevel::Warn, "queue", "Quarantined " + url + " after " + std::to_string(count) + " failures");
        q.failed_items.push_back(std::move(item));
        return FailureOutcome::Quarantined;
    }
    if (q.pending.size() >= policy.max_size) {
        // No room to retry now; recovery brings it back once pending has space.
        Logger::Log(LogLevel::Info, "queue", "Queue is full, holding back " + url + " instead of requeueing it");
        q.failed_items.push_back(std::move(item));
        return FailureOutcome::Quarantined;
    }
    q.pending.push_front(std::move(item));
    return FailureOutcome::Requeued;
}

void ReportSuccess(SessionState& state, const std::string& url) {
    state.queue.failure_counts.erase(url);
    state.queue.recovery_rounds.erase(url);
    state.recovery.consecutive_failures = 0;
    if (state.recovery.recovery_mode_active) {
        state.recovery.recovery_mode_active = false;
        Logger::Log(LogLevel::Info, "queue", "Leaving recovery mode after successful playback of " + url);
    }
}

size_t Skip(SessionState& state, const QueuePolicy& policy, size_t count) {
    auto& q = state.queue;
    size_t skipped = 0;
    while (skipped < count && !q.pending.empty()) {
        PushHistory(q, policy, std::move(q.pending.front()));
        q.pending.pop_front();
        ++skipped;
    }
    return skipped;
}

void Clear(SessionState& state) {
    state.queue.pending.clear();
    state.queue.failed_items.clear();
    state.queue.failure_counts.clear();
    state.queue.recovery_rounds.clear();
    state.recovery = RecoveryState{};
}

size_t RemoveDuplicates(SessionState& state) {
    auto& q = state.queue;
    std::unordered_set<std::string> seen;
    if (q.current) seen.insert(q.current->canonical_url);
    const size_t before = q.pending.size();
    q.pending.erase(std::remove_if(q.pending.begin(), q.pending.end(),
                                   [&seen](const Item& item) { return !seen.insert(item.canonical_url).second; }),
                    q.pending.end());
    return before - q.pending.size();
}

QueueSnapshot Snapshot(const SessionState& state) {
    const auto& q = state.queue;
    QueueSnapshot snap;
    snap.pending.assign(q.pending.begin(), q.pending.end());
    snap.current = q.current;
    snap.history.assign(q.history.begin(), q.history.end());
    snap.failed = q.failed_items;
    snap.loop_mode = q.loop_mode;
    snap.shuffle = q.shuffle;
    for (const auto& item : q.pending) {
        if (item.duration) snap.total_duration += *item.duration;
    }
    if (q.current && q.current->duration) snap.total_duration += *q.current->duration;
    return snap;
}

QueueStats Stats(const SessionState& state) {
    const auto& q = state.queue;
    QueueStats stats;
    stats.pending = q.pending.size();
    stats.history = q.history.size();
    stats.failed = q.failed_items.size();
    stats.tracked_urls = q.failure_counts.size();
    for (const auto& entry : q.failure_counts) stats.total_retries += entry.second;
    stats.consecutive_failures = state.recovery.consecutive_failures;
    stats.recovery_mode_active = state.recovery.recovery_mode_active;
    return stats;
}

}
}
