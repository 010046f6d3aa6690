#pragma once
#include <mutex>
#include <random>
#include "QueueState.hpp"
#include "QueueTransitions.hpp"

namespace Cadenza {
    // One session's queue. Every operation takes the session lock once and
    // applies a single transition, so two Dequeue calls can never pick the same item.
    class ResilientQueue {
    public:
        ResilientQueue(QueuePolicy policy, const IClock& clock, std::mt19937::result_type seed = std::random_device{}());

        // Throws QueueFullError or QuarantinedItemError.
        void Enqueue(Item item);
        std::optional<Item> Dequeue();

        void ReportSuccess(const std::string& url);
        QueueTransitions::FailureOutcome ReportFailure(const std::string& url, const std::string& reason);

        size_t Skip(size_t count);
        void Clear();
        size_t RemoveDuplicates();
        void SetLoopMode(LoopMode mode);
        bool ToggleShuffle();

        std::optional<Item> Current() const;
        int RetryCount(const std::string& url) const;
        QueueSnapshot Snapshot() const;
        QueueStats Stats() const;
        const QueuePolicy& Policy() const { return policy_; }

    private:
        const QueuePolicy policy_;
        const IClock& clock_;
        mutable std::mutex mutex_;
        SessionState state_;
        std::mt19937 rng_;
    };
}
