#pragma once
#include <random>
#include <string>
#include "QueueState.hpp"

namespace Cadenza {
namespace QueueTransitions {

enum class FailureOutcome {
    Counted,     // not the current item; only bookkeeping changed
    Requeued,    // current item put back at the head of pending
    Quarantined  // current item moved to failed_items (also when pending is already full)
};

// Throws QueueFullError or QuarantinedItemError.
void Enqueue(SessionState& state, const QueuePolicy& policy, Item item, IClock::TimePoint now);

std::optional<Item> Dequeue(SessionState& state, const QueuePolicy& policy, IClock::TimePoint now, std::mt19937& rng);

FailureOutcome ReportFailure(SessionState& state, const QueuePolicy& policy, const std::string& url, IClock::TimePoint now);
void ReportSuccess(SessionState& state, const std::string& url);

size_t Skip(SessionState& state, const QueuePolicy& policy, size_t count);
void Clear(SessionState& state);
size_t RemoveDuplicates(SessionState& state);

int RetryCount(const SessionState& state, const std::string& url);
// How long a failed item waits after the last failure before recovery may re-admit it.
std::chrono::seconds RecoveryCooldown(const SessionState& state, const QueuePolicy& policy, const std::string& url);

QueueSnapshot Snapshot(const SessionState& state);
QueueStats Stats(const SessionState& state);

}
}
