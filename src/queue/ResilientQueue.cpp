#include "ResilientQueue.hpp"
#include "../utils/Logger.hpp"

namespace Cadenza {

ResilientQueue::ResilientQueue(QueuePolicy policy, const IClock& clock, std::mt19937::result_type seed)
    : policy_(std::move(policy)), clock_(clock), rng_(seed) {}

void ResilientQueue::Enqueue(Item item) {
    std::lock_guard<std::mutex> lock(mutex_);
    QueueTransitions::Enqueue(state_, policy_, std::move(item), clock_.Now());
}

std::optional<Item> ResilientQueue::Dequeue() {
    std::lock_guard<std::mutex> lock(mutex_);
    return QueueTransitions::Dequeue(state_, policy_, clock_.Now(), rng_);
}

void ResilientQueue::ReportSuccess(const std::string& url) {
    std::lock_guard<std::mutex> lock(mutex_);
    QueueTransitions::ReportSuccess(state_, url);
}

QueueTransitions::FailureOutcome ResilientQueue::ReportFailure(const std::string& url, const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto outcome = QueueTransitions::ReportFailure(state_, policy_, url, clock_.Now());
    Logger::Log(LogLevel::Info, "queue", "Playback failed for " + url + " (" + std::to_string(QueueTransitions::RetryCount(state_, url)) +
                "/" + std::to_string(policy_.max_retries) + "): " + reason);
    return outcome;
}

size_t ResilientQueue::Skip(size_t count) {
    std::lock_guard<std::mutex> lock(mutex_);
    return QueueTransitions::Skip(state_, policy_, count);
}

void ResilientQueue::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    QueueTransitions::Clear(state_);
}

size_t ResilientQueue::RemoveDuplicates() {
    std::lock_guard<std::mutex> lock(mutex_);
    return QueueTransitions::RemoveDuplicates(state_);
}

void ResilientQueue::SetLoopMode(LoopMode mode) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.queue.loop_mode = mode;
}

bool ResilientQueue::ToggleShuffle() {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.queue.shuffle = !state_.queue.shuffle;
    return state_.queue.shuffle;
}

std::optional<Item> ResilientQueue::Current() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_.queue.current;
}

int ResilientQueue::RetryCount(const std::string& url) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return QueueTransitions::RetryCount(state_, url);
}

QueueSnapshot ResilientQueue::Snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return QueueTransitions::Snapshot(state_);
}

QueueStats ResilientQueue::Stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return QueueTransitions::Stats(state_);
}

}
