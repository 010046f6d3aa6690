#include <catch2/catch_all.hpp>
#include <algorithm>
#include <set>
#include "queue/ResilientQueue.hpp"
#include "Fakes.hpp"

using namespace Cadenza;
using Testing::MakeItem;
using Testing::ManualClock;
using QueueTransitions::FailureOutcome;
using std::chrono::minutes;
using std::chrono::seconds;

namespace {

Item Track(const std::string& id, seconds duration = seconds(200)) {
    return MakeItem("Track " + id, "https://example.com/" + id, duration);
}

std::string UrlOf(const std::optional<Item>& item) {
    return item ? item->canonical_url : std::string("<none>");
}

const std::string kA = "https://example.com/a";
const std::string kB = "https://example.com/b";
const std::string kC = "https://example.com/c";

} // anonymous namespace

TEST_CASE("Loop modes round-trip through their names") {
    CHECK(LoopModeFromString("queue") == std::optional<LoopMode>(LoopMode::Queue));
    CHECK(std::string(ToString(LoopMode::Track)) == "track");
    CHECK_FALSE(LoopModeFromString("forever").has_value());
}

TEST_CASE("Queue plays items in order and keeps a bounded history") {
    ManualClock clock;
    QueuePolicy policy;
    policy.history_length = 2;
    ResilientQueue queue(policy, clock, 1);
    for (auto id : {"a", "b", "c", "d"}) queue.Enqueue(Track(id));

    CHECK(UrlOf(queue.Dequeue()) == kA);
    CHECK(UrlOf(queue.Current()) == kA);
    CHECK(UrlOf(queue.Dequeue()) == kB);
    CHECK(UrlOf(queue.Dequeue()) == kC);
    CHECK(UrlOf(queue.Dequeue()) == "https://example.com/d");
    CHECK_FALSE(queue.Dequeue().has_value());

    auto snap = queue.Snapshot();
    REQUIRE(snap.history.size() == 2);
    CHECK(snap.history[0].canonical_url == kC);
    CHECK(snap.history[1].canonical_url == "https://example.com/d");
    CHECK_FALSE(snap.current.has_value());
}

TEST_CASE("Queue rejects items beyond its maximum size") {
    ManualClock clock;
    QueuePolicy policy;
    policy.max_size = 2;
    ResilientQueue queue(policy, clock, 1);
    queue.Enqueue(Track("a"));
    queue.Enqueue(Track("b"));
    CHECK_THROWS_AS(queue.Enqueue(Track("c")), QueueFullError);

    // The playing item does not count against the limit.
    queue.Dequeue();
    CHECK_NOTHROW(queue.Enqueue(Track("c")));
}

TEST_CASE("A repeatedly failing item is quarantined, skipped and later recovered") {
    ManualClock clock;
    QueuePolicy policy;
    policy.max_retries = 3;
    ResilientQueue queue(policy, clock, 1);
    queue.Enqueue(Track("a"));
    queue.Enqueue(Track("b"));

    CHECK(UrlOf(queue.Dequeue()) == kA);
    CHECK(queue.ReportFailure(kA, "stream 403") == FailureOutcome::Requeued);
    CHECK(UrlOf(queue.Dequeue()) == kA);
    CHECK(queue.ReportFailure(kA, "stream 403") == FailureOutcome::Requeued);
    CHECK(UrlOf(queue.Dequeue()) == kA);
    CHECK(queue.ReportFailure(kA, "stream 403") == FailureOutcome::Quarantined);

    auto stats = queue.Stats();
    CHECK(stats.failed == 1);
    CHECK(stats.recovery_mode_active);
    CHECK(queue.RetryCount(kA) == 3);

    // The fourth dequeue passes over the quarantined item.
    CHECK(UrlOf(queue.Dequeue()) == kB);
    CHECK_FALSE(queue.Dequeue().has_value());
    CHECK(queue.Snapshot().failed.size() == 1);

    clock.Advance(minutes(5));
    auto recovered = queue.Dequeue();
    CHECK(UrlOf(recovered) == kA);
    CHECK(queue.RetryCount(kA) == 0);
    CHECK(queue.Stats().failed == 0);

    queue.ReportSuccess(kA);
    CHECK_FALSE(queue.Stats().recovery_mode_active);
}

TEST_CASE("Quarantined URLs are refused until their cooldown passes") {
    ManualClock clock;
    QueuePolicy policy;
    policy.max_retries = 1;
    ResilientQueue queue(policy, clock, 1);
    queue.Enqueue(Track("a"));
    REQUIRE(UrlOf(queue.Dequeue()) == kA);
    REQUIRE(queue.ReportFailure(kA, "gone") == FailureOutcome::Quarantined);

    CHECK_THROWS_AS(queue.Enqueue(Track("a")), QuarantinedItemError);
    clock.Advance(seconds(299));
    CHECK_THROWS_AS(queue.Enqueue(Track("a")), QuarantinedItemError);

    clock.Advance(seconds(1));
    CHECK_NOTHROW(queue.Enqueue(Track("a")));
    auto snap = queue.Snapshot();
    CHECK(snap.failed.empty());
    CHECK(snap.pending.size() == 1);
    CHECK(queue.RetryCount(kA) == 0);
}

TEST_CASE("Failures of items other than the current one are only counted") {
    ManualClock clock;
    QueuePolicy policy;
    ResilientQueue queue(policy, clock, 1);
    queue.Enqueue(Track("a"));
    queue.Dequeue();

    CHECK(queue.ReportFailure(kB, "x") == FailureOutcome::Counted);
    CHECK(queue.ReportFailure(kC, "x") == FailureOutcome::Counted);
    CHECK_FALSE(queue.Stats().recovery_mode_active);
    CHECK(queue.ReportFailure(kC, "x") == FailureOutcome::Counted);

    auto stats = queue.Stats();
    CHECK(stats.consecutive_failures == 3);
    CHECK(stats.recovery_mode_active);
    CHECK(stats.tracked_urls == 2);
    CHECK(stats.total_retries == 3);
    CHECK(UrlOf(queue.Current()) == kA);

    queue.ReportSuccess(kC);
    stats = queue.Stats();
    CHECK(stats.consecutive_failures == 0);
    CHECK_FALSE(stats.recovery_mode_active);
    CHECK(queue.RetryCount(kC) == 0);
    CHECK(queue.RetryCount(kB) == 1);
}

TEST_CASE("Loop track replays the current item") {
    ManualClock clock;
    ResilientQueue queue(QueuePolicy{}, clock, 1);
    queue.Enqueue(Track("a"));
    queue.Enqueue(Track("b"));
    queue.SetLoopMode(LoopMode::Track);

    CHECK(UrlOf(queue.Dequeue()) == kA);
    CHECK(UrlOf(queue.Dequeue()) == kA);
    CHECK(queue.Snapshot().history.empty());

    queue.SetLoopMode(LoopMode::Off);
    CHECK(UrlOf(queue.Dequeue()) == kB);
    CHECK(queue.Snapshot().history.size() == 1);
}

TEST_CASE("Loop queue sends finished items to the back") {
    ManualClock clock;
    ResilientQueue queue(QueuePolicy{}, clock, 1);
    queue.Enqueue(Track("a"));
    queue.Enqueue(Track("b"));
    queue.SetLoopMode(LoopMode::Queue);

    CHECK(UrlOf(queue.Dequeue()) == kA);
    CHECK(UrlOf(queue.Dequeue()) == kB);
    CHECK(UrlOf(queue.Dequeue()) == kA);
    CHECK(UrlOf(queue.Dequeue()) == kB);
    CHECK(queue.Snapshot().pending.size() == 1);
}

TEST_CASE("Shuffle plays every item exactly once") {
    ManualClock clock;
    ResilientQueue queue(QueuePolicy{}, clock, 7);
    std::set<std::string> expected;
    for (int i = 0; i < 10; ++i) {
        queue.Enqueue(Track(std::to_string(i)));
        expected.insert("https://example.com/" + std::to_string(i));
    }
    CHECK(queue.ToggleShuffle());

    std::multiset<std::string> played;
    while (auto item = queue.Dequeue()) played.insert(item->canonical_url);
    CHECK(played.size() == 10);
    CHECK(std::set<std::string>(played.begin(), played.end()) == expected);

    CHECK_FALSE(queue.ToggleShuffle());
}

TEST_CASE("Skip moves pending items to history") {
    ManualClock clock;
    ResilientQueue queue(QueuePolicy{}, clock, 1);
    for (auto id : {"a", "b", "c"}) queue.Enqueue(Track(id));

    CHECK(queue.Skip(2) == 2);
    auto snap = queue.Snapshot();
    REQUIRE(snap.pending.size() == 1);
    CHECK(snap.pending[0].canonical_url == kC);
    CHECK(snap.history.size() == 2);
    CHECK(queue.Skip(5) == 1);
    CHECK(queue.Skip(1) == 0);
}

TEST_CASE("Clear drops pending and quarantined items but keeps the current one") {
    ManualClock clock;
    QueuePolicy policy;
    policy.max_retries = 1;
    ResilientQueue queue(policy, clock, 1);
    for (auto id : {"a", "b", "c"}) queue.Enqueue(Track(id));
    queue.Dequeue();
    queue.ReportFailure(kA, "x");
    queue.Dequeue();

    queue.Clear();
    auto snap = queue.Snapshot();
    CHECK(snap.pending.empty());
    CHECK(snap.failed.empty());
    CHECK(UrlOf(snap.current) == kB);
    CHECK(queue.RetryCount(kA) == 0);
    CHECK_FALSE(queue.Stats().recovery_mode_active);
    CHECK_NOTHROW(queue.Enqueue(Track("a")));
}

TEST_CASE("RemoveDuplicates keeps the first occurrence of each URL") {
    ManualClock clock;
    ResilientQueue queue(QueuePolicy{}, clock, 1);
    for (auto id : {"a", "b", "a", "c", "b", "a"}) queue.Enqueue(Track(id));
    REQUIRE(UrlOf(queue.Dequeue()) == kA);

    CHECK(queue.RemoveDuplicates() == 3);
    auto snap = queue.Snapshot();
    REQUIRE(snap.pending.size() == 2);
    CHECK(snap.pending[0].canonical_url == kB);
    CHECK(snap.pending[1].canonical_url == kC);
    CHECK(queue.RemoveDuplicates() == 0);
}

TEST_CASE("Snapshot totals the known durations") {
    ManualClock clock;
    ResilientQueue queue(QueuePolicy{}, clock, 1);
    queue.Enqueue(Track("a", seconds(100)));
    queue.Enqueue(Track("b", seconds(50)));
    queue.Enqueue(MakeItem("live", "https://example.com/live", std::nullopt));
    queue.Dequeue();

    auto snap = queue.Snapshot();
    CHECK(snap.total_duration == seconds(150));
    CHECK(snap.pending.size() == 2);
}

TEST_CASE("Recovery cooldown is flat unless exponential backoff is configured") {
    SessionState state;
    QueuePolicy policy;
    policy.recovery_cooldown = seconds(300);
    state.queue.recovery_rounds[kA] = 2;
    CHECK(QueueTransitions::RecoveryCooldown(state, policy, kA) == seconds(300));

    policy.backoff = RecoveryBackoff::Exponential;
    policy.backoff_multiplier = 2.0;
    policy.backoff_cap = seconds(1000);
    CHECK(QueueTransitions::RecoveryCooldown(state, policy, kB) == seconds(300));
    state.queue.recovery_rounds[kA] = 1;
    CHECK(QueueTransitions::RecoveryCooldown(state, policy, kA) == seconds(600));
    state.queue.recovery_rounds[kA] = 2;
    CHECK(QueueTransitions::RecoveryCooldown(state, policy, kA) == seconds(1000));
}

TEST_CASE("Exponential recovery makes a twice-recovered item wait longer") {
    ManualClock clock;
    QueuePolicy policy;
    policy.max_retries = 1;
    policy.backoff = RecoveryBackoff::Exponential;
    ResilientQueue queue(policy, clock, 1);
    queue.Enqueue(Track("a"));

    REQUIRE(UrlOf(queue.Dequeue()) == kA);
    queue.ReportFailure(kA, "x");
    clock.Advance(minutes(5));
    REQUIRE(UrlOf(queue.Dequeue()) == kA);

    queue.ReportFailure(kA, "x");
    clock.Advance(minutes(5));
    CHECK_FALSE(queue.Dequeue().has_value());
    clock.Advance(minutes(5));
    CHECK(UrlOf(queue.Dequeue()) == kA);
}

TEST_CASE("Recovery re-admits at most one batch per dequeue") {
    ManualClock clock;
    QueuePolicy policy;
    policy.max_retries = 1;
    policy.recovery_batch = 2;
    ResilientQueue queue(policy, clock, 1);
    for (auto id : {"a", "b", "c"}) {
        queue.Enqueue(Track(id));
        queue.Dequeue();
        queue.ReportFailure("https://example.com/" + std::string(id), "x");
    }
    REQUIRE(queue.Stats().failed == 3);

    clock.Advance(minutes(5));
    CHECK(UrlOf(queue.Dequeue()) == kA);
    auto stats = queue.Stats();
    CHECK(stats.pending == 1);
    CHECK(stats.failed == 1);
}

TEST_CASE("A failing item is held back rather than overfilling a full queue") {
    ManualClock clock;
    QueuePolicy policy;
    policy.max_size = 2;
    ResilientQueue queue(policy, clock, 1);
    queue.Enqueue(Track("a"));
    queue.Enqueue(Track("b"));
    REQUIRE(UrlOf(queue.Dequeue()) == kA);
    queue.Enqueue(Track("c"));

    CHECK(queue.ReportFailure(kA, "stream 403") == FailureOutcome::Quarantined);
    auto stats = queue.Stats();
    CHECK(stats.pending == 2);
    CHECK(stats.failed == 1);
    CHECK(queue.RetryCount(kA) == 1);

    CHECK(UrlOf(queue.Dequeue()) == kB);
    CHECK(UrlOf(queue.Dequeue()) == kC);
    CHECK_FALSE(queue.Dequeue().has_value());
    clock.Advance(minutes(5));
    CHECK(UrlOf(queue.Dequeue()) == kA);
}

TEST_CASE("Recovery never fills pending past the maximum size") {
    ManualClock clock;
    QueuePolicy policy;
    policy.max_size = 2;
    policy.max_retries = 1;
    policy.recovery_batch = 5;
    ResilientQueue queue(policy, clock, 1);
    for (auto id : {"a", "b", "c"}) {
        queue.Enqueue(Track(id));
        queue.Dequeue();
        queue.ReportFailure("https://example.com/" + std::string(id), "x");
    }
    REQUIRE(queue.Stats().failed == 3);

    clock.Advance(minutes(5));
    CHECK(UrlOf(queue.Dequeue()) == kA);
    auto stats = queue.Stats();
    CHECK(stats.pending == 1);
    CHECK(stats.failed == 1);
}

TEST_CASE("Every admitted item stays accounted for across failures and quarantine") {
    ManualClock clock;
    QueuePolicy policy;
    policy.max_retries = 2;
    policy.history_length = 100;
    ResilientQueue queue(policy, clock, 1);

    auto total = [&queue]() {
        auto snap = queue.Snapshot();
        return snap.pending.size() + (snap.current ? 1 : 0) + snap.history.size() + snap.failed.size();
    };

    for (auto id : {"a", "b", "c", "d", "e"}) queue.Enqueue(Track(id));
    CHECK(total() == 5);

    CHECK(UrlOf(queue.Dequeue()) == kA);
    CHECK(total() == 5);
    CHECK(queue.ReportFailure(kA, "x") == FailureOutcome::Requeued);
    CHECK(total() == 5);
    CHECK(UrlOf(queue.Dequeue()) == kA);
    CHECK(queue.ReportFailure(kA, "x") == FailureOutcome::Quarantined);
    CHECK(total() == 5);

    CHECK(UrlOf(queue.Dequeue()) == kB);
    queue.ReportSuccess(kB);
    CHECK(total() == 5);
    CHECK(queue.ReportFailure(kC, "not current") == FailureOutcome::Counted);
    CHECK(total() == 5);

    queue.Skip(1);
    CHECK(total() == 5);
    while (queue.Dequeue()) {
        CHECK(total() == 5);
    }
    CHECK(total() == 5);
    CHECK(queue.Stats().failed == 1);
}

TEST_CASE("Reporting success for a URL without failures changes nothing") {
    ManualClock clock;
    ResilientQueue queue(QueuePolicy{}, clock, 1);
    queue.Enqueue(Track("a"));
    queue.Enqueue(Track("b"));
    queue.Dequeue();
    const auto before = queue.Stats();

    queue.ReportSuccess(kA);
    queue.ReportSuccess(kA);

    const auto after = queue.Stats();
    CHECK(queue.RetryCount(kA) == 0);
    CHECK(after.pending == before.pending);
    CHECK(after.history == before.history);
    CHECK(after.failed == before.failed);
    CHECK(after.tracked_urls == before.tracked_urls);
    CHECK(after.total_retries == before.total_retries);
    CHECK(after.consecutive_failures == before.consecutive_failures);
    CHECK(after.recovery_mode_active == before.recovery_mode_active);
    CHECK(UrlOf(queue.Current()) == kA);
}
