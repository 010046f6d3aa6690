#include "PlaybackSession.hpp"
#include "../model/Errors.hpp"
#include "../utils/Logger.hpp"
#include "../utils/UrlUtil.hpp"
#include <algorithm>
#include <random>

namespace Cadenza {

PlaybackSession::PlaybackSession(dpp::snowflake guild_id, QueuePolicy policy, const IClock& clock, HierarchicalResolver& resolver)
    : guild_id_(guild_id), queue_(std::move(policy), clock), resolver_(resolver) {}

Item PlaybackSession::Add(const std::string& query, dpp::snowflake requester) {
    auto result = resolver_.Resolve(query, 1, requester);
    if (result.items.empty()) {
        throw NoResultsError("Nothing found for \"" + query + "\"");
    }
    Item item = result.items.front().WithRequester(requester);
    queue_.Enqueue(item);
    Logger::Log(LogLevel::Info, "session", "Guild " + std::to_string(guild_id_) + " queued " + item.canonical_url);
    return item;
}

PlaylistAddResult PlaybackSession::AddPlaylist(const std::string& url, dpp::snowflake requester, bool shuffle) {
    auto resolved = resolver_.ResolvePlaylist(url, 0, requester);
    PlaylistAddResult result;
    result.playlist_id = UrlUtil::ExtractPlaylistId(resolved.effective_query).value_or("");
    result.found = resolved.items.size();
    result.shuffled = shuffle;

    auto& items = resolved.items;
    if (shuffle) {
        std::mt19937 rng(std::random_device{}());
        std::shuffle(items.begin(), items.end(), rng);
    }

    for (auto& item : items) {
        try {
            queue_.Enqueue(item);
            ++result.added;
        } catch (const QuarantinedItemError& e) {
            Logger::Log(LogLevel::Debug, "session", std::string("Playlist entry held back: ") + e.what());
            ++result.held_back;
        } catch (const QueueFullError&) {
            if (result.added == 0) throw;
            result.truncated = true;
            break;
        }
    }
    Logger::Log(LogLevel::Info, "session", "Guild " + std::to_string(guild_id_) + " queued " + std::to_string(result.added) +
                " of " + std::to_string(result.found) + " playlist entries" + (result.truncated ? " (queue full)" : ""));
    return result;
}

bool PlaybackSession::ClaimIdle() {
    bool expected = false;
    return playing_.compare_exchange_strong(expected, true);
}

std::optional<PlayableTrack> PlaybackSession::Next() {
    for (int round = 0; round < 2; ++round) {
        if (auto track = NextPlayable()) {
            playing_ = true;
            return track;
        }
        playing_ = false;
        // An Add that landed after the empty dequeue could not claim the session.
        if (queue_.Stats().pending == 0 || !ClaimIdle()) break;
    }
    return std::nullopt;
}

std::optional<PlayableTrack> PlaybackSession::NextPlayable() {
    // Each failure either requeues the item (bounded by max_retries) or quarantines it.
    const auto stats = queue_.Stats();
    const size_t retries = static_cast<size_t>(std::max(1, queue_.Policy().max_retries));
    const size_t max_attempts = (stats.pending + 1) * retries;

    for (size_t attempt = 0; attempt < max_attempts; ++attempt) {
        auto item = queue_.Dequeue();
        if (!item) return std::nullopt;

        try {
            std::string stream = resolver_.ResolveStreamUrl(*item);
            return PlayableTrack{*item, std::move(stream)};
        } catch (const ResolveError& e) {
            Logger::Log(LogLevel::Warn, "session", "No stream for " + item->canonical_url + ": " + e.what());
            resolver_.InvalidateStream(item->canonical_url);
            queue_.ReportFailure(item->canonical_url, e.what());
        }
    }
    Logger::Log(LogLevel::Warn, "session", "Guild " + std::to_string(guild_id_) + " gave up looking for a playable item");
    return std::nullopt;
}

void PlaybackSession::ReportPlaybackSuccess(const std::string& url) {
    queue_.ReportSuccess(url);
}

QueueTransitions::FailureOutcome PlaybackSession::ReportPlaybackFailure(const std::string& url, const std::string& reason) {
    // A stale stream URL is the usual cause; force a fresh lookup on retry.
    resolver_.InvalidateStream(url);
    return queue_.ReportFailure(url, reason);
}

}
