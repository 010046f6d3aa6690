#pragma once
#include <atomic>
#include <optional>
#include <string>
#include <dpp/snowflake.h>
#include "../queue/ResilientQueue.hpp"
#include "../resolver/HierarchicalResolver.hpp"

namespace Cadenza {
    struct PlayableTrack {
        Item item;
        std::string stream_url;
    };

    // Queue plus resolver for one guild. The audio side calls ReportPlaybackSuccess
    // or ReportPlaybackFailure once a track ends.
    class PlaybackSession {
    public:
        PlaybackSession(dpp::snowflake guild_id, QueuePolicy policy, const IClock& clock, HierarchicalResolver& resolver);

        // Resolves `query` to its best match and appends it. Throws ResolveError or QueueError.
        Item Add(const std::string& query, dpp::snowflake requester);

        // Resolves a playlist link and appends its entries, shuffled first when asked.
        // Stops at the queue limit; throws QueueFullError only when nothing fit.
        PlaylistAddResult AddPlaylist(const std::string& url, dpp::snowflake requester, bool shuffle);

        // Marks an idle session as playing. Exactly one caller gets true until Next()
        // runs out of playable items; only that caller may start playback.
        bool ClaimIdle();
        bool IsPlaying() const { return playing_; }

        // Next item with a playable stream. Items whose stream cannot be resolved are
        // reported as failed and the following one is tried. nullopt when nothing is
        // playable right now (empty, or everything held back for recovery), which
        // also returns the session to idle.
        std::optional<PlayableTrack> Next();

        void ReportPlaybackSuccess(const std::string& url);
        QueueTransitions::FailureOutcome ReportPlaybackFailure(const std::string& url, const std::string& reason);

        ResilientQueue& Queue() { return queue_; }
        const ResilientQueue& Queue() const { return queue_; }
        dpp::snowflake GuildId() const { return guild_id_; }

    private:
        std::optional<PlayableTrack> NextPlayable();

        const dpp::snowflake guild_id_;
        ResilientQueue queue_;
        HierarchicalResolver& resolver_;
        std::atomic<bool> playing_{false};
    };
}
