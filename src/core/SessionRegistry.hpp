#pragma once
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>
#include <dpp/snowflake.h>
#include "PlaybackSession.hpp"

namespace Cadenza {
    // One PlaybackSession per guild, created on first use. Sessions share the
    // resolver and cache but never each other's queue state.
    class SessionRegistry {
    public:
        SessionRegistry(HierarchicalResolver& resolver, QueuePolicy policy, const IClock& clock);

        std::shared_ptr<PlaybackSession> GetOrCreate(dpp::snowflake guild_id);
        std::shared_ptr<PlaybackSession> Find(dpp::snowflake guild_id) const;
        bool Remove(dpp::snowflake guild_id);
        size_t Size() const;
        std::vector<dpp::snowflake> Guilds() const;

    private:
        HierarchicalResolver& resolver_;
        const QueuePolicy policy_;
        const IClock& clock_;
        mutable std::mutex mutex_;
        std::unordered_map<dpp::snowflake, std::shared_ptr<PlaybackSession>> sessions_;
    };
}
