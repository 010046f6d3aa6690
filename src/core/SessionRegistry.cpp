#include "SessionRegistry.hpp"
#include "../utils/Logger.hpp"

namespace Cadenza {

SessionRegistry::SessionRegistry(HierarchicalResolver& resolver, QueuePolicy policy, const IClock& clock)
    : resolver_(resolver), policy_(std::move(policy)), clock_(clock) {}

std::shared_ptr<PlaybackSession> SessionRegistry::GetOrCreate(dpp::snowflake guild_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(guild_id);
    if (it != sessions_.end()) return it->second;

    auto session = std::make_shared<PlaybackSession>(guild_id, policy_, clock_, resolver_);
    sessions_.emplace(guild_id, session);
    Logger::Log(LogLevel::Debug, "session", "Created session for guild " + std::to_string(guild_id));
    return session;
}

std::shared_ptr<PlaybackSession> SessionRegistry::Find(dpp::snowflake guild_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(guild_id);
    return it == sessions_.end() ? nullptr : it->second;
}

bool SessionRegistry::Remove(dpp::snowflake guild_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.erase(guild_id) > 0;
}

size_t SessionRegistry::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

std::vector<dpp::snowflake> SessionRegistry::Guilds() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<dpp::snowflake> out;
    out.reserve(sessions_.size());
    for (const auto& entry : sessions_) out.push_back(entry.first);
    return out;
}

}
