#pragma once
#include <dpp/dpp.h>
#include <functional>
#include <mutex>
#include <unordered_map>
#include <vector>
#include "JobScheduler.hpp"
#include "SessionRegistry.hpp"
#include "../cache/AdaptiveCache.hpp"
#include "../utils/ThreadPool.hpp"

namespace Cadenza {
    // Slash command glue. Resolution blocks, so every command that may hit a
    // backend runs on the thread pool behind a deferred reply.
    class MusicCommandHandler {
    public:
        // Hands a ready track to the voice side. It must call OnTrackFinished when done.
        using TrackStarter = std::function<void(dpp::snowflake guild_id, const PlayableTrack& track)>;

        MusicCommandHandler(dpp::cluster& bot, ThreadPool& pool, SessionRegistry& sessions, BackendRegistry& backends,
                            AdaptiveCache& cache, JobScheduler& scheduler, std::vector<uint64_t> operator_ids);

        void SetTrackStarter(TrackStarter starter);
        void RegisterCommands();
        void OnSlashCommand(const dpp::slashcommand_t& event);
        void OnTrackFinished(dpp::snowflake guild_id, const std::string& url, bool succeeded, const std::string& reason = {});

    private:
        void HandlePlay(const dpp::slashcommand_t& event);
        void HandlePlaylist(const dpp::slashcommand_t& event);
        // Runs on the pool behind a deferred reply.
        void QueuePlaylist(const dpp::slashcommand_t& event, const std::string& url, bool shuffle);
        void HandleSkip(const dpp::slashcommand_t& event);
        void HandleQueue(const dpp::slashcommand_t& event);
        void HandleLoop(const dpp::slashcommand_t& event);
        void HandleShuffle(const dpp::slashcommand_t& event);
        void HandleClear(const dpp::slashcommand_t& event);
        void HandleBackend(const dpp::slashcommand_t& event);

        // Starts the next playable item, or schedules another try once held-back items may be recovered.
        void Advance(dpp::snowflake guild_id);
        void Announce(dpp::snowflake guild_id, const dpp::embed& embed);
        bool IsOperator(dpp::snowflake user_id) const;

        dpp::cluster& bot;
        ThreadPool& thread_pool;
        SessionRegistry& sessions_;
        BackendRegistry& backends_;
        AdaptiveCache& cache_;
        JobScheduler& job_scheduler;
        const std::vector<uint64_t> operator_ids_;
        TrackStarter track_starter_;
        std::unordered_map<dpp::snowflake, dpp::snowflake> announce_channels_;
        std::mutex announce_mutex_;
    };
}
