#include "MusicCommandHandler.hpp"
#include "utils/EmbedBuilder.hpp"
#include "utils/Logger.hpp"
#include "utils/UrlUtil.hpp"
#include "model/Errors.hpp"
#include <algorithm>

namespace Cadenza {

namespace {

std::optional<std::string> StringParam(const dpp::slashcommand_t& event, const std::string& name) {
    const auto& value = event.get_parameter(name);
    if (std::holds_alternative<std::string>(value)) return std::get<std::string>(value);
    return std::nullopt;
}

std::optional<int64_t> IntParam(const dpp::slashcommand_t& event, const std::string& name) {
    const auto& value = event.get_parameter(name);
    if (std::holds_alternative<int64_t>(value)) return std::get<int64_t>(value);
    return std::nullopt;
}

dpp::message EmbedMessage(const dpp::embed& embed) {
    dpp::message msg;
    msg.add_embed(embed);
    return msg;
}

dpp::message ErrorMessage(const std::string& text) {
    dpp::message msg;
    msg.add_embed(BuildErrorEmbed(text));
    msg.set_flags(dpp::m_ephemeral);
    return msg;
}

} // anonymous namespace

MusicCommandHandler::MusicCommandHandler(dpp::cluster& bot, ThreadPool& pool, SessionRegistry& sessions, BackendRegistry& backends,
                                         AdaptiveCache& cache, JobScheduler& scheduler, std::vector<uint64_t> operator_ids)
    : bot(bot), thread_pool(pool), sessions_(sessions), backends_(backends), cache_(cache), job_scheduler(scheduler),
      operator_ids_(std::move(operator_ids)) {}

void MusicCommandHandler::SetTrackStarter(TrackStarter starter) {
    track_starter_ = std::move(starter);
}

void MusicCommandHandler::RegisterCommands() {
    std::vector<dpp::slashcommand> commands;

    dpp::slashcommand play("play", "Queue a track by search text or URL", bot.me.id);
    play.add_option(dpp::command_option(dpp::co_string, "query", "Search text or link", true));
    commands.push_back(play);

    dpp::slashcommand playlist("playlist", "Queue a whole playlist", bot.me.id);
    playlist.add_option(dpp::command_option(dpp::co_string, "url", "Playlist link", true));
    playlist.add_option(dpp::command_option(dpp::co_boolean, "shuffle", "Shuffle the playlist before queueing", false));
    commands.push_back(playlist);

    dpp::slashcommand skip("skip", "Skip the current track", bot.me.id);
    skip.add_option(dpp::command_option(dpp::co_integer, "count", "How many tracks to skip", false));
    commands.push_back(skip);

    commands.emplace_back("queue", "Show the queue", bot.me.id);

    dpp::slashcommand loop("loop", "Set the loop mode", bot.me.id);
    loop.add_option(dpp::command_option(dpp::co_string, "mode", "Loop mode", true)
                        .add_choice(dpp::command_option_choice("Off", std::string("off")))
                        .add_choice(dpp::command_option_choice("Track", std::string("track")))
                        .add_choice(dpp::command_option_choice("Queue", std::string("queue"))));
    commands.push_back(loop);

    commands.emplace_back("shuffle", "Toggle shuffle", bot.me.id);

    dpp::slashcommand clear("clear", "Clear the queue", bot.me.id);
    clear.add_option(dpp::command_option(dpp::co_boolean, "duplicates", "Only remove duplicate entries", false));
    commands.push_back(clear);

    dpp::slashcommand backend("backend", "Inspect or change backend policy (operators only)", bot.me.id);
    backend.add_option(dpp::command_option(dpp::co_string, "action", "What to do", true)
                           .add_choice(dpp::command_option_choice("Status", std::string("status")))
                           .add_choice(dpp::command_option_choice("Enable", std::string("enable")))
                           .add_choice(dpp::command_option_choice("Disable", std::string("disable")))
                           .add_choice(dpp::command_option_choice("Timeout (ms)", std::string("timeout")))
                           .add_choice(dpp::command_option_choice("Retries", std::string("retries")))
                           .add_choice(dpp::command_option_choice("Priority", std::string("priority"))));
    backend.add_option(dpp::command_option(dpp::co_string, "name", "Backend name", false));
    backend.add_option(dpp::command_option(dpp::co_integer, "value", "New value", false));
    commands.push_back(backend);

    bot.global_bulk_command_create(commands, [](const dpp::confirmation_callback_t& cc) {
        if (cc.is_error()) {
            Logger::Log(LogLevel::Error, "commands", "Failed to register slash commands: " + cc.get_error().message);
        } else {
            Logger::Log(LogLevel::Info, "commands", "Slash commands registered");
        }
    });
}

void MusicCommandHandler::OnSlashCommand(const dpp::slashcommand_t& event) {
    if (!event.command.guild_id) {
        event.reply(ErrorMessage("Music commands only work inside a server."));
        return;
    }
    {
        std::lock_guard<std::mutex> lk(announce_mutex_);
        announce_channels_[event.command.guild_id] = event.command.channel_id;
    }

    const std::string name = event.command.get_command_name();
    Logger::Log(LogLevel::Debug, "commands", "/" + name + " from " + std::to_string(event.command.get_issuing_user().id));

    if (name == "play") HandlePlay(event);
    else if (name == "playlist") HandlePlaylist(event);
    else if (name == "skip") HandleSkip(event);
    else if (name == "queue") HandleQueue(event);
    else if (name == "loop") HandleLoop(event);
    else if (name == "shuffle") HandleShuffle(event);
    else if (name == "clear") HandleClear(event);
    else if (name == "backend") HandleBackend(event);
}

void MusicCommandHandler::HandlePlay(const dpp::slashcommand_t& event) {
    auto query = StringParam(event, "query");
    if (!query || query->empty()) {
        event.reply(ErrorMessage("Tell me what to play."));
        return;
    }

    event.thinking();
    if (UrlUtil::IsPlaylistUrl(UrlUtil::Normalize(*query))) {
        QueuePlaylist(event, *query, false);
        return;
    }
    const dpp::snowflake guild_id = event.command.guild_id;
    const dpp::snowflake user_id = event.command.get_issuing_user().id;
    try {
        thread_pool.enqueue([this, event, guild_id, user_id, query = *query]() {
            auto session = sessions_.GetOrCreate(guild_id);
            try {
                Item item = session->Add(query, user_id);
                event.edit_original_response(EmbedMessage(BuildItemEmbed(item, "Added to queue")));
                if (session->ClaimIdle()) Advance(guild_id);
            } catch (const QuarantinedItemError& e) {
                event.edit_original_response(ErrorMessage(std::string("That track keeps failing and is on hold: ") + e.what()));
            } catch (const QueueFullError& e) {
                event.edit_original_response(ErrorMessage(e.what()));
            } catch (const NoResultsError& e) {
                event.edit_original_response(ErrorMessage(std::string("No results: ") + e.what()));
            } catch (const ResolveError& e) {
                Logger::Log(LogLevel::Warn, "commands", "Resolution failed for '" + query + "': " + e.what());
                event.edit_original_response(ErrorMessage("Every source is failing right now, try again shortly."));
            }
        });
    } catch (const std::runtime_error& e) {
        Logger::Log(LogLevel::Error, "commands", std::string("Could not queue /play: ") + e.what());
    }
}

void MusicCommandHandler::HandlePlaylist(const dpp::slashcommand_t& event) {
    auto url = StringParam(event, "url");
    if (!url || !UrlUtil::ExtractPlaylistId(UrlUtil::Normalize(*url))) {
        event.reply(ErrorMessage("That is not a playlist link. It needs a `list=` parameter."));
        return;
    }
    const auto& shuffle = event.get_parameter("shuffle");
    event.thinking();
    QueuePlaylist(event, *url, std::holds_alternative<bool>(shuffle) && std::get<bool>(shuffle));
}

void MusicCommandHandler::QueuePlaylist(const dpp::slashcommand_t& event, const std::string& url, bool shuffle) {
    const dpp::snowflake guild_id = event.command.guild_id;
    const dpp::snowflake user_id = event.command.get_issuing_user().id;
    try {
        thread_pool.enqueue([this, event, guild_id, user_id, url, shuffle]() {
            auto session = sessions_.GetOrCreate(guild_id);
            try {
                auto result = session->AddPlaylist(url, user_id, shuffle);
                event.edit_original_response(EmbedMessage(BuildPlaylistEmbed(result, UrlUtil::Normalize(url))));
                if (result.added > 0 && session->ClaimIdle()) Advance(guild_id);
            } catch (const QueueFullError& e) {
                event.edit_original_response(ErrorMessage(e.what()));
            } catch (const NoResultsError& e) {
                event.edit_original_response(ErrorMessage(std::string("Could not load that playlist: ") + e.what()));
            } catch (const ResolveError& e) {
                Logger::Log(LogLevel::Warn, "commands", "Playlist failed for '" + url + "': " + e.what());
                event.edit_original_response(ErrorMessage("Every source is failing right now, try again shortly."));
            }
        });
    } catch (const std::runtime_error& e) {
        Logger::Log(LogLevel::Error, "commands", std::string("Could not queue /playlist: ") + e.what());
    }
}

void MusicCommandHandler::HandleSkip(const dpp::slashcommand_t& event) {
    auto session = sessions_.Find(event.command.guild_id);
    if (!session || !session->IsPlaying()) {
        event.reply(ErrorMessage("Nothing is playing."));
        return;
    }
    const int64_t count = std::max<int64_t>(1, IntParam(event, "count").value_or(1));
    const size_t dropped = session->Queue().Skip(static_cast<size_t>(count - 1));

    event.thinking();
    const dpp::snowflake guild_id = event.command.guild_id;
    try {
        thread_pool.enqueue([this, event, guild_id, dropped]() {
            event.edit_original_response(dpp::message("Skipped " + std::to_string(dropped + 1) + " track(s)."));
            Advance(guild_id);
        });
    } catch (const std::runtime_error& e) {
        Logger::Log(LogLevel::Error, "commands", std::string("Could not queue /skip: ") + e.what());
    }
}

void MusicCommandHandler::HandleQueue(const dpp::slashcommand_t& event) {
    auto session = sessions_.GetOrCreate(event.command.guild_id);
    event.reply(EmbedMessage(BuildQueueEmbed(session->Queue().Snapshot())));
}

void MusicCommandHandler::HandleLoop(const dpp::slashcommand_t& event) {
    auto mode = LoopModeFromString(StringParam(event, "mode").value_or(""));
    if (!mode) {
        event.reply(ErrorMessage("Loop mode must be off, track or queue."));
        return;
    }
    sessions_.GetOrCreate(event.command.guild_id)->Queue().SetLoopMode(*mode);
    event.reply(dpp::message(std::string("Loop mode: ") + ToString(*mode)));
}

void MusicCommandHandler::HandleShuffle(const dpp::slashcommand_t& event) {
    const bool on = sessions_.GetOrCreate(event.command.guild_id)->Queue().ToggleShuffle();
    event.reply(dpp::message(on ? "Shuffle on." : "Shuffle off."));
}

void MusicCommandHandler::HandleClear(const dpp::slashcommand_t& event) {
    auto session = sessions_.GetOrCreate(event.command.guild_id);
    const auto& dup = event.get_parameter("duplicates");
    if (std::holds_alternative<bool>(dup) && std::get<bool>(dup)) {
        const size_t removed = session->Queue().RemoveDuplicates();
        event.reply(dpp::message("Removed " + std::to_string(removed) + " duplicate(s)."));
        return;
    }
    session->Queue().Clear();
    job_scheduler.Cancel("advance:" + std::to_string(event.command.guild_id));
    event.reply(dpp::message("Queue cleared."));
}

void MusicCommandHandler::HandleBackend(const dpp::slashcommand_t& event) {
    if (!IsOperator(event.command.get_issuing_user().id)) {
        event.reply(ErrorMessage("Only bot operators can change backends."));
        return;
    }

    const std::string action = StringParam(event, "action").value_or("status");
    if (action == "status") {
        dpp::message msg;
        msg.add_embed(BuildBackendEmbed(backends_.Configs(), cache_.Stats()));
        msg.set_flags(dpp::m_ephemeral);
        event.reply(msg);
        return;
    }

    auto name = StringParam(event, "name");
    if (!name) {
        event.reply(ErrorMessage("Name the backend to change."));
        return;
    }
    auto value = IntParam(event, "value");

    bool found = false;
    try {
        if (action == "enable" || action == "disable") {
            found = backends_.SetEnabled(*name, action == "enable");
        } else if (!value) {
            event.reply(ErrorMessage("`" + action + "` needs a value."));
            return;
        } else if (action == "timeout") {
            found = backends_.SetTimeout(*name, std::chrono::milliseconds(*value));
        } else if (action == "retries") {
            found = backends_.SetMaxRetries(*name, static_cast<int>(*value));
        } else if (action == "priority") {
            found = backends_.SetPriority(*name, static_cast<int>(*value));
        }
    } catch (const std::invalid_argument& e) {
        event.reply(ErrorMessage(e.what()));
        return;
    }

    if (!found) {
        event.reply(ErrorMessage("Unknown backend `" + *name + "`."));
        return;
    }
    dpp::message msg;
    msg.add_embed(BuildBackendEmbed(backends_.Configs(), cache_.Stats()));
    msg.set_flags(dpp::m_ephemeral);
    event.reply(msg);
}

void MusicCommandHandler::OnTrackFinished(dpp::snowflake guild_id, const std::string& url, bool succeeded, const std::string& reason) {
    auto session = sessions_.Find(guild_id);
    if (!session) return;

    auto current = session->Queue().Current();
    if (!session->IsPlaying() || !current || current->canonical_url != url) {
        // Already moved past it, e.g. by /skip.
        Logger::Log(LogLevel::Debug, "commands", "Ignoring finish report for " + url + " in guild " + std::to_string(guild_id));
        return;
    }

    if (succeeded) {
        session->ReportPlaybackSuccess(url);
    } else {
        auto outcome = session->ReportPlaybackFailure(url, reason);
        if (outcome == QueueTransitions::FailureOutcome::Quarantined) {
            Announce(guild_id, BuildErrorEmbed("Holding back " + url + " after it failed to play."));
        }
    }

    try {
        thread_pool.enqueue([this, guild_id]() { Advance(guild_id); });
    } catch (const std::runtime_error& e) {
        Logger::Log(LogLevel::Error, "commands", std::string("Could not advance after a track: ") + e.what());
    }
}

// Callers hold the session's playback claim.
void MusicCommandHandler::Advance(dpp::snowflake guild_id) {
    auto session = sessions_.Find(guild_id);
    if (!session) return;

    if (auto track = session->Next()) {
        job_scheduler.Cancel("advance:" + std::to_string(guild_id));
        Announce(guild_id, BuildItemEmbed(track->item, "Now playing"));
        if (track_starter_) {
            track_starter_(guild_id, *track);
        }
        return;
    }

    const auto stats = session->Queue().Stats();
    if (stats.failed == 0) {
        Logger::Log(LogLevel::Debug, "commands", "Guild " + std::to_string(guild_id) + " queue finished");
        return;
    }

    // Everything left is held back; look again once the cooldown has passed.
    const auto delay = std::chrono::duration_cast<std::chrono::milliseconds>(session->Queue().Policy().recovery_cooldown);
    Logger::Log(LogLevel::Info, "commands", "Guild " + std::to_string(guild_id) + " waiting " +
                std::to_string(delay.count() / 1000) + "s to recover " + std::to_string(stats.failed) + " item(s)");
    job_scheduler.Schedule("advance:" + std::to_string(guild_id), delay, [this, guild_id]() {
        auto idle = sessions_.Find(guild_id);
        if (idle && idle->ClaimIdle()) Advance(guild_id);
    });
}

void MusicCommandHandler::Announce(dpp::snowflake guild_id, const dpp::embed& embed) {
    dpp::snowflake channel_id{};
    {
        std::lock_guard<std::mutex> lk(announce_mutex_);
        auto it = announce_channels_.find(guild_id);
        if (it != announce_channels_.end()) channel_id = it->second;
    }
    if (!channel_id) return;
    bot.message_create(dpp::message(channel_id, embed));
}

bool MusicCommandHandler::IsOperator(dpp::snowflake user_id) const {
    const uint64_t id = user_id;
    return std::find(operator_ids_.begin(), operator_ids_.end(), id) != operator_ids_.end();
}

}
