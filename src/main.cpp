#include <dpp/dpp.h>
#include <iostream>
#include <cstdlib>
#include <curl/curl.h>
#include <filesystem>
#include <algorithm>
#include <thread>
#include "../config/Config.hpp"
#include "core/MusicCommandHandler.hpp"
#include "core/SessionRegistry.hpp"
#include "core/JobScheduler.hpp"
#include "adapters/AdapterFactory.hpp"
#include "cache/AdaptiveCache.hpp"
#include "cache/CacheMaintenance.hpp"
#include "cache/MemoryProbe.hpp"
#include "network/HttpFetcher.hpp"
#include "resolver/BackendRegistry.hpp"
#include "resolver/HierarchicalResolver.hpp"
#include "utils/Logger.hpp"
#include "utils/ThreadPool.hpp"
#include "utils/RateLimiter.hpp"
#include "utils/SteadyClock.hpp"

namespace {

Cadenza::AdaptiveCacheOptions MakeCacheOptions(const Cadenza::Config& config) {
    Cadenza::AdaptiveCacheOptions options;
    options.stream = {"stream", std::chrono::seconds(config.stream_ttl_s), config.stream_max_entries, config.stream_max_bytes};
    options.metadata = {"metadata", std::chrono::seconds(config.metadata_ttl_s), config.metadata_max_entries, config.metadata_max_bytes};
    options.search = {"search", std::chrono::seconds(config.search_ttl_s), config.search_max_entries, config.search_max_bytes};
    options.thresholds = {config.pressure_medium, config.pressure_high, config.pressure_critical};
    options.probe_interval = std::chrono::seconds(config.memory_probe_interval_s);
    return options;
}

Cadenza::QueuePolicy MakeQueuePolicy(const Cadenza::Config& config) {
    Cadenza::QueuePolicy policy;
    policy.max_size = config.queue_max_size;
    policy.history_length = config.history_length;
    policy.max_retries = config.queue_max_retries;
    policy.recovery_cooldown = std::chrono::seconds(config.recovery_cooldown_s);
    policy.recovery_batch = config.recovery_batch;
    policy.consecutive_failure_threshold = config.consecutive_failure_threshold;
    policy.backoff = config.recovery_policy == "exponential" ? Cadenza::RecoveryBackoff::Exponential : Cadenza::RecoveryBackoff::Flat;
    policy.backoff_multiplier = config.recovery_backoff_multiplier;
    policy.backoff_cap = std::chrono::seconds(config.recovery_backoff_cap_s);
    return policy;
}

Cadenza::ResolverOptions MakeResolverOptions(const Cadenza::Config& config) {
    Cadenza::ResolverOptions options;
    options.backoff_base = std::chrono::milliseconds(config.backoff_base_ms);
    options.backoff_cap = std::chrono::milliseconds(config.backoff_cap_ms);
    options.fallback_budget = std::chrono::milliseconds(config.fallback_budget_ms);
    options.playlist_limit = static_cast<size_t>(config.playlist_max_items);
    return options;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc == 0 || argv[0] == nullptr) {
        Cadenza::Logger::Log(Cadenza::LogLevel::Error, "Cannot determine executable path.");
        return 1;
    }
    std::filesystem::path exe_path(argv[0]);
    std::filesystem::path exe_dir = exe_path.parent_path();
    std::filesystem::path config_path = exe_dir / "config" / "config.json";
    const std::string config_path_str = config_path.string();

    Cadenza::Logger::Init(exe_dir.string(), Cadenza::LogLevel::Info);

    // Initialize global resources
    curl_global_init(CURL_GLOBAL_ALL);

    // Load Config
    try {
        Cadenza::Config::GetInstance().Load(config_path_str);
        Cadenza::Logger::Log(Cadenza::LogLevel::Info, "Configuration loaded from: " + config_path_str);
    } catch (const std::runtime_error& e) {
        std::string error_message = e.what();
        if (error_message.find("Could not open config file") != std::string::npos) {
            Cadenza::Logger::Log(Cadenza::LogLevel::Warn, "config.json not found. Creating a default one at: " + config_path_str);
            try {
                Cadenza::Config::GetInstance().CreateDefault(config_path_str);
                Cadenza::Logger::Log(Cadenza::LogLevel::Info, "Default config.json created. Please review it, set your bot token, and restart the bot.");
                curl_global_cleanup();
                return 0;
            } catch (const std::exception& create_e) {
                Cadenza::Logger::Log(Cadenza::LogLevel::Error, "Failed to create default config: " + std::string(create_e.what()));
                curl_global_cleanup();
                return 1;
            }
        } else {
            Cadenza::Logger::Log(Cadenza::LogLevel::Error, "Failed to load config: " + error_message);
            curl_global_cleanup();
            return 1;
        }
    }
    const auto& config = Cadenza::Config::GetInstance();
    Cadenza::Logger::SetMinLevel(Cadenza::Logger::FromString(config.log_level));
    for (const auto& entry : config.component_log_levels) {
        Cadenza::Logger::SetComponentLevel(entry.first, Cadenza::Logger::FromString(entry.second));
    }

    // Determine thread pool size
    const unsigned int hardware_cores = std::max(1u, std::thread::hardware_concurrency());
    unsigned int worker_threads = 0;
    if (config.worker_threads <= 0) {
        worker_threads = hardware_cores;
        Cadenza::Logger::Log(Cadenza::LogLevel::Info, "worker_threads is 0, using one per core: " + std::to_string(worker_threads));
    } else {
        worker_threads = static_cast<unsigned int>(config.worker_threads);
        Cadenza::Logger::Log(Cadenza::LogLevel::Info, "Using configured worker_threads: " + std::to_string(worker_threads));
    }
    // Command handlers block on backend calls, so backend calls get a pool of their own.
    const unsigned int adapter_threads = config.adapter_threads > 0 ? static_cast<unsigned int>(config.adapter_threads)
                                                                    : worker_threads * 2;

    // Get Bot Token
    if (config.bot_token == "YOUR_BOT_TOKEN_HERE" || config.bot_token.empty()) {
        Cadenza::Logger::Log(Cadenza::LogLevel::Error, "Please set your bot_token in " + config_path_str);
        curl_global_cleanup();
        return 1;
    }

    // Setup Bot
    dpp::cluster bot(config.bot_token, dpp::i_default_intents);
    bot.on_log([](const dpp::log_t& event) {
        Cadenza::LogLevel level = Cadenza::LogLevel::Debug;
        if (event.severity > dpp::ll_debug) {
            switch (event.severity) {
                case dpp::ll_info:    level = Cadenza::LogLevel::Info; break;
                case dpp::ll_warning: level = Cadenza::LogLevel::Warn; break;
                case dpp::ll_error:
                case dpp::ll_critical:level = Cadenza::LogLevel::Error; break;
                default:              level = Cadenza::LogLevel::Debug; break;
            }
        }
        Cadenza::Logger::Log(level, "dpp", event.message);
    });

    // Setup Core Components. The cache outlives the pool so in-flight
    // resolutions finish before it goes away.
    Cadenza::ProcMemoryProbe memory_probe;
    Cadenza::AdaptiveCache cache(MakeCacheOptions(config), Cadenza::SteadyClock::Instance(), memory_probe);
    Cadenza::ThreadPool thread_pool(worker_threads);
    Cadenza::HttpFetcher http_fetcher;
    auto scrape_limiter = std::make_shared<Cadenza::RateLimiter>(config.scrape_rate_per_sec, Cadenza::SteadyClock::Instance());

    Cadenza::BackendRegistry backends;
    Cadenza::AdapterFactory factory(config, http_fetcher, scrape_limiter);
    for (const auto& backend : config.backends) {
        backends.Add(backend, factory.Create(backend));
        Cadenza::Logger::Log(Cadenza::LogLevel::Info, "Backend " + backend.name + " (" + Cadenza::ToString(backend.kind) +
                             ", priority " + std::to_string(backend.priority) + (backend.enabled ? "" : ", disabled") + ")");
    }

    Cadenza::ThreadPool adapter_pool(adapter_threads);
    Cadenza::Logger::Log(Cadenza::LogLevel::Info, "Backend calls use " + std::to_string(adapter_threads) + " threads");

    Cadenza::HierarchicalResolver resolver(backends, cache, adapter_pool, MakeResolverOptions(config));
    Cadenza::JobScheduler job_scheduler(thread_pool);
    Cadenza::CacheMaintenance cache_maintenance(cache, job_scheduler, std::chrono::seconds(config.cache_optimize_interval_s));
    cache_maintenance.Start();

    Cadenza::SessionRegistry sessions(resolver, MakeQueuePolicy(config), Cadenza::SteadyClock::Instance());
    Cadenza::MusicCommandHandler handler(bot, thread_pool, sessions, backends, cache, job_scheduler, config.operator_ids);
    handler.SetTrackStarter([](dpp::snowflake guild_id, const Cadenza::PlayableTrack& track) {
        Cadenza::Logger::Log(Cadenza::LogLevel::Info, "Guild " + std::to_string(guild_id) + " ready to stream " +
                             track.item.canonical_url);
    });

    // Register Event Handlers
    bot.on_slashcommand([&handler](const dpp::slashcommand_t& event) {
        handler.OnSlashCommand(event);
    });

    bot.on_ready([&bot, &handler](const dpp::ready_t& event) {
        Cadenza::Logger::Log(Cadenza::LogLevel::Info, "Bot is ready! Logged in as " + bot.me.username);
        if (dpp::run_once<struct register_commands>()) {
            handler.RegisterCommands();
        }
    });

    // Start Bot
    try {
        bot.start(dpp::st_wait);
    } catch (const dpp::exception& e) {
        Cadenza::Logger::Log(Cadenza::LogLevel::Error, "DPP Exception: " + std::string(e.what()));
        curl_global_cleanup();
        return 1;
    }

    // Cleanup global resources
    curl_global_cleanup();
    return 0;
}
