#pragma once
#include <string>
#include <vector>
#include <map>
#include <cstdint>
#include <nlohmann/json.hpp>
#include "../src/model/BackendConfig.hpp"

namespace Cadenza {
    struct Config {
        std::string bot_token = "YOUR_BOT_TOKEN_HERE";
        std::string log_level = "info";
        std::map<std::string, std::string> component_log_levels; // e.g. {"resolver": "debug"}
        int worker_threads = 0; // 0 = hardware concurrency
        int adapter_threads = 0; // backend calls; 0 = twice the worker count
        std::vector<uint64_t> operator_ids;

        // HTTP
        std::string http_user_agent = "CadenzaBot/1.0";
        long http_timeout_ms = 8000;
        long http_max_redirects = 5;
        size_t max_body_bytes = 4194304; // 4MB
        size_t direct_probe_bytes = 65536;

        // Backends
        std::string extractor_binary = "yt-dlp";
        int extractor_socket_timeout_s = 10;
        std::string youtube_api_key;
        std::string youtube_bearer_token;
        std::vector<std::string> mirror_instances = {"https://invidious.nerdvpn.de", "https://inv.nadeko.net"};
        std::string mirror_password;
        std::vector<std::string> feed_channel_ids;
        double scrape_rate_per_sec = 2.0;
        std::vector<BackendConfig> backends = DefaultBackends();

        // Resolver
        long backoff_base_ms = 250;
        long backoff_cap_ms = 4000;
        long fallback_budget_ms = 20000;
        int playlist_max_items = 50;

        // Cache
        long stream_ttl_s = 3600;
        long metadata_ttl_s = 7200;
        long search_ttl_s = 1800;
        size_t stream_max_entries = 1000;
        size_t metadata_max_entries = 5000;
        size_t search_max_entries = 500;
        size_t stream_max_bytes = 67108864;    // 64MB
        size_t metadata_max_bytes = 134217728; // 128MB
        size_t search_max_bytes = 67108864;    // 64MB
        long cache_optimize_interval_s = 300;
        long memory_probe_interval_s = 30;
        double pressure_medium = 0.70;
        double pressure_high = 0.85;
        double pressure_critical = 0.95;

        // Queue
        size_t queue_max_size = 100;
        size_t history_length = 50;
        int queue_max_retries = 3;
        long recovery_cooldown_s = 300;
        size_t recovery_batch = 3;
        int consecutive_failure_threshold = 3;
        std::string recovery_policy = "flat"; // "flat" or "exponential"
        double recovery_backoff_multiplier = 2.0;
        long recovery_backoff_cap_s = 3600;

        static Config& GetInstance() {
            static Config instance;
            return instance;
        }

        static std::vector<BackendConfig> DefaultBackends();

        void Load(const std::string& path);
        // Applies known keys from `data`, adding defaults for missing ones. Returns true if `data` changed.
        bool Apply(nlohmann::json& data);
        void ApplyEnvironment();
        // Throws std::runtime_error describing the first invalid setting.
        void Validate() const;
        void CreateDefault(const std::string& path);
        nlohmann::json ToJson() const;
    };
}
