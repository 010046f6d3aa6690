#include "Config.hpp"
#include <fstream>
#include <iomanip>
#include <stdexcept>
#include <filesystem>
#include <cstdlib>
#include <set>
#include "../src/utils/Logger.hpp"

namespace {

// Reads `key` into `field`, or writes the current value of `field` back when the key is missing.
template <typename T>
bool ReadKey(nlohmann::json& data, const char* key, T& field) {
    if (data.contains(key) && !data[key].is_null()) {
        try {
            field = data[key].get<T>();
        } catch (const nlohmann::json::exception& e) {
            throw std::runtime_error(std::string("Invalid value for config key '") + key + "': " + e.what());
        }
        return false;
    }
    data[key] = field;
    return true;
}

void ReadEnv(const char* name, std::string& field) {
    if (const char* v = std::getenv(name)) {
        if (*v) field = v;
    }
}

} // anonymous namespace

namespace Cadenza {

std::vector<BackendConfig> Config::DefaultBackends() {
    using std::chrono::milliseconds;
    return {
        {"yt-dlp", SourceKind::PrimaryExtractor, 1, milliseconds(10000), 1, true},
        {"youtube-api", SourceKind::PublicAPI, 2, milliseconds(3000), 1, true},
        {"invidious", SourceKind::Mirror, 3, milliseconds(5000), 2, true},
        {"youtube-feed", SourceKind::Feed, 4, milliseconds(10000), 1, true},
        {"direct", SourceKind::DirectUrl, 5, milliseconds(8000), 1, true},
    };
}

bool Config::Apply(nlohmann::json& data) {
    if (!data.is_object()) {
        throw std::runtime_error("Config root must be a JSON object");
    }
    bool changed = false;
    changed |= ReadKey(data, "bot_token", bot_token);
    changed |= ReadKey(data, "log_level", log_level);
    changed |= ReadKey(data, "component_log_levels", component_log_levels);
    changed |= ReadKey(data, "worker_threads", worker_threads);
    changed |= ReadKey(data, "adapter_threads", adapter_threads);
    changed |= ReadKey(data, "operator_ids", operator_ids);

    changed |= ReadKey(data, "http_user_agent", http_user_agent);
    changed |= ReadKey(data, "http_timeout_ms", http_timeout_ms);
    changed |= ReadKey(data, "http_max_redirects", http_max_redirects);
    changed |= ReadKey(data, "max_body_bytes", max_body_bytes);
    changed |= ReadKey(data, "direct_probe_bytes", direct_probe_bytes);

    changed |= ReadKey(data, "extractor_binary", extractor_binary);
    changed |= ReadKey(data, "extractor_socket_timeout_s", extractor_socket_timeout_s);
    changed |= ReadKey(data, "youtube_api_key", youtube_api_key);
    changed |= ReadKey(data, "youtube_bearer_token", youtube_bearer_token);
    changed |= ReadKey(data, "mirror_instances", mirror_instances);
    changed |= ReadKey(data, "mirror_password", mirror_password);
    changed |= ReadKey(data, "feed_channel_ids", feed_channel_ids);
    changed |= ReadKey(data, "scrape_rate_per_sec", scrape_rate_per_sec);
    changed |= ReadKey(data, "backends", backends);

    changed |= ReadKey(data, "backoff_base_ms", backoff_base_ms);
    changed |= ReadKey(data, "backoff_cap_ms", backoff_cap_ms);
    changed |= ReadKey(data, "fallback_budget_ms", fallback_budget_ms);
    changed |= ReadKey(data, "playlist_max_items", playlist_max_items);

    changed |= ReadKey(data, "stream_ttl_s", stream_ttl_s);
    changed |= ReadKey(data, "metadata_ttl_s", metadata_ttl_s);
    changed |= ReadKey(data, "search_ttl_s", search_ttl_s);
    changed |= ReadKey(data, "stream_max_entries", stream_max_entries);
    changed |= ReadKey(data, "metadata_max_entries", metadata_max_entries);
    changed |= ReadKey(data, "search_max_entries", search_max_entries);
    changed |= ReadKey(data, "stream_max_bytes", stream_max_bytes);
    changed |= ReadKey(data, "metadata_max_bytes", metadata_max_bytes);
    changed |= ReadKey(data, "search_max_bytes", search_max_bytes);
    changed |= ReadKey(data, "cache_optimize_interval_s", cache_optimize_interval_s);
    changed |= ReadKey(data, "memory_probe_interval_s", memory_probe_interval_s);
    changed |= ReadKey(data, "pressure_medium", pressure_medium);
    changed |= ReadKey(data, "pressure_high", pressure_high);
    changed |= ReadKey(data, "pressure_critical", pressure_critical);

    changed |= ReadKey(data, "queue_max_size", queue_max_size);
    changed |= ReadKey(data, "history_length", history_length);
    changed |= ReadKey(data, "queue_max_retries", queue_max_retries);
    changed |= ReadKey(data, "recovery_cooldown_s", recovery_cooldown_s);
    changed |= ReadKey(data, "recovery_batch", recovery_batch);
    changed |= ReadKey(data, "consecutive_failure_threshold", consecutive_failure_threshold);
    changed |= ReadKey(data, "recovery_policy", recovery_policy);
    changed |= ReadKey(data, "recovery_backoff_multiplier", recovery_backoff_multiplier);
    changed |= ReadKey(data, "recovery_backoff_cap_s", recovery_backoff_cap_s);
    return changed;
}

void Config::ApplyEnvironment() {
    ReadEnv("CADENZA_BOT_TOKEN", bot_token);
    ReadEnv("CADENZA_YOUTUBE_API_KEY", youtube_api_key);
    ReadEnv("CADENZA_YOUTUBE_BEARER", youtube_bearer_token);
    ReadEnv("CADENZA_MIRROR_PASSWORD", mirror_password);
    ReadEnv("CADENZA_LOG_LEVEL", log_level);
}

void Config::Validate() const {
    auto fail = [](const std::string& msg) { throw std::runtime_error("Invalid config: " + msg); };

    if (worker_threads < 0) fail("worker_threads must not be negative");
    if (adapter_threads < 0) fail("adapter_threads must not be negative");
    if (http_timeout_ms <= 0) fail("http_timeout_ms must be positive");
    if (http_max_redirects < 0) fail("http_max_redirects must not be negative");
    if (max_body_bytes == 0) fail("max_body_bytes must be positive");
    if (extractor_socket_timeout_s <= 0) fail("extractor_socket_timeout_s must be positive");
    if (scrape_rate_per_sec <= 0.0) fail("scrape_rate_per_sec must be positive");

    std::set<std::string> names;
    for (const auto& b : backends) {
        if (b.name.empty()) fail("backend name must not be empty");
        if (!names.insert(b.name).second) fail("duplicate backend name " + b.name);
        if (b.timeout.count() <= 0) fail("timeout_ms of backend " + b.name + " must be positive");
        if (b.max_retries < 0) fail("max_retries of backend " + b.name + " must not be negative");
    }

    if (backoff_base_ms < 0 || backoff_cap_ms < backoff_base_ms) fail("backoff_base_ms must be in [0, backoff_cap_ms]");
    if (fallback_budget_ms <= 0) fail("fallback_budget_ms must be positive");
    if (playlist_max_items <= 0) fail("playlist_max_items must be positive");

    if (stream_ttl_s <= 0 || metadata_ttl_s <= 0 || search_ttl_s <= 0) fail("cache TTLs must be positive");
    if (stream_max_entries == 0 || metadata_max_entries == 0 || search_max_entries == 0) fail("cache entry ceilings must be positive");
    if (stream_max_bytes == 0 || metadata_max_bytes == 0 || search_max_bytes == 0) fail("cache byte ceilings must be positive");
    if (cache_optimize_interval_s <= 0) fail("cache_optimize_interval_s must be positive");
    if (memory_probe_interval_s < 0) fail("memory_probe_interval_s must not be negative");
    if (!(0.0 < pressure_medium && pressure_medium < pressure_high && pressure_high < pressure_critical && pressure_critical <= 1.0)) {
        fail("memory pressure thresholds must be ascending within (0, 1]");
    }

    if (queue_max_size == 0) fail("queue_max_size must be positive");
    if (queue_max_retries < 1) fail("queue_max_retries must be at least 1");
    if (recovery_cooldown_s < 0) fail("recovery_cooldown_s must not be negative");
    if (recovery_batch == 0) fail("recovery_batch must be positive");
    if (consecutive_failure_threshold < 1) fail("consecutive_failure_threshold must be at least 1");
    if (recovery_policy != "flat" && recovery_policy != "exponential") fail("recovery_policy must be 'flat' or 'exponential'");
    if (recovery_backoff_multiplier < 1.0) fail("recovery_backoff_multiplier must be at least 1");
    if (recovery_backoff_cap_s < recovery_cooldown_s) fail("recovery_backoff_cap_s must not be below recovery_cooldown_s");
}

void Config::Load(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        throw std::runtime_error("Could not open config file: " + path);
    }
    nlohmann::json data;
    try {
        data = nlohmann::json::parse(f);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Could not parse config file " + path + ": " + e.what());
    }

    bool changed = Apply(data);
    ApplyEnvironment();
    Validate();

    // Write back missing keys so an existing config.json reflects newly added options.
    // Unknown keys are preserved; environment overrides are never written.
    if (changed) {
        std::filesystem::path p(path);
        std::filesystem::path bak = p;
        bak += ".bak";
        std::error_code ec;
        std::filesystem::copy_file(p, bak, std::filesystem::copy_options::overwrite_existing, ec);
        if (ec) {
            Logger::Log(LogLevel::Warn, "Could not back up config to " + bak.string() + ": " + ec.message());
        }

        std::ofstream o(path, std::ios::trunc);
        o << std::setw(4) << data << std::endl;
        if (!o.good()) {
            Logger::Log(LogLevel::Warn, "Could not write updated config to " + path);
        }
    }
}

nlohmann::json Config::ToJson() const {
    nlohmann::json data = nlohmann::json::object();
    Config copy = *this;
    copy.Apply(data);
    return data;
}

void Config::CreateDefault(const std::string& path_str) {
    std::filesystem::path path(path_str);

    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }

    Config defaultConfig;
    nlohmann::json data = defaultConfig.ToJson();

    std::ofstream o(path);
    if (!o.is_open()) {
        throw std::runtime_error("Could not open config file for writing: " + path_str);
    }
    o << std::setw(4) << data << std::endl;
    if (!o.good()) {
        throw std::runtime_error("Failed to write to config file: " + path_str);
    }
}

}
