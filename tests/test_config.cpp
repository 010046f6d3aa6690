#include <catch2/catch_all.hpp>
#include <filesystem>
#include <fstream>
#include <random>
#include "../config/Config.hpp"

using namespace Cadenza;

namespace {

std::filesystem::path TempConfigPath() {
    std::random_device rd;
    auto dir = std::filesystem::temp_directory_path() / ("cadenza-config-" + std::to_string(rd()));
    std::filesystem::create_directories(dir);
    return dir / "config.json";
}

} // anonymous namespace

TEST_CASE("Apply fills missing keys with defaults") {
    Config config;
    nlohmann::json data = {{"log_level", "debug"}, {"queue_max_size", 10}};
    CHECK(config.Apply(data));
    CHECK(config.log_level == "debug");
    CHECK(config.queue_max_size == 10);
    CHECK(data["http_timeout_ms"] == 8000);
    CHECK(data["backends"].size() == Config::DefaultBackends().size());

    // A complete document is left unchanged.
    Config again;
    CHECK_FALSE(again.Apply(data));
    CHECK(again.queue_max_size == 10);
}

TEST_CASE("Apply rejects values of the wrong type") {
    Config config;
    nlohmann::json data = {{"queue_max_retries", "three"}};
    CHECK_THROWS_AS(config.Apply(data), std::runtime_error);

    nlohmann::json not_object = nlohmann::json::array();
    CHECK_THROWS_AS(config.Apply(not_object), std::runtime_error);

    nlohmann::json bad_kind = {{"backends", nlohmann::json::array({{{"name", "x"}, {"kind", "carrier-pigeon"}}})}};
    CHECK_THROWS_AS(config.Apply(bad_kind), std::runtime_error);
}

TEST_CASE("Backends read from JSON keep their policy") {
    Config config;
    nlohmann::json data = {{"backends", nlohmann::json::array({
        {{"name", "mirror"}, {"kind", "mirror"}, {"priority", 7}, {"timeout_ms", 1500}, {"max_retries", 4}, {"enabled", false}},
        {{"name", "direct"}, {"kind", "direct"}},
    })}};
    config.Apply(data);
    REQUIRE(config.backends.size() == 2);
    CHECK(config.backends[0].kind == SourceKind::Mirror);
    CHECK(config.backends[0].priority == 7);
    CHECK(config.backends[0].timeout == std::chrono::milliseconds(1500));
    CHECK(config.backends[0].max_retries == 4);
    CHECK_FALSE(config.backends[0].enabled);
    CHECK(config.backends[1].priority == 100);
    CHECK(config.backends[1].enabled);

    auto json = config.ToJson();
    CHECK(json["backends"][0]["kind"] == "mirror");
    CHECK(json["backends"][0]["timeout_ms"] == 1500);
}

TEST_CASE("Validate accepts the defaults and rejects bad settings") {
    CHECK_NOTHROW(Config{}.Validate());

    Config thresholds;
    thresholds.pressure_high = 0.6;
    CHECK_THROWS_AS(thresholds.Validate(), std::runtime_error);

    Config duplicate;
    duplicate.backends.push_back(duplicate.backends.front());
    CHECK_THROWS_WITH(duplicate.Validate(), Catch::Matchers::ContainsSubstring("duplicate backend name"));

    Config policy;
    policy.recovery_policy = "sometimes";
    CHECK_THROWS_AS(policy.Validate(), std::runtime_error);

    Config retries;
    retries.queue_max_retries = 0;
    CHECK_THROWS_AS(retries.Validate(), std::runtime_error);

    Config backoff;
    backoff.backoff_cap_ms = 100;
    CHECK_THROWS_AS(backoff.Validate(), std::runtime_error);
}

TEST_CASE("CreateDefault writes a config that Load reads back") {
    auto path = TempConfigPath();
    Config::CreateDefault(path.string());
    REQUIRE(std::filesystem::exists(path));

    Config config;
    config.Load(path.string());
    CHECK(config.queue_max_retries == 3);
    CHECK(config.backends.size() == Config::DefaultBackends().size());
    CHECK_FALSE(std::filesystem::exists(path.string() + ".bak"));

    std::filesystem::remove_all(path.parent_path());
}

TEST_CASE("Load writes missing keys back and keeps a backup") {
    auto path = TempConfigPath();
    {
        std::ofstream o(path);
        o << R"({"queue_max_size": 25, "custom": true})";
    }

    Config config;
    config.Load(path.string());
    CHECK(config.queue_max_size == 25);
    CHECK(std::filesystem::exists(path.string() + ".bak"));

    std::ifstream in(path);
    auto written = nlohmann::json::parse(in);
    CHECK(written["queue_max_size"] == 25);
    CHECK(written["custom"] == true);
    CHECK(written.contains("recovery_policy"));

    std::filesystem::remove_all(path.parent_path());
}

TEST_CASE("Load reports unreadable and invalid files") {
    Config config;
    CHECK_THROWS_WITH(config.Load("/nonexistent/cadenza/config.json"),
                      Catch::Matchers::StartsWith("Could not open config file"));

    auto path = TempConfigPath();
    {
        std::ofstream o(path);
        o << "{ not json";
    }
    CHECK_THROWS_WITH(config.Load(path.string()), Catch::Matchers::ContainsSubstring("Could not parse"));

    {
        std::ofstream o(path, std::ios::trunc);
        o << R"({"pressure_medium": 0.9, "pressure_high": 0.8})";
    }
    CHECK_THROWS_WITH(config.Load(path.string()), Catch::Matchers::ContainsSubstring("Invalid config"));

    std::filesystem::remove_all(path.parent_path());
}
