#pragma once
#include <string>
#include <chrono>
#include <nlohmann/json.hpp>
#include "Item.hpp"

namespace Cadenza {
    // Per-backend policy. Operators may change it at runtime through the
    // BackendRegistry; the resolver reads a fresh copy on every call.
    struct BackendConfig {
        std::string name;
        SourceKind kind = SourceKind::DirectUrl;
        int priority = 100; // lower is tried first
        std::chrono::milliseconds timeout{5000};
        int max_retries = 1;
        bool enabled = true;
    };

    inline void to_json(nlohmann::json& j, const BackendConfig& b) {
        j = nlohmann::json{
            {"name", b.name},
            {"kind", b.kind},
            {"priority", b.priority},
            {"timeout_ms", b.timeout.count()},
            {"max_retries", b.max_retries},
            {"enabled", b.enabled},
        };
    }

    inline void from_json(const nlohmann::json& j, BackendConfig& b) {
        b.name = j.at("name").get<std::string>();
        std::string kind = j.at("kind").get<std::string>();
        auto parsed = SourceKindFromString(kind);
        if (!parsed) {
            throw std::runtime_error("Unknown backend kind '" + kind + "' for backend " + b.name);
        }
        b.kind = *parsed;
        b.priority = j.value("priority", 100);
        b.timeout = std::chrono::milliseconds(j.value("timeout_ms", 5000L));
        b.max_retries = j.value("max_retries", 1);
        b.enabled = j.value("enabled", true);
    }
}
