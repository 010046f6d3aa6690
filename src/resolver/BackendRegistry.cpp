#include "BackendRegistry.hpp"
#include "../utils/Logger.hpp"
#include <algorithm>
#include <stdexcept>

namespace Cadenza {

void BackendRegistry::Add(BackendConfig config, std::unique_ptr<IBackendAdapter> adapter) {
    if (!adapter) {
        throw std::invalid_argument("Backend " + config.name + " has no adapter");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(backends_.begin(), backends_.end(), [&](const BackendHandle& b) {
        return b.config.name == config.name;
    });
    if (it != backends_.end()) {
        throw std::invalid_argument("Backend " + config.name + " is already registered");
    }
    Logger::Log(LogLevel::Info, "registry", "Registered backend " + config.name + " (" + ToString(config.kind) +
                ", priority " + std::to_string(config.priority) + (config.enabled ? ")" : ", disabled)"));
    backends_.push_back({std::move(config), std::shared_ptr<IBackendAdapter>(std::move(adapter))});
}

std::vector<BackendHandle> BackendRegistry::Snapshot() const {
    std::vector<BackendHandle> out;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& b : backends_) {
            if (b.config.enabled) out.push_back(b);
        }
    }
    std::stable_sort(out.begin(), out.end(), [](const BackendHandle& a, const BackendHandle& b) {
        return a.config.priority < b.config.priority;
    });
    return out;
}

std::vector<BackendConfig> BackendRegistry::Configs() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<BackendConfig> out;
    out.reserve(backends_.size());
    for (const auto& b : backends_) out.push_back(b.config);
    std::stable_sort(out.begin(), out.end(), [](const BackendConfig& a, const BackendConfig& b) {
        return a.priority < b.priority;
    });
    return out;
}

template <typename F>
bool BackendRegistry::Update(const std::string& name, F&& change) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& b : backends_) {
        if (b.config.name == name) {
            change(b.config);
            return true;
        }
    }
    return false;
}

bool BackendRegistry::SetEnabled(const std::string& name, bool enabled) {
    bool found = Update(name, [enabled](BackendConfig& c) { c.enabled = enabled; });
    if (found) Logger::Log(LogLevel::Info, "registry", "Backend " + name + (enabled ? " enabled" : " disabled"));
    return found;
}

bool BackendRegistry::SetTimeout(const std::string& name, std::chrono::milliseconds timeout) {
    if (timeout.count() <= 0) {
        throw std::invalid_argument("Backend timeout must be positive");
    }
    bool found = Update(name, [timeout](BackendConfig& c) { c.timeout = timeout; });
    if (found) Logger::Log(LogLevel::Info, "registry", "Backend " + name + " timeout set to " + std::to_string(timeout.count()) + "ms");
    return found;
}

bool BackendRegistry::SetMaxRetries(const std::string& name, int max_retries) {
    if (max_retries < 0) {
        throw std::invalid_argument("Backend retry count must not be negative");
    }
    bool found = Update(name, [max_retries](BackendConfig& c) { c.max_retries = max_retries; });
    if (found) Logger::Log(LogLevel::Info, "registry", "Backend " + name + " max retries set to " + std::to_string(max_retries));
    return found;
}

bool BackendRegistry::SetPriority(const std::string& name, int priority) {
    bool found = Update(name, [priority](BackendConfig& c) { c.priority = priority; });
    if (found) Logger::Log(LogLevel::Info, "registry", "Backend " + name + " priority set to " + std::to_string(priority));
    return found;
}

}
