#pragma once
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <chrono>
#include "../interfaces/IBackendAdapter.hpp"
#include "../model/BackendConfig.hpp"

namespace Cadenza {
    struct BackendHandle {
        BackendConfig config;
        std::shared_ptr<IBackendAdapter> adapter;
    };

    // Adapters and their live policy. Operators change policy at runtime; the
    // resolver takes a fresh snapshot on every call.
    class BackendRegistry {
    public:
        void Add(BackendConfig config, std::unique_ptr<IBackendAdapter> adapter);

        // Enabled backends ordered by ascending priority; ties keep insertion order.
        std::vector<BackendHandle> Snapshot() const;
        std::vector<BackendConfig> Configs() const;

        bool SetEnabled(const std::string& name, bool enabled);
        bool SetTimeout(const std::string& name, std::chrono::milliseconds timeout);
        bool SetMaxRetries(const std::string& name, int max_retries);
        bool SetPriority(const std::string& name, int priority);

    private:
        template <typename F>
        bool Update(const std::string& name, F&& change);

        mutable std::mutex mutex_;
        std::vector<BackendHandle> backends_;
    };
}
