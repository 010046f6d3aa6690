#pragma once
#include <string>
#include <vector>
#include <optional>
#include <functional>
#include <chrono>
#include <dpp/snowflake.h>
#include "BackendRegistry.hpp"
#include "../cache/AdaptiveCache.hpp"
#include "../utils/ThreadPool.hpp"

namespace Cadenza {
    enum class AttemptOutcome {
        Success,
        Empty,
        Timeout,
        ProtocolError,
        Unavailable,
        Failed
    };

    const char* ToString(AttemptOutcome outcome);

    struct AttemptRecord {
        std::string backend;
        int attempt = 1;
        AttemptOutcome outcome = AttemptOutcome::Failed;
        std::chrono::milliseconds elapsed{0};
        std::string detail;
    };

    struct ResolveResult {
        std::vector<Item> items;
        std::vector<AttemptRecord> attempts;
        bool from_cache = false;
        bool used_fallback = false;
        std::string effective_query;
    };

    struct ResolverOptions {
        std::chrono::milliseconds backoff_base{250};
        std::chrono::milliseconds backoff_cap{4000};
        std::chrono::milliseconds fallback_budget{20000};
        size_t default_limit = 5;
        size_t playlist_limit = 50;
    };

    // Tries enabled backends in priority order, each under its own deadline and
    // retry count, with the adaptive cache in front. Adapter exceptions never
    // escape: callers see ResolveError subclasses only.
    class HierarchicalResolver {
    public:
        using Sleeper = std::function<void(std::chrono::milliseconds)>;

        // `adapter_pool` runs backend calls only. Resolve blocks until they answer,
        // so it must not be called from a task on that same pool.
        HierarchicalResolver(BackendRegistry& registry, AdaptiveCache& cache, ThreadPool& adapter_pool,
                             ResolverOptions options, Sleeper sleeper = nullptr);

        // URL input goes to backends that accept the URL; anything else is a search.
        // Throws NoResultsError, or the last transient error when every backend failed transiently.
        ResolveResult Resolve(const std::string& input, size_t limit = 0, dpp::snowflake requester = 0);

        // Entries of a playlist link from the first backend that can list it. Cached
        // with the search results under the playlist id. Throws like Resolve.
        ResolveResult ResolvePlaylist(const std::string& input, size_t limit = 0, dpp::snowflake requester = 0);

        // Playable media URL for a queued item, via the stream cache.
        std::string ResolveStreamUrl(const Item& item);
        void InvalidateStream(const std::string& canonical_url);

        std::chrono::milliseconds BackoffDelay(int attempt) const;

        BackendRegistry& Registry() { return registry_; }

    private:
        struct ChainState;

        template <typename R>
        std::optional<R> RunChain(const std::vector<BackendHandle>& backends,
                                  const std::function<R(IBackendAdapter&)>& call,
                                  const std::function<bool(const R&)>& usable,
                                  std::optional<std::chrono::steady_clock::time_point> deadline,
                                  ChainState& state);

        ResolveResult ResolveUrl(const std::string& url, const std::vector<BackendHandle>& backends, dpp::snowflake requester);
        ResolveResult Search(const std::string& query, size_t limit, const std::vector<BackendHandle>& backends, dpp::snowflake requester);
        [[noreturn]] void ThrowExhausted(const ChainState& state, const std::string& what);

        BackendRegistry& registry_;
        AdaptiveCache& cache_;
        ThreadPool& pool_;
        ResolverOptions options_;
        Sleeper sleeper_;
    };
}
