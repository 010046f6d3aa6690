#include "HierarchicalResolver.hpp"
#include "QueryNormalizer.hpp"
#include "ResultRanker.hpp"
#include "../model/Errors.hpp"
#include "../utils/Logger.hpp"
#include "../utils/UrlUtil.hpp"
#include <algorithm>
#include <future>
#include <set>
#include <thread>

namespace Cadenza {

const char* ToString(AttemptOutcome outcome) {
    switch (outcome) {
        case AttemptOutcome::Success:       return "success";
        case AttemptOutcome::Empty:         return "empty";
        case AttemptOutcome::Timeout:       return "timeout";
        case AttemptOutcome::ProtocolError: return "protocol-error";
        case AttemptOutcome::Unavailable:   return "unavailable";
        case AttemptOutcome::Failed:        return "failed";
    }
    return "failed";
}

struct HierarchicalResolver::ChainState {
    std::vector<AttemptRecord> attempts;
    std::vector<std::string> tried;
    // Backends whose last attempt ended for a reason other than a transient error.
    std::set<std::string> settled;
    std::optional<AttemptOutcome> last_transient;
    std::string last_transient_detail;

    void Record(const std::string& backend, int attempt, AttemptOutcome outcome,
                std::chrono::milliseconds elapsed, const std::string& detail) {
        if (std::find(tried.begin(), tried.end(), backend) == tried.end()) tried.push_back(backend);
        attempts.push_back({backend, attempt, outcome, elapsed, detail});
        if (outcome == AttemptOutcome::Timeout || outcome == AttemptOutcome::Unavailable) {
            last_transient = outcome;
            last_transient_detail = detail;
            settled.erase(backend);
        } else {
            settled.insert(backend);
        }
    }
};

HierarchicalResolver::HierarchicalResolver(BackendRegistry& registry, AdaptiveCache& cache, ThreadPool& pool,
                                           ResolverOptions options, Sleeper sleeper)
    : registry_(registry), cache_(cache), pool_(pool), options_(options), sleeper_(std::move(sleeper)) {
    if (!sleeper_) {
        sleeper_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
    }
}

std::chrono::milliseconds HierarchicalResolver::BackoffDelay(int attempt) const {
    if (attempt < 1) attempt = 1;
    long long delay = options_.backoff_base.count();
    for (int i = 1; i < attempt && delay < options_.backoff_cap.count(); ++i) delay *= 2;
    return std::min(std::chrono::milliseconds(delay), options_.backoff_cap);
}

template <typename R>
std::optional<R> HierarchicalResolver::RunChain(const std::vector<BackendHandle>& backends,
                                                const std::function<R(IBackendAdapter&)>& call,
                                                const std::function<bool(const R&)>& usable,
                                                std::optional<std::chrono::steady_clock::time_point> deadline,
                                                ChainState& state) {
    using namespace std::chrono;
    for (const auto& backend : backends) {
        const BackendConfig& cfg = backend.config;
        const int attempts = std::max(1, cfg.max_retries);

        for (int attempt = 1; attempt <= attempts; ++attempt) {
            milliseconds timeout = cfg.timeout;
            if (deadline) {
                auto remaining = duration_cast<milliseconds>(*deadline - steady_clock::now());
                if (remaining.count() <= 0) {
                    Logger::Log(LogLevel::Info, "resolver", "Fallback budget exhausted before " + cfg.name);
                    return std::nullopt;
                }
                timeout = std::min(timeout, remaining);
            }

            auto start = steady_clock::now();
            AttemptOutcome outcome = AttemptOutcome::Failed;
            std::string detail;
            std::optional<R> value;
            try {
                auto adapter = backend.adapter;
                auto future = pool_.enqueue([adapter, call]() { return call(*adapter); });
                if (future.wait_for(timeout) != std::future_status::ready) {
                    // The late result is abandoned with the future.
                    outcome = AttemptOutcome::Timeout;
                    detail = cfg.name + ": no answer within " + std::to_string(timeout.count()) + "ms";
                } else {
                    R r = future.get();
                    if (usable(r)) {
                        outcome = AttemptOutcome::Success;
                        value = std::move(r);
                    } else {
                        outcome = AttemptOutcome::Empty;
                        detail = cfg.name + ": no results";
                    }
                }
            } catch (const BackendTimeout& e) {
                outcome = AttemptOutcome::Timeout;
                detail = e.what();
            } catch (const BackendProtocolError& e) {
                outcome = AttemptOutcome::ProtocolError;
                detail = e.what();
            } catch (const BackendUnavailable& e) {
                outcome = AttemptOutcome::Unavailable;
                detail = e.what();
            } catch (const NoResultsError& e) {
                outcome = AttemptOutcome::Empty;
                detail = e.what();
            } catch (const std::exception& e) {
                outcome = AttemptOutcome::Failed;
                detail = cfg.name + ": " + e.what();
            }

            auto elapsed = duration_cast<milliseconds>(steady_clock::now() - start);
            state.Record(cfg.name, attempt, outcome, elapsed, detail);

            LogLevel level = LogLevel::Debug;
            if (outcome == AttemptOutcome::Timeout || outcome == AttemptOutcome::Unavailable) level = LogLevel::Warn;
            else if (outcome == AttemptOutcome::ProtocolError || outcome == AttemptOutcome::Failed) level = LogLevel::Error;
            Logger::Log(level, "resolver", cfg.name + " attempt " + std::to_string(attempt) + "/" + std::to_string(attempts) +
                        ": " + ToString(outcome) + " in " + std::to_string(elapsed.count()) + "ms" +
                        (detail.empty() ? std::string() : " (" + detail + ")"));

            if (outcome == AttemptOutcome::Success) return value;
            if (outcome != AttemptOutcome::Timeout) break; // skip this backend for the rest of the call

            if (attempt < attempts) {
                milliseconds delay = BackoffDelay(attempt);
                if (deadline) {
                    auto remaining = duration_cast<milliseconds>(*deadline - steady_clock::now());
                    delay = std::max(milliseconds(0), std::min(delay, remaining));
                }
                if (delay.count() > 0) sleeper_(delay);
            }
        }
    }
    return std::nullopt;
}

void HierarchicalResolver::ThrowExhausted(const ChainState& state, const std::string& what) {
    const std::string tried = " (tried: " + JoinNames(state.tried) + ")";
    if (state.settled.empty() && state.last_transient) {
        if (*state.last_transient == AttemptOutcome::Timeout) {
            throw BackendTimeout(state.last_transient_detail + tried, state.tried);
        }
        throw BackendUnavailable(state.last_transient_detail + tried, state.tried);
    }
    throw NoResultsError(what + tried, state.tried);
}

ResolveResult HierarchicalResolver::Resolve(const std::string& input, size_t limit, dpp::snowflake requester) {
    if (limit == 0) limit = options_.default_limit;

    auto backends = registry_.Snapshot();
    if (backends.empty()) {
        Logger::Log(LogLevel::Warn, "resolver", "Resolve called with every backend disabled");
        throw NoResultsError("No backends are enabled", {});
    }

    std::string text = UrlUtil::Normalize(input);
    if (text.empty()) {
        throw NoResultsError("Empty query", {});
    }

    if (UrlUtil::IsHttpUrl(text)) {
        return ResolveUrl(text, backends, requester);
    }
    return Search(text, limit, backends, requester);
}

ResolveResult HierarchicalResolver::ResolveUrl(const std::string& url, const std::vector<BackendHandle>& backends, dpp::snowflake requester) {
    ResolveResult result;
    result.effective_query = url;
    const std::string key = UrlUtil::ExtractVideoId(url).value_or(url);

    if (auto cached = cache_.GetMetadata(key)) {
        Logger::Log(LogLevel::Debug, "resolver", "Metadata cache hit for " + key);
        result.items.push_back(cached->WithRequester(requester));
        result.from_cache = true;
        return result;
    }

    std::vector<BackendHandle> accepting;
    for (const auto& b : backends) {
        if (b.adapter->IsValidUrl(url)) accepting.push_back(b);
    }
    if (accepting.empty()) {
        throw NoResultsError("No enabled backend accepts " + url, {});
    }

    ChainState state;
    std::function<std::vector<Item>(IBackendAdapter&)> call = [url](IBackendAdapter& a) {
        return std::vector<Item>{a.Resolve(url)};
    };
    std::function<bool(const std::vector<Item>&)> usable = [](const std::vector<Item>& v) {
        return !v.empty() && !v.front().title.empty();
    };
    auto items = RunChain(accepting, call, usable, std::nullopt, state);
    result.attempts = std::move(state.attempts);
    if (!items) {
        ThrowExhausted(state, "Could not resolve " + url);
    }

    Item item = items->front();
    if (!cache_.PutMetadata(key, item)) {
        Logger::Log(LogLevel::Debug, "resolver", "Metadata for " + key + " was not cached");
    }
    result.items.push_back(item.WithRequester(requester));
    return result;
}

ResolveResult HierarchicalResolver::Search(const std::string& query, size_t limit, const std::vector<BackendHandle>& backends, dpp::snowflake requester) {
    ResolveResult result;
    result.effective_query = query;
    const std::string key = QueryNormalizer::Normalize(query);

    // The cache keeps the whole ranked list so a later call with a larger limit can use it.
    const size_t fetch_limit = std::max(limit, options_.default_limit);

    auto finish = [&](std::vector<Item> items, const std::string& ranked_by) {
        ResultRanker::Rank(items, ranked_by);
        if (!key.empty() && !cache_.PutSearch(key, items)) {
            Logger::Log(LogLevel::Debug, "resolver", "Search results for '" + key + "' were not cached");
        }
        if (items.size() > limit) items.resize(limit);
        for (auto& item : items) item.requested_by = requester;
        result.items = std::move(items);
    };

    if (!key.empty()) {
        if (auto cached = cache_.GetSearch(key)) {
            if (!cached->empty() && cached->size() >= limit) {
                Logger::Log(LogLevel::Debug, "resolver", "Search cache hit for '" + key + "'");
                if (cached->size() > limit) cached->resize(limit);
                for (auto& item : *cached) item.requested_by = requester;
                result.items = std::move(*cached);
                result.from_cache = true;
                return result;
            }
        }
    }

    ChainState state;
    std::function<bool(const std::vector<Item>&)> usable = [](const std::vector<Item>& v) { return !v.empty(); };
    auto search_for = [fetch_limit](const std::string& q) {
        return std::function<std::vector<Item>(IBackendAdapter&)>([q, fetch_limit](IBackendAdapter& a) {
            return a.Search(q, fetch_limit);
        });
    };

    if (auto items = RunChain(backends, search_for(query), usable, std::nullopt, state)) {
        finish(std::move(*items), query);
        result.attempts = std::move(state.attempts);
        return result;
    }

    const auto deadline = std::chrono::steady_clock::now() + options_.fallback_budget;
    for (const auto& correction : QueryNormalizer::Corrections(query)) {
        if (std::chrono::steady_clock::now() >= deadline) break;
        Logger::Log(LogLevel::Info, "resolver", "No results for '" + query + "', retrying as '" + correction + "'");
        if (auto items = RunChain(backends, search_for(correction), usable, deadline, state)) {
            finish(std::move(*items), correction);
            result.attempts = std::move(state.attempts);
            result.used_fallback = true;
            result.effective_query = correction;
            return result;
        }
    }

    ThrowExhausted(state, "No results for '" + query + "'");
}

ResolveResult HierarchicalResolver::ResolvePlaylist(const std::string& input, size_t limit, dpp::snowflake requester) {
    if (limit == 0) limit = options_.playlist_limit;

    auto backends = registry_.Snapshot();
    if (backends.empty()) {
        Logger::Log(LogLevel::Warn, "resolver", "ResolvePlaylist called with every backend disabled");
        throw NoResultsError("No backends are enabled", {});
    }

    const std::string url = UrlUtil::Normalize(input);
    auto list_id = UrlUtil::ExtractPlaylistId(url);
    if (!list_id) {
        throw NoResultsError("Not a playlist link: " + url, {});
    }

    ResolveResult result;
    result.effective_query = url;
    // Normalized queries never contain ':', so this cannot collide with a search key.
    const std::string key = "playlist:" + *list_id;
    const size_t fetch_limit = std::max(limit, options_.playlist_limit);

    auto finish = [&](std::vector<Item> items) {
        if (items.size() > limit) items.resize(limit);
        for (auto& item : items) item.requested_by = requester;
        result.items = std::move(items);
    };

    if (limit <= options_.playlist_limit) {
        if (auto cached = cache_.GetSearch(key)) {
            if (!cached->empty()) {
                Logger::Log(LogLevel::Debug, "resolver", "Playlist cache hit for " + *list_id);
                finish(std::move(*cached));
                result.from_cache = true;
                return result;
            }
        }
    }

    std::vector<BackendHandle> accepting;
    for (const auto& b : backends) {
        if (b.adapter->IsValidPlaylistUrl(url)) accepting.push_back(b);
    }
    if (accepting.empty()) {
        throw NoResultsError("No enabled backend can list " + url, {});
    }

    ChainState state;
    std::function<std::vector<Item>(IBackendAdapter&)> call = [url, fetch_limit](IBackendAdapter& a) {
        return a.ResolvePlaylist(url, fetch_limit);
    };
    std::function<bool(const std::vector<Item>&)> usable = [](const std::vector<Item>& v) { return !v.empty(); };
    auto items = RunChain(accepting, call, usable, std::nullopt, state);
    result.attempts = std::move(state.attempts);
    if (!items) {
        ThrowExhausted(state, "Playlist " + *list_id + " is empty or unavailable");
    }

    Logger::Log(LogLevel::Info, "resolver", "Playlist " + *list_id + " resolved to " + std::to_string(items->size()) + " items");
    if (!cache_.PutSearch(key, *items)) {
        Logger::Log(LogLevel::Debug, "resolver", "Playlist " + *list_id + " was not cached");
    }
    finish(std::move(*items));
    return result;
}

std::string HierarchicalResolver::ResolveStreamUrl(const Item& item) {
    const std::string& url = item.canonical_url;
    if (auto cached = cache_.GetStream(url)) {
        return *cached;
    }

    std::vector<BackendHandle> accepting;
    for (const auto& b : registry_.Snapshot()) {
        if (b.adapter->IsValidUrl(url)) accepting.push_back(b);
    }
    if (accepting.empty()) {
        throw NoResultsError("No enabled backend can stream " + url, {});
    }

    using Stream = std::optional<std::string>;
    ChainState state;
    std::function<Stream(IBackendAdapter&)> call = [item](IBackendAdapter& a) { return a.StreamUrl(item); };
    std::function<bool(const Stream&)> usable = [](const Stream& s) { return s.has_value() && !s->empty(); };
    auto found = RunChain(accepting, call, usable, std::nullopt, state);
    if (!found) {
        ThrowExhausted(state, "No stream found for " + url);
    }

    const std::string& stream = **found;
    if (!cache_.PutStream(url, stream)) {
        Logger::Log(LogLevel::Debug, "resolver", "Stream URL for " + url + " was not cached");
    }
    return stream;
}

void HierarchicalResolver::InvalidateStream(const std::string& canonical_url) {
    if (cache_.EraseStream(canonical_url)) {
        Logger::Log(LogLevel::Debug, "resolver", "Dropped cached stream for " + canonical_url);
    }
}

}
