#pragma once
#include <mutex>
#include <memory>
#include "../interfaces/IBackendAdapter.hpp"
#include "../interfaces/IHttpFetcher.hpp"
#include "../interfaces/IRateLimiter.hpp"

namespace Cadenza {

// Invidious-compatible mirror instances. Each call starts at the next instance
// in round-robin order and moves on to the others when one is unreachable.
class MirrorAdapter : public IBackendAdapter {
public:
    struct Options {
        std::vector<std::string> instances;
        std::string password; // sent as Authorization when set
        long request_timeout_ms = 0;
    };

    MirrorAdapter(std::string name, IHttpFetcher& fetcher, std::shared_ptr<IRateLimiter> limiter, Options options);

    SourceKind Kind() const override { return SourceKind::Mirror; }
    const std::string& Name() const override { return name_; }
    std::vector<Item> Search(const std::string& query, size_t limit) override;
    Item Resolve(const std::string& url) override;
    bool IsValidUrl(const std::string& url) const override;
    std::optional<std::string> StreamUrl(const Item& item) override;
    std::vector<Item> ResolvePlaylist(const std::string& url, size_t limit) override;
    bool IsValidPlaylistUrl(const std::string& url) const override;

    // Highest-bitrate audio entry of a videos/{id} response's adaptiveFormats.
    static std::optional<std::string> BestAudioFormat(const nlohmann::json& video);

private:
    size_t NextStartIndex();
    nlohmann::json GetFromAnyInstance(const std::string& path_and_query);
    Item ItemFromVideo(const nlohmann::json& video, const std::string& instance) const;

    std::string name_;
    IHttpFetcher& fetcher_;
    std::shared_ptr<IRateLimiter> limiter_;
    Options options_;
    std::mutex index_mutex_;
    size_t next_index_ = 0;
};

}
