#pragma once
#include "../interfaces/IBackendAdapter.hpp"
#include "../interfaces/IHttpFetcher.hpp"

namespace Cadenza {

// YouTube Data API v3: search for ids, then one videos call for durations.
class PublicApiAdapter : public IBackendAdapter {
public:
    struct Options {
        std::string api_key;
        std::string bearer_token;
        std::string base_url = "https://www.googleapis.com/youtube/v3";
        long request_timeout_ms = 0;
    };

    PublicApiAdapter(std::string name, IHttpFetcher& fetcher, Options options);

    SourceKind Kind() const override { return SourceKind::PublicAPI; }
    const std::string& Name() const override { return name_; }
    std::vector<Item> Search(const std::string& query, size_t limit) override;
    Item Resolve(const std::string& url) override;
    bool IsValidUrl(const std::string& url) const override;
    // playlistItems for the ids, then videos for durations. Deleted and private entries drop out.
    std::vector<Item> ResolvePlaylist(const std::string& url, size_t limit) override;
    bool IsValidPlaylistUrl(const std::string& url) const override;

private:
    nlohmann::json Get(const std::string& path, const std::string& query_string);
    std::vector<Item> FetchVideos(const std::vector<std::string>& ids);

    std::string name_;
    IHttpFetcher& fetcher_;
    Options options_;
};

}
