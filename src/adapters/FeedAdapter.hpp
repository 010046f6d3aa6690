#pragma once
#include <memory>
#include "../interfaces/IBackendAdapter.hpp"
#include "../interfaces/IHttpFetcher.hpp"
#include "../interfaces/IRateLimiter.hpp"

namespace Cadenza {

// Scrapes the public search-results page; when that yields nothing, filters the
// configured channels' Atom feeds by the query words.
class FeedAdapter : public IBackendAdapter {
public:
    struct Options {
        std::string site_url = "https://www.youtube.com";
        std::vector<std::string> channel_ids;
        long request_timeout_ms = 0;
    };

    FeedAdapter(std::string name, IHttpFetcher& fetcher, std::shared_ptr<IRateLimiter> limiter, Options options);

    SourceKind Kind() const override { return SourceKind::Feed; }
    const std::string& Name() const override { return name_; }
    std::vector<Item> Search(const std::string& query, size_t limit) override;
    Item Resolve(const std::string& url) override;
    bool IsValidUrl(const std::string& url) const override;

private:
    FetchResult Get(const std::string& url);
    std::vector<Item> SearchFeeds(const std::string& query, size_t limit);

    std::string name_;
    IHttpFetcher& fetcher_;
    std::shared_ptr<IRateLimiter> limiter_;
    Options options_;
};

}
