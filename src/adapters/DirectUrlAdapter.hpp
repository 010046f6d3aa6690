#pragma once
#include "../interfaces/IBackendAdapter.hpp"
#include "../interfaces/IHttpFetcher.hpp"

namespace Cadenza {

// Plain http(s) links: audio files play as-is, HTML pages are read for
// OpenGraph metadata. Cannot search.
class DirectUrlAdapter : public IBackendAdapter {
public:
    struct Options {
        size_t probe_bytes = 65536;
        long request_timeout_ms = 0;
    };

    DirectUrlAdapter(std::string name, IHttpFetcher& fetcher, Options options);

    SourceKind Kind() const override { return SourceKind::DirectUrl; }
    const std::string& Name() const override { return name_; }
    std::vector<Item> Search(const std::string& query, size_t limit) override;
    Item Resolve(const std::string& url) override;
    bool IsValidUrl(const std::string& url) const override;
    std::optional<std::string> StreamUrl(const Item& item) override;

    static bool IsAudioContentType(const std::string& content_type);
    static bool HasAudioExtension(const std::string& url);

private:
    FetchResult Probe(const std::string& url);

    std::string name_;
    IHttpFetcher& fetcher_;
    Options options_;
};

}
