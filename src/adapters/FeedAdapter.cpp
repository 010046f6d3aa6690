#include "FeedAdapter.hpp"
#include "AdapterHttp.hpp"
#include "../model/Errors.hpp"
#include "../parser/PageMetadataParser.hpp"
#include "../parser/ResultsPageParser.hpp"
#include "../utils/Logger.hpp"
#include "../utils/UrlUtil.hpp"
#include <algorithm>
#include <sstream>

namespace {

std::string Lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return (c >= 'A' && c <= 'Z') ? static_cast<char>(c + 32) : static_cast<char>(c);
    });
    return s;
}

bool ContainsAllWords(const std::string& haystack, const std::string& query) {
    std::string lower = Lower(haystack);
    std::istringstream words(Lower(query));
    std::string word;
    bool any = false;
    while (words >> word) {
        any = true;
        if (lower.find(word) == std::string::npos) return false;
    }
    return any;
}

} // anonymous namespace

namespace Cadenza {

FeedAdapter::FeedAdapter(std::string name, IHttpFetcher& fetcher, std::shared_ptr<IRateLimiter> limiter, Options options)
    : name_(std::move(name)), fetcher_(fetcher), limiter_(std::move(limiter)), options_(std::move(options)) {}

FetchResult FeedAdapter::Get(const std::string& url) {
    if (limiter_ && !limiter_->TryAcquire(UrlUtil::ExtractHostLower(url))) {
        throw BackendUnavailable(name_ + ": rate limited for " + UrlUtil::ExtractHostLower(url), {name_});
    }
    HttpRequest req;
    req.url = url;
    req.timeout_ms = options_.request_timeout_ms;
    req.headers.push_back("Accept-Language: en-US,en;q=0.9");
    FetchResult result = fetcher_.FetchSync(req);
    AdapterHttp::CheckResponse(result, name_);
    return result;
}

std::vector<Item> FeedAdapter::SearchFeeds(const std::string& query, size_t limit) {
    std::vector<Item> items;
    for (const auto& channel : options_.channel_ids) {
        if (items.size() >= limit) break;
        FetchResult result;
        try {
            result = Get(options_.site_url + "/feeds/videos.xml?channel_id=" + UrlUtil::Encode(channel));
        } catch (const BackendUnavailable& e) {
            Logger::Log(LogLevel::Debug, name_, std::string("feed skipped: ") + e.what());
            continue;
        } catch (const BackendProtocolError& e) {
            Logger::Log(LogLevel::Debug, name_, std::string("feed skipped: ") + e.what());
            continue;
        }
        for (auto& item : ResultsPageParser::ParseFeed(result.content)) {
            std::string haystack = item.title + " " + item.artist.value_or("");
            if (!ContainsAllWords(haystack, query)) continue;
            items.push_back(std::move(item));
            if (items.size() >= limit) break;
        }
    }
    return items;
}

std::vector<Item> FeedAdapter::Search(const std::string& query, size_t limit) {
    if (limit == 0) return {};
    // The sp filter restricts the results page to videos.
    FetchResult page = Get(options_.site_url + "/results?search_query=" + UrlUtil::Encode(query) + "&sp=EgIQAQ%253D%253D");
    auto items = ResultsPageParser::ParseSearchResults(page.content, limit);
    if (!items.empty()) return items;

    Logger::Log(LogLevel::Debug, name_, "results page had no entries for '" + query + "', trying channel feeds");
    return SearchFeeds(query, limit);
}

Item FeedAdapter::Resolve(const std::string& url) {
    auto id = UrlUtil::ExtractVideoId(url);
    if (!id) {
        throw BackendProtocolError(name_ + ": no video id in " + url, {name_});
    }
    FetchResult page = Get(UrlUtil::WatchUrl(*id));
    auto meta = PageMetadataParser::Parse(page.content);
    if (!meta || meta->title.empty()) {
        throw BackendProtocolError(name_ + ": watch page for " + *id + " has no metadata", {name_});
    }
    Item item;
    item.title = meta->title;
    item.canonical_url = UrlUtil::WatchUrl(*id);
    item.source_kind = SourceKind::Feed;
    if (!meta->artist.empty()) item.artist = meta->artist;
    if (!meta->image_url.empty()) item.thumbnail = meta->image_url;
    item.duration = meta->duration;
    return item;
}

bool FeedAdapter::IsValidUrl(const std::string& url) const {
    return UrlUtil::IsYouTubeUrl(url) && UrlUtil::ExtractVideoId(url).has_value();
}

}
