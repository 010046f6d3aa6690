#include "PublicApiAdapter.hpp"
#include "AdapterHttp.hpp"
#include "../model/Errors.hpp"
#include "../parser/DurationParser.hpp"
#include "../utils/Logger.hpp"
#include "../utils/UrlUtil.hpp"
#include <algorithm>
#include <map>

namespace {

std::optional<std::string> BestThumbnail(const nlohmann::json& snippet) {
    if (!snippet.contains("thumbnails") || !snippet["thumbnails"].is_object()) return std::nullopt;
    const auto& thumbs = snippet["thumbnails"];
    for (const char* quality : {"maxres", "high", "medium", "default"}) {
        if (thumbs.contains(quality) && thumbs[quality].is_object()) {
            std::string url = thumbs[quality].value("url", std::string());
            if (!url.empty()) return url;
        }
    }
    return std::nullopt;
}

} // anonymous namespace

namespace Cadenza {

PublicApiAdapter::PublicApiAdapter(std::string name, IHttpFetcher& fetcher, Options options)
    : name_(std::move(name)), fetcher_(fetcher), options_(std::move(options)) {}

nlohmann::json PublicApiAdapter::Get(const std::string& path, const std::string& query_string) {
    if (options_.api_key.empty()) {
        throw BackendUnavailable(name_ + ": no API key configured", {name_});
    }
    HttpRequest req;
    req.url = options_.base_url + path + "?" + query_string + "&key=" + UrlUtil::Encode(options_.api_key);
    req.timeout_ms = options_.request_timeout_ms;
    req.headers.push_back("Accept: application/json");
    if (!options_.bearer_token.empty()) {
        req.headers.push_back("Authorization: Bearer " + options_.bearer_token);
    }
    return AdapterHttp::ParseJson(fetcher_.FetchSync(req), name_);
}

std::vector<Item> PublicApiAdapter::FetchVideos(const std::vector<std::string>& ids) {
    std::string joined;
    for (const auto& id : ids) {
        if (!joined.empty()) joined += ",";
        joined += id;
    }
    auto data = Get("/videos", "part=snippet,contentDetails&id=" + UrlUtil::Encode(joined));
    if (!data.contains("items") || !data["items"].is_array()) {
        throw BackendProtocolError(name_ + ": videos response has no items", {name_});
    }

    std::map<std::string, Item> by_id;
    for (const auto& video : data["items"]) {
        if (!video.is_object() || !video.contains("id") || !video["id"].is_string()) continue;
        const auto snippet = video.value("snippet", nlohmann::json::object());
        Item item;
        item.title = snippet.value("title", std::string());
        if (item.title.empty()) continue;
        std::string id = video["id"].get<std::string>();
        item.canonical_url = UrlUtil::WatchUrl(id);
        item.source_kind = SourceKind::PublicAPI;
        std::string channel = snippet.value("channelTitle", std::string());
        if (!channel.empty()) item.artist = channel;
        item.thumbnail = BestThumbnail(snippet);
        const auto details = video.value("contentDetails", nlohmann::json::object());
        if (details.contains("duration") && details["duration"].is_string()) {
            item.duration = DurationParser::ParseIso8601(details["duration"].get<std::string>());
        }
        by_id.emplace(id, std::move(item));
    }

    // Keep the order the ids were requested in.
    std::vector<Item> items;
    for (const auto& id : ids) {
        auto it = by_id.find(id);
        if (it != by_id.end()) items.push_back(it->second);
    }
    return items;
}

std::vector<Item> PublicApiAdapter::Search(const std::string& query, size_t limit) {
    if (limit == 0) return {};
    size_t max_results = std::min<size_t>(limit, 50);
    auto data = Get("/search", "part=snippet&type=video&maxResults=" + std::to_string(max_results) + "&q=" + UrlUtil::Encode(query));
    if (!data.contains("items") || !data["items"].is_array()) {
        throw BackendProtocolError(name_ + ": search response has no items", {name_});
    }

    std::vector<std::string> ids;
    for (const auto& entry : data["items"]) {
        if (!entry.is_object() || !entry.contains("id") || !entry["id"].is_object()) continue;
        std::string id = entry["id"].value("videoId", std::string());
        if (!id.empty()) ids.push_back(id);
    }
    if (ids.empty()) return {};
    Logger::Log(LogLevel::Debug, name_, "search returned " + std::to_string(ids.size()) + " ids for '" + query + "'");
    return FetchVideos(ids);
}

Item PublicApiAdapter::Resolve(const std::string& url) {
    auto id = UrlUtil::ExtractVideoId(url);
    if (!id) {
        throw BackendProtocolError(name_ + ": no video id in " + url, {name_});
    }
    auto items = FetchVideos({*id});
    if (items.empty()) {
        throw BackendProtocolError(name_ + ": video " + *id + " not found", {name_});
    }
    return items.front();
}

bool PublicApiAdapter::IsValidUrl(const std::string& url) const {
    return UrlUtil::IsYouTubeUrl(url) && UrlUtil::ExtractVideoId(url).has_value();
}

std::vector<Item> PublicApiAdapter::ResolvePlaylist(const std::string& url, size_t limit) {
    auto list_id = UrlUtil::ExtractPlaylistId(url);
    if (!list_id) {
        throw BackendProtocolError(name_ + ": no playlist id in " + url, {name_});
    }
    if (limit == 0) return {};
    size_t max_results = std::min<size_t>(limit, 50);
    auto data = Get("/playlistItems", "part=snippet&maxResults=" + std::to_string(max_results) + "&playlistId=" + UrlUtil::Encode(*list_id));
    if (!data.contains("items") || !data["items"].is_array()) {
        throw BackendProtocolError(name_ + ": playlistItems response has no items", {name_});
    }

    std::vector<std::string> ids;
    for (const auto& entry : data["items"]) {
        if (!entry.is_object()) continue;
        const auto snippet = entry.value("snippet", nlohmann::json::object());
        const auto resource = snippet.value("resourceId", nlohmann::json::object());
        std::string id = resource.value("videoId", std::string());
        if (!id.empty() && std::find(ids.begin(), ids.end(), id) == ids.end()) ids.push_back(id);
    }
    if (ids.empty()) return {};
    Logger::Log(LogLevel::Debug, name_, "playlist " + *list_id + " lists " + std::to_string(ids.size()) + " videos");
    return FetchVideos(ids);
}

bool PublicApiAdapter::IsValidPlaylistUrl(const std::string& url) const {
    return UrlUtil::ExtractPlaylistId(url).has_value();
}

}
