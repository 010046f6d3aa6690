#include "MirrorAdapter.hpp"
#include "AdapterHttp.hpp"
#include "../model/Errors.hpp"
#include "../utils/Logger.hpp"
#include "../utils/UrlUtil.hpp"
#include <algorithm>
#include <exception>

namespace {

std::optional<std::chrono::seconds> LengthSeconds(const nlohmann::json& video) {
    if (!video.contains("lengthSeconds")) return std::nullopt;
    const auto& v = video["lengthSeconds"];
    if (v.is_number()) return std::chrono::seconds(v.get<long long>());
    if (v.is_string()) {
        try {
            return std::chrono::seconds(std::stoll(v.get<std::string>()));
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

long long Bitrate(const nlohmann::json& format) {
    if (!format.contains("bitrate")) return 0;
    const auto& b = format["bitrate"];
    if (b.is_number()) return b.get<long long>();
    if (b.is_string()) {
        try {
            return std::stoll(b.get<std::string>());
        } catch (const std::exception&) {
            return 0;
        }
    }
    return 0;
}

} // anonymous namespace

namespace Cadenza {

MirrorAdapter::MirrorAdapter(std::string name, IHttpFetcher& fetcher, std::shared_ptr<IRateLimiter> limiter, Options options)
    : name_(std::move(name)), fetcher_(fetcher), limiter_(std::move(limiter)), options_(std::move(options)) {
    for (auto& instance : options_.instances) {
        while (!instance.empty() && instance.back() == '/') instance.pop_back();
    }
}

size_t MirrorAdapter::NextStartIndex() {
    std::lock_guard<std::mutex> lock(index_mutex_);
    size_t index = next_index_;
    next_index_ = (next_index_ + 1) % std::max<size_t>(1, options_.instances.size());
    return index;
}

nlohmann::json MirrorAdapter::GetFromAnyInstance(const std::string& path_and_query) {
    if (options_.instances.empty()) {
        throw BackendUnavailable(name_ + ": no mirror instances configured", {name_});
    }
    const size_t count = options_.instances.size();
    const size_t start = NextStartIndex() % count;
    std::exception_ptr last_error;
    for (size_t i = 0; i < count; ++i) {
        const std::string& instance = options_.instances[(start + i) % count];
        if (limiter_ && !limiter_->TryAcquire(UrlUtil::ExtractHostLower(instance))) {
            Logger::Log(LogLevel::Debug, name_, "instance " + instance + " skipped: rate limited");
            last_error = std::make_exception_ptr(BackendUnavailable(name_ + ": " + instance + " rate limited", {name_}));
            continue;
        }
        HttpRequest req;
        req.url = instance + path_and_query;
        req.timeout_ms = options_.request_timeout_ms;
        req.headers.push_back("Accept: application/json");
        if (!options_.password.empty()) {
            req.headers.push_back("Authorization: " + options_.password);
        }
        try {
            return AdapterHttp::ParseJson(fetcher_.FetchSync(req), name_);
        } catch (const BackendUnavailable& e) {
            Logger::Log(LogLevel::Debug, name_, "instance " + instance + " unavailable: " + e.what());
            last_error = std::current_exception();
        } catch (const BackendTimeout& e) {
            Logger::Log(LogLevel::Debug, name_, "instance " + instance + " timed out: " + e.what());
            last_error = std::current_exception();
        }
    }
    std::rethrow_exception(last_error);
}

Item MirrorAdapter::ItemFromVideo(const nlohmann::json& video, const std::string& instance) const {
    Item item;
    item.title = video.value("title", std::string());
    std::string id = video.value("videoId", std::string());
    item.canonical_url = UrlUtil::WatchUrl(id);
    item.source_kind = SourceKind::Mirror;
    std::string author = video.value("author", std::string());
    if (!author.empty()) item.artist = author;
    item.duration = LengthSeconds(video);
    if (video.contains("videoThumbnails") && video["videoThumbnails"].is_array() && !video["videoThumbnails"].empty()) {
        const auto& thumb = video["videoThumbnails"].front();
        if (thumb.is_object()) {
            std::string url = thumb.value("url", std::string());
            if (!url.empty()) item.thumbnail = UrlUtil::ResolveAgainst(instance + "/", url);
        }
    }
    return item;
}

std::vector<Item> MirrorAdapter::Search(const std::string& query, size_t limit) {
    if (limit == 0) return {};
    auto data = GetFromAnyInstance("/api/v1/search?type=video&page=1&q=" + UrlUtil::Encode(query));
    if (!data.is_array()) {
        throw BackendProtocolError(name_ + ": search response is not an array", {name_});
    }
    const std::string& base = options_.instances.front();
    std::vector<Item> items;
    for (const auto& entry : data) {
        if (items.size() >= limit) break;
        if (!entry.is_object() || entry.value("type", std::string("video")) != "video") continue;
        if (entry.value("videoId", std::string()).empty() || entry.value("title", std::string()).empty()) continue;
        items.push_back(ItemFromVideo(entry, base));
    }
    return items;
}

Item MirrorAdapter::Resolve(const std::string& url) {
    auto id = UrlUtil::ExtractVideoId(url);
    if (!id) {
        throw BackendProtocolError(name_ + ": no video id in " + url, {name_});
    }
    auto video = GetFromAnyInstance("/api/v1/videos/" + *id);
    if (!video.is_object() || video.value("title", std::string()).empty()) {
        throw BackendProtocolError(name_ + ": malformed video response for " + *id, {name_});
    }
    if (!video.contains("videoId")) video["videoId"] = *id;
    return ItemFromVideo(video, options_.instances.front());
}

bool MirrorAdapter::IsValidUrl(const std::string& url) const {
    return UrlUtil::IsYouTubeUrl(url) && UrlUtil::ExtractVideoId(url).has_value();
}

std::vector<Item> MirrorAdapter::ResolvePlaylist(const std::string& url, size_t limit) {
    auto list_id = UrlUtil::ExtractPlaylistId(url);
    if (!list_id) {
        throw BackendProtocolError(name_ + ": no playlist id in " + url, {name_});
    }
    if (limit == 0) return {};
    auto data = GetFromAnyInstance("/api/v1/playlists/" + UrlUtil::Encode(*list_id));
    if (!data.is_object() || !data.contains("videos") || !data["videos"].is_array()) {
        throw BackendProtocolError(name_ + ": malformed playlist response for " + *list_id, {name_});
    }
    const std::string& base = options_.instances.front();
    std::vector<Item> items;
    for (const auto& entry : data["videos"]) {
        if (items.size() >= limit) break;
        if (!entry.is_object()) continue;
        if (entry.value("videoId", std::string()).empty() || entry.value("title", std::string()).empty()) continue;
        items.push_back(ItemFromVideo(entry, base));
    }
    return items;
}

bool MirrorAdapter::IsValidPlaylistUrl(const std::string& url) const {
    return UrlUtil::ExtractPlaylistId(url).has_value();
}

std::optional<std::string> MirrorAdapter::BestAudioFormat(const nlohmann::json& video) {
    if (!video.is_object() || !video.contains("adaptiveFormats") || !video["adaptiveFormats"].is_array()) return std::nullopt;
    std::optional<std::string> best;
    long long best_bitrate = -1;
    for (const auto& format : video["adaptiveFormats"]) {
        if (!format.is_object()) continue;
        std::string type = format.value("type", std::string());
        std::string url = format.value("url", std::string());
        if (type.rfind("audio/", 0) != 0 || url.empty()) continue;
        long long bitrate = Bitrate(format);
        if (bitrate > best_bitrate) {
            best_bitrate = bitrate;
            best = url;
        }
    }
    return best;
}

std::optional<std::string> MirrorAdapter::StreamUrl(const Item& item) {
    auto id = UrlUtil::ExtractVideoId(item.canonical_url);
    if (!id) return std::nullopt;
    return BestAudioFormat(GetFromAnyInstance("/api/v1/videos/" + *id));
}

}
