#include "DirectUrlAdapter.hpp"
#include "AdapterHttp.hpp"
#include "../model/Errors.hpp"
#include "../parser/PageMetadataParser.hpp"
#include "../utils/UrlUtil.hpp"
#include <algorithm>

namespace {

std::string Lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return (c >= 'A' && c <= 'Z') ? static_cast<char>(c + 32) : static_cast<char>(c);
    });
    return s;
}

} // anonymous namespace

namespace Cadenza {

DirectUrlAdapter::DirectUrlAdapter(std::string name, IHttpFetcher& fetcher, Options options)
    : name_(std::move(name)), fetcher_(fetcher), options_(options) {}

bool DirectUrlAdapter::IsAudioContentType(const std::string& content_type) {
    std::string type = Lower(content_type.substr(0, content_type.find(';')));
    return type.rfind("audio/", 0) == 0 || type.rfind("video/", 0) == 0 ||
           type == "application/ogg" || type == "application/x-mpegurl" || type == "application/vnd.apple.mpegurl";
}

bool DirectUrlAdapter::HasAudioExtension(const std::string& url) {
    std::string name = Lower(UrlUtil::FileName(url));
    auto dot = name.rfind('.');
    if (dot == std::string::npos) return false;
    static const char* kExtensions[] = {"mp3", "ogg", "oga", "opus", "flac", "wav", "m4a", "aac", "webm", "mp4", "m3u8"};
    std::string ext = name.substr(dot + 1);
    return std::any_of(std::begin(kExtensions), std::end(kExtensions), [&](const char* e) { return ext == e; });
}

FetchResult DirectUrlAdapter::Probe(const std::string& url) {
    HttpRequest req;
    req.url = url;
    req.max_bytes = options_.probe_bytes;
    req.use_range = true;
    req.timeout_ms = options_.request_timeout_ms;
    FetchResult result = fetcher_.FetchSync(req);
    AdapterHttp::CheckResponse(result, name_);
    return result;
}

std::vector<Item> DirectUrlAdapter::Search(const std::string& query, size_t limit) {
    (void)query;
    (void)limit;
    return {};
}

Item DirectUrlAdapter::Resolve(const std::string& url) {
    FetchResult result = Probe(url);

    Item item;
    item.canonical_url = url;
    item.source_kind = SourceKind::DirectUrl;

    if (IsAudioContentType(result.content_type) || (result.content_type.empty() && HasAudioExtension(url))) {
        item.title = UrlUtil::FileName(url);
        if (item.title.empty()) item.title = UrlUtil::ExtractHostLower(url);
        return item;
    }

    if (Lower(result.content_type).find("html") != std::string::npos) {
        auto meta = PageMetadataParser::Parse(result.content);
        if (meta && !meta->title.empty()) {
            item.title = meta->title;
            if (!meta->artist.empty()) item.artist = meta->artist;
            if (!meta->image_url.empty()) item.thumbnail = UrlUtil::ResolveAgainst(url, meta->image_url);
            item.duration = meta->duration;
            return item;
        }
        throw BackendProtocolError(name_ + ": page has no usable metadata: " + url, {name_});
    }

    throw BackendProtocolError(name_ + ": unsupported content type '" + result.content_type + "' at " + url, {name_});
}

bool DirectUrlAdapter::IsValidUrl(const std::string& url) const {
    return UrlUtil::IsHttpUrl(url);
}

std::optional<std::string> DirectUrlAdapter::StreamUrl(const Item& item) {
    if (HasAudioExtension(item.canonical_url)) return item.canonical_url;
    FetchResult result = Probe(item.canonical_url);
    if (IsAudioContentType(result.content_type)) return item.canonical_url;
    if (Lower(result.content_type).find("html") != std::string::npos) {
        auto meta = PageMetadataParser::Parse(result.content);
        if (meta && !meta->audio_url.empty()) return UrlUtil::ResolveAgainst(item.canonical_url, meta->audio_url);
    }
    return std::nullopt;
}

}
