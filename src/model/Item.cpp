#include "Item.hpp"
#include <cstdint>

namespace Cadenza {

const char* ToString(SourceKind kind) {
    switch (kind) {
        case SourceKind::PrimaryExtractor: return "extractor";
        case SourceKind::PublicAPI:        return "public_api";
        case SourceKind::Mirror:           return "mirror";
        case SourceKind::Feed:             return "feed";
        case SourceKind::DirectUrl:        return "direct";
    }
    return "direct";
}

std::optional<SourceKind> SourceKindFromString(const std::string& s) {
    for (auto kind : {SourceKind::PrimaryExtractor, SourceKind::PublicAPI, SourceKind::Mirror,
                      SourceKind::Feed, SourceKind::DirectUrl}) {
        if (s == ToString(kind)) return kind;
    }
    return std::nullopt;
}

Item Item::WithRequester(dpp::snowflake user) const {
    Item copy = *this;
    copy.requested_by = user;
    return copy;
}

bool operator==(const Item& a, const Item& b) {
    return a.title == b.title && a.artist == b.artist && a.duration == b.duration &&
           a.thumbnail == b.thumbnail && a.canonical_url == b.canonical_url &&
           a.source_kind == b.source_kind && a.requested_by == b.requested_by;
}

bool operator!=(const Item& a, const Item& b) {
    return !(a == b);
}

void to_json(nlohmann::json& j, const Item& item) {
    j = nlohmann::json{
        {"title", item.title},
        {"url", item.canonical_url},
        {"source", item.source_kind},
        {"requested_by", static_cast<uint64_t>(item.requested_by)},
    };
    if (item.artist) j["artist"] = *item.artist;
    if (item.duration) j["duration"] = item.duration->count();
    if (item.thumbnail) j["thumbnail"] = *item.thumbnail;
}

void from_json(const nlohmann::json& j, Item& item) {
    item.title = j.value("title", std::string());
    item.canonical_url = j.value("url", std::string());
    item.source_kind = j.value("source", SourceKind::DirectUrl);
    item.requested_by = j.value("requested_by", static_cast<uint64_t>(0));
    item.artist.reset();
    item.duration.reset();
    item.thumbnail.reset();
    if (j.contains("artist") && j["artist"].is_string()) item.artist = j["artist"].get<std::string>();
    if (j.contains("duration") && j["duration"].is_number()) item.duration = std::chrono::seconds(j["duration"].get<long long>());
    if (j.contains("thumbnail") && j["thumbnail"].is_string()) item.thumbnail = j["thumbnail"].get<std::string>();
}

std::string FormatDuration(const std::optional<std::chrono::seconds>& duration) {
    if (!duration) return "--:--";
    long long total = duration->count();
    if (total < 0) total = 0;
    long long h = total / 3600;
    long long m = (total % 3600) / 60;
    long long s = total % 60;
    auto two = [](long long v) { return (v < 10 ? "0" : "") + std::to_string(v); };
    if (h > 0) return std::to_string(h) + ":" + two(m) + ":" + two(s);
    return std::to_string(m) + ":" + two(s);
}

}
