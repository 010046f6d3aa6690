#pragma once
#include <string>
#include <vector>
#include <optional>
#include "../model/Item.hpp"

namespace Cadenza {

// One external media source. Implementations report failures by throwing
// BackendTimeout, BackendProtocolError or BackendUnavailable.
class IBackendAdapter {
public:
    virtual ~IBackendAdapter() = default;
    virtual SourceKind Kind() const = 0;
    virtual const std::string& Name() const = 0;
    virtual std::vector<Item> Search(const std::string& query, size_t limit) = 0;
    virtual Item Resolve(const std::string& url) = 0;
    virtual bool IsValidUrl(const std::string& url) const = 0;
    // Playlist entries in playlist order, at most `limit`. Only called for URLs
    // IsValidPlaylistUrl accepts.
    virtual std::vector<Item> ResolvePlaylist(const std::string& url, size_t limit) {
        (void)url;
        (void)limit;
        return {};
    }
    virtual bool IsValidPlaylistUrl(const std::string& url) const {
        (void)url;
        return false;
    }
    // Direct media URL for playback, when this source can extract one.
    virtual std::optional<std::string> StreamUrl(const Item& item) {
        (void)item;
        return std::nullopt;
    }
};

}
