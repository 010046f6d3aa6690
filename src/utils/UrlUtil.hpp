#pragma once
#include <string>
#include <vector>
#include <optional>

namespace Cadenza {
namespace UrlUtil {

// True when the whole (trimmed) input is a single http(s) URL, optionally wrapped in <...>.
bool IsHttpUrl(const std::string& text);

// Strips surrounding whitespace and Discord's <...> link suppression.
std::string Normalize(const std::string& text);

// Resolve possibly-relative or protocol-relative URL against a base URL (page URL).
// Rules:
// - If candidate starts with http:// or https://, return as-is.
// - If candidate starts with //, prefix https:.
// - If candidate starts with /, return base_scheme://base_host + candidate.
// - Otherwise, append to base directory: base_scheme://base_host/base_dir/ + candidate.
// On parse failure, returns candidate unchanged.
std::string ResolveAgainst(const std::string& base_url, const std::string& candidate);

// Percent-encode everything except RFC 3986 unreserved characters.
std::string Encode(const std::string& s);

std::string ExtractHostLower(const std::string& url);

// Last path segment without query or fragment, percent-decoded. Empty if none.
std::string FileName(const std::string& url);

// 11-character video id from watch/shorts/embed/youtu.be URLs.
std::optional<std::string> ExtractVideoId(const std::string& url);

bool IsYouTubeUrl(const std::string& url);

// `list` parameter of a YouTube playlist page or of a video opened from one.
std::optional<std::string> ExtractPlaylistId(const std::string& url);

// Playlist page without a video id, e.g. youtube.com/playlist?list=...
bool IsPlaylistUrl(const std::string& url);

std::string WatchUrl(const std::string& video_id);
std::string PlaylistUrl(const std::string& playlist_id);

}
}
