#include "UrlUtil.hpp"
#include <regex>
#include <algorithm>
#include <cstring>
#include <cctype>

namespace Cadenza {
namespace UrlUtil {

static inline bool starts_with(const std::string& s, const char* pfx) {
    size_t n = strlen(pfx);
    return s.size() >= n && memcmp(s.data(), pfx, n) == 0;
}

static inline std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return (char)std::tolower(c); });
    return s;
}

std::string Normalize(const std::string& text) {
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
    auto b = std::find_if_not(text.begin(), text.end(), is_space);
    auto e = std::find_if_not(text.rbegin(), text.rend(), is_space).base();
    if (b >= e) return {};
    std::string s(b, e);
    if (s.size() >= 2 && s.front() == '<' && s.back() == '>') {
        s = s.substr(1, s.size() - 2);
    }
    return s;
}

bool IsHttpUrl(const std::string& text) {
    std::string s = Normalize(text);
    std::string lower = to_lower(s);
    if (!starts_with(lower, "http://") && !starts_with(lower, "https://")) return false;
    if (s.find_first_of(" \t\r\n") != std::string::npos) return false;
    return !ExtractHostLower(s).empty();
}

static inline std::string get_scheme_host(const std::string& url) {
    // Very small parser: scheme://host[:port]
    auto pos_scheme = url.find("://");
    if (pos_scheme == std::string::npos) return {};
    auto start_host = pos_scheme + 3;
    auto pos_end = url.find_first_of("/\\?#", start_host);
    if (pos_end == std::string::npos) pos_end = url.size();
    return url.substr(0, pos_end);
}

static inline std::string get_base_dir(const std::string& url) {
    // Returns scheme://host[:port]/path/dir (without filename)
    auto scheme_host = get_scheme_host(url);
    if (scheme_host.empty()) return {};
    std::string rest = url.substr(scheme_host.size());
    auto qpos = rest.find_first_of("?#");
    if (qpos != std::string::npos) rest = rest.substr(0, qpos);
    if (!rest.empty()) {
        if (rest.back() != '/') {
            auto slash = rest.find_last_of('/');
            if (slash != std::string::npos) rest = rest.substr(0, slash + 1);
            else rest = "/";
        }
    } else {
        rest = "/";
    }
    return scheme_host + rest;
}

std::string ResolveAgainst(const std::string& base_url, const std::string& candidate) {
    if (candidate.empty()) return candidate;
    if (starts_with(candidate, "http://") || starts_with(candidate, "https://")) return candidate;
    if (starts_with(candidate, "//")) return std::string("https:") + candidate;

    auto scheme_host = get_scheme_host(base_url);
    if (scheme_host.empty()) return candidate; // fallback

    if (candidate[0] == '/') {
        return scheme_host + candidate;
    }

    auto base_dir = get_base_dir(base_url);
    if (base_dir.empty()) return candidate;
    if (base_dir.back() != '/') {
        return base_dir + "/" + candidate;
    }
    return base_dir + candidate;
}

std::string Encode(const std::string& s) {
    auto is_unreserved = [](unsigned char c) {
        return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.' || c == '~';
    };
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    out.reserve(s.size() * 3);
    for (unsigned char c : s) {
        if (is_unreserved(c)) {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(hex[(c >> 4) & 0xF]);
            out.push_back(hex[c & 0xF]);
        }
    }
    return out;
}

static inline int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

static std::string Decode(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '%' && i + 2 < s.size()) {
            int hi = hex_value(s[i + 1]);
            int lo = hex_value(s[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>((hi << 4) | lo));
                i += 2;
                continue;
            }
        }
        out.push_back(s[i]);
    }
    return out;
}

std::string ExtractHostLower(const std::string& url) {
    auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos) return {};
    auto start = scheme_end + 3;
    auto end = url.find_first_of("/\\?#", start);
    if (end == std::string::npos) end = url.size();
    std::string host = url.substr(start, end - start);
    // Drop userinfo and port
    auto at = host.rfind('@');
    if (at != std::string::npos) host = host.substr(at + 1);
    auto colon = host.find(':');
    if (colon != std::string::npos) host = host.substr(0, colon);
    return to_lower(host);
}

std::string FileName(const std::string& url) {
    auto scheme_host = get_scheme_host(url);
    std::string path = scheme_host.empty() ? url : url.substr(scheme_host.size());
    auto qpos = path.find_first_of("?#");
    if (qpos != std::string::npos) path = path.substr(0, qpos);
    while (!path.empty() && path.back() == '/') path.pop_back();
    auto slash = path.find_last_of('/');
    std::string name = (slash == std::string::npos) ? path : path.substr(slash + 1);
    return Decode(name);
}

std::optional<std::string> ExtractVideoId(const std::string& url) {
    static const std::regex re(
        R"((?:https?://)?(?:www\.|m\.|music\.)?(?:youtube\.com/(?:watch\?(?:[^#\s]*&)?v=|shorts/|embed/|v/)|youtu\.be/)([A-Za-z0-9_-]{11}))");
    std::smatch m;
    if (std::regex_search(url, m, re)) {
        return m[1].str();
    }
    return std::nullopt;
}

bool IsYouTubeUrl(const std::string& url) {
    std::string host = ExtractHostLower(url);
    if (host.empty()) return false;
    auto ends_with = [&](const std::string& suffix) {
        return host.size() >= suffix.size() && host.compare(host.size() - suffix.size(), suffix.size(), suffix) == 0;
    };
    return host == "youtu.be" || host == "youtube.com" || ends_with(".youtube.com");
}

std::string WatchUrl(const std::string& video_id) {
    return "https://www.youtube.com/watch?v=" + video_id;
}

std::optional<std::string> ExtractPlaylistId(const std::string& url) {
    if (!IsYouTubeUrl(url)) return std::nullopt;
    static const std::regex re(R"([?&]list=([A-Za-z0-9_-]+))");
    std::smatch m;
    if (std::regex_search(url, m, re)) {
        return m[1].str();
    }
    return std::nullopt;
}

bool IsPlaylistUrl(const std::string& url) {
    return ExtractPlaylistId(url).has_value() && !ExtractVideoId(url).has_value();
}

std::string PlaylistUrl(const std::string& playlist_id) {
    return "https://www.youtube.com/playlist?list=" + playlist_id;
}

}
}
