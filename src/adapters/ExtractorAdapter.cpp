#include "ExtractorAdapter.hpp"
#include "../model/Errors.hpp"
#include "../utils/Logger.hpp"
#include "../utils/UrlUtil.hpp"
#include <algorithm>
#include <sstream>

namespace {

std::string FirstLine(const std::string& text) {
    auto end = text.find('\n');
    std::string line = text.substr(0, end);
    while (!line.empty() && (line.back() == '\r' || line.back() == ' ')) line.pop_back();
    return line;
}

// yt-dlp prints "ERROR: ..." lines; the last one is usually the most specific.
std::string LastErrorLine(const std::string& err) {
    std::istringstream in(err);
    std::string line, last;
    while (std::getline(in, line)) {
        if (!line.empty()) last = line;
    }
    return last.empty() ? std::string("no error output") : last;
}

} // anonymous namespace

namespace Cadenza {

ExtractorAdapter::ExtractorAdapter(std::string name, Options options, ProcessRunner runner)
    : name_(std::move(name)), options_(std::move(options)), runner_(std::move(runner)) {}

ExtractorAdapter::ProcessRunner ExtractorAdapter::DefaultRunner() {
    return [](const std::vector<std::string>& argv, std::chrono::milliseconds timeout) {
        return RunProcess(argv, timeout);
    };
}

std::vector<std::string> ExtractorAdapter::BaseArgs() const {
    return {
        options_.binary,
        "--no-warnings",
        "--skip-download",
        "--socket-timeout", std::to_string(options_.socket_timeout_s),
    };
}

ProcessResult ExtractorAdapter::Run(const std::vector<std::string>& argv) {
    Logger::Log(LogLevel::Debug, name_, "running " + argv.front() + " for " + argv.back());
    ProcessResult result = runner_(argv, options_.process_timeout);
    if (!result.spawn_error.empty()) {
        throw BackendUnavailable(name_ + ": could not start extractor: " + result.spawn_error, {name_});
    }
    if (result.timed_out) {
        throw BackendTimeout(name_ + ": extractor killed after " + std::to_string(options_.process_timeout.count()) + "ms", {name_});
    }
    if (result.exit_code != 0) {
        std::string reason = LastErrorLine(result.err);
        if (reason.find("timed out") != std::string::npos) {
            throw BackendTimeout(name_ + ": " + reason, {name_});
        }
        throw BackendUnavailable(name_ + ": exit code " + std::to_string(result.exit_code) + ": " + reason, {name_});
    }
    return result;
}

std::optional<Item> ExtractorAdapter::ItemFromJson(const nlohmann::json& info) {
    if (!info.is_object()) return std::nullopt;
    Item item;
    item.title = info.value("title", std::string());
    if (item.title.empty()) return std::nullopt;
    item.source_kind = SourceKind::PrimaryExtractor;

    std::string url = info.value("webpage_url", std::string());
    if (url.empty()) url = info.value("original_url", std::string());
    if (url.empty()) {
        // Flat-playlist entries may only carry the id or a relative url.
        std::string raw = info.value("url", std::string());
        if (UrlUtil::IsHttpUrl(raw)) url = raw;
        else if (info.contains("id") && info["id"].is_string()) url = UrlUtil::WatchUrl(info["id"].get<std::string>());
    }
    if (url.empty()) return std::nullopt;
    item.canonical_url = url;

    for (const char* key : {"artist", "uploader", "channel"}) {
        if (info.contains(key) && info[key].is_string() && !info[key].get<std::string>().empty()) {
            item.artist = info[key].get<std::string>();
            break;
        }
    }
    if (info.contains("duration") && info["duration"].is_number()) {
        double d = info["duration"].get<double>();
        if (d >= 0) item.duration = std::chrono::seconds(static_cast<long long>(d));
    }
    if (info.contains("thumbnail") && info["thumbnail"].is_string()) {
        item.thumbnail = info["thumbnail"].get<std::string>();
    } else if (info.contains("thumbnails") && info["thumbnails"].is_array() && !info["thumbnails"].empty()) {
        const auto& last = info["thumbnails"].back();
        if (last.is_object() && last.contains("url") && last["url"].is_string()) item.thumbnail = last["url"].get<std::string>();
    }
    return item;
}

std::vector<Item> ExtractorAdapter::Search(const std::string& query, size_t limit) {
    if (limit == 0) return {};
    auto argv = BaseArgs();
    argv.insert(argv.end(), {"--dump-json", "--flat-playlist", "ytsearch" + std::to_string(limit) + ":" + query});
    ProcessResult result = Run(argv);
    return ParseItems(result.out, limit);
}

std::vector<Item> ExtractorAdapter::ParseItems(const std::string& out, size_t limit) const {
    std::vector<Item> items;
    std::istringstream lines(out);
    std::string line;
    size_t bad_lines = 0;
    while (std::getline(lines, line) && items.size() < limit) {
        if (line.empty()) continue;
        auto info = nlohmann::json::parse(line, nullptr, false);
        auto item = info.is_discarded() ? std::nullopt : ItemFromJson(info);
        if (item) items.push_back(std::move(*item));
        else ++bad_lines;
    }
    if (items.empty() && bad_lines > 0) {
        throw BackendProtocolError(name_ + ": unparsable extractor output", {name_});
    }
    return items;
}

Item ExtractorAdapter::Resolve(const std::string& url) {
    auto argv = BaseArgs();
    argv.insert(argv.end(), {"--dump-json", "--no-playlist", url});
    ProcessResult result = Run(argv);

    auto info = nlohmann::json::parse(FirstLine(result.out), nullptr, false);
    auto item = info.is_discarded() ? std::nullopt : ItemFromJson(info);
    if (!item) {
        throw BackendProtocolError(name_ + ": unparsable extractor output for " + url, {name_});
    }
    return *item;
}

bool ExtractorAdapter::IsValidUrl(const std::string& url) const {
    return UrlUtil::IsHttpUrl(url);
}

std::vector<Item> ExtractorAdapter::ResolvePlaylist(const std::string& url, size_t limit) {
    auto list_id = UrlUtil::ExtractPlaylistId(url);
    if (!list_id) {
        throw BackendProtocolError(name_ + ": no playlist id in " + url, {name_});
    }
    if (limit == 0) return {};
    auto argv = BaseArgs();
    argv.insert(argv.end(), {"--dump-json", "--flat-playlist", "--playlist-end", std::to_string(limit),
                             UrlUtil::PlaylistUrl(*list_id)});
    ProcessResult result = Run(argv);
    auto items = ParseItems(result.out, limit);
    items.erase(std::remove_if(items.begin(), items.end(), [](const Item& item) {
                    return item.title == "[Deleted video]" || item.title == "[Private video]";
                }),
                items.end());
    return items;
}

bool ExtractorAdapter::IsValidPlaylistUrl(const std::string& url) const {
    return UrlUtil::ExtractPlaylistId(url).has_value();
}

std::optional<std::string> ExtractorAdapter::StreamUrl(const Item& item) {
    auto argv = BaseArgs();
    argv.insert(argv.end(), {"-f", "bestaudio/best", "--get-url", "--no-playlist", item.canonical_url});
    ProcessResult result = Run(argv);
    std::string url = FirstLine(result.out);
    if (!UrlUtil::IsHttpUrl(url)) return std::nullopt;
    return url;
}

}
