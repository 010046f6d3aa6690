#include <catch2/catch_all.hpp>
#include <algorithm>
#include "adapters/AdapterFactory.hpp"
#include "adapters/AdapterHttp.hpp"
#include "adapters/DirectUrlAdapter.hpp"
#include "adapters/ExtractorAdapter.hpp"
#include "adapters/FeedAdapter.hpp"
#include "adapters/MirrorAdapter.hpp"
#include "adapters/PublicApiAdapter.hpp"
#include "../config/Config.hpp"
#include "Fakes.hpp"

using namespace Cadenza;
using Testing::FakeFetcher;
using Testing::FixedRateLimiter;
using std::chrono::milliseconds;
using std::chrono::seconds;

namespace {

bool Contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

struct RecordingRunner {
    std::vector<std::vector<std::string>> calls;
    ProcessResult next;

    ExtractorAdapter::ProcessRunner Get() {
        return [this](const std::vector<std::string>& argv, milliseconds) {
            calls.push_back(argv);
            return next;
        };
    }
};

ProcessResult Output(const std::string& out) {
    ProcessResult r;
    r.exit_code = 0;
    r.out = out;
    return r;
}

} // anonymous namespace

TEST_CASE("CheckResponse maps transport and status failures") {
    FetchResult timed_out;
    timed_out.timed_out = true;
    CHECK_THROWS_AS(AdapterHttp::CheckResponse(timed_out, "b"), BackendTimeout);

    FetchResult refused;
    refused.error = "Couldn't connect to server";
    CHECK_THROWS_AS(AdapterHttp::CheckResponse(refused, "b"), BackendUnavailable);

    CHECK_THROWS_AS(AdapterHttp::CheckResponse(FakeFetcher::Status(429), "b"), BackendUnavailable);
    CHECK_THROWS_AS(AdapterHttp::CheckResponse(FakeFetcher::Status(502), "b"), BackendUnavailable);
    CHECK_THROWS_AS(AdapterHttp::CheckResponse(FakeFetcher::Status(404), "b"), BackendProtocolError);
    CHECK_NOTHROW(AdapterHttp::CheckResponse(FakeFetcher::Status(206), "b"));

    CHECK_THROWS_AS(AdapterHttp::ParseJson(FakeFetcher::Ok("{not json"), "b"), BackendProtocolError);
    FetchResult truncated = FakeFetcher::Ok("{}");
    truncated.truncated = true;
    CHECK_THROWS_AS(AdapterHttp::ParseJson(truncated, "b"), BackendProtocolError);
    CHECK(AdapterHttp::ParseJson(FakeFetcher::Ok(R"({"a":1})"), "b")["a"] == 1);
}

TEST_CASE("ExtractorAdapter searches with a fixed argument set") {
    RecordingRunner runner;
    runner.next = Output(
        R"({"id":"aaaaaaaaaaa","title":"One","uploader":"Up","duration":201.5})" "\n"
        R"({"url":"https://www.youtube.com/watch?v=bbbbbbbbbbb","title":"Two","thumbnails":[{"url":"s"},{"url":"l"}]})" "\n");
    ExtractorAdapter::Options options;
    options.binary = "/usr/bin/yt-dlp";
    options.socket_timeout_s = 7;
    ExtractorAdapter adapter("yt-dlp", options, runner.Get());

    auto items = adapter.Search("never gonna", 2);
    REQUIRE(runner.calls.size() == 1);
    const std::vector<std::string> expected = {
        "/usr/bin/yt-dlp", "--no-warnings", "--skip-download", "--socket-timeout", "7",
        "--dump-json", "--flat-playlist", "ytsearch2:never gonna"};
    CHECK(runner.calls[0] == expected);

    REQUIRE(items.size() == 2);
    CHECK(items[0].title == "One");
    CHECK(items[0].canonical_url == "https://www.youtube.com/watch?v=aaaaaaaaaaa");
    CHECK(items[0].artist == std::optional<std::string>("Up"));
    CHECK(items[0].duration == seconds(201));
    CHECK(items[0].source_kind == SourceKind::PrimaryExtractor);
    CHECK(items[1].canonical_url == "https://www.youtube.com/watch?v=bbbbbbbbbbb");
    CHECK(items[1].thumbnail == std::optional<std::string>("l"));
}

TEST_CASE("ExtractorAdapter maps process failures onto backend errors") {
    RecordingRunner runner;
    ExtractorAdapter adapter("yt-dlp", ExtractorAdapter::Options{}, runner.Get());

    runner.next = ProcessResult{};
    runner.next.spawn_error = "yt-dlp: No such file or directory";
    CHECK_THROWS_AS(adapter.Search("q", 1), BackendUnavailable);

    runner.next = ProcessResult{};
    runner.next.timed_out = true;
    CHECK_THROWS_AS(adapter.Search("q", 1), BackendTimeout);

    runner.next = ProcessResult{};
    runner.next.exit_code = 1;
    runner.next.err = "WARNING: x\nERROR: Read timed out.\n";
    CHECK_THROWS_AS(adapter.Search("q", 1), BackendTimeout);

    runner.next.err = "ERROR: Video unavailable\n";
    CHECK_THROWS_AS(adapter.Resolve("https://www.youtube.com/watch?v=aaaaaaaaaaa"), BackendUnavailable);

    runner.next = Output("this is not json\n");
    CHECK_THROWS_AS(adapter.Search("q", 1), BackendProtocolError);
    CHECK_THROWS_AS(adapter.Resolve("https://www.youtube.com/watch?v=aaaaaaaaaaa"), BackendProtocolError);
}

TEST_CASE("ExtractorAdapter resolves URLs and extracts stream URLs") {
    RecordingRunner runner;
    ExtractorAdapter adapter("yt-dlp", ExtractorAdapter::Options{}, runner.Get());

    runner.next = Output(R"({"webpage_url":"https://www.youtube.com/watch?v=ccccccccccc","title":"Three","channel":"Chan","thumbnail":"t"})");
    Item item = adapter.Resolve("https://youtu.be/ccccccccccc");
    CHECK(item.title == "Three");
    CHECK(item.artist == std::optional<std::string>("Chan"));
    CHECK(runner.calls.back().back() == "https://youtu.be/ccccccccccc");
    CHECK(std::find(runner.calls.back().begin(), runner.calls.back().end(), "--no-playlist") != runner.calls.back().end());

    runner.next = Output("https://media.example/audio.webm?x=1\n");
    CHECK(adapter.StreamUrl(item) == std::optional<std::string>("https://media.example/audio.webm?x=1"));
    CHECK(std::find(runner.calls.back().begin(), runner.calls.back().end(), "bestaudio/best") != runner.calls.back().end());

    runner.next = Output("\n");
    CHECK_FALSE(adapter.StreamUrl(item).has_value());

    CHECK(adapter.IsValidUrl("https://soundcloud.com/a/b"));
    CHECK_FALSE(adapter.IsValidUrl("just words"));
}

TEST_CASE("PublicApiAdapter searches then fetches details in request order") {
    FakeFetcher fetcher;
    fetcher.handler = [](const HttpRequest& req) {
        if (Contains(req.url, "/search?")) {
            return FakeFetcher::Ok(R"({"items":[
                {"id":{"kind":"youtube#video","videoId":"aaaaaaaaaaa"}},
                {"id":{"kind":"youtube#channel","channelId":"UC1"}},
                {"id":{"kind":"youtube#video","videoId":"bbbbbbbbbbb"}}]})");
        }
        return FakeFetcher::Ok(R"({"items":[
            {"id":"bbbbbbbbbbb","snippet":{"title":"B","channelTitle":"Chan B","thumbnails":{"default":{"url":"d"},"high":{"url":"h"}}},
             "contentDetails":{"duration":"PT4M1S"}},
            {"id":"aaaaaaaaaaa","snippet":{"title":"A"},"contentDetails":{"duration":"PT1H"}}]})");
    };
    PublicApiAdapter::Options options;
    options.api_key = "k&y";
    options.base_url = "https://api.example/v3";
    PublicApiAdapter adapter("youtube-api", fetcher, options);

    auto items = adapter.Search("some song", 5);
    REQUIRE(items.size() == 2);
    CHECK(items[0].title == "A");
    CHECK(items[0].duration == seconds(3600));
    CHECK(items[1].title == "B");
    CHECK(items[1].artist == std::optional<std::string>("Chan B"));
    CHECK(items[1].thumbnail == std::optional<std::string>("h"));
    CHECK(items[1].duration == seconds(241));
    CHECK(items[1].source_kind == SourceKind::PublicAPI);

    auto requests = fetcher.Requests();
    REQUIRE(requests.size() == 2);
    CHECK(Contains(requests[0].url, "https://api.example/v3/search?part=snippet&type=video&maxResults=5&q=some%20song"));
    CHECK(Contains(requests[0].url, "&key=k%26y"));
    CHECK(Contains(requests[1].url, "id=aaaaaaaaaaa%2Cbbbbbbbbbbb"));
}

TEST_CASE("PublicApiAdapter reports missing keys and bad responses") {
    FakeFetcher fetcher;
    PublicApiAdapter no_key("youtube-api", fetcher, PublicApiAdapter::Options{});
    CHECK_THROWS_AS(no_key.Search("x", 1), BackendUnavailable);
    CHECK(fetcher.Requests().empty());

    PublicApiAdapter::Options options;
    options.api_key = "k";
    PublicApiAdapter adapter("youtube-api", fetcher, options);

    fetcher.handler = [](const HttpRequest&) { return FakeFetcher::Ok(R"({"error":"quota"})"); };
    CHECK_THROWS_AS(adapter.Search("x", 1), BackendProtocolError);

    fetcher.handler = [](const HttpRequest&) { return FakeFetcher::Status(403); };
    CHECK_THROWS_AS(adapter.Search("x", 1), BackendProtocolError);

    fetcher.handler = [](const HttpRequest&) { return FakeFetcher::Ok(R"({"items":[]})"); };
    CHECK(adapter.Search("x", 1).empty());
    CHECK_THROWS_AS(adapter.Resolve("https://www.youtube.com/watch?v=aaaaaaaaaaa"), BackendProtocolError);
    CHECK_THROWS_AS(adapter.Resolve("https://example.com/song"), BackendProtocolError);

    CHECK(adapter.IsValidUrl("https://youtu.be/aaaaaaaaaaa"));
    CHECK_FALSE(adapter.IsValidUrl("https://example.com/a.mp3"));
}

TEST_CASE("MirrorAdapter fails over between instances in round-robin order") {
    FakeFetcher fetcher;
    fetcher.handler = [](const HttpRequest& req) {
        if (Contains(req.url, "https://down.example")) return FakeFetcher::Status(503);
        return FakeFetcher::Ok(R"([
            {"type":"channel","author":"x"},
            {"type":"video","videoId":"aaaaaaaaaaa","title":"Mirror A","author":"Auth","lengthSeconds":185,
             "videoThumbnails":[{"quality":"maxres","url":"/vi/aaaaaaaaaaa/maxres.jpg"}]},
            {"type":"video","videoId":"bbbbbbbbbbb","title":"Mirror B","lengthSeconds":"99"}])");
    };
    MirrorAdapter::Options options;
    options.instances = {"https://down.example/", "https://up.example"};
    options.password = "secret";
    MirrorAdapter adapter("invidious", fetcher, nullptr, options);

    auto items = adapter.Search("q", 5);
    REQUIRE(items.size() == 2);
    CHECK(items[0].title == "Mirror A");
    CHECK(items[0].duration == seconds(185));
    CHECK(items[0].artist == std::optional<std::string>("Auth"));
    CHECK(items[0].thumbnail == std::optional<std::string>("https://down.example/vi/aaaaaaaaaaa/maxres.jpg"));
    CHECK(items[1].duration == seconds(99));
    CHECK(items[1].source_kind == SourceKind::Mirror);

    auto requests = fetcher.Requests();
    REQUIRE(requests.size() == 2);
    CHECK(Contains(requests[0].url, "https://down.example/api/v1/search?type=video&page=1&q=q"));
    CHECK(Contains(requests[1].url, "https://up.example/api/v1/search"));
    CHECK(std::find(requests[1].headers.begin(), requests[1].headers.end(), "Authorization: secret") != requests[1].headers.end());

    // The next call starts at the second instance.
    adapter.Search("q", 1);
    requests = fetcher.Requests();
    REQUIRE(requests.size() == 3);
    CHECK(Contains(requests[2].url, "https://up.example"));
}

TEST_CASE("MirrorAdapter rethrows when every instance is down") {
    FakeFetcher fetcher;
    fetcher.handler = [](const HttpRequest&) {
        FetchResult r;
        r.timed_out = true;
        return r;
    };
    MirrorAdapter::Options options;
    options.instances = {"https://a.example", "https://b.example"};
    MirrorAdapter adapter("invidious", fetcher, nullptr, options);
    CHECK_THROWS_AS(adapter.Search("q", 1), BackendTimeout);
    CHECK(fetcher.Requests().size() == 2);

    auto limiter = std::make_shared<FixedRateLimiter>(false);
    MirrorAdapter limited("invidious", fetcher, limiter, options);
    CHECK_THROWS_AS(limited.Search("q", 1), BackendUnavailable);
    CHECK(limiter->hosts == std::vector<std::string>{"a.example", "b.example"});
    CHECK(fetcher.Requests().size() == 2);

    MirrorAdapter none("invidious", fetcher, nullptr, MirrorAdapter::Options{});
    CHECK_THROWS_AS(none.Search("q", 1), BackendUnavailable);
}

TEST_CASE("MirrorAdapter picks the highest-bitrate audio stream") {
    auto video = nlohmann::json::parse(R"({"adaptiveFormats":[
        {"type":"video/mp4; codecs=\"avc1\"","bitrate":"900000","url":"v"},
        {"type":"audio/webm; codecs=\"opus\"","bitrate":"160000","url":"opus"},
        {"type":"audio/mp4; codecs=\"mp4a\"","bitrate":128000,"url":"aac"}]})");
    CHECK(MirrorAdapter::BestAudioFormat(video) == std::optional<std::string>("opus"));
    CHECK_FALSE(MirrorAdapter::BestAudioFormat(nlohmann::json::object()).has_value());

    FakeFetcher fetcher;
    fetcher.handler = [video](const HttpRequest& req) {
        CHECK(Contains(req.url, "/api/v1/videos/aaaaaaaaaaa"));
        return FakeFetcher::Ok(video.dump());
    };
    MirrorAdapter::Options options;
    options.instances = {"https://up.example"};
    MirrorAdapter adapter("invidious", fetcher, nullptr, options);
    Item item = Testing::MakeItem("A", "https://www.youtube.com/watch?v=aaaaaaaaaaa");
    CHECK(adapter.StreamUrl(item) == std::optional<std::string>("opus"));
}

TEST_CASE("DirectUrlAdapter classifies probed URLs") {
    FakeFetcher fetcher;
    fetcher.handler = [](const HttpRequest& req) {
        if (Contains(req.url, "stream")) return FakeFetcher::Ok("ID3", "audio/mpeg");
        if (Contains(req.url, "page")) {
            return FakeFetcher::Ok(R"(<html><head><meta property="og:title" content="Page Song">
                <meta property="og:image" content="/c.jpg"><meta property="og:audio" content="/a.ogg"></head></html>)",
                "text/html; charset=utf-8");
        }
        if (Contains(req.url, "bare")) return FakeFetcher::Ok("<html><body></body></html>", "text/html");
        return FakeFetcher::Ok("%PDF", "application/pdf");
    };
    DirectUrlAdapter::Options options;
    options.probe_bytes = 1024;
    DirectUrlAdapter adapter("direct", fetcher, options);

    Item audio = adapter.Resolve("https://cdn.example.com/stream/My%20Track");
    CHECK(audio.title == "My Track");
    CHECK(audio.source_kind == SourceKind::DirectUrl);
    auto requests = fetcher.Requests();
    REQUIRE_FALSE(requests.empty());
    CHECK(requests[0].use_range);
    CHECK(requests[0].max_bytes == 1024);

    Item page = adapter.Resolve("https://example.com/page/1");
    CHECK(page.title == "Page Song");
    CHECK(page.thumbnail == std::optional<std::string>("https://example.com/c.jpg"));
    CHECK(adapter.StreamUrl(page) == std::optional<std::string>("https://example.com/a.ogg"));

    CHECK_THROWS_AS(adapter.Resolve("https://example.com/bare"), BackendProtocolError);
    CHECK_THROWS_AS(adapter.Resolve("https://example.com/doc.pdf"), BackendProtocolError);
    CHECK(adapter.Search("anything", 5).empty());
}

TEST_CASE("DirectUrlAdapter recognizes audio without probing") {
    FakeFetcher fetcher;
    DirectUrlAdapter adapter("direct", fetcher, DirectUrlAdapter::Options{});
    Item item = Testing::MakeItem("x", "https://cdn.example.com/a/song.MP3?sig=1");
    CHECK(adapter.StreamUrl(item) == std::optional<std::string>(item.canonical_url));
    CHECK(fetcher.Requests().empty());

    CHECK(DirectUrlAdapter::IsAudioContentType("audio/ogg; codecs=opus"));
    CHECK(DirectUrlAdapter::IsAudioContentType("application/vnd.apple.mpegurl"));
    CHECK_FALSE(DirectUrlAdapter::IsAudioContentType("text/html"));
    CHECK(DirectUrlAdapter::HasAudioExtension("https://x.example/a.flac"));
    CHECK_FALSE(DirectUrlAdapter::HasAudioExtension("https://x.example/a.html"));
}

TEST_CASE("FeedAdapter scrapes results and falls back to channel feeds") {
    FakeFetcher fetcher;
    fetcher.handler = [](const HttpRequest& req) {
        if (Contains(req.url, "/results?")) return FakeFetcher::Ok("<html><body>no results</body></html>", "text/html");
        if (Contains(req.url, "channel_id=UC1")) {
            return FakeFetcher::Ok(R"(<feed>
                <entry><title>Morning Jam Session</title><link href="https://www.youtube.com/watch?v=aaaaaaaaaaa"/></entry>
                <entry><title>Evening Talk</title><link href="https://www.youtube.com/watch?v=bbbbbbbbbbb"/></entry>
                </feed>)", "application/atom+xml");
        }
        return FakeFetcher::Status(404);
    };
    FeedAdapter::Options options;
    options.site_url = "https://yt.example";
    options.channel_ids = {"UC0", "UC1"};
    FeedAdapter adapter("youtube-feed", fetcher, nullptr, options);

    auto items = adapter.Search("jam morning", 5);
    REQUIRE(items.size() == 1);
    CHECK(items[0].title == "Morning Jam Session");
    CHECK(items[0].source_kind == SourceKind::Feed);

    auto requests = fetcher.Requests();
    REQUIRE(requests.size() == 3);
    CHECK(Contains(requests[0].url, "https://yt.example/results?search_query=jam%20morning"));
}

TEST_CASE("FeedAdapter resolves watch pages and respects the rate limiter") {
    FakeFetcher fetcher;
    fetcher.handler = [](const HttpRequest&) {
        return FakeFetcher::Ok(R"(<html><head><meta property="og:title" content="Watch Title">
            <meta itemprop="duration" content="PT2M5S"></head></html>)", "text/html");
    };
    FeedAdapter adapter("youtube-feed", fetcher, nullptr, FeedAdapter::Options{});
    Item item = adapter.Resolve("https://youtu.be/ccccccccccc");
    CHECK(item.title == "Watch Title");
    CHECK(item.duration == seconds(125));
    CHECK(item.canonical_url == "https://www.youtube.com/watch?v=ccccccccccc");

    auto limiter = std::make_shared<FixedRateLimiter>(false);
    FeedAdapter limited("youtube-feed", fetcher, limiter, FeedAdapter::Options{});
    CHECK_THROWS_AS(limited.Search("q", 1), BackendUnavailable);
    CHECK(limiter->hosts == std::vector<std::string>{"www.youtube.com"});
}

TEST_CASE("AdapterFactory builds one adapter per default backend") {
    Config config;
    FakeFetcher fetcher;
    AdapterFactory factory(config, fetcher, std::make_shared<FixedRateLimiter>(true));
    for (const auto& backend : Config::DefaultBackends()) {
        auto adapter = factory.Create(backend);
        REQUIRE(adapter);
        CHECK(adapter->Name() == backend.name);
        CHECK(adapter->Kind() == backend.kind);
    }
}

TEST_CASE("PublicApiAdapter lists playlist entries in playlist order") {
    FakeFetcher fetcher;
    fetcher.handler = [](const HttpRequest& req) {
        if (Contains(req.url, "/playlistItems?")) {
            return FakeFetcher::Ok(R"({"items":[
                {"snippet":{"title":"Second","resourceId":{"kind":"youtube#video","videoId":"bbbbbbbbbbb"}}},
                {"snippet":{"title":"Deleted video","resourceId":{"kind":"youtube#video","videoId":"ddddddddddd"}}},
                {"snippet":{"title":"First","resourceId":{"kind":"youtube#video","videoId":"aaaaaaaaaaa"}}},
                {"snippet":{"title":"No id"}}]})");
        }
        // Deleted and private videos are missing from the videos response.
        return FakeFetcher::Ok(R"({"items":[
            {"id":"aaaaaaaaaaa","snippet":{"title":"First"},"contentDetails":{"duration":"PT3M"}},
            {"id":"bbbbbbbbbbb","snippet":{"title":"Second","channelTitle":"Chan"},"contentDetails":{"duration":"PT2M5S"}}]})");
    };
    PublicApiAdapter::Options options;
    options.api_key = "k";
    options.base_url = "https://api.example/v3";
    PublicApiAdapter adapter("youtube-api", fetcher, options);

    const std::string url = "https://www.youtube.com/playlist?list=PLabc_123-x";
    REQUIRE(adapter.IsValidPlaylistUrl(url));
    CHECK_FALSE(adapter.IsValidPlaylistUrl("https://www.youtube.com/watch?v=aaaaaaaaaaa"));

    auto items = adapter.ResolvePlaylist(url, 80);
    REQUIRE(items.size() == 2);
    CHECK(items[0].title == "Second");
    CHECK(items[0].artist == std::optional<std::string>("Chan"));
    CHECK(items[0].duration == seconds(125));
    CHECK(items[1].canonical_url == "https://www.youtube.com/watch?v=aaaaaaaaaaa");

    auto requests = fetcher.Requests();
    REQUIRE(requests.size() == 2);
    CHECK(Contains(requests[0].url, "https://api.example/v3/playlistItems?part=snippet&maxResults=50&playlistId=PLabc_123-x"));
    CHECK(Contains(requests[1].url, "id=bbbbbbbbbbb%2Cddddddddddd%2Caaaaaaaaaaa"));

    fetcher.handler = [](const HttpRequest&) { return FakeFetcher::Ok(R"({"items":[]})"); };
    CHECK(adapter.ResolvePlaylist(url, 10).empty());
    CHECK_THROWS_AS(adapter.ResolvePlaylist("https://example.com/list", 10), BackendProtocolError);
}

TEST_CASE("MirrorAdapter lists playlists through any instance") {
    FakeFetcher fetcher;
    fetcher.handler = [](const HttpRequest& req) {
        if (Contains(req.url, "https://down.example")) return FakeFetcher::Status(502);
        return FakeFetcher::Ok(R"({"title":"Mix","playlistId":"PLmix","videos":[
            {"title":"One","videoId":"aaaaaaaaaaa","author":"A","lengthSeconds":120},
            {"title":"","videoId":"bbbbbbbbbbb"},
            {"title":"Three","videoId":"ccccccccccc","lengthSeconds":"61"},
            {"title":"Four","videoId":"ddddddddddd"}]})");
    };
    MirrorAdapter::Options options;
    options.instances = {"https://down.example", "https://up.example"};
    MirrorAdapter adapter("invidious", fetcher, nullptr, options);

    auto items = adapter.ResolvePlaylist("https://music.youtube.com/playlist?list=PLmix", 2);
    REQUIRE(items.size() == 2);
    CHECK(items[0].title == "One");
    CHECK(items[0].duration == seconds(120));
    CHECK(items[1].canonical_url == "https://www.youtube.com/watch?v=ccccccccccc");
    CHECK(items[1].source_kind == SourceKind::Mirror);

    auto requests = fetcher.Requests();
    REQUIRE(requests.size() == 2);
    CHECK(requests[1].url == "https://up.example/api/v1/playlists/PLmix");

    fetcher.handler = [](const HttpRequest&) { return FakeFetcher::Ok(R"({"title":"Mix"})"); };
    CHECK_THROWS_AS(adapter.ResolvePlaylist("https://www.youtube.com/playlist?list=PLmix", 5), BackendProtocolError);
}

TEST_CASE("ExtractorAdapter lists playlists without unavailable entries") {
    RecordingRunner runner;
    runner.next = Output(
        R"({"id":"aaaaaaaaaaa","url":"https://www.youtube.com/watch?v=aaaaaaaaaaa","title":"Kept","duration":200})" "\n"
        R"({"id":"bbbbbbbbbbb","url":"https://www.youtube.com/watch?v=bbbbbbbbbbb","title":"[Private video]"})" "\n"
        R"({"id":"ccccccccccc","url":"https://www.youtube.com/watch?v=ccccccccccc","title":"Also kept","channel":"C"})" "\n");
    ExtractorAdapter::Options options;
    options.binary = "/usr/bin/yt-dlp";
    options.socket_timeout_s = 7;
    ExtractorAdapter adapter("yt-dlp", options, runner.Get());

    auto items = adapter.ResolvePlaylist("https://www.youtube.com/watch?v=aaaaaaaaaaa&list=PLx1", 25);
    REQUIRE(items.size() == 2);
    CHECK(items[0].title == "Kept");
    CHECK(items[1].artist == std::optional<std::string>("C"));

    REQUIRE(runner.calls.size() == 1);
    CHECK(runner.calls[0] == std::vector<std::string>{"/usr/bin/yt-dlp", "--no-warnings", "--skip-download",
                                                      "--socket-timeout", "7", "--dump-json", "--flat-playlist",
                                                      "--playlist-end", "25", "https://www.youtube.com/playlist?list=PLx1"});
    CHECK(adapter.IsValidPlaylistUrl("https://youtube.com/playlist?list=PLx1"));
    CHECK_FALSE(adapter.IsValidPlaylistUrl("https://example.com/?list=PLx1"));
}
