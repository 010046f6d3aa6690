#include <catch2/catch_all.hpp>
#include "utils/UrlUtil.hpp"
#include "utils/EmbedBuilder.hpp"
#include "Fakes.hpp"

using namespace Cadenza;
using Testing::MakeItem;

TEST_CASE("UrlUtil tells single URLs apart from search text") {
    CHECK(UrlUtil::IsHttpUrl("https://www.youtube.com/watch?v=dQw4w9WgXcQ"));
    CHECK(UrlUtil::IsHttpUrl("  <https://example.com/a.mp3>  "));
    CHECK(UrlUtil::IsHttpUrl("HTTP://Example.com"));
    CHECK_FALSE(UrlUtil::IsHttpUrl("never gonna give you up"));
    CHECK_FALSE(UrlUtil::IsHttpUrl("https://example.com/a b"));
    CHECK_FALSE(UrlUtil::IsHttpUrl("ftp://example.com/file"));
    CHECK_FALSE(UrlUtil::IsHttpUrl("https://"));
}

TEST_CASE("FormatDuration renders clock strings") {
    CHECK(FormatDuration(std::nullopt) == "--:--");
    CHECK(FormatDuration(std::chrono::seconds(5)) == "0:05");
    CHECK(FormatDuration(std::chrono::seconds(225)) == "3:45");
    CHECK(FormatDuration(std::chrono::seconds(3723)) == "1:02:03");
}

TEST_CASE("EmbedBuilder copies item fields") {
    Item item = MakeItem("Hello", "https://example.com/watch", std::chrono::seconds(225), SourceKind::Mirror);
    item.artist = "World";
    item.thumbnail = "https://img.example/x.png";
    item.requested_by = 42;

    auto e = BuildItemEmbed(item, "Now playing");
    CHECK(e.title == item.title);
    CHECK(e.description == "World");
    CHECK(e.url == item.canonical_url);
    REQUIRE(e.thumbnail.has_value());
    CHECK(e.thumbnail->url == *item.thumbnail);
    REQUIRE(e.fields.size() == 3);
    CHECK(e.fields[0].value == "3:45");
    CHECK(e.fields[1].value == "mirror");
    CHECK(e.fields[2].value == "<@42>");
}

TEST_CASE("EmbedBuilder lists the queue with a footer summary") {
    QueueSnapshot snap;
    snap.current = MakeItem("Current", "https://a.example/1", std::chrono::seconds(60));
    for (int i = 0; i < 12; ++i) {
        snap.pending.push_back(MakeItem("Track " + std::to_string(i), "https://a.example/p" + std::to_string(i)));
    }
    snap.loop_mode = LoopMode::Queue;
    snap.total_duration = std::chrono::seconds(3600);

    auto e = BuildQueueEmbed(snap, 10);
    CHECK(e.description.find("Current") != std::string::npos);
    CHECK(e.description.find("10. [Track 9]") != std::string::npos);
    CHECK(e.description.find("Track 10") == std::string::npos);
    CHECK(e.description.find("and 2 more") != std::string::npos);
    REQUIRE(e.footer.has_value());
    CHECK(e.footer->text.find("loop queue") != std::string::npos);
    CHECK(e.footer->text.find("1:00:00") != std::string::npos);
}

TEST_CASE("EmbedBuilder error embed carries the message") {
    auto e = BuildErrorEmbed("nope");
    CHECK(e.description == "nope");
    CHECK(e.color == kErrorColor);
}

TEST_CASE("UrlUtil finds playlist ids on YouTube links only") {
    CHECK(UrlUtil::ExtractPlaylistId("https://www.youtube.com/playlist?list=PL1a_b-C") == std::optional<std::string>("PL1a_b-C"));
    CHECK(UrlUtil::ExtractPlaylistId("https://www.youtube.com/watch?v=aaaaaaaaaaa&list=RDxyz&index=2") ==
          std::optional<std::string>("RDxyz"));
    CHECK_FALSE(UrlUtil::ExtractPlaylistId("https://example.com/playlist?list=PL1").has_value());
    CHECK_FALSE(UrlUtil::ExtractPlaylistId("https://www.youtube.com/watch?v=aaaaaaaaaaa").has_value());

    CHECK(UrlUtil::IsPlaylistUrl("https://music.youtube.com/playlist?list=PL1"));
    CHECK_FALSE(UrlUtil::IsPlaylistUrl("https://www.youtube.com/watch?v=aaaaaaaaaaa&list=PL1"));
    CHECK(UrlUtil::PlaylistUrl("PL1") == "https://www.youtube.com/playlist?list=PL1");
}

TEST_CASE("EmbedBuilder summarizes a playlist add") {
    PlaylistAddResult result;
    result.playlist_id = "PL1";
    result.found = 12;
    result.added = 10;
    result.truncated = true;
    result.held_back = 1;
    result.shuffled = true;

    auto e = BuildPlaylistEmbed(result, "https://www.youtube.com/playlist?list=PL1");
    CHECK(e.title == "Added 10 tracks from playlist");
    CHECK(e.url == "https://www.youtube.com/playlist?list=PL1");
    CHECK(e.description.find("10 of 12 entries queued, shuffled.") != std::string::npos);
    CHECK(e.description.find("queue filled up") != std::string::npos);
    CHECK(e.description.find("1 entries are on hold") != std::string::npos);
    REQUIRE(e.fields.size() == 1);
    CHECK(e.fields[0].value == "`PL1`");
}
