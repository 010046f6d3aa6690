#include <catch2/catch_all.hpp>
#include "utils/UrlUtil.hpp"

using namespace Cadenza;

TEST_CASE("ResolveAgainst handles protocol and relative URLs") {
    using UrlUtil::ResolveAgainst;

    std::string base = "https://example.com/path/page.html";
    CHECK(ResolveAgainst(base, "https://cdn.example.com/a.jpg") == "https://cdn.example.com/a.jpg");
    CHECK(ResolveAgainst(base, "//cdn.example.com/a.jpg") == "https://cdn.example.com/a.jpg");
    CHECK(ResolveAgainst(base, "/img/a.png") == "https://example.com/img/a.png");
    CHECK(ResolveAgainst(base, "img/a.png") == "https://example.com/path/img/a.png");
    CHECK(ResolveAgainst("https://example.com", "img.png").rfind("https://example.com/", 0) == 0);
}

TEST_CASE("ExtractVideoId understands the common link shapes") {
    using UrlUtil::ExtractVideoId;
    CHECK(ExtractVideoId("https://www.youtube.com/watch?v=dQw4w9WgXcQ") == std::optional<std::string>("dQw4w9WgXcQ"));
    CHECK(ExtractVideoId("https://youtube.com/watch?list=PL1&v=dQw4w9WgXcQ&t=5") == std::optional<std::string>("dQw4w9WgXcQ"));
    CHECK(ExtractVideoId("https://youtu.be/dQw4w9WgXcQ?si=abc") == std::optional<std::string>("dQw4w9WgXcQ"));
    CHECK(ExtractVideoId("https://music.youtube.com/watch?v=dQw4w9WgXcQ") == std::optional<std::string>("dQw4w9WgXcQ"));
    CHECK(ExtractVideoId("https://www.youtube.com/shorts/dQw4w9WgXcQ") == std::optional<std::string>("dQw4w9WgXcQ"));
    CHECK_FALSE(ExtractVideoId("https://example.com/watch?v=dQw4w9WgXcQ").has_value());
    CHECK_FALSE(ExtractVideoId("https://www.youtube.com/channel/UC123").has_value());
}

TEST_CASE("Host and file name helpers") {
    CHECK(UrlUtil::ExtractHostLower("https://User@Example.COM:8443/x") == "example.com");
    CHECK(UrlUtil::IsYouTubeUrl("https://m.youtube.com/watch?v=dQw4w9WgXcQ"));
    CHECK_FALSE(UrlUtil::IsYouTubeUrl("https://notyoutube.com/watch?v=dQw4w9WgXcQ"));
    CHECK(UrlUtil::FileName("https://cdn.example.com/music/My%20Song.mp3?sig=1") == "My Song.mp3");
    CHECK(UrlUtil::FileName("https://cdn.example.com/") == "");
    CHECK(UrlUtil::WatchUrl("abc") == "https://www.youtube.com/watch?v=abc");
}

TEST_CASE("Encode percent-encodes reserved characters") {
    CHECK(UrlUtil::Encode("a b&c=d") == "a%20b%26c%3Dd");
    CHECK(UrlUtil::Encode("Safe-_.~") == "Safe-_.~");
}
