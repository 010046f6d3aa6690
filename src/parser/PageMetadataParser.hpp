#pragma once
#include <string>
#include <optional>
#include <chrono>

namespace Cadenza {
    struct PageMetadata {
        std::string title;
        std::string image_url;
        std::string description;
        std::string site_name;
        std::string artist;
        std::string audio_url;
        std::optional<std::chrono::seconds> duration;
    };

    // OpenGraph / Twitter card / music:* meta tags from an HTML document.
    class PageMetadataParser {
    public:
        static std::optional<PageMetadata> Parse(const std::string& html_content);
    };
}
