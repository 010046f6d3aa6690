#pragma once
#include <string>
#include <vector>
#include "../model/Item.hpp"

namespace Cadenza {
    // Scrapes video entries out of a search-results page or a channel Atom feed.
    class ResultsPageParser {
    public:
        // Reads the initial-data JSON embedded in the page's script blocks; falls back
        // to scanning the raw markup for videoId/title pairs when that JSON is absent.
        static std::vector<Item> ParseSearchResults(const std::string& html, size_t limit);

        static std::vector<Item> ParseFeed(const std::string& xml);

        // Returns the balanced JSON object that follows `marker` in `text`, or empty.
        static std::string ExtractJsonObject(const std::string& text, const std::string& marker);
    };
}
