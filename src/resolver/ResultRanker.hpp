#pragma once
#include <string>
#include <vector>
#include <optional>
#include <chrono>
#include "../model/Item.hpp"

namespace Cadenza {
namespace ResultRanker {

// Smooth preference for typical track lengths: close to 1 inside 1-10 minutes,
// falling off on either side. Unknown durations score 0.5.
double DurationScore(const std::optional<std::chrono::seconds>& duration);

// Case-insensitive containment of the trimmed query in the title.
bool TitleMatches(const std::string& title, const std::string& query);

// Title matches first, then by duration score. Stable otherwise.
void Rank(std::vector<Item>& items, const std::string& query);

}
}
