#pragma once
#include <string>
#include <optional>
#include <chrono>

namespace Cadenza {
namespace DurationParser {

// "3:45", "1:02:03" or plain seconds "225".
std::optional<std::chrono::seconds> ParseClock(const std::string& text);

// ISO-8601 durations as used by video APIs, e.g. "PT1H2M3S", "P1DT5M".
std::optional<std::chrono::seconds> ParseIso8601(const std::string& text);

}
}
