#include "ResultRanker.hpp"
#include <algorithm>
#include <cmath>

namespace {

constexpr double kBandLowSeconds = 60.0;
constexpr double kBandHighSeconds = 600.0;
constexpr double kLowSteepness = 15.0;
constexpr double kHighSteepness = 90.0;

double Logistic(double x) {
    return 1.0 / (1.0 + std::exp(-x));
}

std::string LowerTrimmed(const std::string& s) {
    auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return {};
    auto e = s.find_last_not_of(" \t\r\n");
    std::string out = s.substr(b, e - b + 1);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return (c >= 'A' && c <= 'Z') ? static_cast<char>(c + 32) : static_cast<char>(c);
    });
    return out;
}

} // anonymous namespace

namespace Cadenza {
namespace ResultRanker {

double DurationScore(const std::optional<std::chrono::seconds>& duration) {
    if (!duration) return 0.5;
    double d = static_cast<double>(duration->count());
    return Logistic((d - kBandLowSeconds) / kLowSteepness) * Logistic((kBandHighSeconds - d) / kHighSteepness);
}

bool TitleMatches(const std::string& title, const std::string& query) {
    std::string q = LowerTrimmed(query);
    if (q.empty()) return false;
    return LowerTrimmed(title).find(q) != std::string::npos;
}

void Rank(std::vector<Item>& items, const std::string& query) {
    struct Scored {
        bool match;
        double score;
        size_t index;
    };
    std::vector<Scored> scored;
    scored.reserve(items.size());
    for (size_t i = 0; i < items.size(); ++i) {
        scored.push_back({TitleMatches(items[i].title, query), DurationScore(items[i].duration), i});
    }
    std::stable_sort(scored.begin(), scored.end(), [](const Scored& a, const Scored& b) {
        if (a.match != b.match) return a.match;
        return a.score > b.score;
    });

    std::vector<Item> ranked;
    ranked.reserve(items.size());
    for (const auto& s : scored) ranked.push_back(std::move(items[s.index]));
    items = std::move(ranked);
}

}
}
