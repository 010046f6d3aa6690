#include "DurationParser.hpp"
#include <cctype>

namespace Cadenza {
namespace DurationParser {

std::optional<std::chrono::seconds> ParseClock(const std::string& text) {
    long long total = 0;
    long long part = 0;
    bool have_digit = false;
    int groups = 0;
    for (unsigned char c : text) {
        if (std::isdigit(c)) {
            part = part * 10 + (c - '0');
            have_digit = true;
        } else if (c == ':') {
            if (!have_digit) return std::nullopt;
            total = total * 60 + part;
            part = 0;
            have_digit = false;
            if (++groups > 2) return std::nullopt;
        } else if (std::isspace(c)) {
            continue;
        } else {
            return std::nullopt;
        }
    }
    if (!have_digit) return std::nullopt;
    total = total * 60 + part;
    return std::chrono::seconds(total);
}

std::optional<std::chrono::seconds> ParseIso8601(const std::string& text) {
    if (text.size() < 2 || text[0] != 'P') return std::nullopt;
    long long total = 0;
    long long number = 0;
    bool have_number = false;
    bool in_time = false;
    bool any = false;
    for (size_t i = 1; i < text.size(); ++i) {
        char c = text[i];
        if (c >= '0' && c <= '9') {
            number = number * 10 + (c - '0');
            have_number = true;
            continue;
        }
        if (c == 'T') {
            if (have_number || in_time) return std::nullopt;
            in_time = true;
            continue;
        }
        if (c == '.') {
            // Fractional seconds: drop the fraction.
            while (i + 1 < text.size() && text[i + 1] >= '0' && text[i + 1] <= '9') ++i;
            continue;
        }
        if (!have_number) return std::nullopt;
        long long unit = 0;
        if (!in_time) {
            if (c == 'W') unit = 7 * 86400;
            else if (c == 'D') unit = 86400;
            else return std::nullopt; // years and months have no fixed length
        } else {
            if (c == 'H') unit = 3600;
            else if (c == 'M') unit = 60;
            else if (c == 'S') unit = 1;
            else return std::nullopt;
        }
        total += number * unit;
        number = 0;
        have_number = false;
        any = true;
    }
    if (have_number || !any) return std::nullopt;
    return std::chrono::seconds(total);
}

}
}
