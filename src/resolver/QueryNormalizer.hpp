#pragma once
#include <string>
#include <vector>

namespace Cadenza {
namespace QueryNormalizer {

// Cache key form: ASCII lowercased, punctuation turned into spaces, whitespace
// collapsed. Non-ASCII bytes are kept so non-Latin queries still key apart.
std::string Normalize(const std::string& query);

// Replaces accented Latin letters (UTF-8) with their base ASCII letter.
std::string StripDiacritics(const std::string& text);

// Ordered, de-duplicated rewrites tried when every backend came back empty:
// accents and punctuation stripped, then the first two words, then the first
// word alone when it is longer than three characters.
std::vector<std::string> Corrections(const std::string& query);

std::vector<std::string> Words(const std::string& text);

}
}
