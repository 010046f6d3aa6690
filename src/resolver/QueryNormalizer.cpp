#include "QueryNormalizer.hpp"
#include <algorithm>
#include <sstream>

namespace {

// Base letters for U+00C0..U+017F; 0 where there is no single-letter base.
const char kLatin1[] =
    "AAAAAAACEEEEIIII"  // C0-CF
    "DNOOOOO\0OUUUUY\0s" // D0-DF
    "aaaaaaaceeeeiiii"  // E0-EF
    "dnooooo\0ouuuuy\0y"; // F0-FF

const char kLatinExtA[] =
    "AaAaAaCcCcCcCcDd"  // 100-10F
    "DdEeEeEeEeEeGgGg"  // 110-11F
    "GgGgHhHhIiIiIiIi"  // 120-12F
    "Ii\0\0JjKkkLlLlLlL"  // 130-13F
    "lLlNnNnNnnNnOoOo"  // 140-14F
    "Oo\0\0RrRrRrSsSsSs"  // 150-15F
    "SsTtTtTtUuUuUuUu"  // 160-16F
    "UuUuWwYyYZzZzZzs"; // 170-17F

char BaseLetter(unsigned cp) {
    if (cp >= 0xC0 && cp <= 0xFF) return kLatin1[cp - 0xC0];
    if (cp >= 0x100 && cp <= 0x17F) return kLatinExtA[cp - 0x100];
    return 0;
}

bool IsAsciiAlnum(unsigned char c) {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

} // anonymous namespace

namespace Cadenza {
namespace QueryNormalizer {

std::string Normalize(const std::string& query) {
    std::string out;
    out.reserve(query.size());
    bool pending_space = false;
    for (unsigned char c : query) {
        bool keep = IsAsciiAlnum(c) || c >= 0x80;
        if (!keep) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) {
            out.push_back(' ');
            pending_space = false;
        }
        out.push_back((c >= 'A' && c <= 'Z') ? static_cast<char>(c + 32) : static_cast<char>(c));
    }
    return out;
}

std::string StripDiacritics(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size();) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        // Two-byte sequences cover U+0080..U+07FF, which holds every letter we map.
        if ((c & 0xE0) == 0xC0 && i + 1 < text.size() && (static_cast<unsigned char>(text[i + 1]) & 0xC0) == 0x80) {
            unsigned cp = ((c & 0x1Fu) << 6) | (static_cast<unsigned char>(text[i + 1]) & 0x3Fu);
            char base = BaseLetter(cp);
            if (base) {
                out.push_back(base);
                if (cp == 0xDF) out.push_back('s'); // sharp s
            } else {
                out.append(text, i, 2);
            }
            i += 2;
            continue;
        }
        out.push_back(static_cast<char>(c));
        ++i;
    }
    return out;
}

std::vector<std::string> Words(const std::string& text) {
    std::vector<std::string> words;
    std::istringstream in(text);
    std::string w;
    while (in >> w) words.push_back(w);
    return words;
}

std::vector<std::string> Corrections(const std::string& query) {
    const std::string original = Normalize(query);
    std::vector<std::string> out;
    auto add = [&](const std::string& candidate) {
        if (candidate.empty() || candidate == original) return;
        if (std::find(out.begin(), out.end(), candidate) != out.end()) return;
        out.push_back(candidate);
    };

    std::string cleaned = Normalize(StripDiacritics(query));
    add(cleaned);

    auto words = Words(cleaned);
    if (words.size() > 2) {
        add(words[0] + " " + words[1]);
    }
    if (words.size() > 1 && words[0].size() > 3) {
        add(words[0]);
    }
    return out;
}

}
}
