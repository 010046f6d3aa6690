#include "ResultsPageParser.hpp"
#include "DurationParser.hpp"
#include "../utils/UrlUtil.hpp"
#include "../utils/Logger.hpp"
#include <lexbor/html/html.h>
#include <lexbor/dom/dom.h>
#include <nlohmann/json.hpp>
#include <cstring>
#include <set>

namespace {

using Cadenza::Item;

std::string to_std_string(const lxb_char_t* lxb_str, size_t len) {
    if (lxb_str && len > 0) {
        return std::string(reinterpret_cast<const char*>(lxb_str), len);
    }
    return "";
}

std::string get_attribute_value(lxb_dom_element_t* element, const char* key) {
    size_t len = 0;
    const lxb_char_t* value = lxb_dom_element_get_attribute(element, reinterpret_cast<const lxb_char_t*>(key), strlen(key), &len);
    return to_std_string(value, len);
}

std::string text_content(lxb_dom_element_t* element) {
    lxb_dom_node_t* node = lxb_dom_interface_node(element);
    size_t len = 0;
    lxb_char_t* text = lxb_dom_node_text_content(node, &len);
    std::string out = to_std_string(text, len);
    if (text) lxb_dom_document_destroy_text(node->owner_document, text);
    return out;
}

// Elements named `tag` below `scope`, in document order.
std::vector<lxb_dom_element_t*> elements_by_tag(lxb_dom_document_t* doc, lxb_dom_element_t* scope, const char* tag) {
    std::vector<lxb_dom_element_t*> out;
    lxb_dom_collection_t* col = lxb_dom_collection_make(doc, 16);
    if (!col) return out;
    if (lxb_dom_elements_by_tag_name(scope, col, reinterpret_cast<const lxb_char_t*>(tag), strlen(tag)) == LXB_STATUS_OK) {
        const size_t count = lxb_dom_collection_length(col);
        out.reserve(count);
        for (size_t i = 0; i < count; ++i) out.push_back(lxb_dom_collection_element(col, i));
    }
    lxb_dom_collection_destroy(col, true);
    return out;
}

std::string DefaultThumbnail(const std::string& id) {
    return "https://i.ytimg.com/vi/" + id + "/hqdefault.jpg";
}

std::string FirstRunText(const nlohmann::json& node) {
    if (!node.is_object()) return {};
    if (node.contains("simpleText") && node["simpleText"].is_string()) return node["simpleText"].get<std::string>();
    if (node.contains("runs") && node["runs"].is_array() && !node["runs"].empty()) {
        const auto& run = node["runs"][0];
        if (run.is_object() && run.contains("text") && run["text"].is_string()) return run["text"].get<std::string>();
    }
    return {};
}

std::optional<Item> FromVideoRenderer(const nlohmann::json& r) {
    if (!r.is_object() || !r.contains("videoId") || !r["videoId"].is_string()) return std::nullopt;
    Item item;
    std::string id = r["videoId"].get<std::string>();
    item.title = r.contains("title") ? FirstRunText(r["title"]) : std::string();
    if (item.title.empty()) return std::nullopt;
    item.canonical_url = Cadenza::UrlUtil::WatchUrl(id);
    item.source_kind = Cadenza::SourceKind::Feed;
    if (r.contains("ownerText")) {
        std::string owner = FirstRunText(r["ownerText"]);
        if (!owner.empty()) item.artist = owner;
    }
    if (r.contains("lengthText")) {
        item.duration = Cadenza::DurationParser::ParseClock(FirstRunText(r["lengthText"]));
    }
    item.thumbnail = DefaultThumbnail(id);
    if (r.contains("thumbnail") && r["thumbnail"].is_object()) {
        const auto& thumbs = r["thumbnail"].value("thumbnails", nlohmann::json::array());
        if (thumbs.is_array() && !thumbs.empty() && thumbs.back().is_object()) {
            std::string url = thumbs.back().value("url", std::string());
            if (!url.empty()) item.thumbnail = url;
        }
    }
    return item;
}

void CollectVideoRenderers(const nlohmann::json& node, std::vector<Item>& out, std::set<std::string>& seen, size_t limit) {
    if (out.size() >= limit) return;
    if (node.is_object()) {
        auto it = node.find("videoRenderer");
        if (it != node.end()) {
            auto item = FromVideoRenderer(*it);
            if (item && seen.insert(item->canonical_url).second) out.push_back(std::move(*item));
            return;
        }
        for (const auto& child : node) {
            CollectVideoRenderers(child, out, seen, limit);
            if (out.size() >= limit) return;
        }
    } else if (node.is_array()) {
        for (const auto& child : node) {
            CollectVideoRenderers(child, out, seen, limit);
            if (out.size() >= limit) return;
        }
    }
}

// Reads a JSON string literal starting at the opening quote.
std::optional<std::string> ReadJsonString(const std::string& s, size_t quote_pos, size_t& end_pos) {
    if (quote_pos >= s.size() || s[quote_pos] != '"') return std::nullopt;
    size_t i = quote_pos + 1;
    for (; i < s.size(); ++i) {
        if (s[i] == '\\') { ++i; continue; }
        if (s[i] == '"') break;
    }
    if (i >= s.size()) return std::nullopt;
    end_pos = i + 1;
    auto parsed = nlohmann::json::parse(s.substr(quote_pos, end_pos - quote_pos), nullptr, false);
    if (parsed.is_discarded() || !parsed.is_string()) return std::nullopt;
    return parsed.get<std::string>();
}

// Last resort for pages whose initial data could not be parsed.
std::vector<Item> ScanMarkup(const std::string& html, size_t limit) {
    static const std::string kId = "\"videoId\":\"";
    static const std::string kTitle = "\"title\":{\"runs\":[{\"text\":";
    std::vector<Item> out;
    std::set<std::string> seen;
    size_t pos = 0;
    while (out.size() < limit && (pos = html.find(kId, pos)) != std::string::npos) {
        size_t id_start = pos + kId.size();
        pos = id_start;
        if (id_start + 11 > html.size() || (id_start + 11 < html.size() && html[id_start + 11] != '"')) continue;
        std::string id = html.substr(id_start, 11);
        if (seen.count(id)) continue;

        size_t title_pos = html.find(kTitle, id_start);
        if (title_pos == std::string::npos || title_pos - id_start > 4096) continue;
        size_t end = 0;
        auto title = ReadJsonString(html, title_pos + kTitle.size(), end);
        if (!title || title->empty()) continue;

        seen.insert(id);
        Item item;
        item.title = *title;
        item.canonical_url = Cadenza::UrlUtil::WatchUrl(id);
        item.source_kind = Cadenza::SourceKind::Feed;
        item.thumbnail = DefaultThumbnail(id);
        out.push_back(std::move(item));
        pos = end;
    }
    return out;
}

} // anonymous namespace

namespace Cadenza {

std::string ResultsPageParser::ExtractJsonObject(const std::string& text, const std::string& marker) {
    size_t at = text.find(marker);
    if (at == std::string::npos) return {};
    size_t start = text.find('{', at + marker.size());
    if (start == std::string::npos) return {};

    int depth = 0;
    bool in_string = false;
    for (size_t i = start; i < text.size(); ++i) {
        char c = text[i];
        if (in_string) {
            if (c == '\\') ++i;
            else if (c == '"') in_string = false;
            continue;
        }
        if (c == '"') in_string = true;
        else if (c == '{') ++depth;
        else if (c == '}') {
            if (--depth == 0) return text.substr(start, i - start + 1);
        }
    }
    return {};
}

std::vector<Item> ResultsPageParser::ParseSearchResults(const std::string& html, size_t limit) {
    std::vector<Item> out;
    if (limit == 0) return out;

    lxb_html_document_t* document = lxb_html_document_create();
    if (!document) return ScanMarkup(html, limit);

    lxb_status_t status = lxb_html_document_parse(document,
        reinterpret_cast<const lxb_char_t*>(html.c_str()), html.length());
    if (status == LXB_STATUS_OK) {
        lxb_dom_document_t* dom_doc = lxb_html_document_original_ref(document);
        lxb_dom_element_t* root = lxb_dom_document_element(dom_doc);
        if (root) {
            std::set<std::string> seen;
            for (auto* script : elements_by_tag(dom_doc, root, "script")) {
                std::string body = text_content(script);
                std::string json_text = ExtractJsonObject(body, "ytInitialData");
                if (json_text.empty()) continue;
                auto data = nlohmann::json::parse(json_text, nullptr, false);
                if (data.is_discarded()) {
                    Logger::Log(LogLevel::Debug, "parser", "initial data block is not valid JSON");
                    continue;
                }
                CollectVideoRenderers(data, out, seen, limit);
                if (!out.empty()) break;
            }
        }
    }
    lxb_html_document_destroy(document);

    if (out.empty()) out = ScanMarkup(html, limit);
    return out;
}

std::vector<Item> ResultsPageParser::ParseFeed(const std::string& xml) {
    std::vector<Item> out;
    lxb_html_document_t* document = lxb_html_document_create();
    if (!document) return out;

    lxb_status_t status = lxb_html_document_parse(document,
        reinterpret_cast<const lxb_char_t*>(xml.c_str()), xml.length());
    if (status != LXB_STATUS_OK) {
        lxb_html_document_destroy(document);
        return out;
    }

    lxb_dom_document_t* dom_doc = lxb_html_document_original_ref(document);
    lxb_dom_element_t* root = lxb_dom_document_element(dom_doc);
    if (root) {
        for (auto* entry : elements_by_tag(dom_doc, root, "entry")) {
            std::optional<std::string> id;
            for (auto* link : elements_by_tag(dom_doc, entry, "link")) {
                id = UrlUtil::ExtractVideoId(get_attribute_value(link, "href"));
                if (id) break;
            }
            if (!id) {
                auto ids = elements_by_tag(dom_doc, entry, "yt:videoid");
                if (!ids.empty()) {
                    std::string raw = text_content(ids.front());
                    if (raw.size() == 11) id = raw;
                }
            }
            if (!id) continue;

            Item item;
            auto titles = elements_by_tag(dom_doc, entry, "title");
            if (!titles.empty()) item.title = text_content(titles.front());
            if (item.title.empty()) continue;
            item.canonical_url = UrlUtil::WatchUrl(*id);
            item.source_kind = SourceKind::Feed;
            for (auto* author : elements_by_tag(dom_doc, entry, "author")) {
                auto names = elements_by_tag(dom_doc, author, "name");
                if (!names.empty()) {
                    std::string name = text_content(names.front());
                    if (!name.empty()) item.artist = name;
                }
                break;
            }
            item.thumbnail = DefaultThumbnail(*id);
            auto thumbs = elements_by_tag(dom_doc, entry, "media:thumbnail");
            if (!thumbs.empty()) {
                std::string url = get_attribute_value(thumbs.front(), "url");
                if (!url.empty()) item.thumbnail = url;
            }
            out.push_back(std::move(item));
        }
    }

    lxb_html_document_destroy(document);
    return out;
}

}
