#include "PageMetadataParser.hpp"
#include "DurationParser.hpp"
#include <lexbor/html/html.h>
#include <lexbor/dom/dom.h>
#include <cstring>
#include <algorithm>

namespace {

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

static inline void ascii_tolower_inplace(std::string& s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){
        return (c >= 'A' && c <= 'Z') ? static_cast<char>(c + 32) : static_cast<char>(c);
    });
}

void set_once(std::string& field, const std::string& value) {
    if (field.empty()) field = value;
}

} // anonymous namespace

namespace Cadenza {

std::optional<PageMetadata> PageMetadataParser::Parse(const std::string& html_content) {
    lxb_html_document_t* document = lxb_html_document_create();
    if (!document) return std::nullopt;

    lxb_status_t status = lxb_html_document_parse(document,
        reinterpret_cast<const lxb_char_t*>(html_content.c_str()),
        html_content.length());

    if (status != LXB_STATUS_OK) {
        lxb_html_document_destroy(document);
        return std::nullopt;
    }

    PageMetadata meta;
    std::string document_title;
    {
        size_t tlen = 0;
        const lxb_char_t* t = lxb_html_document_title(document, &tlen);
        document_title = to_std_string(t, tlen);
    }

    lxb_dom_document_t* dom_doc = lxb_html_document_original_ref(document);

    lxb_dom_collection_t* col = lxb_dom_collection_make(dom_doc, 32);
    if (col != nullptr) {
        // Some players put music:* tags in the body, so scan the whole document.
        auto* root = lxb_dom_document_element(dom_doc);
        if (root != nullptr) {
            (void) lxb_dom_elements_by_tag_name(root, col, reinterpret_cast<const lxb_char_t*>("meta"), 4);
        }

        const size_t count = lxb_dom_collection_length(col);
        for (size_t i = 0; i < count; ++i) {
            lxb_dom_element_t* el = lxb_dom_collection_element(col, i);
            if (!el) continue;

            std::string prop = get_attribute_value(el, "property");
            if (prop.empty()) prop = get_attribute_value(el, "name");
            if (prop.empty()) prop = get_attribute_value(el, "itemprop");
            std::string content = get_attribute_value(el, "content");

            if (prop.empty() || content.empty()) continue;
            ascii_tolower_inplace(prop);

            if (prop == "og:title" || prop == "twitter:title") set_once(meta.title, content);
            else if (prop == "og:description" || prop == "twitter:description" || prop == "description") set_once(meta.description, content);
            else if (prop == "og:image" || prop == "og:image:url" || prop == "og:image:secure_url" ||
                     prop == "twitter:image" || prop == "twitter:image:src") set_once(meta.image_url, content);
            else if (prop == "og:site_name") set_once(meta.site_name, content);
            else if (prop == "music:musician" || prop == "og:audio:artist" || prop == "author") set_once(meta.artist, content);
            else if (prop == "og:audio" || prop == "og:audio:url" || prop == "og:audio:secure_url") set_once(meta.audio_url, content);
            else if ((prop == "music:duration" || prop == "video:duration" || prop == "og:video:duration") && !meta.duration) {
                meta.duration = DurationParser::ParseClock(content);
            } else if (prop == "duration" && !meta.duration) {
                meta.duration = DurationParser::ParseIso8601(content);
            }
        }

        lxb_dom_collection_destroy(col, true);
    }

    lxb_html_document_destroy(document);

    if (meta.title.empty()) meta.title = document_title;

    if (!meta.title.empty() || !meta.description.empty() || !meta.image_url.empty() || !meta.site_name.empty()) {
        return meta;
    }

    return std::nullopt;
}

}
