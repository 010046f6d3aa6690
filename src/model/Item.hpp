#pragma once
#include <string>
#include <optional>
#include <chrono>
#include <vector>
#include <dpp/snowflake.h>
#include <nlohmann/json.hpp>

namespace Cadenza {
    enum class SourceKind {
        PrimaryExtractor,
        PublicAPI,
        Mirror,
        Feed,
        DirectUrl
    };

    NLOHMANN_JSON_SERIALIZE_ENUM(SourceKind, {
        {SourceKind::PrimaryExtractor, "extractor"},
        {SourceKind::PublicAPI, "public_api"},
        {SourceKind::Mirror, "mirror"},
        {SourceKind::Feed, "feed"},
        {SourceKind::DirectUrl, "direct"},
    })

    const char* ToString(SourceKind kind);
    std::optional<SourceKind> SourceKindFromString(const std::string& s);

    // A resolved media reference. Treated as a value: queue bookkeeping is keyed
    // by canonical_url and never written back into the item.
    struct Item {
        std::string title;
        std::optional<std::string> artist;
        std::optional<std::chrono::seconds> duration;
        std::optional<std::string> thumbnail;
        std::string canonical_url;
        SourceKind source_kind = SourceKind::DirectUrl;
        dpp::snowflake requested_by = 0;

        Item WithRequester(dpp::snowflake user) const;
    };

    bool operator==(const Item& a, const Item& b);
    bool operator!=(const Item& a, const Item& b);

    void to_json(nlohmann::json& j, const Item& item);
    void from_json(const nlohmann::json& j, Item& item);

    // "3:45", "1:02:03" or "--:--" when unknown
    std::string FormatDuration(const std::optional<std::chrono::seconds>& duration);
}
