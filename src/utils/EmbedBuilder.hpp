#pragma once
#include <string>
#include <vector>
#include <dpp/dpp.h>
#include "../model/Item.hpp"
#include "../model/BackendConfig.hpp"
#include "../queue/QueueState.hpp"
#include "../cache/AdaptiveCache.hpp"

namespace Cadenza {

constexpr uint32_t kEmbedColor = 0x5865F2;
constexpr uint32_t kErrorColor = 0xED4245;

// "Now playing" / "Added to queue" card for one item.
dpp::embed BuildItemEmbed(const Item& item, const std::string& heading);

// Current item plus the first `max_lines` pending entries.
dpp::embed BuildQueueEmbed(const QueueSnapshot& snapshot, size_t max_lines = 10);

dpp::embed BuildPlaylistEmbed(const PlaylistAddResult& result, const std::string& url);

dpp::embed BuildErrorEmbed(const std::string& message);

dpp::embed BuildBackendEmbed(const std::vector<BackendConfig>& backends, const AdaptiveCacheStats& cache);

}
