#include "EmbedBuilder.hpp"
#include <cstdio>

namespace Cadenza {

namespace {

std::string Line(const Item& item) {
    std::string line = "[" + item.title + "](" + item.canonical_url + ")";
    if (item.artist) line += " - " + *item.artist;
    line += " `" + FormatDuration(item.duration) + "`";
    return line;
}

} // anonymous namespace

dpp::embed BuildItemEmbed(const Item& item, const std::string& heading) {
    dpp::embed e;
    e.set_color(kEmbedColor);
    e.set_author(heading, "", "");
    if (!item.title.empty()) e.set_title(item.title);
    if (!item.canonical_url.empty()) e.set_url(item.canonical_url);
    if (item.artist) e.set_description(*item.artist);
    e.add_field("Duration", FormatDuration(item.duration), true);
    e.add_field("Source", ToString(item.source_kind), true);
    if (item.requested_by) e.add_field("Requested by", "<@" + std::to_string(item.requested_by) + ">", true);
    if (item.thumbnail) e.set_thumbnail(*item.thumbnail);
    return e;
}

dpp::embed BuildQueueEmbed(const QueueSnapshot& snapshot, size_t max_lines) {
    dpp::embed e;
    e.set_color(kEmbedColor);
    e.set_title("Queue");

    std::string body;
    if (snapshot.current) {
        body += "**Now playing:** " + Line(*snapshot.current) + "\n\n";
    }
    if (snapshot.pending.empty()) {
        body += "Nothing queued.";
    }
    for (size_t i = 0; i < snapshot.pending.size() && i < max_lines; ++i) {
        body += std::to_string(i + 1) + ". " + Line(snapshot.pending[i]) + "\n";
    }
    if (snapshot.pending.size() > max_lines) {
        body += "... and " + std::to_string(snapshot.pending.size() - max_lines) + " more";
    }
    e.set_description(body);

    std::string footer = std::to_string(snapshot.pending.size()) + " queued | total " +
                         FormatDuration(snapshot.total_duration) + " | loop " + ToString(snapshot.loop_mode) +
                         (snapshot.shuffle ? " | shuffle on" : "");
    if (!snapshot.failed.empty()) {
        footer += " | " + std::to_string(snapshot.failed.size()) + " held back after failures";
    }
    e.set_footer(dpp::embed_footer().set_text(footer));
    return e;
}

dpp::embed BuildPlaylistEmbed(const PlaylistAddResult& result, const std::string& url) {
    dpp::embed e;
    e.set_color(kEmbedColor);
    e.set_title(result.added == 1 ? "Added 1 track from playlist" : "Added " + std::to_string(result.added) + " tracks from playlist");
    e.set_url(url);

    std::string body = std::to_string(result.added) + " of " + std::to_string(result.found) + " entries queued";
    if (result.shuffled) body += ", shuffled";
    body += ".";
    if (result.truncated) body += "\nThe queue filled up before the rest could be added.";
    if (result.held_back > 0) {
        body += "\n" + std::to_string(result.held_back) + " entries are on hold after repeated failures.";
    }
    e.set_description(body);
    if (!result.playlist_id.empty()) e.add_field("Playlist", "`" + result.playlist_id + "`", true);
    return e;
}

dpp::embed BuildErrorEmbed(const std::string& message) {
    dpp::embed e;
    e.set_color(kErrorColor);
    e.set_description(message);
    return e;
}

dpp::embed BuildBackendEmbed(const std::vector<BackendConfig>& backends, const AdaptiveCacheStats& cache) {
    dpp::embed e;
    e.set_color(kEmbedColor);
    e.set_title("Backends");
    for (const auto& b : backends) {
        std::string value = std::string(ToString(b.kind)) + ", priority " + std::to_string(b.priority) +
                            ", " + std::to_string(b.timeout.count()) + "ms x" + std::to_string(b.max_retries) +
                            (b.enabled ? "" : " (disabled)");
        e.add_field(b.name, value, false);
    }

    char ratio[16];
    std::snprintf(ratio, sizeof(ratio), "%.1f%%", cache.hit_ratio * 100.0);
    std::string summary = std::to_string(cache.total_entries) + " entries, " +
                          std::to_string(cache.total_bytes / 1024) + " KiB (peak " + std::to_string(cache.peak_bytes / 1024) +
                          " KiB), hit ratio " + ratio + ", memory pressure " + ToString(cache.last_pressure);
    e.set_footer(dpp::embed_footer().set_text(summary));
    return e;
}

}
