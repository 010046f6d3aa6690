#pragma once
#include <functional>
#include <chrono>
#include "../interfaces/IBackendAdapter.hpp"
#include "../utils/Subprocess.hpp"

namespace Cadenza {

// Local yt-dlp process. Every invocation uses a fixed argument set and is
// killed once its process deadline passes.
class ExtractorAdapter : public IBackendAdapter {
public:
    using ProcessRunner = std::function<ProcessResult(const std::vector<std::string>&, std::chrono::milliseconds)>;

    struct Options {
        std::string binary = "yt-dlp";
        int socket_timeout_s = 10;
        std::chrono::milliseconds process_timeout{15000};
    };

    ExtractorAdapter(std::string name, Options options, ProcessRunner runner = DefaultRunner());

    SourceKind Kind() const override { return SourceKind::PrimaryExtractor; }
    const std::string& Name() const override { return name_; }
    std::vector<Item> Search(const std::string& query, size_t limit) override;
    Item Resolve(const std::string& url) override;
    bool IsValidUrl(const std::string& url) const override;
    std::optional<std::string> StreamUrl(const Item& item) override;
    std::vector<Item> ResolvePlaylist(const std::string& url, size_t limit) override;
    bool IsValidPlaylistUrl(const std::string& url) const override;

    // Builds an Item from one line of --dump-json output.
    static std::optional<Item> ItemFromJson(const nlohmann::json& info);

    static ProcessRunner DefaultRunner();

private:
    std::vector<std::string> BaseArgs() const;
    ProcessResult Run(const std::vector<std::string>& argv);
    // One item per --dump-json line, at most `limit`.
    std::vector<Item> ParseItems(const std::string& out, size_t limit) const;

    std::string name_;
    Options options_;
    ProcessRunner runner_;
};

}
