#include "AdapterFactory.hpp"
#include "DirectUrlAdapter.hpp"
#include "ExtractorAdapter.hpp"
#include "FeedAdapter.hpp"
#include "MirrorAdapter.hpp"
#include "PublicApiAdapter.hpp"
#include "../../config/Config.hpp"
#include <stdexcept>

namespace Cadenza {

AdapterFactory::AdapterFactory(const Config& config, IHttpFetcher& fetcher, std::shared_ptr<IRateLimiter> scrape_limiter)
    : config_(config), fetcher_(fetcher), scrape_limiter_(std::move(scrape_limiter)) {}

std::unique_ptr<IBackendAdapter> AdapterFactory::Create(const BackendConfig& backend) const {
    // Requests never outlive the resolver's deadline for this backend.
    const long request_timeout_ms = static_cast<long>(backend.timeout.count());

    switch (backend.kind) {
        case SourceKind::PrimaryExtractor: {
            ExtractorAdapter::Options options;
            options.binary = config_.extractor_binary;
            options.socket_timeout_s = config_.extractor_socket_timeout_s;
            options.process_timeout = backend.timeout;
            return std::make_unique<ExtractorAdapter>(backend.name, options);
        }
        case SourceKind::PublicAPI: {
            PublicApiAdapter::Options options;
            options.api_key = config_.youtube_api_key;
            options.bearer_token = config_.youtube_bearer_token;
            options.request_timeout_ms = request_timeout_ms;
            return std::make_unique<PublicApiAdapter>(backend.name, fetcher_, options);
        }
        case SourceKind::Mirror: {
            MirrorAdapter::Options options;
            options.instances = config_.mirror_instances;
            options.password = config_.mirror_password;
            options.request_timeout_ms = request_timeout_ms;
            return std::make_unique<MirrorAdapter>(backend.name, fetcher_, scrape_limiter_, options);
        }
        case SourceKind::Feed: {
            FeedAdapter::Options options;
            options.channel_ids = config_.feed_channel_ids;
            options.request_timeout_ms = request_timeout_ms;
            return std::make_unique<FeedAdapter>(backend.name, fetcher_, scrape_limiter_, options);
        }
        case SourceKind::DirectUrl: {
            DirectUrlAdapter::Options options;
            options.probe_bytes = config_.direct_probe_bytes;
            options.request_timeout_ms = request_timeout_ms;
            return std::make_unique<DirectUrlAdapter>(backend.name, fetcher_, options);
        }
    }
    throw std::logic_error("Unhandled backend kind for " + backend.name);
}

}
