#pragma once
#include <memory>
#include "../interfaces/IBackendAdapter.hpp"
#include "../interfaces/IHttpFetcher.hpp"
#include "../interfaces/IRateLimiter.hpp"
#include "../model/BackendConfig.hpp"

namespace Cadenza {
    struct Config;

    class AdapterFactory {
    public:
        // `scrape_limiter` throttles every adapter that scrapes or hits mirrors.
        AdapterFactory(const Config& config, IHttpFetcher& fetcher, std::shared_ptr<IRateLimiter> scrape_limiter);

        std::unique_ptr<IBackendAdapter> Create(const BackendConfig& backend) const;

    private:
        const Config& config_;
        IHttpFetcher& fetcher_;
        std::shared_ptr<IRateLimiter> scrape_limiter_;
    };
}
