#pragma once

#include <chrono>
#include <string>

#include "cloudpan/client/content_fetcher.hpp"
#include "cloudpan/client/logger.hpp"
#include "cloudpan/client/transport.hpp"

namespace cloudpan::client
{

    struct TransportOptions
    {
        std::string api_base;
        std::string access_token;
        std::chrono::seconds timeout{60};
    };

    // Bearer-authenticated JSON calls against the Open API.
    class HttpTransport final : public Transport
    {
    public:
        HttpTransport(TransportOptions options, Logger logger);

        api::ApiResponse request_json(api::HttpMethod method, std::string_view path,
                                      const api::FormParams &params) override;

    private:
        std::string resolve_url(std::string_view path) const;

        TransportOptions options_;
        Logger logger_;
    };

    // Plain GET streaming of signed download URLs. The CDN expects a browser
    // User-Agent and the web referer.
    class CurlContentFetcher final : public ContentFetcher
    {
    public:
        explicit CurlContentFetcher(std::chrono::seconds stall_timeout = std::chrono::seconds(60));

        void fetch(const std::string &url, const ChunkHandler &on_chunk) override;

    private:
        std::chrono::seconds stall_timeout_;
    };

    std::string encode_form(const api::FormParams &params);

} // namespace cloudpan::client
