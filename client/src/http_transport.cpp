#include "cloudpan/client/http_transport.hpp"

#include <utility>

#include <nlohmann/json.hpp>

#include "cloudpan/client/curl_session.hpp"
#include "cloudpan/error_codes.hpp"

namespace cloudpan::client
{

    namespace
    {

        constexpr auto kBrowserUserAgent =
            "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, like Gecko) "
            "Chrome/131.0.0.0 Safari/537.36";

    } // namespace

    std::string encode_form(const api::FormParams &params)
    {
        std::string encoded;
        for (const auto &[key, value] : params)
        {
            if (!encoded.empty())
            {
                encoded.push_back('&');
            }
            encoded += CurlSession::escape(key);
            encoded.push_back('=');
            encoded += CurlSession::escape(value);
        }
        return encoded;
    }

    HttpTransport::HttpTransport(TransportOptions options, Logger logger)
        : options_(std::move(options)), logger_(std::move(logger))
    {
        if (options_.api_base.empty())
        {
            options_.api_base = std::string(api::kDefaultApiBase);
        }
        while (!options_.api_base.empty() && options_.api_base.back() == '/')
        {
            options_.api_base.pop_back();
        }
    }

    std::string HttpTransport::resolve_url(std::string_view path) const
    {
        if (path.starts_with("http://") || path.starts_with("https://"))
        {
            return std::string(path);
        }
        return options_.api_base + std::string(path);
    }

    api::ApiResponse HttpTransport::request_json(api::HttpMethod method, std::string_view path,
                                                 const api::FormParams &params)
    {
        if (options_.access_token.empty())
        {
            throw ApiError(ErrorCode::InvalidArgument, "No access token configured");
        }

        const HeaderList headers{
            "Authorization: Bearer " + options_.access_token,
            "Accept: application/json",
        };

        CurlSession session(options_.timeout);
        auto url = resolve_url(path);
        const auto form = encode_form(params);
        HttpReply reply;
        if (method == api::HttpMethod::Get)
        {
            if (!form.empty())
            {
                url += (url.find('?') == std::string::npos ? '?' : '&');
                url += form;
            }
            reply = session.get(url, headers);
        }
        else
        {
            reply = session.post_form(url, form, headers);
        }

        if (reply.status != 200)
        {
            logger_.warn("http", api::to_string(method), ' ', path, " status=", reply.status);
            throw ApiError(ErrorCode::TransportFailure,
                           std::string(path) + " returned HTTP " + std::to_string(reply.status));
        }

        nlohmann::json body;
        try
        {
            body = nlohmann::json::parse(reply.body);
        }
        catch (const nlohmann::json::parse_error &ex)
        {
            logger_.warn("http", api::to_string(method), ' ', path, " parse_error=", ex.what());
            throw ApiError(ErrorCode::ProtocolViolation, std::string(path) + " returned malformed JSON");
        }

        auto response = api::parse_response(body);
        logger_.log("http", api::to_string(method), ' ', path, " state=", response.ok, " code=", response.code);
        return response;
    }

    CurlContentFetcher::CurlContentFetcher(std::chrono::seconds stall_timeout) : stall_timeout_(stall_timeout) {}

    void CurlContentFetcher::fetch(const std::string &url, const ChunkHandler &on_chunk)
    {
        const HeaderList headers{
            "Accept: */*",
            "Accept-Language: zh-CN,zh;q=0.9,en;q=0.8",
            "Referer: https://115.com/",
        };
        CurlSession session(stall_timeout_, kBrowserUserAgent);
        session.stream(url, headers, on_chunk);
    }

} // namespace cloudpan::client
