#include "cloudpan/client/oss_client.hpp"

#include <ctime>
#include <fstream>
#include <utility>

#include <nlohmann/json.hpp>

#include "cloudpan/client/curl_session.hpp"
#include "cloudpan/crypto.hpp"
#include "cloudpan/encoding/base64.hpp"
#include "cloudpan/error_codes.hpp"

namespace cloudpan::client
{

    namespace
    {

        constexpr auto kContentType = "application/octet-stream";

        std::string http_date()
        {
            const auto now = std::time(nullptr);
            std::tm utc{};
#ifdef _WIN32
            gmtime_s(&utc, &now);
#else
            gmtime_r(&now, &utc);
#endif
            char buffer[64];
            std::strftime(buffer, sizeof(buffer), "%a, %d %b %Y %H:%M:%S GMT", &utc);
            return buffer;
        }

        // "https://oss-cn-shenzhen.aliyuncs.com" -> scheme "https", host "oss-cn-shenzhen.aliyuncs.com".
        std::pair<std::string, std::string> split_endpoint(const std::string &endpoint)
        {
            std::string scheme = "https";
            std::string host = endpoint;
            if (const auto pos = endpoint.find("://"); pos != std::string::npos)
            {
                scheme = endpoint.substr(0, pos);
                host = endpoint.substr(pos + 3);
            }
            while (!host.empty() && host.back() == '/')
            {
                host.pop_back();
            }
            return {scheme, host};
        }

        std::string escape_object_key(const std::string &key)
        {
            std::string escaped;
            std::size_t start = 0;
            while (start <= key.size())
            {
                const auto slash = key.find('/', start);
                const auto end = slash == std::string::npos ? key.size() : slash;
                escaped += CurlSession::escape(std::string_view(key).substr(start, end - start));
                if (slash == std::string::npos)
                {
                    break;
                }
                escaped.push_back('/');
                start = slash + 1;
            }
            return escaped;
        }

        bool callback_accepted(const std::string &body)
        {
            if (body.empty())
            {
                return true;
            }
            const auto json = nlohmann::json::parse(body, nullptr, false);
            if (json.is_discarded() || !json.is_object())
            {
                return true;
            }
            const auto state = json.find("state");
            if (state == json.end())
            {
                return true;
            }
            return state->is_boolean() ? state->get<bool>() : (state->is_number() && state->get<int>() != 0);
        }

    } // namespace

    OssClient::OssClient(Logger logger, std::chrono::seconds stall_timeout)
        : logger_(std::move(logger)), stall_timeout_(stall_timeout) {}

    std::string OssClient::authorization(const api::UploadCredentials &credentials, const std::string &verb,
                                         const std::string &content_type, const std::string &date,
                                         const std::map<std::string, std::string> &oss_headers,
                                         const std::string &resource)
    {
        std::string string_to_sign = verb + "\n\n" + content_type + "\n" + date + "\n";
        for (const auto &[name, value] : oss_headers)
        {
            string_to_sign += name + ":" + value + "\n";
        }
        string_to_sign += resource;
        const auto signature = crypto::hmac_sha1(credentials.access_key_secret, string_to_sign);
        return "OSS " + credentials.access_key_id + ":" + encoding::encode_base64(signature);
    }

    bool OssClient::put_file(const std::filesystem::path &local_path, const ObjectTarget &target,
                             const api::UploadCredentials &credentials, const ByteProgress &progress)
    {
        if (target.bucket.empty() || target.object.empty())
        {
            throw ApiError(ErrorCode::ProtocolViolation, "Upload target is missing bucket/object");
        }

        std::error_code ec;
        const auto size = std::filesystem::file_size(local_path, ec);
        if (ec)
        {
            throw ApiError(ErrorCode::LocalIo, "Cannot stat " + local_path.string() + ": " + ec.message());
        }
        if (size > kMaxSingleShotBytes)
        {
            throw ApiError(ErrorCode::Unsupported, "File exceeds the 5 GiB single-shot upload limit");
        }

        std::ifstream in(local_path, std::ios::binary);
        if (!in.is_open())
        {
            throw ApiError(ErrorCode::LocalIo, "Could not open " + local_path.string() + " for upload");
        }

        std::map<std::string, std::string> oss_headers{
            {"x-oss-callback", encoding::encode_base64(target.callback)},
            {"x-oss-callback-var", encoding::encode_base64(target.callback_var)},
        };
        if (!credentials.security_token.empty())
        {
            oss_headers.emplace("x-oss-security-token", credentials.security_token);
        }

        const auto date = http_date();
        const auto resource = "/" + target.bucket + "/" + target.object;
        HeaderList headers{
            "Date: " + date,
            std::string("Content-Type: ") + kContentType,
            "Authorization: " + authorization(credentials, "PUT", kContentType, date, oss_headers, resource),
            "Expect:",
        };
        for (const auto &[name, value] : oss_headers)
        {
            headers.push_back(name + ": " + value);
        }

        const auto [scheme, host] = split_endpoint(credentials.endpoint);
        const auto url = scheme + "://" + target.bucket + "." + host + "/" + escape_object_key(target.object);

        std::uint64_t transferred = 0;
        const std::function<void(std::uint64_t)> on_sent = [&](std::uint64_t delta)
        {
            transferred += delta;
            if (progress)
            {
                progress(delta, transferred, size);
            }
        };

        CurlSession session(stall_timeout_);
        const auto reply = session.put(url, headers, in, size, on_sent);
        if (reply.status != 200 && reply.status != 203)
        {
            logger_.warn("oss", "put ", target.object, " status=", reply.status, " body=", reply.body);
            return false;
        }
        if (reply.status == 203 || !callback_accepted(reply.body))
        {
            // 203: object stored but the callback to the service failed.
            logger_.warn("oss", "callback rejected for ", target.object, " body=", reply.body);
            return false;
        }
        logger_.log("oss", "stored ", local_path.filename().string(), " as ", target.object, " (", size, " bytes)");
        return true;
    }

} // namespace cloudpan::client
