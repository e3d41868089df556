#include "cloudpan/api.hpp"

#include <array>
#include <charconv>
#include <cmath>
#include <limits>

namespace cloudpan::api
{

    namespace
    {

        struct MethodMapping
        {
            HttpMethod method;
            std::string_view label;
        };

        constexpr std::array<MethodMapping, 2> kMethodMappings{{
            {HttpMethod::Get, "GET"},
            {HttpMethod::Post, "POST"},
        }};

        // The service encodes most numbers as strings ("fid": "123"), so every
        // numeric field accepts either representation.
        std::uint64_t read_u64(const nlohmann::json &json, const char *key, std::uint64_t fallback = 0)
        {
            const auto it = json.find(key);
            if (it == json.end() || it->is_null())
            {
                return fallback;
            }
            if (it->is_number_unsigned())
            {
                return it->get<std::uint64_t>();
            }
            if (it->is_number_integer())
            {
                const auto value = it->get<std::int64_t>();
                return value < 0 ? fallback : static_cast<std::uint64_t>(value);
            }
            if (it->is_number_float())
            {
                // 2^64 is exact as a double; anything outside [0, 2^64) has no conversion.
                const auto value = it->get<double>();
                if (!std::isfinite(value) || value < 0.0 || value >= 18446744073709551616.0)
                {
                    return fallback;
                }
                return static_cast<std::uint64_t>(value);
            }
            if (it->is_string())
            {
                const auto &text = it->get_ref<const std::string &>();
                std::uint64_t value = 0;
                const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
                if (ec == std::errc() && ptr == text.data() + text.size())
                {
                    return value;
                }
            }
            return fallback;
        }

        std::int64_t read_i64(const nlohmann::json &json, const char *key, std::int64_t fallback = 0)
        {
            const auto it = json.find(key);
            if (it == json.end() || it->is_null())
            {
                return fallback;
            }
            if (it->is_number_unsigned())
            {
                const auto value = it->get<std::uint64_t>();
                return value > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())
                           ? fallback
                           : static_cast<std::int64_t>(value);
            }
            if (it->is_number_integer())
            {
                return it->get<std::int64_t>();
            }
            if (it->is_number_float())
            {
                const auto value = it->get<double>();
                if (!std::isfinite(value) || value < -9223372036854775808.0 || value >= 9223372036854775808.0)
                {
                    return fallback;
                }
                return static_cast<std::int64_t>(value);
            }
            if (it->is_string())
            {
                const auto &text = it->get_ref<const std::string &>();
                std::int64_t value = 0;
                const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
                if (ec == std::errc() && ptr == text.data() + text.size())
                {
                    return value;
                }
            }
            return fallback;
        }

        std::string read_string(const nlohmann::json &json, const char *key)
        {
            const auto it = json.find(key);
            if (it == json.end() || it->is_null())
            {
                return {};
            }
            if (it->is_string())
            {
                return it->get<std::string>();
            }
            if (it->is_number() || it->is_boolean())
            {
                return it->dump();
            }
            return {};
        }

        bool read_state(const nlohmann::json &json)
        {
            const auto it = json.find("state");
            if (it == json.end())
            {
                return false;
            }
            if (it->is_boolean())
            {
                return it->get<bool>();
            }
            if (it->is_number())
            {
                return it->get<std::int64_t>() != 0;
            }
            return false;
        }

        nlohmann::json object_or_first(const nlohmann::json &json)
        {
            if (json.is_object())
            {
                return json;
            }
            if (json.is_array() && !json.empty() && json.front().is_object())
            {
                return json.front();
            }
            return nlohmann::json::object();
        }

    } // namespace

    std::string_view to_string(HttpMethod method) noexcept
    {
        for (const auto &mapping : kMethodMappings)
        {
            if (mapping.method == method)
            {
                return mapping.label;
            }
        }
        return "UNKNOWN";
    }

    ApiResponse parse_response(const nlohmann::json &body)
    {
        if (!body.is_object())
        {
            throw ApiError(ErrorCode::ProtocolViolation, "Response body is not a JSON object");
        }
        ApiResponse response;
        response.ok = read_state(body);
        response.code = read_i64(body, "code");
        response.message = read_string(body, "message");
        if (const auto it = body.find("data"); it != body.end() && !it->is_null())
        {
            response.data = *it;
        }
        response.raw = body;
        return response;
    }

    void ensure_ok(const ApiResponse &response, std::string_view context)
    {
        if (response.ok)
        {
            return;
        }
        std::string message(context);
        message += ": ";
        message += response.message.empty() ? "request rejected" : response.message;
        message += " (code " + std::to_string(response.code) + ")";
        throw ApiError(ErrorCode::RemoteRejected, message, response.code);
    }

    nlohmann::json first_data_item(const ApiResponse &response)
    {
        return object_or_first(response.data);
    }

    std::string join_ids(const std::vector<RemoteId> &ids)
    {
        std::string joined;
        for (const auto id : ids)
        {
            if (!joined.empty())
            {
                joined.push_back(',');
            }
            joined += std::to_string(id);
        }
        return joined;
    }

    void from_json(const nlohmann::json &json, RemoteEntry &entry)
    {
        if (!json.is_object())
        {
            throw ApiError(ErrorCode::ProtocolViolation, "Listing entry is not an object");
        }
        entry.id = read_u64(json, "fid");
        entry.parent_id = read_u64(json, "pid");
        entry.name = read_string(json, "fn");
        entry.is_folder = read_string(json, "fc") == "0";
        entry.size = read_u64(json, "fs");
        entry.pick_code = read_string(json, "pc");
        entry.sha1 = read_string(json, "sha1");
    }

    ListPage parse_list_page(const ApiResponse &response)
    {
        ListPage page;
        if (response.data.is_array())
        {
            page.items.reserve(response.data.size());
            for (const auto &item : response.data)
            {
                page.items.push_back(item.get<RemoteEntry>());
            }
        }
        else if (!response.data.is_object() || !response.data.empty())
        {
            throw ApiError(ErrorCode::ProtocolViolation, "Listing data is not an array");
        }
        page.count = read_u64(response.raw, "count", page.items.size());
        page.offset = read_u64(response.raw, "offset");
        page.limit = read_u64(response.raw, "limit");
        return page;
    }

    FileInfo parse_file_info(const ApiResponse &response)
    {
        const auto data = first_data_item(response);
        if (data.empty())
        {
            throw ApiError(ErrorCode::NotFound, "File info response carries no data");
        }
        FileInfo info;
        info.id = read_u64(data, "file_id");
        info.name = read_string(data, "file_name");
        info.is_folder = read_string(data, "file_category") == "0";
        info.size = read_u64(data, "size_byte");
        info.pick_code = read_string(data, "pick_code");
        if (info.pick_code.empty())
        {
            info.pick_code = read_string(data, "pc");
        }
        info.sha1 = read_string(data, "sha1");
        return info;
    }

    RemoteId parse_created_folder(const ApiResponse &response)
    {
        auto id = read_u64(first_data_item(response), "file_id");
        if (id == 0)
        {
            id = read_u64(response.raw, "file_id");
        }
        if (id == 0)
        {
            throw ApiError(ErrorCode::ProtocolViolation, "Folder created but no folder id was returned");
        }
        return id;
    }

    DownloadTicket parse_download_ticket(const ApiResponse &response)
    {
        // data is keyed by file id with a single entry.
        if (!response.data.is_object() || response.data.empty())
        {
            throw ApiError(ErrorCode::NotFound, "Empty download address; the pick code is unknown or names a folder");
        }
        const auto &entry = response.data.begin().value();
        if (!entry.is_object())
        {
            throw ApiError(ErrorCode::ProtocolViolation, "Malformed download address entry");
        }
        DownloadTicket ticket;
        ticket.file_name = read_string(entry, "file_name");
        ticket.file_size = read_u64(entry, "file_size");
        ticket.pick_code = read_string(entry, "pick_code");
        if (const auto url = entry.find("url"); url != entry.end())
        {
            ticket.url = url->is_object() ? read_string(*url, "url") : (url->is_string() ? url->get<std::string>() : "");
        }
        if (ticket.url.empty())
        {
            throw ApiError(ErrorCode::ProtocolViolation, "Download address entry has no URL");
        }
        return ticket;
    }

    UploadInitReply parse_upload_init(const ApiResponse &response)
    {
        const auto data = first_data_item(response);
        UploadInitReply reply;
        reply.status = static_cast<int>(read_i64(data, "status"));
        reply.code = read_i64(data, "code", 0);
        if (reply.code == 0)
        {
            reply.code = response.code;
        }
        reply.sign_key = read_string(data, "sign_key");
        reply.sign_check = read_string(data, "sign_check");
        reply.pick_code = read_string(data, "pick_code");
        reply.file_id = read_string(data, "file_id");
        reply.bucket = read_string(data, "bucket");
        reply.object = read_string(data, "object");
        if (const auto it = data.find("callback"); it != data.end())
        {
            const auto callback = object_or_first(*it);
            reply.callback = read_string(callback, "callback");
            reply.callback_var = read_string(callback, "callback_var");
        }
        return reply;
    }

    UploadCredentials parse_upload_credentials(const ApiResponse &response)
    {
        const auto data = first_data_item(response);
        UploadCredentials credentials;
        credentials.endpoint = read_string(data, "endpoint");
        credentials.access_key_id = read_string(data, "AccessKeyId");
        credentials.access_key_secret = read_string(data, "AccessKeySecret");
        credentials.security_token = read_string(data, "SecurityToken");
        credentials.expiration = read_string(data, "Expiration");
        if (credentials.endpoint.empty() || credentials.access_key_id.empty() ||
            credentials.access_key_secret.empty())
        {
            throw ApiError(ErrorCode::ProtocolViolation, "Upload token response is missing credentials");
        }
        return credentials;
    }

    UserInfo parse_user_info(const ApiResponse &response)
    {
        const auto data = first_data_item(response);
        UserInfo info;
        info.user_id = read_string(data, "user_id");
        info.user_name = read_string(data, "user_name");
        if (const auto vip = data.find("vip_info"); vip != data.end() && vip->is_object())
        {
            info.vip_level = read_string(*vip, "level_name");
        }
        if (info.user_id.empty() || info.user_name.empty())
        {
            throw ApiError(ErrorCode::ProtocolViolation, "User info response is missing user fields");
        }
        return info;
    }

    std::vector<RecycleEntry> parse_recycle_list(const ApiResponse &response)
    {
        std::vector<RecycleEntry> entries;
        auto append = [&entries](const nlohmann::json &item)
        {
            if (!item.is_object() || !item.contains("id"))
            {
                return;
            }
            entries.push_back(RecycleEntry{
                .id = read_string(item, "id"),
                .name = read_string(item, "file_name"),
                .size = read_u64(item, "file_size"),
                .parent_name = read_string(item, "parent_name"),
            });
        };
        if (response.data.is_array())
        {
            for (const auto &item : response.data)
            {
                append(item);
            }
        }
        else if (response.data.is_object())
        {
            for (const auto &item : response.data)
            {
                append(item);
            }
        }
        return entries;
    }

} // namespace cloudpan::api
