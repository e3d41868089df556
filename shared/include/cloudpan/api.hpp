/**
 * CloudPan - Open API schema: endpoint paths, the response envelope, and the
 * typed records every remote reply is validated into.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "cloudpan/error_codes.hpp"

namespace cloudpan::api
{

    using RemoteId = std::uint64_t;

    inline constexpr RemoteId kRootFolderId = 0;
    inline constexpr std::string_view kDefaultApiBase = "https://proapi.115.com";

    // Largest page the listing endpoint serves.
    inline constexpr std::uint64_t kMaxListPage = 1150;

    namespace endpoint
    {
        inline constexpr std::string_view kUploadToken = "/open/upload/get_token";
        inline constexpr std::string_view kUploadInit = "/open/upload/init";
        inline constexpr std::string_view kUploadResume = "/open/upload/resume";
        inline constexpr std::string_view kFolderAdd = "/open/folder/add";
        inline constexpr std::string_view kFolderInfo = "/open/folder/get_info";
        inline constexpr std::string_view kFiles = "/open/ufile/files";
        inline constexpr std::string_view kSearch = "/open/ufile/search";
        inline constexpr std::string_view kCopy = "/open/ufile/copy";
        inline constexpr std::string_view kMove = "/open/ufile/move";
        inline constexpr std::string_view kDownUrl = "/open/ufile/downurl";
        inline constexpr std::string_view kUpdate = "/open/ufile/update";
        inline constexpr std::string_view kDelete = "/open/ufile/delete";
        inline constexpr std::string_view kRecycleList = "/open/rb/list";
        inline constexpr std::string_view kRecycleRevert = "/open/rb/revert";
        inline constexpr std::string_view kRecycleDelete = "/open/rb/del";
        inline constexpr std::string_view kUserInfo = "/open/user/info";
    } // namespace endpoint

    enum class HttpMethod : std::uint8_t
    {
        Get,
        Post
    };

    std::string_view to_string(HttpMethod method) noexcept;

    using FormParams = std::vector<std::pair<std::string, std::string>>;

    struct ApiResponse
    {
        bool ok{};
        std::int64_t code{};
        std::string message{};
        nlohmann::json data{nlohmann::json::object()};
        nlohmann::json raw{nlohmann::json::object()};
    };

    // Validates the {state, code, message, data} envelope. Throws ApiError
    // (ProtocolViolation) when the body is not an object.
    ApiResponse parse_response(const nlohmann::json &body);

    // Throws ApiError(RemoteRejected) when the call did not succeed.
    void ensure_ok(const ApiResponse &response, std::string_view context);

    // `data` is sometimes a one-element array; returns its first object either way.
    nlohmann::json first_data_item(const ApiResponse &response);

    std::string join_ids(const std::vector<RemoteId> &ids);

    struct RemoteEntry
    {
        RemoteId id{};
        RemoteId parent_id{};
        std::string name;
        bool is_folder{};
        std::uint64_t size{};
        std::string pick_code;
        std::string sha1;
    };

    void from_json(const nlohmann::json &json, RemoteEntry &entry);

    struct ListPage
    {
        std::vector<RemoteEntry> items;
        std::uint64_t count{};
        std::uint64_t offset{};
        std::uint64_t limit{};
    };

    ListPage parse_list_page(const ApiResponse &response);

    struct FileInfo
    {
        RemoteId id{};
        std::string name;
        bool is_folder{};
        std::uint64_t size{};
        std::string pick_code;
        std::string sha1;
    };

    FileInfo parse_file_info(const ApiResponse &response);

    RemoteId parse_created_folder(const ApiResponse &response);

    struct DownloadTicket
    {
        std::string url;
        std::string file_name;
        std::uint64_t file_size{};
        std::string pick_code;
    };

    DownloadTicket parse_download_ticket(const ApiResponse &response);

    struct UploadInitReply
    {
        int status{};
        std::int64_t code{};
        std::string sign_key;
        std::string sign_check;
        std::string pick_code;
        std::string file_id;
        std::string bucket;
        std::string object;
        std::string callback;
        std::string callback_var;
    };

    UploadInitReply parse_upload_init(const ApiResponse &response);

    struct UploadCredentials
    {
        std::string endpoint;
        std::string access_key_id;
        std::string access_key_secret;
        std::string security_token;
        std::string expiration;
    };

    UploadCredentials parse_upload_credentials(const ApiResponse &response);

    struct UserInfo
    {
        std::string user_id;
        std::string user_name;
        std::string vip_level;
    };

    UserInfo parse_user_info(const ApiResponse &response);

    struct RecycleEntry
    {
        std::string id;
        std::string name;
        std::uint64_t size{};
        std::string parent_name;
    };

    std::vector<RecycleEntry> parse_recycle_list(const ApiResponse &response);

} // namespace cloudpan::api
