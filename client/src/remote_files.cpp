#include "cloudpan/client/remote_files.hpp"

#include <algorithm>

#include "cloudpan/error_codes.hpp"

namespace cloudpan::client
{

    namespace
    {

        constexpr std::size_t kMaxFolderNameBytes = 255;

        std::string trim(const std::string &input)
        {
            const auto begin = input.find_first_not_of(" \t\r\n");
            if (begin == std::string::npos)
            {
                return "";
            }
            const auto end = input.find_last_not_of(" \t\r\n");
            return input.substr(begin, end - begin + 1);
        }

        void require_ids(const std::vector<api::RemoteId> &ids)
        {
            if (ids.empty())
            {
                throw ApiError(ErrorCode::InvalidArgument, "At least one file id is required");
            }
        }

    } // namespace

    RemoteFiles::RemoteFiles(Transport &transport) : transport_(transport) {}

    std::string RemoteFiles::normalize_remote_path(const std::string &input)
    {
        auto path = trim(input);
        if (path.empty())
        {
            throw ApiError(ErrorCode::InvalidArgument, "Remote path must not be empty");
        }
        if (path.front() != '/')
        {
            path.insert(path.begin(), '/');
        }
        if (path == "/")
        {
            throw ApiError(ErrorCode::InvalidArgument, "The root path / does not address a file");
        }
        return path;
    }

    api::ListPage RemoteFiles::list(api::RemoteId folder, std::uint64_t offset, std::uint64_t limit, bool show_dirs)
    {
        const api::FormParams params{
            {"cid", std::to_string(folder)},
            {"limit", std::to_string(std::clamp<std::uint64_t>(limit, 1, api::kMaxListPage))},
            {"offset", std::to_string(offset)},
            {"show_dir", show_dirs ? "1" : "0"},
        };
        const auto response = transport_.request_json(api::HttpMethod::Get, api::endpoint::kFiles, params);
        api::ensure_ok(response, "List folder " + std::to_string(folder));
        return api::parse_list_page(response);
    }

    std::vector<api::RemoteEntry> RemoteFiles::list_all(api::RemoteId folder, std::uint64_t page_limit)
    {
        const auto limit = std::clamp<std::uint64_t>(page_limit, 1, api::kMaxListPage);
        std::vector<api::RemoteEntry> entries;
        std::uint64_t offset = 0;
        while (true)
        {
            auto page = list(folder, offset, limit);
            if (page.items.empty())
            {
                break;
            }
            const auto page_size = page.items.size();
            entries.insert(entries.end(), std::make_move_iterator(page.items.begin()),
                           std::make_move_iterator(page.items.end()));
            if (entries.size() >= page.count || page_size < limit)
            {
                break;
            }
            offset += page_size;
        }
        return entries;
    }

    api::FileInfo RemoteFiles::info(api::RemoteId id)
    {
        if (id == api::kRootFolderId)
        {
            throw ApiError(ErrorCode::InvalidArgument, "The root folder has no file info");
        }
        const auto response = transport_.request_json(api::HttpMethod::Get, api::endpoint::kFolderInfo,
                                                      {{"file_id", std::to_string(id)}});
        api::ensure_ok(response, "Get info for " + std::to_string(id));
        return api::parse_file_info(response);
    }

    api::FileInfo RemoteFiles::info(const std::string &remote_path)
    {
        const auto path = normalize_remote_path(remote_path);
        const auto response =
            transport_.request_json(api::HttpMethod::Get, api::endpoint::kFolderInfo, {{"path", path}});
        api::ensure_ok(response, "Get info for " + path);
        return api::parse_file_info(response);
    }

    api::RemoteId RemoteFiles::create_folder(api::RemoteId parent, const std::string &name)
    {
        if (name.empty() || name.size() > kMaxFolderNameBytes)
        {
            throw ApiError(ErrorCode::InvalidArgument, "Folder name must be 1 to 255 bytes");
        }
        const auto response = transport_.request_json(api::HttpMethod::Post, api::endpoint::kFolderAdd,
                                                      {{"pid", std::to_string(parent)}, {"file_name", name}});
        api::ensure_ok(response, "Create folder " + name);
        return api::parse_created_folder(response);
    }

    api::ListPage RemoteFiles::search(const std::string &keyword, std::uint64_t limit, std::uint64_t offset,
                                      std::optional<api::RemoteId> folder)
    {
        if (trim(keyword).empty())
        {
            throw ApiError(ErrorCode::InvalidArgument, "Search keyword must not be empty");
        }
        api::FormParams params{
            {"search_value", keyword},
            {"limit", std::to_string(limit)},
            {"offset", std::to_string(offset)},
        };
        if (folder)
        {
            params.emplace_back("cid", std::to_string(*folder));
        }
        const auto response = transport_.request_json(api::HttpMethod::Get, api::endpoint::kSearch, params);
        api::ensure_ok(response, "Search " + keyword);
        return api::parse_list_page(response);
    }

    void RemoteFiles::copy(api::RemoteId target_folder, const std::vector<api::RemoteId> &ids, bool allow_duplicates)
    {
        require_ids(ids);
        const auto response = transport_.request_json(api::HttpMethod::Post, api::endpoint::kCopy,
                                                      {{"pid", std::to_string(target_folder)},
                                                       {"file_id", api::join_ids(ids)},
                                                       {"nodupli", allow_duplicates ? "0" : "1"}});
        api::ensure_ok(response, "Copy");
    }

    void RemoteFiles::move(const std::vector<api::RemoteId> &ids, api::RemoteId target_folder)
    {
        require_ids(ids);
        const auto response = transport_.request_json(api::HttpMethod::Post, api::endpoint::kMove,
                                                      {{"file_ids", api::join_ids(ids)},
                                                       {"to_cid", std::to_string(target_folder)}});
        api::ensure_ok(response, "Move");
    }

    void RemoteFiles::rename(api::RemoteId id, const std::string &new_name)
    {
        if (trim(new_name).empty())
        {
            throw ApiError(ErrorCode::InvalidArgument, "New name must not be empty");
        }
        const auto response = transport_.request_json(api::HttpMethod::Post, api::endpoint::kUpdate,
                                                      {{"file_id", std::to_string(id)}, {"file_name", new_name}});
        api::ensure_ok(response, "Rename " + std::to_string(id));
    }

    void RemoteFiles::remove(const std::vector<api::RemoteId> &ids, std::optional<api::RemoteId> parent)
    {
        require_ids(ids);
        api::FormParams params{{"file_ids", api::join_ids(ids)}};
        if (parent)
        {
            params.emplace_back("parent_id", std::to_string(*parent));
        }
        const auto response = transport_.request_json(api::HttpMethod::Post, api::endpoint::kDelete, params);
        api::ensure_ok(response, "Delete");
    }

    api::DownloadTicket RemoteFiles::download_url(const std::string &pick_code)
    {
        if (pick_code.empty())
        {
            throw ApiError(ErrorCode::InvalidArgument, "Pick code must not be empty");
        }
        const auto response =
            transport_.request_json(api::HttpMethod::Post, api::endpoint::kDownUrl, {{"pick_code", pick_code}});
        api::ensure_ok(response, "Resolve download address");
        return api::parse_download_ticket(response);
    }

    api::UserInfo RemoteFiles::user_info()
    {
        const auto response = transport_.request_json(api::HttpMethod::Get, api::endpoint::kUserInfo, {});
        api::ensure_ok(response, "User info");
        return api::parse_user_info(response);
    }

} // namespace cloudpan::client
