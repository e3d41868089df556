#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "cloudpan/api.hpp"
#include "cloudpan/client/transport.hpp"

namespace cloudpan::client
{

    // Typed file and folder operations on top of the transport. Every method
    // throws ApiError when the call fails or the reply does not validate.
    class RemoteFiles
    {
    public:
        explicit RemoteFiles(Transport &transport);

        api::ListPage list(api::RemoteId folder, std::uint64_t offset, std::uint64_t limit, bool show_dirs = true);

        // Every child of `folder`, following pagination. `page_limit` is clamped
        // to the service maximum.
        std::vector<api::RemoteEntry> list_all(api::RemoteId folder, std::uint64_t page_limit = api::kMaxListPage);

        api::FileInfo info(api::RemoteId id);
        api::FileInfo info(const std::string &remote_path);

        api::RemoteId create_folder(api::RemoteId parent, const std::string &name);

        api::ListPage search(const std::string &keyword, std::uint64_t limit, std::uint64_t offset,
                             std::optional<api::RemoteId> folder = std::nullopt);

        void copy(api::RemoteId target_folder, const std::vector<api::RemoteId> &ids, bool allow_duplicates = true);
        void move(const std::vector<api::RemoteId> &ids, api::RemoteId target_folder);
        void rename(api::RemoteId id, const std::string &new_name);
        void remove(const std::vector<api::RemoteId> &ids, std::optional<api::RemoteId> parent = std::nullopt);

        api::DownloadTicket download_url(const std::string &pick_code);

        api::UserInfo user_info();

        // "/docs/report.pdf" form: trimmed, leading slash. Rejects "" and "/".
        static std::string normalize_remote_path(const std::string &input);

    private:
        Transport &transport_;
    };

} // namespace cloudpan::client
