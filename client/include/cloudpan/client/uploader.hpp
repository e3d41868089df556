#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <variant>

#include "cloudpan/api.hpp"
#include "cloudpan/client/folder_mirror.hpp"
#include "cloudpan/client/logger.hpp"
#include "cloudpan/client/object_transfer.hpp"
#include "cloudpan/client/remote_files.hpp"
#include "cloudpan/client/transfer_result.hpp"
#include "cloudpan/client/transport.hpp"
#include "cloudpan/client/upload_negotiator.hpp"
#include "cloudpan/client/worker_pool.hpp"

namespace cloudpan::client
{

    struct UploadOptions
    {
        bool create_folder{true};
        bool show_progress{true};
        BatchMode mode{BatchMode::Concurrent};
        std::optional<std::size_t> max_workers;
        // Single files only: pick up an interrupted upload instead of starting over.
        std::optional<std::string> resume_pick_code;
    };

    class Uploader
    {
    public:
        Uploader(Transport &transport, ObjectTransferClient &objects, Logger logger);

        // A regular file yields bool, a directory yields its batch summary.
        // Throws ApiError for invalid arguments before any remote call is made.
        std::variant<bool, TransferBatchResult> upload(const std::filesystem::path &local_path, api::RemoteId target,
                                                       const UploadOptions &options = {});

        TransferResult upload_file(const std::filesystem::path &local_path, api::RemoteId target,
                                   const UploadOptions &options = {});

        // Mirrors the directory structure first (failures there throw), then
        // uploads every file. Per-file failures only show up in the summary, and
        // local subdirectories that cannot be read are listed in omitted_paths.
        TransferBatchResult upload_tree(const std::filesystem::path &local_root, api::RemoteId target,
                                        const UploadOptions &options = {});

        static std::size_t default_workers();

    private:
        TransferResult transfer(const std::filesystem::path &local_path, const std::string &display_name,
                                api::RemoteId target, const std::optional<std::string> &resume_pick_code,
                                bool show_bytes);

        RemoteFiles files_;
        FolderMirror mirror_;
        UploadNegotiator negotiator_;
        ObjectTransferClient &objects_;
        Logger logger_;
    };

} // namespace cloudpan::client
