#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <variant>

#include "cloudpan/api.hpp"
#include "cloudpan/client/content_fetcher.hpp"
#include "cloudpan/client/logger.hpp"
#include "cloudpan/client/remote_files.hpp"
#include "cloudpan/client/transfer_result.hpp"
#include "cloudpan/client/transport.hpp"
#include "cloudpan/client/tree_walker.hpp"
#include "cloudpan/client/worker_pool.hpp"

namespace cloudpan::client
{

    struct DownloadOptions
    {
        std::optional<std::string> filename;
        bool overwrite{false};
        bool show_progress{true};
        bool create_folder{true};
        BatchMode mode{BatchMode::Concurrent};
        std::optional<std::size_t> max_workers;
        std::size_t chunk_size{8192};
    };

    struct DownloadRequest
    {
        std::string pick_code;
        std::filesystem::path save_dir;
        std::optional<std::string> filename;
        // Shown in progress lines and results; defaults to the file name.
        std::string display_name;
    };

    // Numeric file or folder id, or an absolute remote file path.
    using DownloadTarget = std::variant<api::RemoteId, std::string>;

    class Downloader
    {
    public:
        static constexpr std::size_t kDefaultWorkers = 5;

        Downloader(Transport &transport, ContentFetcher &fetcher, Logger logger);

        // Resolves `target` and downloads it. Resolution failures throw;
        // transfer failures are reported in the returned result.
        std::variant<TransferResult, TransferBatchResult> download(const DownloadTarget &target,
                                                                   const std::filesystem::path &save_path,
                                                                   const DownloadOptions &options = {});

        // Never throws. A partial file is removed before returning a failure.
        TransferResult download_one(const DownloadRequest &request, const DownloadOptions &options = {});

        TransferBatchResult download_folder(api::RemoteId folder, const std::filesystem::path &save_path,
                                            const DownloadOptions &options = {});

    private:
        void stream_to_file(const std::string &url, const std::filesystem::path &destination, std::uint64_t expected,
                            const std::string &label, const DownloadOptions &options);

        RemoteFiles files_;
        TreeWalker walker_;
        ContentFetcher &fetcher_;
        Logger logger_;
    };

} // namespace cloudpan::client
