#include "cloudpan/client/uploader.hpp"

#include <algorithm>
#include <exception>
#include <system_error>
#include <utility>
#include <vector>

#include "cloudpan/client/progress.hpp"
#include "cloudpan/error_codes.hpp"

namespace cloudpan::client
{

    namespace fs = std::filesystem;

    namespace
    {

        struct LocalTree
        {
            std::vector<std::string> directories;
            std::vector<fs::path> files;
            std::vector<std::string> omitted;
        };

        std::size_t depth_of(const std::string &relative)
        {
            return static_cast<std::size_t>(std::count(relative.begin(), relative.end(), '/'));
        }

        std::string base_name(const fs::path &path)
        {
            auto normal = path.lexically_normal();
            if (normal.filename().empty())
            {
                normal = normal.parent_path();
            }
            return normal.filename().string();
        }

        // Unreadable subdirectories land in `omitted` and the walk carries on.
        // Directory symlinks are not followed.
        void scan_directory(const fs::path &root, const fs::path &directory, LocalTree &tree)
        {
            const bool is_root = directory == root;
            const auto relative = is_root ? std::string{} : directory.lexically_relative(root).generic_string();
            std::error_code ec;
            fs::directory_iterator it(directory, ec);
            if (ec)
            {
                if (is_root)
                {
                    throw ApiError(ErrorCode::LocalIo, "Cannot read " + root.string() + ": " + ec.message());
                }
                tree.omitted.push_back(relative);
                return;
            }
            if (!is_root)
            {
                tree.directories.push_back(relative);
            }

            std::vector<fs::path> subdirectories;
            for (; !ec && it != fs::directory_iterator(); it.increment(ec))
            {
                const auto &entry = *it;
                std::error_code type_ec;
                if (entry.is_symlink(type_ec))
                {
                    if (entry.is_regular_file(type_ec))
                    {
                        tree.files.push_back(entry.path());
                    }
                }
                else if (entry.is_directory(type_ec))
                {
                    subdirectories.push_back(entry.path());
                }
                else if (entry.is_regular_file(type_ec))
                {
                    tree.files.push_back(entry.path());
                }
            }
            if (ec)
            {
                // Listing broke off part way; whatever was read is kept.
                tree.omitted.push_back(is_root ? std::string(".") : relative);
            }
            for (const auto &subdirectory : subdirectories)
            {
                scan_directory(root, subdirectory, tree);
            }
        }

        LocalTree scan_tree(const fs::path &root)
        {
            LocalTree tree;
            scan_directory(root, root, tree);
            std::stable_sort(tree.directories.begin(), tree.directories.end(),
                             [](const std::string &lhs, const std::string &rhs)
                             { return depth_of(lhs) < depth_of(rhs); });
            return tree;
        }

    } // namespace

    Uploader::Uploader(Transport &transport, ObjectTransferClient &objects, Logger logger)
        : files_(transport), mirror_(files_, logger), negotiator_(transport, logger), objects_(objects),
          logger_(std::move(logger))
    {
    }

    std::size_t Uploader::default_workers()
    {
        const auto hardware = hardware_workers();
        return hardware > 1 ? hardware - 1 : 1;
    }

    std::variant<bool, TransferBatchResult> Uploader::upload(const fs::path &local_path, api::RemoteId target,
                                                             const UploadOptions &options)
    {
        std::error_code ec;
        const auto status = fs::status(local_path, ec);
        if (ec || !fs::exists(status))
        {
            throw ApiError(ErrorCode::InvalidArgument, "Local path does not exist: " + local_path.string());
        }
        if (options.max_workers && options.mode == BatchMode::Loop && *options.max_workers > 1)
        {
            logger_.warn("upload", "--max-workers is ignored in loop mode");
        }

        if (fs::is_regular_file(status))
        {
            return upload_file(local_path, target, options).success;
        }
        if (fs::is_directory(status))
        {
            if (options.resume_pick_code)
            {
                throw ApiError(ErrorCode::InvalidArgument, "Resuming is only possible for a single file");
            }
            return upload_tree(local_path, target, options);
        }
        throw ApiError(ErrorCode::InvalidArgument, "Not a regular file or directory: " + local_path.string());
    }

    TransferResult Uploader::upload_file(const fs::path &local_path, api::RemoteId target,
                                         const UploadOptions &options)
    {
        return transfer(local_path, local_path.filename().string(), target, options.resume_pick_code,
                        options.show_progress);
    }

    TransferResult Uploader::transfer(const fs::path &local_path, const std::string &display_name,
                                      api::RemoteId target, const std::optional<std::string> &resume_pick_code,
                                      bool show_bytes)
    {
        TransferResult result;
        result.identifier = local_path.string();
        result.display_name = display_name;
        result.destination_path = local_path;
        result.remote_folder_id = target;

        try
        {
            const auto file = describe_file(local_path);
            result.byte_size = file.size;

            const auto outcome = resume_pick_code ? negotiator_.resume(file, target, *resume_pick_code)
                                                  : negotiator_.negotiate(file, target);
            if (outcome.state == NegotiationState::InstantComplete)
            {
                result.success = true;
                result.message = outcome.message;
                return result;
            }
            if (outcome.state != NegotiationState::ReadyForTransfer || !outcome.ticket)
            {
                result.message = outcome.message;
                return result;
            }

            const auto credentials = negotiator_.fetch_credentials();
            auto progress = make_progress(show_bytes, ProgressUnit::Bytes);
            progress->start("upload " + display_name, file.size);
            bool stored = false;
            try
            {
                stored = objects_.put_file(local_path, *outcome.ticket, credentials,
                                           [&progress](std::uint64_t delta, std::uint64_t, std::uint64_t)
                                           { progress->advance(delta); });
            }
            catch (...)
            {
                progress->finish();
                throw;
            }
            progress->finish();

            result.success = stored;
            result.message = stored ? "uploaded" : "object store did not confirm the upload";
        }
        catch (const std::exception &ex)
        {
            result.success = false;
            result.message = ex.what();
        }

        if (result.success)
        {
            logger_.log("upload", display_name, " -> folder ", target, ": ", result.message);
        }
        else
        {
            logger_.warn("upload", display_name, " failed: ", result.message);
        }
        return result;
    }

    TransferBatchResult Uploader::upload_tree(const fs::path &local_root, api::RemoteId target,
                                              const UploadOptions &options)
    {
        if (!fs::is_directory(local_root))
        {
            throw ApiError(ErrorCode::InvalidArgument, "Not a directory: " + local_root.string());
        }
        auto tree = scan_tree(local_root);
        const auto workers = resolve_worker_count(options.max_workers, default_workers());

        TransferBatchResult batch;
        batch.folder_name = base_name(local_root);
        batch.destination_root = local_root;
        batch.total_files = tree.files.size();
        for (const auto &skipped : tree.omitted)
        {
            logger_.warn("upload", batch.folder_name, ": cannot read ", skipped, ", skipped");
        }
        batch.omitted_paths = std::move(tree.omitted);

        auto root_id = target;
        if (options.create_folder)
        {
            root_id = mirror_.ensure_folder(target, batch.folder_name);
        }
        batch.folder_identifier = root_id;

        DirectoryCache cache(root_id);
        for (const auto &directory : tree.directories)
        {
            mirror_.ensure_path(cache, directory);
        }
        logger_.log("upload", batch.folder_name, ": ", tree.directories.size(), " folders mirrored, ",
                    tree.files.size(), " files queued, mode ", to_string(options.mode), ", workers ", workers);

        auto progress = make_progress(options.show_progress, ProgressUnit::Files);
        progress->start("upload " + batch.folder_name, tree.files.size());
        ResultCollector collector(tree.files.size(), *progress);

        run_batch(tree.files, options.mode, workers,
                  [&](const fs::path &file)
                  {
                      const auto relative = file.lexically_relative(local_root).generic_string();
                      TransferResult result;
                      try
                      {
                          const auto folder = cache.nearest(parent_of(relative));
                          result = transfer(file, relative, folder, std::nullopt, false);
                      }
                      catch (const std::exception &ex)
                      {
                          result = failed_result(file.string(), relative, ex.what());
                      }
                      collector.record(std::move(result));
                  });

        progress->finish();
        collector.finalize(batch);
        logger_.log("upload", batch.folder_name, ": ", batch.succeeded, " succeeded, ", batch.failed, " failed");
        return batch;
    }

} // namespace cloudpan::client
