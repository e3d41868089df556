#include "cloudpan/client/downloader.hpp"

#include <algorithm>
#include <cstddef>
#include <exception>
#include <fstream>
#include <set>
#include <span>
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

        // Collects arbitrary network chunks and writes them out in fixed-size blocks.
        class ChunkedWriter
        {
        public:
            ChunkedWriter(const fs::path &path, std::size_t chunk_size, ProgressSink &progress)
                : out_(path, std::ios::binary | std::ios::trunc), chunk_size_(chunk_size), progress_(progress)
            {
                if (!out_)
                {
                    throw ApiError(ErrorCode::LocalIo, "Cannot open " + path.string() + " for writing");
                }
                buffer_.reserve(chunk_size_);
            }

            void append(std::span<const std::byte> data)
            {
                while (!data.empty())
                {
                    const auto take = std::min(chunk_size_ - buffer_.size(), data.size());
                    buffer_.insert(buffer_.end(), data.begin(), data.begin() + static_cast<std::ptrdiff_t>(take));
                    data = data.subspan(take);
                    if (buffer_.size() == chunk_size_)
                    {
                        flush();
                    }
                }
            }

            void close()
            {
                flush();
                out_.close();
                if (out_.fail())
                {
                    throw ApiError(ErrorCode::LocalIo, "Failed to finish writing the download");
                }
            }

            std::uint64_t written() const noexcept { return written_; }

        private:
            void flush()
            {
                if (buffer_.empty())
                {
                    return;
                }
                out_.write(reinterpret_cast<const char *>(buffer_.data()), static_cast<std::streamsize>(buffer_.size()));
                if (!out_)
                {
                    throw ApiError(ErrorCode::LocalIo, "Write to disk failed");
                }
                written_ += buffer_.size();
                progress_.advance(buffer_.size());
                buffer_.clear();
            }

            std::ofstream out_;
            std::size_t chunk_size_;
            ProgressSink &progress_;
            std::vector<std::byte> buffer_;
            std::uint64_t written_{};
        };

        void remove_partial(const fs::path &path)
        {
            std::error_code ec;
            fs::remove(path, ec);
        }

    } // namespace

    Downloader::Downloader(Transport &transport, ContentFetcher &fetcher, Logger logger)
        : files_(transport), walker_(files_, logger), fetcher_(fetcher), logger_(std::move(logger))
    {
    }

    void Downloader::stream_to_file(const std::string &url, const fs::path &destination, std::uint64_t expected,
                                    const std::string &label, const DownloadOptions &options)
    {
        auto progress = make_progress(options.show_progress, ProgressUnit::Bytes);
        progress->start(label, expected);
        try
        {
            ChunkedWriter writer(destination, options.chunk_size, *progress);
            fetcher_.fetch(url, [&writer](std::span<const std::byte> chunk)
                           { writer.append(chunk); });
            writer.close();
            if (expected != 0 && writer.written() != expected)
            {
                throw ApiError(ErrorCode::TransportFailure, "Stream ended after " + std::to_string(writer.written()) +
                                                                " of " + std::to_string(expected) + " bytes");
            }
        }
        catch (...)
        {
            progress->finish();
            remove_partial(destination);
            throw;
        }
        progress->finish();
    }

    TransferResult Downloader::download_one(const DownloadRequest &request, const DownloadOptions &options)
    {
        TransferResult result;
        result.identifier = request.pick_code;
        result.display_name = request.display_name;

        try
        {
            if (options.chunk_size == 0)
            {
                throw ApiError(ErrorCode::InvalidArgument, "Chunk size must be positive");
            }
            const auto ticket = files_.download_url(request.pick_code);
            if (ticket.url.empty())
            {
                throw ApiError(ErrorCode::ProtocolViolation, "No download address for " + request.pick_code);
            }

            const auto name = request.filename.value_or(ticket.file_name);
            if (!is_safe_entry_name(name))
            {
                throw ApiError(ErrorCode::InvalidArgument, "Unusable local file name: '" + name + "'");
            }
            if (result.display_name.empty())
            {
                result.display_name = name;
            }
            result.byte_size = ticket.file_size;

            fs::create_directories(request.save_dir);
            const auto destination = request.save_dir / name;
            result.destination_path = destination;

            if (fs::exists(destination) && !options.overwrite)
            {
                result.skipped = true;
                result.message = "already exists, skipped";
                logger_.log("download", destination.string(), " exists, skipped");
                return result;
            }

            stream_to_file(ticket.url, destination, ticket.file_size, result.display_name, options);
            result.success = true;
            result.message = "downloaded";
            logger_.log("download", result.display_name, " -> ", destination.string());
        }
        catch (const std::exception &ex)
        {
            result.success = false;
            result.message = ex.what();
            logger_.warn("download", result.display_name.empty() ? request.pick_code : result.display_name,
                         " failed: ", ex.what());
        }
        return result;
    }

    TransferBatchResult Downloader::download_folder(api::RemoteId folder, const fs::path &save_path,
                                                    const DownloadOptions &options)
    {
        const auto info = files_.info(folder);
        if (!info.is_folder)
        {
            throw ApiError(ErrorCode::InvalidArgument, std::to_string(folder) + " is not a folder");
        }

        TransferBatchResult batch;
        batch.folder_identifier = folder;
        batch.folder_name = info.name;

        auto base = save_path;
        if (options.create_folder)
        {
            if (!is_safe_entry_name(info.name))
            {
                throw ApiError(ErrorCode::InvalidArgument, "Unusable local folder name: '" + info.name + "'");
            }
            base /= info.name;
        }
        fs::create_directories(base);
        batch.destination_root = base;

        auto tree = walker_.flatten(folder, base);
        batch.omitted_paths = std::move(tree.omitted_paths);

        // Same-named siblings would share one local file; the first one wins.
        std::set<fs::path> claimed;
        std::vector<RemoteFileEntry> files;
        files.reserve(tree.files.size());
        for (auto &file : tree.files)
        {
            if (!claimed.insert(file.target_path.lexically_normal()).second)
            {
                logger_.warn("download", info.name, ": duplicate name ", file.relative_path, ", skipped");
                batch.omitted_paths.push_back(file.relative_path);
                continue;
            }
            files.push_back(std::move(file));
        }
        tree.files = std::move(files);
        batch.total_files = tree.files.size();

        const auto workers = resolve_worker_count(options.max_workers, kDefaultWorkers);
        logger_.log("download", info.name, ": ", tree.files.size(), " files, mode ", to_string(options.mode),
                    ", workers ", workers);

        auto progress = make_progress(options.show_progress, ProgressUnit::Files);
        progress->start("download " + info.name, tree.files.size());
        ResultCollector collector(tree.files.size(), *progress);

        auto per_file = options;
        per_file.show_progress = false;
        per_file.filename.reset();

        run_batch(tree.files, options.mode, workers,
                  [&](const RemoteFileEntry &file)
                  {
                      TransferResult result;
                      if (!is_within(base, file.target_path))
                      {
                          result = failed_result(file.pick_code, file.relative_path, "destination escapes " + base.string());
                      }
                      else
                      {
                          result = download_one(DownloadRequest{
                                                    .pick_code = file.pick_code,
                                                    .save_dir = file.target_path.parent_path(),
                                                    .filename = file.name,
                                                    .display_name = file.relative_path,
                                                },
                                                per_file);
                      }
                      collector.record(std::move(result));
                  });

        progress->finish();
        collector.finalize(batch);
        logger_.log("download", info.name, ": ", batch.succeeded, " succeeded, ", batch.failed, " failed");
        return batch;
    }

    std::variant<TransferResult, TransferBatchResult> Downloader::download(const DownloadTarget &target,
                                                                           const fs::path &save_path,
                                                                           const DownloadOptions &options)
    {
        if (options.chunk_size == 0)
        {
            throw ApiError(ErrorCode::InvalidArgument, "Chunk size must be positive");
        }

        if (const auto *path = std::get_if<std::string>(&target))
        {
            const auto info = files_.info(*path);
            if (info.is_folder)
            {
                throw ApiError(ErrorCode::InvalidArgument, *path + " is a folder; download folders by id");
            }
            if (info.pick_code.empty())
            {
                throw ApiError(ErrorCode::NotFound, "No pick code for " + *path);
            }
            return download_one(DownloadRequest{
                                    .pick_code = info.pick_code,
                                    .save_dir = save_path,
                                    .filename = options.filename ? options.filename : std::optional<std::string>(info.name),
                                    .display_name = options.filename.value_or(info.name),
                                },
                                options);
        }

        const auto id = std::get<api::RemoteId>(target);
        if (id == api::kRootFolderId)
        {
            throw ApiError(ErrorCode::InvalidArgument, "The root folder cannot be downloaded");
        }
        const auto info = files_.info(id);
        if (info.is_folder)
        {
            return download_folder(id, save_path, options);
        }
        if (info.pick_code.empty())
        {
            throw ApiError(ErrorCode::NotFound, "No pick code for file " + std::to_string(id));
        }
        return download_one(DownloadRequest{
                                .pick_code = info.pick_code,
                                .save_dir = save_path,
                                .filename = options.filename,
                                .display_name = options.filename.value_or(info.name),
                            },
                            options);
    }

} // namespace cloudpan::client
