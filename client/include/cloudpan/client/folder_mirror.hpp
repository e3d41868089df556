#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>

#include "cloudpan/api.hpp"
#include "cloudpan/client/logger.hpp"
#include "cloudpan/client/remote_files.hpp"

namespace cloudpan::client
{

    // Local relative directory (posix separators, "" for the tree root) to the
    // remote folder mirroring it. Lives for one tree operation; entries are never
    // replaced once written.
    class DirectoryCache
    {
    public:
        explicit DirectoryCache(api::RemoteId root);

        std::optional<api::RemoteId> find(const std::string &relative) const;

        // Returns false when `relative` is already mapped; the existing id wins.
        bool put(const std::string &relative, api::RemoteId id);

        // Id of `relative`, or of its closest mapped ancestor, or of the root.
        api::RemoteId nearest(const std::string &relative) const;

        api::RemoteId root() const noexcept { return root_; }
        std::size_t size() const;

    private:
        api::RemoteId root_;
        mutable std::mutex mutex_;
        std::map<std::string, api::RemoteId> entries_;
    };

    // Get-or-create for remote child folders.
    class FolderMirror
    {
    public:
        FolderMirror(RemoteFiles &files, Logger logger);

        // Id of the child folder `name` under `parent`, creating it when no such
        // folder exists yet.
        api::RemoteId ensure_folder(api::RemoteId parent, const std::string &name);

        // Resolves `relative` (and every missing ancestor) under the cache root.
        api::RemoteId ensure_path(DirectoryCache &cache, const std::string &relative);

    private:
        RemoteFiles &files_;
        Logger logger_;
    };

    std::string parent_of(const std::string &relative);

} // namespace cloudpan::client
