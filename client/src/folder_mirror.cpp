#include "cloudpan/client/folder_mirror.hpp"

#include <utility>

#include "cloudpan/error_codes.hpp"

namespace cloudpan::client
{

    std::string parent_of(const std::string &relative)
    {
        const auto slash = relative.find_last_of('/');
        if (slash == std::string::npos)
        {
            return "";
        }
        return relative.substr(0, slash);
    }

    DirectoryCache::DirectoryCache(api::RemoteId root) : root_(root)
    {
        entries_.emplace("", root);
    }

    std::optional<api::RemoteId> DirectoryCache::find(const std::string &relative) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = entries_.find(relative);
        if (it == entries_.end())
        {
            return std::nullopt;
        }
        return it->second;
    }

    bool DirectoryCache::put(const std::string &relative, api::RemoteId id)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.emplace(relative, id).second;
    }

    api::RemoteId DirectoryCache::nearest(const std::string &relative) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::string current = relative;
        while (true)
        {
            const auto it = entries_.find(current);
            if (it != entries_.end())
            {
                return it->second;
            }
            if (current.empty())
            {
                return root_;
            }
            current = parent_of(current);
        }
    }

    std::size_t DirectoryCache::size() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

    FolderMirror::FolderMirror(RemoteFiles &files, Logger logger) : files_(files), logger_(std::move(logger)) {}

    api::RemoteId FolderMirror::ensure_folder(api::RemoteId parent, const std::string &name)
    {
        if (name.empty())
        {
            throw ApiError(ErrorCode::InvalidArgument, "Folder name must not be empty");
        }

        for (const auto &entry : files_.list_all(parent))
        {
            if (entry.is_folder && entry.name == name && entry.parent_id == parent)
            {
                logger_.log("mirror", "reuse folder ", name, " (", entry.id, ") under ", parent);
                return entry.id;
            }
        }

        const auto created = files_.create_folder(parent, name);
        if (created == api::kRootFolderId)
        {
            throw ApiError(ErrorCode::ProtocolViolation, "Folder creation returned no id for " + name);
        }
        logger_.log("mirror", "created folder ", name, " (", created, ") under ", parent);
        return created;
    }

    api::RemoteId FolderMirror::ensure_path(DirectoryCache &cache, const std::string &relative)
    {
        if (const auto hit = cache.find(relative))
        {
            return *hit;
        }
        const auto parent_id = ensure_path(cache, parent_of(relative));
        const auto slash = relative.find_last_of('/');
        const auto name = slash == std::string::npos ? relative : relative.substr(slash + 1);
        const auto id = ensure_folder(parent_id, name);
        cache.put(relative, id);
        return *cache.find(relative);
    }

} // namespace cloudpan::client
