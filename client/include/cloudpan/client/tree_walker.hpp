#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "cloudpan/api.hpp"
#include "cloudpan/client/logger.hpp"
#include "cloudpan/client/remote_files.hpp"

namespace cloudpan::client
{

    struct RemoteFileEntry
    {
        api::RemoteId file_id{};
        std::string name;
        std::string pick_code;
        std::uint64_t size{};
        std::string relative_path;
        std::filesystem::path target_path;
    };

    struct FlattenResult
    {
        std::vector<RemoteFileEntry> files;
        // Relative paths of subtrees that could not be listed and of entries
        // whose names cannot be mapped to a local file.
        std::vector<std::string> omitted_paths;
    };

    // A remote name usable as one local path component.
    bool is_safe_entry_name(std::string_view name) noexcept;

    // Lexical containment: `candidate` names something strictly below `base`.
    bool is_within(const std::filesystem::path &base, const std::filesystem::path &candidate);

    class TreeWalker
    {
    public:
        TreeWalker(RemoteFiles &files, Logger logger);

        // Every file below `folder`, depth first. Throws if `folder` itself
        // cannot be listed; unreadable subfolders end up in omitted_paths.
        FlattenResult flatten(api::RemoteId folder, const std::filesystem::path &local_base);

    private:
        void walk(api::RemoteId folder, const std::string &relative, const std::filesystem::path &local_base,
                  FlattenResult &out);

        RemoteFiles &files_;
        Logger logger_;
    };

} // namespace cloudpan::client
