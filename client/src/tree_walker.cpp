#include "cloudpan/client/tree_walker.hpp"

#include <exception>
#include <utility>

namespace cloudpan::client
{

    bool is_safe_entry_name(std::string_view name) noexcept
    {
        if (name.empty() || name == "." || name == "..")
        {
            return false;
        }
        return name.find_first_of(std::string_view("/\\\0", 3)) == std::string_view::npos;
    }

    bool is_within(const std::filesystem::path &base, const std::filesystem::path &candidate)
    {
        const auto relative = candidate.lexically_normal().lexically_relative(base.lexically_normal());
        if (relative.empty() || relative == ".")
        {
            return false;
        }
        return *relative.begin() != "..";
    }

    TreeWalker::TreeWalker(RemoteFiles &files, Logger logger) : files_(files), logger_(std::move(logger)) {}

    FlattenResult TreeWalker::flatten(api::RemoteId folder, const std::filesystem::path &local_base)
    {
        FlattenResult out;
        walk(folder, "", local_base, out);
        logger_.log("walk", "folder ", folder, ": ", out.files.size(), " files, ", out.omitted_paths.size(),
                    " omitted");
        return out;
    }

    void TreeWalker::walk(api::RemoteId folder, const std::string &relative, const std::filesystem::path &local_base,
                          FlattenResult &out)
    {
        const auto entries = files_.list_all(folder);
        for (const auto &entry : entries)
        {
            const auto child = relative.empty() ? entry.name : relative + "/" + entry.name;
            if (!is_safe_entry_name(entry.name))
            {
                logger_.warn("walk", "rejected entry name in folder ", folder, ": '", entry.name, "'");
                out.omitted_paths.push_back(child);
                continue;
            }

            if (entry.is_folder)
            {
                if (entry.id == api::kRootFolderId)
                {
                    out.omitted_paths.push_back(child);
                    continue;
                }
                try
                {
                    walk(entry.id, child, local_base, out);
                }
                catch (const std::exception &ex)
                {
                    logger_.warn("walk", "cannot list ", child, " (", entry.id, "): ", ex.what());
                    out.omitted_paths.push_back(child);
                }
                continue;
            }

            if (entry.pick_code.empty())
            {
                logger_.warn("walk", child, " has no pick code");
                out.omitted_paths.push_back(child);
                continue;
            }

            RemoteFileEntry file;
            file.file_id = entry.id;
            file.name = entry.name;
            file.pick_code = entry.pick_code;
            file.size = entry.size;
            file.relative_path = child;
            file.target_path = local_base / std::filesystem::path(child);
            out.files.push_back(std::move(file));
        }
    }

} // namespace cloudpan::client
