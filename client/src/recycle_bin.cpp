#include "cloudpan/client/recycle_bin.hpp"

#include "cloudpan/error_codes.hpp"

namespace cloudpan::client
{

    namespace
    {

        std::string join(const std::vector<std::string> &ids)
        {
            std::string joined;
            for (const auto &id : ids)
            {
                if (!joined.empty())
                {
                    joined.push_back(',');
                }
                joined += id;
            }
            return joined;
        }

    } // namespace

    RecycleBin::RecycleBin(Transport &transport) : transport_(transport) {}

    std::vector<api::RecycleEntry> RecycleBin::list(std::uint64_t limit, std::uint64_t offset)
    {
        if (limit == 0 || limit > kMaxPage)
        {
            throw ApiError(ErrorCode::InvalidArgument, "Recycle bin page size must be between 1 and 200");
        }
        const auto response = transport_.request_json(
            api::HttpMethod::Get, api::endpoint::kRecycleList,
            {{"limit", std::to_string(limit)}, {"offset", std::to_string(offset)}});
        api::ensure_ok(response, "List recycle bin");
        return api::parse_recycle_list(response);
    }

    void RecycleBin::restore(const std::vector<std::string> &ids)
    {
        if (ids.empty())
        {
            throw ApiError(ErrorCode::InvalidArgument, "Nothing to restore");
        }
        const auto response =
            transport_.request_json(api::HttpMethod::Post, api::endpoint::kRecycleRevert, {{"tid", join(ids)}});
        api::ensure_ok(response, "Restore from recycle bin");
    }

    void RecycleBin::purge(const std::vector<std::string> &ids)
    {
        if (ids.empty())
        {
            throw ApiError(ErrorCode::InvalidArgument, "Nothing to purge; use purge_all to empty the bin");
        }
        const auto response =
            transport_.request_json(api::HttpMethod::Post, api::endpoint::kRecycleDelete, {{"tid", join(ids)}});
        api::ensure_ok(response, "Purge from recycle bin");
    }

    void RecycleBin::purge_all()
    {
        const auto response = transport_.request_json(api::HttpMethod::Post, api::endpoint::kRecycleDelete, {});
        api::ensure_ok(response, "Empty recycle bin");
    }

} // namespace cloudpan::client
