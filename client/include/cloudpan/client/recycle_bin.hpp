#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "cloudpan/api.hpp"
#include "cloudpan/client/transport.hpp"

namespace cloudpan::client
{

    class RecycleBin
    {
    public:
        static constexpr std::uint64_t kMaxPage = 200;

        explicit RecycleBin(Transport &transport);

        std::vector<api::RecycleEntry> list(std::uint64_t limit = 40, std::uint64_t offset = 0);
        void restore(const std::vector<std::string> &ids);
        void purge(const std::vector<std::string> &ids);
        void purge_all();

    private:
        Transport &transport_;
    };

} // namespace cloudpan::client
