#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>

#include "cloudpan/api.hpp"

namespace cloudpan::client
{

    // Where the negotiated upload lands in the blob store, plus the callback the
    // store forwards to the service once the object is written.
    struct ObjectTarget
    {
        std::string bucket;
        std::string object;
        std::string callback;
        std::string callback_var;
    };

    using ByteProgress = std::function<void(std::uint64_t delta, std::uint64_t transferred, std::uint64_t total)>;

    class ObjectTransferClient
    {
    public:
        virtual ~ObjectTransferClient() = default;

        virtual bool put_file(const std::filesystem::path &local_path, const ObjectTarget &target,
                              const api::UploadCredentials &credentials, const ByteProgress &progress) = 0;
    };

} // namespace cloudpan::client
