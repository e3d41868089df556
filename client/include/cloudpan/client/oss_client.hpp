#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <string>

#include "cloudpan/client/logger.hpp"
#include "cloudpan/client/object_transfer.hpp"

namespace cloudpan::client
{

    // Single-shot PutObject against the object store, signed with the store's
    // header signature and the temporary STS token from the upload-token call.
    class OssClient final : public ObjectTransferClient
    {
    public:
        static constexpr std::uint64_t kMaxSingleShotBytes = 5ULL * 1024 * 1024 * 1024;

        OssClient(Logger logger, std::chrono::seconds stall_timeout = std::chrono::seconds(60));

        bool put_file(const std::filesystem::path &local_path, const ObjectTarget &target,
                      const api::UploadCredentials &credentials, const ByteProgress &progress) override;

        // Exposed for tests: "OSS <id>:<base64 hmac-sha1>".
        static std::string authorization(const api::UploadCredentials &credentials, const std::string &verb,
                                         const std::string &content_type, const std::string &date,
                                         const std::map<std::string, std::string> &oss_headers,
                                         const std::string &resource);

    private:
        Logger logger_;
        std::chrono::seconds stall_timeout_;
    };

} // namespace cloudpan::client
