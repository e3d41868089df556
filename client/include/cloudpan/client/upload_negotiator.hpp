#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "cloudpan/api.hpp"
#include "cloudpan/client/logger.hpp"
#include "cloudpan/client/object_transfer.hpp"
#include "cloudpan/client/transport.hpp"

namespace cloudpan::client
{

    enum class NegotiationState : std::uint8_t
    {
        Initiated,
        InstantComplete,
        NeedsSecondFactor,
        ReadyForTransfer,
        Failed
    };

    std::string_view to_string(NegotiationState state) noexcept;

    // Everything the init call needs to know about one local file.
    struct FileDescriptor
    {
        std::filesystem::path local_path;
        std::string name;
        std::uint64_t size{};
        std::string whole_digest;
        std::string prefix_digest;
        std::string pick_code;
    };

    // Hashes `path` (one pass) and fills a descriptor for it. Throws ApiError.
    FileDescriptor describe_file(const std::filesystem::path &path);

    struct InitOptions
    {
        std::optional<std::string> pick_code;
        std::optional<int> topupload;
    };

    struct NegotiationOutcome
    {
        NegotiationState state{NegotiationState::Initiated};
        std::optional<ObjectTarget> ticket;
        std::string pick_code;
        std::string message;
        int init_calls{};

        bool finished() const noexcept { return state == NegotiationState::InstantComplete; }
    };

    // Drives the content-addressed init handshake for a single file and decides
    // whether its bytes have to be sent at all.
    class UploadNegotiator
    {
    public:
        UploadNegotiator(Transport &transport, Logger logger);

        // Never throws for remote or local failures; they come back as Failed.
        NegotiationOutcome negotiate(const FileDescriptor &file, api::RemoteId target, const InitOptions &options = {});

        // Recovers the transfer ticket of an interrupted upload.
        NegotiationOutcome resume(const FileDescriptor &file, api::RemoteId target, const std::string &pick_code);

        // Short-lived STS credentials for the object store. Throws ApiError.
        api::UploadCredentials fetch_credentials();

        static std::string target_parameter(api::RemoteId folder);

    private:
        NegotiationOutcome run(const FileDescriptor &file, api::RemoteId target, const InitOptions &options);
        api::ApiResponse submit(const api::FormParams &params);

        Transport &transport_;
        Logger logger_;
    };

} // namespace cloudpan::client
