#include "cloudpan/client/upload_negotiator.hpp"

#include <array>
#include <charconv>
#include <exception>
#include <utility>

#include "cloudpan/crypto.hpp"
#include "cloudpan/error_codes.hpp"

namespace cloudpan::client
{

    namespace
    {

        constexpr std::array<std::string_view, 5> kStateNames = {
            "initiated",
            "instant_complete",
            "needs_second_factor",
            "ready_for_transfer",
            "failed",
        };

        constexpr std::array<int, 3> kChallengeStatuses = {6, 7, 8};
        constexpr std::array<std::int64_t, 3> kChallengeCodes = {700, 701, 702};

        template <typename T, std::size_t N>
        bool contains(const std::array<T, N> &values, T value)
        {
            for (const auto &candidate : values)
            {
                if (candidate == value)
                {
                    return true;
                }
            }
            return false;
        }

        bool is_challenge(const api::UploadInitReply &reply)
        {
            if (reply.sign_check.empty() || reply.sign_key.empty())
            {
                return false;
            }
            return contains(kChallengeStatuses, reply.status) || contains(kChallengeCodes, reply.code);
        }

        bool parse_offset(std::string_view text, std::uint64_t &value)
        {
            const auto *end = text.data() + text.size();
            const auto result = std::from_chars(text.data(), end, value);
            return result.ec == std::errc{} && result.ptr == end;
        }

        // "<first>-<last>", inclusive.
        std::pair<std::uint64_t, std::uint64_t> parse_sign_range(const std::string &check, std::uint64_t file_size)
        {
            const auto dash = check.find('-');
            std::uint64_t first = 0;
            std::uint64_t last = 0;
            if (dash == std::string::npos ||
                !parse_offset(std::string_view(check).substr(0, dash), first) ||
                !parse_offset(std::string_view(check).substr(dash + 1), last))
            {
                throw ApiError(ErrorCode::ProtocolViolation, "Malformed sign_check range: " + check);
            }
            if (first > last || last >= file_size)
            {
                throw ApiError(ErrorCode::ProtocolViolation, "sign_check range " + check + " is outside the file");
            }
            return {first, last};
        }

        NegotiationOutcome failed(std::string message, int calls)
        {
            NegotiationOutcome outcome;
            outcome.state = NegotiationState::Failed;
            outcome.message = std::move(message);
            outcome.init_calls = calls;
            return outcome;
        }

        // Terminal classification of a reply that is not a challenge.
        NegotiationOutcome classify(const api::ApiResponse &response, const api::UploadInitReply &reply, int calls)
        {
            NegotiationOutcome outcome;
            outcome.init_calls = calls;
            outcome.pick_code = reply.pick_code;

            // Status 2 is the documented instant-upload reply; 1 is still seen from
            // older API revisions and completes the same way.
            if (reply.status == 2 || reply.status == 1)
            {
                outcome.state = NegotiationState::InstantComplete;
                outcome.message = reply.status == 2 ? "instant upload" : "instant upload (status 1)";
                return outcome;
            }
            if (!response.ok)
            {
                return failed("Upload init rejected (code " + std::to_string(response.code) + "): " + response.message,
                              calls);
            }
            if (reply.bucket.empty() || reply.object.empty())
            {
                return failed("Upload init reply carries no bucket/object", calls);
            }
            if (reply.callback.empty() || reply.callback_var.empty())
            {
                return failed("Upload init reply carries no callback", calls);
            }

            outcome.state = NegotiationState::ReadyForTransfer;
            outcome.ticket = ObjectTarget{
                .bucket = reply.bucket,
                .object = reply.object,
                .callback = reply.callback,
                .callback_var = reply.callback_var,
            };
            return outcome;
        }

    } // namespace

    std::string_view to_string(NegotiationState state) noexcept
    {
        const auto index = static_cast<std::size_t>(state);
        if (index >= kStateNames.size())
        {
            return "unknown";
        }
        return kStateNames[index];
    }

    FileDescriptor describe_file(const std::filesystem::path &path)
    {
        const auto digests = crypto::digest_file(path);
        FileDescriptor file;
        file.local_path = path;
        file.name = path.filename().string();
        file.size = digests.size;
        file.whole_digest = digests.whole;
        file.prefix_digest = digests.prefix;
        return file;
    }

    UploadNegotiator::UploadNegotiator(Transport &transport, Logger logger)
        : transport_(transport), logger_(std::move(logger))
    {
    }

    std::string UploadNegotiator::target_parameter(api::RemoteId folder)
    {
        return "U_1_" + std::to_string(folder);
    }

    api::ApiResponse UploadNegotiator::submit(const api::FormParams &params)
    {
        return transport_.request_json(api::HttpMethod::Post, api::endpoint::kUploadInit, params);
    }

    NegotiationOutcome UploadNegotiator::negotiate(const FileDescriptor &file, api::RemoteId target,
                                                   const InitOptions &options)
    {
        try
        {
            auto outcome = run(file, target, options);
            logger_.log("negotiate", file.name, " -> ", to_string(outcome.state),
                        outcome.message.empty() ? "" : " (" + outcome.message + ")");
            return outcome;
        }
        catch (const std::exception &ex)
        {
            logger_.warn("negotiate", file.name, " failed: ", ex.what());
            return failed(ex.what(), 0);
        }
    }

    NegotiationOutcome UploadNegotiator::run(const FileDescriptor &file, api::RemoteId target,
                                             const InitOptions &options)
    {
        if (file.size == 0)
        {
            throw ApiError(ErrorCode::InvalidArgument, "Empty files cannot be uploaded");
        }
        if (file.whole_digest.empty())
        {
            throw ApiError(ErrorCode::InvalidArgument, "File digest is missing");
        }

        api::FormParams params{
            {"file_name", file.name},
            {"file_size", std::to_string(file.size)},
            {"target", target_parameter(target)},
            {"fileid", file.whole_digest},
            {"preid", file.prefix_digest},
        };
        if (options.pick_code)
        {
            params.emplace_back("pick_code", *options.pick_code);
        }
        if (options.topupload)
        {
            params.emplace_back("topupload", std::to_string(*options.topupload));
        }

        auto response = submit(params);
        auto reply = api::parse_upload_init(response);
        if (!is_challenge(reply))
        {
            return classify(response, reply, 1);
        }

        const auto [first, last] = parse_sign_range(reply.sign_check, file.size);
        logger_.log("negotiate", file.name, " second factor over bytes ", first, "-", last);
        params.emplace_back("sign_key", reply.sign_key);
        params.emplace_back("sign_val", crypto::hash_file_range(file.local_path, first, last));

        response = submit(params);
        reply = api::parse_upload_init(response);
        if (is_challenge(reply))
        {
            return failed("Second-factor signature was challenged again", 2);
        }
        return classify(response, reply, 2);
    }

    NegotiationOutcome UploadNegotiator::resume(const FileDescriptor &file, api::RemoteId target,
                                                const std::string &pick_code)
    {
        try
        {
            if (pick_code.empty())
            {
                throw ApiError(ErrorCode::InvalidArgument, "Resuming an upload needs its pick code");
            }
            const auto response = transport_.request_json(api::HttpMethod::Post, api::endpoint::kUploadResume,
                                                          {{"file_size", std::to_string(file.size)},
                                                           {"target", target_parameter(target)},
                                                           {"fileid", file.whole_digest},
                                                           {"pick_code", pick_code}});
            auto reply = api::parse_upload_init(response);
            if (reply.pick_code.empty())
            {
                reply.pick_code = pick_code;
            }
            // A resumed ticket is never an instant upload.
            reply.status = 0;
            auto outcome = classify(response, reply, 0);
            logger_.log("negotiate", file.name, " resumed -> ", to_string(outcome.state));
            return outcome;
        }
        catch (const std::exception &ex)
        {
            logger_.warn("negotiate", file.name, " resume failed: ", ex.what());
            return failed(ex.what(), 0);
        }
    }

    api::UploadCredentials UploadNegotiator::fetch_credentials()
    {
        const auto response = transport_.request_json(api::HttpMethod::Get, api::endpoint::kUploadToken, {});
        api::ensure_ok(response, "Fetch upload token");
        return api::parse_upload_credentials(response);
    }

} // namespace cloudpan::client
