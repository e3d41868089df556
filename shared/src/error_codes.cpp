#include "cloudpan/error_codes.hpp"

#include <array>
#include <utility>

namespace cloudpan
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view description;
        };

        constexpr std::array<ErrorCodeDescription, 11> kDescriptions{{
            {ErrorCode::Ok, "ok"},
            {ErrorCode::InvalidArgument, "invalid_argument"},
            {ErrorCode::TransportFailure, "transport_failure"},
            {ErrorCode::RemoteRejected, "remote_rejected"},
            {ErrorCode::ProtocolViolation, "protocol_violation"},
            {ErrorCode::NotFound, "not_found"},
            {ErrorCode::AlreadyExists, "already_exists"},
            {ErrorCode::LocalIo, "local_io"},
            {ErrorCode::Unsupported, "unsupported"},
            {ErrorCode::Timeout, "timeout"},
            {ErrorCode::InternalError, "internal_error"},
        }};
    } // namespace

    std::string_view to_string(ErrorCode code) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.code == code)
            {
                return entry.description;
            }
        }
        return "unknown";
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (static_cast<std::uint16_t>(entry.code) == value)
            {
                return entry.code;
            }
        }
        return ErrorCode::InternalError;
    }

    ApiError::ApiError(ErrorCode code, std::string message, std::int64_t remote_code)
        : std::runtime_error(std::move(message)), code_(code), remote_code_(remote_code) {}

} // namespace cloudpan
