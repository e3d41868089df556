/**
 * CloudPan - Error taxonomy shared by the API layer and the transfer engine.
 */
#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace cloudpan
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        InvalidArgument = 1,
        TransportFailure = 2,
        RemoteRejected = 3,
        ProtocolViolation = 4,
        NotFound = 5,
        AlreadyExists = 6,
        LocalIo = 7,
        Unsupported = 8,
        Timeout = 9,
        InternalError = 10
    };

    std::string_view to_string(ErrorCode code) noexcept;

    constexpr std::uint16_t to_int(ErrorCode code) noexcept
    {
        return static_cast<std::uint16_t>(code);
    }

    ErrorCode error_code_from_int(std::uint16_t value) noexcept;

    // Raised by the transport, the typed API wrappers, the hasher and argument
    // validation. remote_code carries the service's numeric code when there is one.
    class ApiError : public std::runtime_error
    {
    public:
        ApiError(ErrorCode code, std::string message, std::int64_t remote_code = 0);

        ErrorCode code() const noexcept { return code_; }
        std::int64_t remote_code() const noexcept { return remote_code_; }

    private:
        ErrorCode code_;
        std::int64_t remote_code_;
    };

} // namespace cloudpan
