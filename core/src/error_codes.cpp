#include "ftpcmd/error_codes.hpp"

#include <array>

namespace ftpcmd
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
            {ErrorCode::ConnectionFailed, "connection_failed"},
            {ErrorCode::NotFound, "not_found"},
            {ErrorCode::PermissionDenied, "permission_denied"},
            {ErrorCode::ProtocolError, "protocol_error"},
            {ErrorCode::DepthLimit, "depth_limit"},
            {ErrorCode::AmbiguousEntry, "ambiguous_entry"},
            {ErrorCode::Cancelled, "cancelled"},
            {ErrorCode::InvalidArgument, "invalid_argument"},
            {ErrorCode::LocalIo, "local_io"},
            {ErrorCode::VerificationFailed, "verification_failed"},
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

    FtpError::FtpError(ErrorCode code, std::string message, int reply_code)
        : std::runtime_error(std::move(message)), code_(code), reply_code_(reply_code) {}

    TransferInterrupted::TransferInterrupted(const FtpError &cause, std::uint64_t bytes_transferred)
        : FtpError(cause.code(),
                   std::string(cause.what()) + " (after " + std::to_string(bytes_transferred) + " bytes)",
                   cause.reply_code()),
          bytes_transferred_(bytes_transferred) {}

} // namespace ftpcmd
