/**
 * ftpcmd - Error codes and the exception hierarchy raised by the transfer core.
 */
#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace ftpcmd
{

    enum class ErrorCode : std::uint16_t
    {
        Ok = 0,
        ConnectionFailed = 1,
        NotFound = 2,
        PermissionDenied = 3,
        ProtocolError = 4,
        DepthLimit = 5,
        AmbiguousEntry = 6,
        Cancelled = 7,
        InvalidArgument = 8,
        LocalIo = 9,
        VerificationFailed = 10
    };

    std::string_view to_string(ErrorCode code) noexcept;

    class FtpError : public std::runtime_error
    {
    public:
        FtpError(ErrorCode code, std::string message, int reply_code = 0);

        ErrorCode code() const noexcept { return code_; }

        // FTP reply that triggered the error, 0 when it came from the transport or local side.
        int reply_code() const noexcept { return reply_code_; }

    private:
        ErrorCode code_;
        int reply_code_;
    };

    class ConnectionError : public FtpError
    {
    public:
        explicit ConnectionError(std::string message, int reply_code = 0)
            : FtpError(ErrorCode::ConnectionFailed, std::move(message), reply_code) {}
    };

    class NotFoundError : public FtpError
    {
    public:
        explicit NotFoundError(std::string message, int reply_code = 0)
            : FtpError(ErrorCode::NotFound, std::move(message), reply_code) {}
    };

    class PermissionError : public FtpError
    {
    public:
        explicit PermissionError(std::string message, int reply_code = 0)
            : FtpError(ErrorCode::PermissionDenied, std::move(message), reply_code) {}
    };

    class ProtocolError : public FtpError
    {
    public:
        explicit ProtocolError(std::string message, int reply_code = 0)
            : FtpError(ErrorCode::ProtocolError, std::move(message), reply_code) {}
    };

    class CancelledError : public FtpError
    {
    public:
        CancelledError() : FtpError(ErrorCode::Cancelled, "operation cancelled") {}
    };

    /**
     * Raised when a file transfer fails after its data stream was opened. Carries the
     * cause's code and the bytes moved by this attempt, not counting the resume offset.
     */
    class TransferInterrupted : public FtpError
    {
    public:
        TransferInterrupted(const FtpError &cause, std::uint64_t bytes_transferred);

        std::uint64_t bytes_transferred() const noexcept { return bytes_transferred_; }

    private:
        std::uint64_t bytes_transferred_;
    };

} // namespace ftpcmd
