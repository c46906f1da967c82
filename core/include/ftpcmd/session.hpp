/**
 * ftpcmd - Protocol verbs of one FTP control connection. The engines only talk to
 * this interface; FtpSession implements it over Asio.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "ftpcmd/types.hpp"

namespace ftpcmd
{

    // Data channel of an upload. Destroying an unfinished sink aborts the transfer and
    // leaves the bytes already sent on the server.
    class WriteSink
    {
    public:
        virtual ~WriteSink() = default;

        virtual void write(std::span<const std::byte> data) = 0;

        // Closes the data channel and waits for the server to confirm the transfer.
        virtual void finish() = 0;
    };

    class ReadSource
    {
    public:
        virtual ~ReadSource() = default;

        // Returns 0 once the server closed the data channel.
        virtual std::size_t read(std::span<std::byte> buffer) = 0;

        virtual void finish() = 0;
    };

    /**
     * Not safe for concurrent command issuance: one thread drives a session at a time.
     * interrupt() is the exception and may be called from any thread to unblock a
     * pending read or write.
     */
    class Session
    {
    public:
        virtual ~Session() = default;

        // Throws NotFoundError when the file is missing or SIZE is unsupported.
        virtual std::uint64_t remote_size(const std::string &path) = 0;

        // Creates missing segments from the root downward. Throws PermissionError when
        // the server refuses MKD.
        virtual void ensure_remote_dir(const std::string &path) = 0;

        // offset 0 stores a fresh file, otherwise the upload continues at offset.
        virtual std::unique_ptr<WriteSink> open_upload_stream(const std::string &path, std::uint64_t offset) = 0;

        virtual std::unique_ptr<ReadSource> open_download_stream(const std::string &path, std::uint64_t offset) = 0;

        // Throws NotFoundError when the directory does not exist.
        virtual void change_dir(const std::string &path) = 0;

        virtual std::vector<RemoteEntry> list_current_dir() = 0;

        // SHA-256 of a remote file, nullopt when the server has no HASH support.
        virtual std::optional<std::string> remote_hash(const std::string &path) = 0;

        virtual void interrupt() noexcept = 0;

        virtual void close() noexcept = 0;
    };

} // namespace ftpcmd
