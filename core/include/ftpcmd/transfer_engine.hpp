/**
 * ftpcmd - Resumable transfer of one file in either direction.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

#include "ftpcmd/cancellation.hpp"
#include "ftpcmd/logger.hpp"
#include "ftpcmd/session.hpp"
#include "ftpcmd/types.hpp"

namespace ftpcmd
{

    struct TransferOptions
    {
        std::size_t chunk_size{64 * 1024};
        bool verify{false};
    };

    enum class TransferOutcome : std::uint8_t
    {
        Transferred,
        Skipped
    };

    struct TransferResult
    {
        TransferOutcome outcome{TransferOutcome::Skipped};
        // Bytes moved by this attempt; the resume offset is not included.
        std::uint64_t bytes_transferred{};
        std::uint64_t resume_offset{};
        std::optional<std::uint64_t> total_size{};
        // Empty when verification was not requested or the server cannot hash.
        std::optional<bool> verified{};
    };

    struct ResumePlan
    {
        bool skip{false};
        std::uint64_t offset{};
    };

    // Remote absent: fresh upload. Remote shorter: resume at its size. Otherwise skip.
    ResumePlan plan_upload(std::uint64_t local_size, std::optional<std::uint64_t> remote_size) noexcept;

    // local_size is empty when the local file is absent; that always downloads, so an
    // empty remote file is still created. An unknown remote size resumes at the local
    // size and lets the server decide how much is left.
    ResumePlan plan_download(std::optional<std::uint64_t> local_size, std::optional<std::uint64_t> remote_size) noexcept;

    // Throws FtpError(VerificationFailed) when result.verified is false.
    void require_verified(const TransferResult &result, const std::string &path);

    using ProgressCallback = std::function<void(const ProgressSample &)>;

    class TransferEngine
    {
    public:
        TransferEngine(Session &session, Logger logger, TransferOptions options = {}, ProgressCallback progress = {},
                       const CancellationToken *cancel = nullptr);

        // Throws NotFoundError when the local file is missing. Failures after the data
        // stream opened surface as TransferInterrupted.
        TransferResult upload(const std::filesystem::path &local_path, const std::string &remote_path);

        // listing carries what a directory listing said about the file. When SIZE fails
        // and the listing classified the entry as a file, the download runs without a
        // known total instead of failing.
        TransferResult download(const std::string &remote_path, const std::filesystem::path &local_path,
                                const RemoteEntry *listing = nullptr);

    private:
        TransferResult stream_upload(const TransferTask &task, std::uint64_t local_size);
        TransferResult stream_download(const TransferTask &task, std::optional<std::uint64_t> remote_size);
        std::optional<bool> verify(const TransferTask &task);
        void emit(const TransferTask &task, std::uint64_t position, std::optional<std::uint64_t> total,
                  std::chrono::steady_clock::time_point started) const;
        void check_cancelled() const;

        Session &session_;
        Logger logger_;
        TransferOptions options_;
        ProgressCallback progress_;
        const CancellationToken *cancel_;
    };

} // namespace ftpcmd
