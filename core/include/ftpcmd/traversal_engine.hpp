/**
 * ftpcmd - Recursive directory mirroring in either direction over an explicit work
 * list of TraversalFrame values.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "ftpcmd/cancellation.hpp"
#include "ftpcmd/directory_explorer.hpp"
#include "ftpcmd/error_codes.hpp"
#include "ftpcmd/logger.hpp"
#include "ftpcmd/session.hpp"
#include "ftpcmd/transfer_engine.hpp"

namespace ftpcmd
{

    struct TraversalIssue
    {
        std::string path;
        ErrorCode code{ErrorCode::Ok};
        std::string message;
    };

    struct TraversalSummary
    {
        std::size_t files_transferred{};
        std::size_t files_skipped{};
        std::size_t files_failed{};
        std::size_t frames_truncated{};
        std::size_t frames_failed{};
        std::uint64_t bytes_transferred{};
        std::vector<TraversalIssue> issues;

        // No failed file, failed frame or truncated branch. Ambiguous entries do not count.
        bool complete() const noexcept
        {
            return files_failed == 0 && frames_failed == 0 && frames_truncated == 0;
        }
    };

    /**
     * Per-file and per-frame errors are recorded and the walk continues with the next
     * frame. ConnectionError and cancellation abort the walk.
     */
    class TraversalEngine
    {
    public:
        static constexpr std::size_t kDefaultMaxDepth = 50;

        TraversalEngine(Session &session, TransferEngine &transfers, Logger logger,
                        std::size_t max_depth = kDefaultMaxDepth, const CancellationToken *cancel = nullptr);

        // Throws NotFoundError when local_root is not a directory.
        TraversalSummary upload_tree(const std::filesystem::path &local_root, const std::string &remote_root);

        // Throws NotFoundError when remote_root cannot be listed.
        TraversalSummary download_tree(const std::string &remote_root, const std::filesystem::path &local_root);

    private:
        bool admit(const TraversalFrame &frame, TraversalSummary &summary);
        void fail_frame(const std::string &path, const FtpError &error, TraversalSummary &summary);
        void record_transfer(const std::string &path, const TransferResult &result, TraversalSummary &summary);
        void fail_file(const std::string &path, const FtpError &error, TraversalSummary &summary);
        void note_ambiguous(const std::string &path, const std::string &why, TraversalSummary &summary);
        void check_cancelled() const;

        Session &session_;
        TransferEngine &transfers_;
        DirectoryExplorer explorer_;
        Logger logger_;
        std::size_t max_depth_;
        const CancellationToken *cancel_;
    };

} // namespace ftpcmd
