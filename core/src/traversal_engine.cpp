#include "ftpcmd/traversal_engine.hpp"

#include <algorithm>
#include <utility>

#include "ftpcmd/remote_path.hpp"

namespace ftpcmd
{

    namespace
    {

        bool is_fatal(const FtpError &error) noexcept
        {
            return error.code() == ErrorCode::ConnectionFailed || error.code() == ErrorCode::Cancelled;
        }

        // Names a server could use to escape the local download root.
        bool is_unsafe_name(const std::string &name)
        {
            return name.empty() || name == "." || name == ".." || name.find('/') != std::string::npos ||
                   name.find('\0') != std::string::npos;
        }

        void push_reversed(std::vector<TraversalFrame> &work, std::vector<TraversalFrame> &children)
        {
            for (auto it = children.rbegin(); it != children.rend(); ++it)
            {
                work.push_back(std::move(*it));
            }
        }

    } // namespace

    TraversalEngine::TraversalEngine(Session &session, TransferEngine &transfers, Logger logger,
                                     std::size_t max_depth, const CancellationToken *cancel)
        : session_(session),
          transfers_(transfers),
          explorer_(session, logger, cancel),
          logger_(std::move(logger)),
          max_depth_(max_depth),
          cancel_(cancel) {}

    void TraversalEngine::check_cancelled() const
    {
        if (cancel_)
        {
            cancel_->throw_if_cancelled();
        }
    }

    bool TraversalEngine::admit(const TraversalFrame &frame, TraversalSummary &summary)
    {
        if (frame.depth <= max_depth_)
        {
            return true;
        }
        ++summary.frames_truncated;
        summary.issues.push_back(TraversalIssue{
            .path = frame.remote_path,
            .code = ErrorCode::DepthLimit,
            .message = "depth limit " + std::to_string(max_depth_) + " reached, branch not descended",
        });
        logger_.warn("traverse", "depth limit ", max_depth_, " reached at ", frame.remote_path);
        return false;
    }

    void TraversalEngine::fail_frame(const std::string &path, const FtpError &error, TraversalSummary &summary)
    {
        ++summary.frames_failed;
        summary.issues.push_back(TraversalIssue{.path = path, .code = error.code(), .message = error.what()});
        logger_.warn("traverse", "abandoning ", path, ": ", error.what());
    }

    void TraversalEngine::fail_file(const std::string &path, const FtpError &error, TraversalSummary &summary)
    {
        ++summary.files_failed;
        summary.issues.push_back(TraversalIssue{.path = path, .code = error.code(), .message = error.what()});
        logger_.warn("traverse", "file ", path, " failed: ", error.what());
    }

    void TraversalEngine::note_ambiguous(const std::string &path, const std::string &why, TraversalSummary &summary)
    {
        summary.issues.push_back(TraversalIssue{.path = path, .code = ErrorCode::AmbiguousEntry, .message = why});
        logger_.warn("traverse", "skipping ", path, ": ", why);
    }

    void TraversalEngine::record_transfer(const std::string &path, const TransferResult &result,
                                          TraversalSummary &summary)
    {
        if (result.verified && !*result.verified)
        {
            fail_file(path, FtpError(ErrorCode::VerificationFailed, "checksum mismatch after transfer"), summary);
            return;
        }
        if (result.outcome == TransferOutcome::Skipped)
        {
            ++summary.files_skipped;
            return;
        }
        ++summary.files_transferred;
        summary.bytes_transferred += result.bytes_transferred;
    }

    TraversalSummary TraversalEngine::upload_tree(const std::filesystem::path &local_root,
                                                  const std::string &remote_root)
    {
        std::error_code ec;
        if (!std::filesystem::is_directory(local_root, ec))
        {
            throw NotFoundError("local directory does not exist: " + local_root.string());
        }
        logger_.log("traverse", "upload ", local_root.string(), " -> ", remote_root, " (max depth ", max_depth_, ")");

        TraversalSummary summary;
        std::vector<TraversalFrame> work{TraversalFrame{.remote_path = remote_root, .local_path = local_root, .depth = 0}};
        while (!work.empty())
        {
            check_cancelled();
            auto frame = std::move(work.back());
            work.pop_back();
            if (!admit(frame, summary))
            {
                continue;
            }

            try
            {
                session_.ensure_remote_dir(frame.remote_path);
            }
            catch (const FtpError &ex)
            {
                if (is_fatal(ex))
                {
                    throw;
                }
                fail_frame(frame.remote_path, ex, summary);
                continue;
            }

            std::vector<std::filesystem::directory_entry> entries;
            std::filesystem::directory_iterator it(frame.local_path, ec);
            for (const std::filesystem::directory_iterator end; !ec && it != end; it.increment(ec))
            {
                entries.push_back(*it);
            }
            if (ec)
            {
                fail_frame(frame.local_path.string(),
                           FtpError(ErrorCode::LocalIo, "cannot read local directory: " + ec.message()), summary);
                ec.clear();
                continue;
            }
            std::sort(entries.begin(), entries.end(), [](const auto &a, const auto &b)
                      { return a.path().filename() < b.path().filename(); });

            std::vector<TraversalFrame> children;
            for (const auto &entry : entries)
            {
                const auto name = entry.path().filename().string();
                const auto remote_child = remote_path::join(frame.remote_path, name);
                std::error_code type_ec;
                if (entry.is_directory(type_ec))
                {
                    children.push_back(TraversalFrame{
                        .remote_path = remote_child,
                        .local_path = entry.path(),
                        .depth = frame.depth + 1,
                    });
                }
                else if (entry.is_regular_file(type_ec))
                {
                    try
                    {
                        record_transfer(remote_child, transfers_.upload(entry.path(), remote_child), summary);
                    }
                    catch (const FtpError &ex)
                    {
                        if (is_fatal(ex))
                        {
                            throw;
                        }
                        fail_file(remote_child, ex, summary);
                    }
                }
                else
                {
                    note_ambiguous(entry.path().string(), "neither a regular file nor a directory", summary);
                }
            }
            push_reversed(work, children);
        }

        logger_.log("traverse", "upload finished: ", summary.files_transferred, " transferred, ",
                    summary.files_skipped, " skipped, ", summary.files_failed, " failed, ", summary.frames_truncated,
                    " truncated");
        return summary;
    }

    TraversalSummary TraversalEngine::download_tree(const std::string &remote_root,
                                                    const std::filesystem::path &local_root)
    {
        logger_.log("traverse", "download ", remote_root, " -> ", local_root.string(), " (max depth ", max_depth_,
                    ")");

        TraversalSummary summary;
        std::vector<TraversalFrame> work{TraversalFrame{.remote_path = remote_root, .local_path = local_root, .depth = 0}};
        while (!work.empty())
        {
            check_cancelled();
            auto frame = std::move(work.back());
            work.pop_back();
            if (!admit(frame, summary))
            {
                continue;
            }

            std::vector<RemoteEntry> entries;
            try
            {
                entries = explorer_.list(frame.remote_path);
            }
            catch (const FtpError &ex)
            {
                if (is_fatal(ex) || frame.depth == 0)
                {
                    throw;
                }
                fail_frame(frame.remote_path, ex, summary);
                continue;
            }

            std::error_code ec;
            std::filesystem::create_directories(frame.local_path, ec);
            if (ec)
            {
                fail_frame(frame.local_path.string(),
                           FtpError(ErrorCode::LocalIo, "cannot create local directory: " + ec.message()), summary);
                continue;
            }

            std::sort(entries.begin(), entries.end(), [](const RemoteEntry &a, const RemoteEntry &b)
                      { return a.name < b.name; });

            std::vector<TraversalFrame> children;
            for (const auto &entry : entries)
            {
                const auto remote_child = remote_path::join(frame.remote_path, entry.name);
                if (is_unsafe_name(entry.name))
                {
                    note_ambiguous(remote_child, "unsafe entry name", summary);
                    continue;
                }
                const auto local_child = frame.local_path / entry.name;
                switch (entry.kind)
                {
                case EntryKind::Directory:
                    children.push_back(TraversalFrame{
                        .remote_path = remote_child,
                        .local_path = local_child,
                        .depth = frame.depth + 1,
                    });
                    break;
                case EntryKind::File:
                    try
                    {
                        record_transfer(remote_child, transfers_.download(remote_child, local_child, &entry), summary);
                    }
                    catch (const FtpError &ex)
                    {
                        if (is_fatal(ex))
                        {
                            throw;
                        }
                        fail_file(remote_child, ex, summary);
                    }
                    break;
                case EntryKind::Unknown:
                    note_ambiguous(remote_child, "listing does not say whether this is a file or a directory",
                                   summary);
                    break;
                }
            }
            push_reversed(work, children);
        }

        logger_.log("traverse", "download finished: ", summary.files_transferred, " transferred, ",
                    summary.files_skipped, " skipped, ", summary.files_failed, " failed, ", summary.frames_truncated,
                    " truncated");
        return summary;
    }

} // namespace ftpcmd
