#include "ftpcmd/client/command_runner.hpp"

#include <iomanip>
#include <utility>

#include "ftpcmd/remote_path.hpp"

namespace ftpcmd::client
{

    namespace
    {

        bool ends_with_slash(const std::optional<std::string> &value)
        {
            return value && !value->empty() && value->back() == '/';
        }

        // Last component of a local path, also for "dir/" and ".".
        std::string local_name(const std::filesystem::path &path)
        {
            std::error_code ec;
            auto normal = std::filesystem::absolute(path, ec).lexically_normal();
            if (ec)
            {
                normal = path.lexically_normal();
            }
            if (normal.filename().empty())
            {
                normal = normal.parent_path();
            }
            return normal.filename().string();
        }

        std::string_view kind_label(EntryKind kind) noexcept
        {
            switch (kind)
            {
            case EntryKind::Directory:
                return "DIR ";
            case EntryKind::File:
                return "FILE";
            case EntryKind::Unknown:
                break;
            }
            return "????";
        }

        void create_local_directory(const std::filesystem::path &path)
        {
            std::error_code ec;
            std::filesystem::create_directories(path, ec);
            if (ec)
            {
                throw FtpError(ErrorCode::LocalIo, "cannot create " + path.string() + ": " + ec.message());
            }
        }

    } // namespace

    void print_error(std::ostream &err, const FtpError &error)
    {
        err << "ERROR: " << to_string(error.code()) << std::endl;
        err << error.what() << std::endl;
    }

    void print_summary(std::ostream &out, const TraversalSummary &summary)
    {
        out << "Transferred: " << summary.files_transferred << '\n'
            << "Skipped: " << summary.files_skipped << '\n'
            << "Failed: " << summary.files_failed + summary.frames_failed << '\n'
            << "Truncated: " << summary.frames_truncated << '\n';
        for (const auto &issue : summary.issues)
        {
            const bool warning = issue.code == ErrorCode::DepthLimit || issue.code == ErrorCode::AmbiguousEntry;
            out << (warning ? "WARN " : "ERROR ") << to_string(issue.code) << ' ' << issue.path << ": "
                << issue.message << '\n';
        }
        out << std::flush;
    }

    CommandRunner::CommandRunner(ClientConfig config, Session &session, Logger logger,
                                 const CancellationToken &cancel, std::ostream &out, std::ostream &err)
        : config_(std::move(config)),
          session_(session),
          logger_(std::move(logger)),
          cancel_(cancel),
          out_(out),
          err_(err),
          progress_(out),
          transfers_(session, logger_, TransferOptions{.verify = config_.verify},
                     [this](const ProgressSample &sample)
                     { progress_.report(sample); },
                     &cancel),
          traversal_(session, transfers_, logger_, config_.max_depth, &cancel),
          explorer_(session, logger_, &cancel) {}

    int CommandRunner::run()
    {
        try
        {
            switch (config_.mode)
            {
            case Mode::Put:
                return handle_put();
            case Mode::Get:
                return handle_get();
            case Mode::Ls:
                return handle_ls();
            case Mode::Tree:
                return handle_tree();
            case Mode::Find:
                return handle_find();
            }
            throw FtpError(ErrorCode::InvalidArgument, "unsupported mode");
        }
        catch (const TransferInterrupted &ex)
        {
            progress_.finish();
            if (cancel_.cancelled())
            {
                err_ << "Cancelled; run the same command again to resume." << std::endl;
                return kExitCancelled;
            }
            print_error(err_, ex);
            err_ << ex.bytes_transferred() << " bytes were transferred before the failure; run the same command "
                 << "again to resume." << std::endl;
            logger_.warn("client", "transfer interrupted: ", ex.what());
            return kExitFailure;
        }
        catch (const FtpError &ex)
        {
            progress_.finish();
            if (ex.code() == ErrorCode::Cancelled || cancel_.cancelled())
            {
                err_ << "Cancelled; run the same command again to resume." << std::endl;
                logger_.warn("client", "cancelled");
                return kExitCancelled;
            }
            print_error(err_, ex);
            logger_.warn("client", "failed: ", ex.what());
            return kExitFailure;
        }
    }

    void CommandRunner::print_transfer(const TransferResult &result, const std::string &from, const std::string &to)
    {
        progress_.finish();
        if (result.outcome == TransferOutcome::Skipped)
        {
            out_ << "Skipped " << to << " (already complete)" << std::endl;
            return;
        }
        out_ << "Transferred " << from << " -> " << to << " (" << result.bytes_transferred << " bytes";
        if (result.resume_offset > 0)
        {
            out_ << ", resumed at byte " << result.resume_offset;
        }
        out_ << ")";
        if (result.verified)
        {
            out_ << (*result.verified ? " [sha256 verified]" : " [sha256 MISMATCH]");
        }
        out_ << std::endl;
    }

    int CommandRunner::finish_traversal(const TraversalSummary &summary)
    {
        progress_.finish();
        print_summary(out_, summary);
        if (summary.complete() || config_.allow_partial)
        {
            return kExitOk;
        }
        return kExitPartial;
    }

    int CommandRunner::handle_put()
    {
        if (!config_.local_path || config_.local_path->empty())
        {
            throw FtpError(ErrorCode::InvalidArgument, "--put needs a local path");
        }
        const std::filesystem::path local(*config_.local_path);
        const auto remote = resolve_remote(config_, config_.remote_path);
        const bool into_directory =
            !config_.remote_path || ends_with_slash(config_.remote_path) ||
            remote == remote_path::normalize(config_.base_path);

        std::error_code ec;
        if (std::filesystem::is_regular_file(local, ec))
        {
            const auto target = into_directory ? remote_path::join(remote, local.filename().string()) : remote;
            const auto parent = remote_path::parent(target);
            if (!parent.empty())
            {
                session_.ensure_remote_dir(parent);
            }
            const auto result = transfers_.upload(local, target);
            print_transfer(result, local.string(), target);
            require_verified(result, target);
            return kExitOk;
        }
        if (std::filesystem::is_directory(local, ec))
        {
            const auto target = ends_with_slash(config_.remote_path) ? remote_path::join(remote, local_name(local))
                                                                     : remote;
            session_.ensure_remote_dir(target);
            return finish_traversal(traversal_.upload_tree(local, target));
        }
        throw NotFoundError("local path does not exist: " + local.string());
    }

    int CommandRunner::handle_get()
    {
        if (!config_.remote_path || config_.remote_path->empty())
        {
            throw FtpError(ErrorCode::InvalidArgument, "--get needs a remote path");
        }
        const auto remote = resolve_remote(config_, config_.remote_path);

        bool is_directory = false;
        try
        {
            session_.change_dir(remote);
            is_directory = true;
        }
        catch (const NotFoundError &ex)
        {
            logger_.debug("client", remote, " is not a directory: ", ex.what());
        }
        if (!is_directory)
        {
            try
            {
                (void)session_.remote_size(remote);
            }
            catch (const NotFoundError &ex)
            {
                throw NotFoundError("remote path does not exist: " + remote, ex.reply_code());
            }
        }

        auto name = remote_path::filename(remote);
        if (name.empty() || name == "/" || name == ".")
        {
            name = "downloaded";
        }
        std::filesystem::path target(name);
        if (config_.local_path && !config_.local_path->empty())
        {
            if (ends_with_slash(config_.local_path))
            {
                create_local_directory(*config_.local_path);
                target = std::filesystem::path(*config_.local_path) / name;
            }
            else
            {
                target = std::filesystem::path(*config_.local_path);
            }
        }

        if (is_directory)
        {
            return finish_traversal(traversal_.download_tree(remote, target));
        }
        const auto result = transfers_.download(remote, target);
        print_transfer(result, remote, target.string());
        require_verified(result, remote);
        return kExitOk;
    }

    int CommandRunner::handle_ls()
    {
        const auto remote = resolve_remote(config_, config_.remote_path);
        auto entries = explorer_.list(remote);
        if (entries.empty())
        {
            out_ << "Directory '" << remote << "' is empty" << std::endl;
            return kExitOk;
        }
        sort_for_display(entries);
        const std::string rule(80, '-');
        out_ << "Contents of '" << remote << "':\n" << rule << '\n';
        for (const auto &entry : entries)
        {
            out_ << kind_label(entry.kind) << ' ' << std::setw(12) << std::right;
            if (entry.size)
            {
                out_ << *entry.size;
            }
            else
            {
                out_ << '-';
            }
            out_ << ' ' << entry.name << '\n';
        }
        out_ << rule << std::endl;
        return kExitOk;
    }

    int CommandRunner::handle_tree()
    {
        const auto remote = resolve_remote(config_, config_.remote_path);
        const auto summary = explorer_.tree(remote, out_, config_.tree_depth);
        out_ << std::flush;
        if (summary.failed > 0 && !config_.allow_partial)
        {
            return kExitPartial;
        }
        return kExitOk;
    }

    int CommandRunner::handle_find()
    {
        const auto remote = resolve_remote(config_, config_.remote_path);
        const auto summary = explorer_.find(remote, out_, config_.find_depth);
        out_ << std::flush;
        if (summary.failed > 0 && !config_.allow_partial)
        {
            return kExitPartial;
        }
        return kExitOk;
    }

} // namespace ftpcmd::client
