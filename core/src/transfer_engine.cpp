#include "ftpcmd/transfer_engine.hpp"

#include <algorithm>
#include <fstream>
#include <span>
#include <utility>
#include <vector>

#include "ftpcmd/crypto.hpp"
#include "ftpcmd/error_codes.hpp"
#include "ftpcmd/remote_path.hpp"

namespace ftpcmd
{

    ResumePlan plan_upload(std::uint64_t local_size, std::optional<std::uint64_t> remote_size) noexcept
    {
        if (!remote_size)
        {
            return {false, 0};
        }
        if (*remote_size >= local_size)
        {
            return {true, *remote_size};
        }
        return {false, *remote_size};
    }

    ResumePlan plan_download(std::optional<std::uint64_t> local_size, std::optional<std::uint64_t> remote_size) noexcept
    {
        if (!local_size)
        {
            return {false, 0};
        }
        if (remote_size && *remote_size <= *local_size)
        {
            return {true, *local_size};
        }
        return {false, *local_size};
    }

    void require_verified(const TransferResult &result, const std::string &path)
    {
        if (result.verified && !*result.verified)
        {
            throw FtpError(ErrorCode::VerificationFailed, "checksum mismatch after transfer of " + path);
        }
    }

    TransferEngine::TransferEngine(Session &session, Logger logger, TransferOptions options, ProgressCallback progress,
                                   const CancellationToken *cancel)
        : session_(session),
          logger_(std::move(logger)),
          options_(options),
          progress_(std::move(progress)),
          cancel_(cancel)
    {
        if (options_.chunk_size == 0)
        {
            options_.chunk_size = TransferOptions{}.chunk_size;
        }
    }

    void TransferEngine::check_cancelled() const
    {
        if (cancel_)
        {
            cancel_->throw_if_cancelled();
        }
    }

    void TransferEngine::emit(const TransferTask &task, std::uint64_t position, std::optional<std::uint64_t> total,
                              std::chrono::steady_clock::time_point started) const
    {
        if (!progress_)
        {
            return;
        }
        progress_(ProgressSample{
            .bytes_transferred = position,
            .total_bytes = total,
            .file_name = task.direction == Direction::Upload ? task.local_path.filename().string()
                                                             : remote_path::filename(task.remote_path),
            .start_offset = task.resume_offset,
            .elapsed = std::chrono::steady_clock::now() - started,
        });
    }

    TransferResult TransferEngine::upload(const std::filesystem::path &local_path, const std::string &remote_path)
    {
        check_cancelled();
        std::error_code ec;
        if (!std::filesystem::is_regular_file(local_path, ec))
        {
            throw NotFoundError("local file does not exist: " + local_path.string());
        }
        const auto local_size = std::filesystem::file_size(local_path, ec);
        if (ec)
        {
            throw FtpError(ErrorCode::LocalIo, "cannot stat " + local_path.string() + ": " + ec.message());
        }

        std::optional<std::uint64_t> remote_size;
        try
        {
            remote_size = session_.remote_size(remote_path);
        }
        catch (const NotFoundError &ex)
        {
            logger_.debug("transfer", "no remote size for ", remote_path, ": ", ex.what());
        }

        const auto plan = plan_upload(local_size, remote_size);
        if (plan.skip)
        {
            logger_.log("transfer", "skip upload ", local_path.string(), " -> ", remote_path, " (remote has ",
                        *remote_size, " of ", local_size, " bytes)");
            return TransferResult{
                .outcome = TransferOutcome::Skipped,
                .bytes_transferred = 0,
                .resume_offset = plan.offset,
                .total_size = local_size,
            };
        }
        if (plan.offset > 0)
        {
            logger_.log("transfer", "resume upload ", remote_path, " at byte ", plan.offset, " of ", local_size);
        }

        const TransferTask task{
            .local_path = local_path,
            .remote_path = remote_path,
            .direction = Direction::Upload,
            .resume_offset = plan.offset,
        };
        auto result = stream_upload(task, local_size);
        if (options_.verify)
        {
            result.verified = verify(task);
        }
        return result;
    }

    TransferResult TransferEngine::stream_upload(const TransferTask &task, std::uint64_t local_size)
    {
        std::ifstream in(task.local_path, std::ios::binary);
        if (!in.is_open())
        {
            throw FtpError(ErrorCode::LocalIo, "cannot open " + task.local_path.string() + " for reading");
        }
        in.seekg(static_cast<std::streamoff>(task.resume_offset));

        std::vector<char> buffer(options_.chunk_size);
        std::uint64_t moved = 0;
        const auto started = std::chrono::steady_clock::now();
        try
        {
            auto sink = session_.open_upload_stream(task.remote_path, task.resume_offset);
            while (task.resume_offset + moved < local_size)
            {
                check_cancelled();
                const auto remaining = local_size - task.resume_offset - moved;
                const auto wanted = static_cast<std::size_t>(std::min<std::uint64_t>(remaining, buffer.size()));
                in.read(buffer.data(), static_cast<std::streamsize>(wanted));
                const auto count = static_cast<std::size_t>(in.gcount());
                if (count == 0)
                {
                    throw FtpError(ErrorCode::LocalIo, task.local_path.string() + " shrank during upload");
                }
                sink->write(std::as_bytes(std::span(buffer.data(), count)));
                moved += count;
                emit(task, task.resume_offset + moved, local_size, started);
            }
            sink->finish();
        }
        catch (const CancelledError &)
        {
            logger_.warn("transfer", "upload of ", task.remote_path, " cancelled after ", moved, " bytes");
            throw;
        }
        catch (const FtpError &ex)
        {
            if (moved == 0 && ex.code() != ErrorCode::ConnectionFailed)
            {
                throw;
            }
            logger_.warn("transfer", "upload of ", task.remote_path, " interrupted after ", moved, " bytes: ",
                         ex.what());
            throw TransferInterrupted(ex, moved);
        }

        logger_.log("transfer", "uploaded ", task.local_path.string(), " -> ", task.remote_path, " (", moved,
                    " bytes from offset ", task.resume_offset, ")");
        return TransferResult{
            .outcome = TransferOutcome::Transferred,
            .bytes_transferred = moved,
            .resume_offset = task.resume_offset,
            .total_size = local_size,
        };
    }

    TransferResult TransferEngine::download(const std::string &remote_path, const std::filesystem::path &local_path,
                                            const RemoteEntry *listing)
    {
        check_cancelled();
        std::optional<std::uint64_t> remote_size;
        try
        {
            remote_size = session_.remote_size(remote_path);
        }
        catch (const NotFoundError &ex)
        {
            if (!listing || listing->kind != EntryKind::File)
            {
                throw;
            }
            remote_size = listing->size;
            logger_.log("transfer", "SIZE unavailable for ", remote_path, " (", ex.what(),
                        "), downloading without a verified total");
        }

        std::error_code ec;
        std::optional<std::uint64_t> local_size;
        if (std::filesystem::exists(local_path, ec))
        {
            if (!std::filesystem::is_regular_file(local_path, ec))
            {
                throw FtpError(ErrorCode::LocalIo, "local target is not a regular file: " + local_path.string());
            }
            local_size = std::filesystem::file_size(local_path, ec);
            if (ec)
            {
                throw FtpError(ErrorCode::LocalIo, "cannot stat " + local_path.string() + ": " + ec.message());
            }
        }

        const auto plan = plan_download(local_size, remote_size);
        if (plan.skip)
        {
            logger_.log("transfer", "skip download ", remote_path, " -> ", local_path.string(), " (local has ",
                        *local_size, " of ", *remote_size, " bytes)");
            return TransferResult{
                .outcome = TransferOutcome::Skipped,
                .bytes_transferred = 0,
                .resume_offset = plan.offset,
                .total_size = remote_size,
            };
        }
        if (plan.offset > 0)
        {
            logger_.log("transfer", "resume download ", remote_path, " at byte ", plan.offset);
        }

        const auto parent = local_path.parent_path();
        if (!parent.empty())
        {
            std::filesystem::create_directories(parent, ec);
            if (ec)
            {
                throw FtpError(ErrorCode::LocalIo, "cannot create " + parent.string() + ": " + ec.message());
            }
        }

        const TransferTask task{
            .local_path = local_path,
            .remote_path = remote_path,
            .direction = Direction::Download,
            .resume_offset = plan.offset,
        };
        auto result = stream_download(task, remote_size);
        if (!remote_size && result.bytes_transferred == 0 && plan.offset > 0)
        {
            logger_.log("transfer", "server had nothing past byte ", plan.offset, " of ", remote_path,
                        ", treating as up to date");
            result.outcome = TransferOutcome::Skipped;
            return result;
        }
        if (options_.verify)
        {
            result.verified = verify(task);
        }
        return result;
    }

    TransferResult TransferEngine::stream_download(const TransferTask &task, std::optional<std::uint64_t> remote_size)
    {
        std::vector<char> buffer(options_.chunk_size);
        std::uint64_t moved = 0;
        const auto started = std::chrono::steady_clock::now();
        try
        {
            auto source = session_.open_download_stream(task.remote_path, task.resume_offset);
            const auto mode = std::ios::binary | (task.resume_offset > 0 ? std::ios::app : std::ios::trunc);
            std::ofstream out(task.local_path, mode);
            if (!out.is_open())
            {
                throw FtpError(ErrorCode::LocalIo, "cannot open " + task.local_path.string() + " for writing");
            }
            for (;;)
            {
                check_cancelled();
                const auto count = source->read(std::as_writable_bytes(std::span(buffer)));
                if (count == 0)
                {
                    break;
                }
                out.write(buffer.data(), static_cast<std::streamsize>(count));
                if (!out)
                {
                    throw FtpError(ErrorCode::LocalIo, "write to " + task.local_path.string() + " failed");
                }
                moved += count;
                emit(task, task.resume_offset + moved, remote_size, started);
            }
            out.flush();
            if (!out)
            {
                throw FtpError(ErrorCode::LocalIo, "flush of " + task.local_path.string() + " failed");
            }
            source->finish();
        }
        catch (const CancelledError &)
        {
            logger_.warn("transfer", "download of ", task.remote_path, " cancelled after ", moved, " bytes");
            throw;
        }
        catch (const FtpError &ex)
        {
            if (moved == 0 && ex.code() != ErrorCode::ConnectionFailed)
            {
                throw;
            }
            logger_.warn("transfer", "download of ", task.remote_path, " interrupted after ", moved, " bytes: ",
                         ex.what());
            throw TransferInterrupted(ex, moved);
        }

        const auto final_size = task.resume_offset + moved;
        if (remote_size && final_size != *remote_size)
        {
            logger_.warn("transfer", remote_path::filename(task.remote_path), " ended at ", final_size,
                         " bytes, server reported ", *remote_size);
        }
        logger_.log("transfer", "downloaded ", task.remote_path, " -> ", task.local_path.string(), " (", moved,
                    " bytes from offset ", task.resume_offset, ")");
        return TransferResult{
            .outcome = TransferOutcome::Transferred,
            .bytes_transferred = moved,
            .resume_offset = task.resume_offset,
            .total_size = remote_size,
        };
    }

    std::optional<bool> TransferEngine::verify(const TransferTask &task)
    {
        check_cancelled();
        const auto remote_digest = session_.remote_hash(task.remote_path);
        if (!remote_digest)
        {
            logger_.debug("transfer", "server offers no SHA-256 HASH, ", task.remote_path, " left unverified");
            return std::nullopt;
        }
        const auto local_digest = crypto::sha256_file(task.local_path);
        if (local_digest != *remote_digest)
        {
            logger_.warn("transfer", "checksum mismatch for ", task.remote_path, ": local ", local_digest,
                         " remote ", *remote_digest);
            return false;
        }
        logger_.debug("transfer", "verified ", task.remote_path, " sha256=", local_digest);
        return true;
    }

} // namespace ftpcmd
