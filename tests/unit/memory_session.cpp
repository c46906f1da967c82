#include "memory_session.hpp"

#include <algorithm>
#include <cstring>
#include <sstream>

#include "ftpcmd/crypto.hpp"
#include "ftpcmd/error_codes.hpp"
#include "ftpcmd/listing.hpp"
#include "ftpcmd/remote_path.hpp"

namespace ftpcmd::testing
{

    class MemoryWriteSink final : public WriteSink
    {
    public:
        MemoryWriteSink(MemorySession &session, std::string path, std::optional<std::size_t> fail_after)
            : session_(session), path_(std::move(path)), fail_after_(fail_after) {}

        void write(std::span<const std::byte> data) override
        {
            auto &content = session_.files_[path_];
            auto count = data.size();
            if (fail_after_)
            {
                const auto room = *fail_after_ > written_ ? *fail_after_ - written_ : 0;
                if (count > room)
                {
                    content.append(reinterpret_cast<const char *>(data.data()), room);
                    written_ += room;
                    throw ConnectionError("simulated data channel loss while storing " + path_);
                }
            }
            content.append(reinterpret_cast<const char *>(data.data()), count);
            written_ += count;
        }

        void finish() override
        {
            session_.operations_.push_back("226 " + path_);
        }

    private:
        MemorySession &session_;
        std::string path_;
        std::optional<std::size_t> fail_after_;
        std::size_t written_{};
    };

    namespace
    {

        class MemoryReadSource final : public ReadSource
        {
        public:
            MemoryReadSource(std::string data, std::string path, std::optional<std::size_t> fail_after)
                : data_(std::move(data)), path_(std::move(path)), fail_after_(fail_after) {}

            std::size_t read(std::span<std::byte> buffer) override
            {
                if (fail_after_ && position_ >= *fail_after_)
                {
                    throw ConnectionError("simulated data channel loss while retrieving " + path_);
                }
                auto count = std::min(buffer.size(), data_.size() - position_);
                if (fail_after_)
                {
                    count = std::min(count, *fail_after_ - position_);
                }
                std::memcpy(buffer.data(), data_.data() + position_, count);
                position_ += count;
                return count;
            }

            void finish() override {}

        private:
            std::string data_;
            std::string path_;
            std::optional<std::size_t> fail_after_;
            std::size_t position_{};
        };

    } // namespace

    MemorySession::MemorySession()
    {
        directories_.insert("/");
    }

    std::string MemorySession::absolute(const std::string &path) const
    {
        return remote_path::join(cwd_, path.empty() ? "." : path);
    }

    void MemorySession::add_directory(const std::string &path)
    {
        std::string current = "/";
        for (const auto &segment : remote_path::split_segments(remote_path::normalize(path)))
        {
            current = remote_path::join(current, segment);
            directories_.insert(current);
        }
    }

    void MemorySession::add_file(const std::string &path, std::string content)
    {
        const auto target = remote_path::normalize(path);
        add_directory(remote_path::parent(target));
        files_[target] = std::move(content);
    }

    void MemorySession::add_link(const std::string &path)
    {
        const auto target = remote_path::normalize(path);
        add_directory(remote_path::parent(target));
        links_.insert(target);
    }

    bool MemorySession::has_directory(const std::string &path) const
    {
        return directories_.count(remote_path::normalize(path)) > 0;
    }

    std::optional<std::string> MemorySession::file(const std::string &path) const
    {
        const auto it = files_.find(remote_path::normalize(path));
        if (it == files_.end())
        {
            return std::nullopt;
        }
        return it->second;
    }

    std::size_t MemorySession::count_operations(const std::string &prefix) const
    {
        return static_cast<std::size_t>(std::count_if(operations_.begin(), operations_.end(),
                                                      [&](const std::string &op)
                                                      { return op.rfind(prefix, 0) == 0; }));
    }

    std::uint64_t MemorySession::remote_size(const std::string &path)
    {
        const auto target = absolute(path);
        operations_.push_back("SIZE " + target);
        if (!size_supported_)
        {
            throw NotFoundError("SIZE not understood", 502);
        }
        const auto it = files_.find(target);
        if (it == files_.end())
        {
            throw NotFoundError(target + ": no such file", 550);
        }
        return it->second.size();
    }

    void MemorySession::ensure_remote_dir(const std::string &path)
    {
        std::string current = "/";
        for (const auto &segment : remote_path::split_segments(absolute(path)))
        {
            current = remote_path::join(current, segment);
            if (directories_.count(current) > 0)
            {
                continue;
            }
            if (mkdir_failures_.count(current) > 0 || files_.count(current) > 0)
            {
                throw PermissionError(current + ": permission denied", 550);
            }
            operations_.push_back("MKD " + current);
            directories_.insert(current);
        }
    }

    std::unique_ptr<WriteSink> MemorySession::open_upload_stream(const std::string &path, std::uint64_t offset)
    {
        const auto target = absolute(path);
        if (directories_.count(remote_path::parent(target)) == 0)
        {
            throw PermissionError(target + ": parent directory missing", 553);
        }
        if (offset > 0)
        {
            if (!rest_supported_)
            {
                throw ProtocolError("REST not supported", 502);
            }
            auto &content = files_[target];
            if (offset > content.size())
            {
                throw ProtocolError("restart offset beyond end of file", 554);
            }
            content.resize(static_cast<std::size_t>(offset));
        }
        else
        {
            files_[target].clear();
        }
        operations_.push_back("STOR " + target + " " + std::to_string(offset));

        std::optional<std::size_t> fail_after;
        if (const auto it = upload_failures_.find(target); it != upload_failures_.end())
        {
            fail_after = it->second;
            upload_failures_.erase(it);
        }
        return std::make_unique<MemoryWriteSink>(*this, target, fail_after);
    }

    std::unique_ptr<ReadSource> MemorySession::open_download_stream(const std::string &path, std::uint64_t offset)
    {
        const auto target = absolute(path);
        const auto it = files_.find(target);
        if (it == files_.end())
        {
            throw NotFoundError(target + ": no such file", 550);
        }
        if (offset > 0 && !rest_supported_)
        {
            throw ProtocolError("REST not supported", 502);
        }
        operations_.push_back("RETR " + target + " " + std::to_string(offset));
        const auto start = std::min<std::size_t>(static_cast<std::size_t>(offset), it->second.size());

        std::optional<std::size_t> fail_after;
        if (const auto failure = download_failures_.find(target); failure != download_failures_.end())
        {
            fail_after = failure->second;
            download_failures_.erase(failure);
        }
        return std::make_unique<MemoryReadSource>(it->second.substr(start), target, fail_after);
    }

    void MemorySession::change_dir(const std::string &path)
    {
        const auto target = absolute(path);
        operations_.push_back("CWD " + target);
        if (directories_.count(target) == 0)
        {
            throw NotFoundError(target + ": no such directory", 550);
        }
        cwd_ = target;
    }

    std::string MemorySession::render_listing() const
    {
        std::ostringstream out;
        const auto is_child = [this](const std::string &path)
        { return path != "/" && remote_path::parent(path) == cwd_; };

        if (!mlsd_)
        {
            out << "total 0\r\n";
        }
        for (const auto &dir : directories_)
        {
            if (!is_child(dir))
            {
                continue;
            }
            const auto name = remote_path::filename(dir);
            if (mlsd_)
            {
                out << "type=dir;modify=20240101000000; " << name << "\r\n";
            }
            else
            {
                out << "drwxr-xr-x    2 ftp      ftp          4096 Jan 01 00:00 " << name << "\r\n";
            }
        }
        for (const auto &[path, content] : files_)
        {
            if (!is_child(path))
            {
                continue;
            }
            const auto name = remote_path::filename(path);
            if (mlsd_)
            {
                out << "type=file;size=" << content.size() << ";modify=20240101000000; " << name << "\r\n";
            }
            else
            {
                out << "-rw-r--r--    1 ftp      ftp      " << content.size() << " Jan 01 00:00 " << name << "\r\n";
            }
        }
        for (const auto &link : links_)
        {
            if (!is_child(link))
            {
                continue;
            }
            const auto name = remote_path::filename(link);
            if (mlsd_)
            {
                out << "type=OS.unix=slink:/elsewhere;size=9; " << name << "\r\n";
            }
            else
            {
                out << "lrwxrwxrwx    1 ftp      ftp             9 Jan 01 00:00 " << name << " -> /elsewhere\r\n";
            }
        }
        return out.str();
    }

    std::vector<RemoteEntry> MemorySession::list_current_dir()
    {
        operations_.push_back(std::string(mlsd_ ? "MLSD " : "LIST ") + cwd_);
        if (list_failures_.count(cwd_) > 0)
        {
            throw PermissionError(cwd_ + ": permission denied", 550);
        }
        return parse_listing(render_listing(), mlsd_ ? ListingFormat::Mlsd : ListingFormat::List);
    }

    std::optional<std::string> MemorySession::remote_hash(const std::string &path)
    {
        if (!hash_supported_)
        {
            return std::nullopt;
        }
        const auto target = absolute(path);
        operations_.push_back("HASH " + target);
        const auto it = files_.find(target);
        if (it == files_.end())
        {
            return std::nullopt;
        }
        if (corrupt_hashes_.count(target) > 0)
        {
            return std::string(64, '0');
        }
        return crypto::sha256_bytes(std::as_bytes(std::span(it->second.data(), it->second.size())));
    }

    void MemorySession::interrupt() noexcept
    {
        interrupted_ = true;
    }

    void MemorySession::close() noexcept
    {
        closed_ = true;
    }

} // namespace ftpcmd::testing
