#include "deep_chain_session.hpp"

#include <algorithm>
#include <cstring>

#include "ftpcmd/error_codes.hpp"
#include "ftpcmd/remote_path.hpp"

namespace ftpcmd::testing
{

    namespace
    {

        class StringReadSource final : public ReadSource
        {
        public:
            explicit StringReadSource(std::string data) : data_(std::move(data)) {}

            std::size_t read(std::span<std::byte> buffer) override
            {
                const auto count = std::min(buffer.size(), data_.size() - position_);
                std::memcpy(buffer.data(), data_.data() + position_, count);
                position_ += count;
                return count;
            }

            void finish() override {}

        private:
            std::string data_;
            std::size_t position_{};
        };

    } // namespace

    std::optional<std::size_t> DeepChainSession::chain_depth(const std::string &path) const
    {
        const auto segments = remote_path::split_segments(path);
        if (segments.size() > depth_ ||
            !std::all_of(segments.begin(), segments.end(), [](const std::string &s)
                         { return s == "d"; }))
        {
            return std::nullopt;
        }
        return segments.size();
    }

    bool DeepChainSession::is_leaf(const std::string &path) const
    {
        return remote_path::filename(path) == "leaf.txt" && chain_depth(remote_path::parent(path)) == depth_;
    }

    std::uint64_t DeepChainSession::remote_size(const std::string &path)
    {
        if (!is_leaf(path))
        {
            throw NotFoundError(path + ": no such file", 550);
        }
        return std::strlen(kLeafContent);
    }

    void DeepChainSession::ensure_remote_dir(const std::string &path)
    {
        throw PermissionError(path + ": read-only tree", 550);
    }

    std::unique_ptr<WriteSink> DeepChainSession::open_upload_stream(const std::string &path, std::uint64_t)
    {
        throw PermissionError(path + ": read-only tree", 553);
    }

    std::unique_ptr<ReadSource> DeepChainSession::open_download_stream(const std::string &path, std::uint64_t offset)
    {
        if (!is_leaf(path))
        {
            throw NotFoundError(path + ": no such file", 550);
        }
        const std::string content(kLeafContent);
        return std::make_unique<StringReadSource>(content.substr(std::min<std::size_t>(offset, content.size())));
    }

    void DeepChainSession::change_dir(const std::string &path)
    {
        const auto depth = chain_depth(path);
        if (!depth)
        {
            throw NotFoundError(path + ": no such directory", 550);
        }
        cwd_depth_ = *depth;
    }

    std::vector<RemoteEntry> DeepChainSession::list_current_dir()
    {
        ++lists_;
        deepest_listed_ = std::max(deepest_listed_, cwd_depth_);
        if (cwd_depth_ < depth_)
        {
            return {RemoteEntry{.name = "d", .kind = EntryKind::Directory}};
        }
        return {RemoteEntry{.name = "leaf.txt", .kind = EntryKind::File, .size = std::strlen(kLeafContent)}};
    }

} // namespace ftpcmd::testing
