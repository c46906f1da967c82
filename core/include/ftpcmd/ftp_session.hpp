/**
 * ftpcmd - Session over a real FTP control connection (passive mode data channels).
 */
#pragma once

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/streambuf.hpp>

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>

#include "ftpcmd/logger.hpp"
#include "ftpcmd/reply.hpp"
#include "ftpcmd/session.hpp"
#include "ftpcmd/text_codec.hpp"
#include "ftpcmd/types.hpp"

namespace ftpcmd
{

    class FtpSession final : public Session
    {
        struct Passkey
        {
            explicit Passkey() = default;
        };

    public:
        // create() followed by open().
        static std::unique_ptr<FtpSession> connect(ConnectionConfig config, Logger logger);

        // Validates the configuration without touching the network. The session can be
        // interrupted from another thread from here on.
        static std::unique_ptr<FtpSession> create(ConnectionConfig config, Logger logger);

        /**
         * Opens the control connection, logs in and negotiates binary type and path
         * encoding. The TCP connect and every handshake reply are bounded by
         * connect_timeout. Throws ConnectionError on failure and CancelledError when
         * interrupted; nothing stays open then.
         */
        void open();

        FtpSession(Passkey, ConnectionConfig config, Logger logger, TextCodec codec);
        ~FtpSession() override;

        FtpSession(const FtpSession &) = delete;
        FtpSession &operator=(const FtpSession &) = delete;

        std::uint64_t remote_size(const std::string &path) override;
        void ensure_remote_dir(const std::string &path) override;
        std::unique_ptr<WriteSink> open_upload_stream(const std::string &path, std::uint64_t offset) override;
        std::unique_ptr<ReadSource> open_download_stream(const std::string &path, std::uint64_t offset) override;
        void change_dir(const std::string &path) override;
        std::vector<RemoteEntry> list_current_dir() override;
        std::optional<std::string> remote_hash(const std::string &path) override;
        void interrupt() noexcept override;
        void close() noexcept override;

        const std::string &home_directory() const noexcept { return home_; }
        bool has_feature(std::string_view name) const;

    private:
        friend class FtpWriteSink;
        friend class FtpReadSource;

        void open_control();
        void login();
        void negotiate();

        std::string read_line();
        void send_line(const std::string &line);
        FtpReply read_reply();
        FtpReply command(const std::string &verb, const std::string &argument = {});
        void drain_pending_reply();

        // Runs the context until the operation behind result completes. Closes socket and
        // returns false at the deadline; throws CancelledError once interrupted.
        bool wait_for_completion(asio::ip::tcp::socket &socket, const std::shared_ptr<std::error_code> &result,
                                 std::chrono::steady_clock::time_point deadline);

        asio::ip::tcp::socket open_data_channel();
        asio::ip::tcp::socket begin_transfer(const std::string &verb, const std::string &path, std::uint64_t offset);
        std::optional<std::string> fetch_listing(const std::string &verb);
        bool try_change_dir(const std::string &absolute_path);

        std::string resolve(const std::string &path) const;
        void track_data_socket(asio::ip::tcp::socket &socket) noexcept;
        void release_data_socket() noexcept;

        ConnectionConfig config_;
        Logger logger_;
        TextCodec codec_;
        asio::io_context io_context_;
        asio::ip::tcp::socket control_;
        asio::streambuf control_buffer_;
        ReplyAssembler assembler_;
        std::set<std::string> features_;
        std::string home_{"/"};
        bool epsv_enabled_{true};
        bool mlsd_enabled_{false};
        bool hash_selected_{false};
        bool pending_transfer_reply_{false};
        // Set while the handshake runs; replies must arrive before it.
        std::optional<std::chrono::steady_clock::time_point> reply_deadline_;
        std::atomic<int> control_fd_{-1};
        std::atomic<int> data_fd_{-1};
        std::atomic<bool> interrupted_{false};
    };

} // namespace ftpcmd
