#include "ftpcmd/ftp_session.hpp"

#include <asio/connect.hpp>
#include <asio/read.hpp>
#include <asio/read_until.hpp>
#include <asio/write.hpp>

#include <sys/socket.h>

#include <algorithm>
#include <cctype>
#include <istream>
#include <utility>

#include "ftpcmd/crypto.hpp"
#include "ftpcmd/error_codes.hpp"
#include "ftpcmd/listing.hpp"
#include "ftpcmd/remote_path.hpp"

namespace ftpcmd
{

    namespace
    {

        std::string to_upper(std::string value)
        {
            for (auto &ch : value)
            {
                ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
            }
            return value;
        }

        [[noreturn]] void throw_transfer_failure(const FtpReply &reply, const std::string &verb,
                                                 const std::string &target)
        {
            const auto message = verb + " " + target + " failed: " + reply.text();
            switch (reply.code)
            {
            case 421:
            case 425:
                throw ConnectionError(message, reply.code);
            case 450:
            case 550:
                if (verb == "RETR")
                {
                    throw NotFoundError(message, reply.code);
                }
                throw PermissionError(message, reply.code);
            case 452:
            case 532:
            case 552:
            case 553:
                throw PermissionError(message, reply.code);
            default:
                throw ProtocolError(message, reply.code);
            }
        }

    } // namespace

    class FtpWriteSink final : public WriteSink
    {
    public:
        FtpWriteSink(FtpSession &session, asio::ip::tcp::socket socket, std::string target)
            : session_(session), socket_(std::move(socket)), target_(std::move(target)) {}

        ~FtpWriteSink() override
        {
            if (!finished_)
            {
                abort();
            }
        }

        void write(std::span<const std::byte> data) override
        {
            if (session_.interrupted_)
            {
                throw CancelledError();
            }
            std::error_code ec;
            asio::write(socket_, asio::buffer(data.data(), data.size()), ec);
            if (ec)
            {
                if (session_.interrupted_)
                {
                    throw CancelledError();
                }
                throw ConnectionError("data channel write failed for " + target_ + ": " + ec.message());
            }
        }

        void finish() override
        {
            finished_ = true;
            std::error_code ec;
            socket_.shutdown(asio::ip::tcp::socket::shutdown_send, ec);
            socket_.close(ec);
            session_.release_data_socket();
            const auto reply = session_.read_reply();
            if (!reply.completed())
            {
                throw_transfer_failure(reply, "STOR", target_);
            }
        }

    private:
        void abort() noexcept
        {
            std::error_code ec;
            socket_.close(ec);
            session_.release_data_socket();
            session_.pending_transfer_reply_ = true;
        }

        FtpSession &session_;
        asio::ip::tcp::socket socket_;
        std::string target_;
        bool finished_{false};
    };

    class FtpReadSource final : public ReadSource
    {
    public:
        FtpReadSource(FtpSession &session, asio::ip::tcp::socket socket, std::string target)
            : session_(session), socket_(std::move(socket)), target_(std::move(target)) {}

        ~FtpReadSource() override
        {
            if (!finished_)
            {
                std::error_code ec;
                socket_.close(ec);
                session_.release_data_socket();
                session_.pending_transfer_reply_ = true;
            }
        }

        std::size_t read(std::span<std::byte> buffer) override
        {
            // A shut down socket may still hand out queued data.
            if (session_.interrupted_)
            {
                throw CancelledError();
            }
            std::error_code ec;
            const auto count = socket_.read_some(asio::buffer(buffer.data(), buffer.size()), ec);
            if (ec == asio::error::eof)
            {
                return count;
            }
            if (ec)
            {
                if (session_.interrupted_)
                {
                    throw CancelledError();
                }
                throw ConnectionError("data channel read failed for " + target_ + ": " + ec.message());
            }
            return count;
        }

        void finish() override
        {
            finished_ = true;
            std::error_code ec;
            socket_.close(ec);
            session_.release_data_socket();
            const auto reply = session_.read_reply();
            if (!reply.completed())
            {
                throw_transfer_failure(reply, "RETR", target_);
            }
        }

    private:
        FtpSession &session_;
        asio::ip::tcp::socket socket_;
        std::string target_;
        bool finished_{false};
    };

    std::unique_ptr<FtpSession> FtpSession::connect(ConnectionConfig config, Logger logger)
    {
        auto session = create(std::move(config), std::move(logger));
        session->open();
        return session;
    }

    std::unique_ptr<FtpSession> FtpSession::create(ConnectionConfig config, Logger logger)
    {
        if (config.host.empty())
        {
            throw ConnectionError("no FTP host configured");
        }
        TextCodec codec(config.encoding);
        return std::make_unique<FtpSession>(Passkey{}, std::move(config), std::move(logger), std::move(codec));
    }

    FtpSession::FtpSession(Passkey, ConnectionConfig config, Logger logger, TextCodec codec)
        : config_(std::move(config)),
          logger_(std::move(logger)),
          codec_(std::move(codec)),
          control_(io_context_) {}

    void FtpSession::open()
    {
        if (interrupted_)
        {
            throw CancelledError();
        }
        try
        {
            open_control();
            login();
            negotiate();
        }
        catch (const ProtocolError &ex)
        {
            reply_deadline_.reset();
            close();
            throw ConnectionError(std::string("handshake failed: ") + ex.what(), ex.reply_code());
        }
        catch (const FtpError &)
        {
            reply_deadline_.reset();
            close();
            throw;
        }
        reply_deadline_.reset();
    }

    FtpSession::~FtpSession()
    {
        close();
    }

    void FtpSession::open_control()
    {
        asio::ip::tcp::resolver resolver(io_context_);
        std::error_code ec;
        const auto endpoints = resolver.resolve(config_.host, std::to_string(config_.port), ec);
        if (ec)
        {
            throw ConnectionError("cannot resolve " + config_.host + ": " + ec.message());
        }

        const auto deadline = std::chrono::steady_clock::now() + config_.connect_timeout;
        auto connect_ec = std::make_shared<std::error_code>(asio::error::would_block);
        asio::async_connect(control_, endpoints,
                            [connect_ec](const std::error_code &result, const asio::ip::tcp::endpoint &)
                            { *connect_ec = result; });
        if (!wait_for_completion(control_, connect_ec, deadline))
        {
            throw ConnectionError("timed out connecting to " + config_.host + ':' + std::to_string(config_.port));
        }
        if (*connect_ec)
        {
            throw ConnectionError("cannot connect to " + config_.host + ':' + std::to_string(config_.port) + ": " +
                                  connect_ec->message());
        }
        control_fd_ = static_cast<int>(control_.native_handle());
        logger_.log("session", "connected to ", config_.host, ':', config_.port);

        reply_deadline_ = std::chrono::steady_clock::now() + config_.connect_timeout;
        auto greeting = read_reply();
        while (greeting.code == 120)
        {
            greeting = read_reply();
        }
        if (greeting.code != 220)
        {
            throw ConnectionError("server refused the session: " + greeting.text(), greeting.code);
        }
    }

    void FtpSession::login()
    {
        auto reply = command("USER", config_.username);
        if (reply.code == 331)
        {
            reply = command("PASS", config_.password);
        }
        crypto::wipe(config_.password);
        if (reply.code == 332)
        {
            throw ConnectionError("server requires an account (ACCT) which is not supported", reply.code);
        }
        if (!reply.completed())
        {
            throw ConnectionError("login rejected for " + config_.username + ": " + reply.message(), reply.code);
        }
        logger_.log("session", "logged in as ", config_.username);
    }

    void FtpSession::negotiate()
    {
        const auto feat = command("FEAT");
        features_ = parse_features(feat);
        mlsd_enabled_ = has_feature("MLST");

        if (codec_.is_utf8() && has_feature("UTF8"))
        {
            const auto reply = command("OPTS", "UTF8 ON");
            if (!reply.completed())
            {
                logger_.warn("session", "server refused OPTS UTF8 ON: ", reply.text());
            }
        }

        const auto type = command("TYPE", "I");
        if (!type.completed())
        {
            throw ConnectionError("server refused binary transfer type: " + type.text(), type.code);
        }

        const auto pwd = command("PWD");
        if (const auto home = parse_pwd_reply(pwd))
        {
            home_ = remote_path::normalize(codec_.from_server(*home));
        }
        logger_.log("session", "home=", home_, " encoding=", codec_.encoding(), " mlsd=", mlsd_enabled_,
                    " features=", features_.size());
    }

    bool FtpSession::has_feature(std::string_view name) const
    {
        return features_.count(to_upper(std::string(name))) > 0;
    }

    bool FtpSession::wait_for_completion(asio::ip::tcp::socket &socket,
                                         const std::shared_ptr<std::error_code> &result,
                                         std::chrono::steady_clock::time_point deadline)
    {
        constexpr std::chrono::milliseconds kPollInterval{50};
        while (*result == asio::error::would_block)
        {
            const auto now = std::chrono::steady_clock::now();
            if (interrupted_ || now >= deadline)
            {
                if (&socket == &control_)
                {
                    control_fd_ = -1;
                }
                std::error_code ignored;
                socket.close(ignored);
                if (interrupted_)
                {
                    throw CancelledError();
                }
                return false;
            }
            io_context_.restart();
            io_context_.run_for(std::min<std::chrono::steady_clock::duration>(deadline - now, kPollInterval));
        }
        return true;
    }

    std::string FtpSession::read_line()
    {
        if (interrupted_)
        {
            throw CancelledError();
        }
        std::error_code ec;
        if (reply_deadline_)
        {
            auto result = std::make_shared<std::error_code>(asio::error::would_block);
            asio::async_read_until(control_, control_buffer_, '\n',
                                   [result](const std::error_code &read_ec, std::size_t)
                                   { *result = read_ec; });
            if (!wait_for_completion(control_, result, *reply_deadline_))
            {
                throw ConnectionError("timed out waiting for a reply from " + config_.host);
            }
            ec = *result;
        }
        else
        {
            asio::read_until(control_, control_buffer_, '\n', ec);
        }
        if (ec)
        {
            if (interrupted_)
            {
                throw CancelledError();
            }
            throw ConnectionError("control connection lost: " + ec.message());
        }
        std::istream stream(&control_buffer_);
        std::string line;
        std::getline(stream, line);
        if (!line.empty() && line.back() == '\r')
        {
            line.pop_back();
        }
        return line;
    }

    void FtpSession::send_line(const std::string &line)
    {
        if (interrupted_)
        {
            throw CancelledError();
        }
        std::error_code ec;
        const auto wire = line + "\r\n";
        asio::write(control_, asio::buffer(wire), ec);
        if (ec)
        {
            if (interrupted_)
            {
                throw CancelledError();
            }
            throw ConnectionError("control connection lost: " + ec.message());
        }
    }

    FtpReply FtpSession::read_reply()
    {
        for (;;)
        {
            const auto line = read_line();
            logger_.debug("session", "< ", line);
            if (auto reply = assembler_.feed(line))
            {
                return std::move(*reply);
            }
        }
    }

    FtpReply FtpSession::command(const std::string &verb, const std::string &argument)
    {
        drain_pending_reply();
        std::string line = verb;
        if (!argument.empty())
        {
            line += ' ';
            line += codec_.to_server(argument);
        }
        logger_.debug("session", "> ", verb == "PASS" ? std::string("PASS ****") : line);
        send_line(line);
        auto reply = read_reply();
        if (reply.code == 421)
        {
            throw ConnectionError("server closed the session: " + reply.text(), reply.code);
        }
        return reply;
    }

    void FtpSession::drain_pending_reply()
    {
        if (!pending_transfer_reply_)
        {
            return;
        }
        pending_transfer_reply_ = false;
        const auto reply = read_reply();
        logger_.debug("session", "aborted transfer closed with ", reply.code);
    }

    asio::ip::tcp::socket FtpSession::open_data_channel()
    {
        std::optional<std::uint16_t> port;
        if (epsv_enabled_)
        {
            const auto reply = command("EPSV");
            if (reply.code == 229)
            {
                port = parse_epsv_reply(reply.message());
                if (!port)
                {
                    throw ProtocolError("malformed EPSV reply: " + reply.text(), reply.code);
                }
            }
            else
            {
                epsv_enabled_ = false;
                logger_.debug("session", "EPSV refused with ", reply.code, ", using PASV");
            }
        }
        if (!port)
        {
            const auto reply = command("PASV");
            if (reply.code != 227)
            {
                throw ProtocolError("PASV refused: " + reply.text(), reply.code);
            }
            port = parse_pasv_reply(reply.lines.back());
            if (!port)
            {
                throw ProtocolError("malformed PASV reply: " + reply.text(), reply.code);
            }
        }

        std::error_code ec;
        const auto peer = control_.remote_endpoint(ec);
        if (ec)
        {
            throw ConnectionError("control connection lost: " + ec.message());
        }
        asio::ip::tcp::socket data(io_context_);
        auto connect_ec = std::make_shared<std::error_code>(asio::error::would_block);
        data.async_connect(asio::ip::tcp::endpoint(peer.address(), *port),
                           [connect_ec](const std::error_code &result)
                           { *connect_ec = result; });
        if (!wait_for_completion(data, connect_ec, std::chrono::steady_clock::now() + config_.connect_timeout))
        {
            throw ConnectionError("timed out opening the data connection to port " + std::to_string(*port));
        }
        if (*connect_ec)
        {
            throw ConnectionError("data connection to port " + std::to_string(*port) + " failed: " +
                                  connect_ec->message());
        }
        return data;
    }

    asio::ip::tcp::socket FtpSession::begin_transfer(const std::string &verb, const std::string &path,
                                                     std::uint64_t offset)
    {
        auto data = open_data_channel();
        track_data_socket(data);
        if (offset > 0)
        {
            const auto rest = command("REST", std::to_string(offset));
            if (rest.code != 350)
            {
                release_data_socket();
                throw ProtocolError("server rejected resume at byte " + std::to_string(offset) + " of " + path + ": " +
                                        rest.text(),
                                    rest.code);
            }
        }
        const auto reply = command(verb, path);
        if (!reply.preliminary())
        {
            release_data_socket();
            throw_transfer_failure(reply, verb, path);
        }
        return data;
    }

    std::uint64_t FtpSession::remote_size(const std::string &path)
    {
        const auto target = resolve(path);
        const auto reply = command("SIZE", target);
        if (reply.code == 213)
        {
            const auto size = parse_size_reply(reply);
            if (!size)
            {
                throw ProtocolError("malformed SIZE reply: " + reply.text(), reply.code);
            }
            return *size;
        }
        switch (reply.code)
        {
        case 450:
        case 500:
        case 501:
        case 502:
        case 504:
        case 550:
            throw NotFoundError("no size for " + target + ": " + reply.message(), reply.code);
        default:
            throw ProtocolError("SIZE " + target + " failed: " + reply.text(), reply.code);
        }
    }

    bool FtpSession::try_change_dir(const std::string &absolute_path)
    {
        return command("CWD", absolute_path).completed();
    }

    void FtpSession::ensure_remote_dir(const std::string &path)
    {
        const auto target = resolve(path);
        if (try_change_dir(target))
        {
            return;
        }
        std::string current = "/";
        for (const auto &segment : remote_path::split_segments(target))
        {
            current = remote_path::join(current, segment);
            if (try_change_dir(current))
            {
                continue;
            }
            const auto reply = command("MKD", current);
            if (reply.completed())
            {
                logger_.log("session", "created remote directory ", current);
                continue;
            }
            // Another client may have created it in between.
            if (!try_change_dir(current))
            {
                throw PermissionError("cannot create remote directory " + current + ": " + reply.message(),
                                      reply.code);
            }
        }
    }

    std::unique_ptr<WriteSink> FtpSession::open_upload_stream(const std::string &path, std::uint64_t offset)
    {
        const auto target = resolve(path);
        auto data = begin_transfer("STOR", target, offset);
        logger_.debug("session", "upload stream open ", target, " at ", offset);
        return std::make_unique<FtpWriteSink>(*this, std::move(data), target);
    }

    std::unique_ptr<ReadSource> FtpSession::open_download_stream(const std::string &path, std::uint64_t offset)
    {
        const auto target = resolve(path);
        auto data = begin_transfer("RETR", target, offset);
        logger_.debug("session", "download stream open ", target, " at ", offset);
        return std::make_unique<FtpReadSource>(*this, std::move(data), target);
    }

    void FtpSession::change_dir(const std::string &path)
    {
        const auto target = resolve(path);
        const auto reply = command("CWD", target);
        if (reply.completed())
        {
            return;
        }
        if (reply.category() == 5)
        {
            throw NotFoundError("no such remote directory " + target + ": " + reply.message(), reply.code);
        }
        throw ProtocolError("CWD " + target + " failed: " + reply.text(), reply.code);
    }

    std::optional<std::string> FtpSession::fetch_listing(const std::string &verb)
    {
        auto data = open_data_channel();
        track_data_socket(data);
        const auto reply = command(verb);
        if (!reply.preliminary())
        {
            release_data_socket();
            if (verb == "MLSD" && (reply.code == 500 || reply.code == 502 || reply.code == 504))
            {
                return std::nullopt;
            }
            if (reply.code == 450 || reply.completed())
            {
                // Some servers answer an empty directory without opening the channel.
                return std::string{};
            }
            if (reply.code == 550)
            {
                throw NotFoundError(verb + " failed: " + reply.message(), reply.code);
            }
            throw ProtocolError(verb + " failed: " + reply.text(), reply.code);
        }

        std::string body;
        std::error_code ec;
        asio::read(data, asio::dynamic_buffer(body), ec);
        if (ec && ec != asio::error::eof)
        {
            release_data_socket();
            if (interrupted_)
            {
                throw CancelledError();
            }
            throw ConnectionError(verb + " data channel failed: " + ec.message());
        }
        data.close(ec);
        release_data_socket();

        const auto done = read_reply();
        if (!done.completed())
        {
            throw ProtocolError(verb + " did not complete: " + done.text(), done.code);
        }
        return body;
    }

    std::vector<RemoteEntry> FtpSession::list_current_dir()
    {
        std::optional<std::string> body;
        auto format = ListingFormat::List;
        if (mlsd_enabled_)
        {
            body = fetch_listing("MLSD");
            if (body)
            {
                format = ListingFormat::Mlsd;
            }
            else
            {
                mlsd_enabled_ = false;
                logger_.log("session", "MLSD unsupported, falling back to LIST");
            }
        }
        if (!body)
        {
            body = fetch_listing("LIST");
        }
        if (!body)
        {
            throw ProtocolError("LIST produced no listing");
        }

        // Lines the codec cannot decode are kept as raw bytes.
        std::string decoded;
        decoded.reserve(body->size());
        std::size_t pos = 0;
        while (pos < body->size())
        {
            auto end = body->find('\n', pos);
            if (end == std::string::npos)
            {
                end = body->size();
            }
            const std::string_view raw(body->data() + pos, end - pos);
            pos = end + 1;
            try
            {
                decoded += codec_.from_server(raw);
            }
            catch (const ProtocolError &ex)
            {
                logger_.warn("session", "listing line kept undecoded: ", ex.what());
                decoded += raw;
            }
            decoded += '\n';
        }
        return parse_listing(decoded, format);
    }

    std::optional<std::string> FtpSession::remote_hash(const std::string &path)
    {
        if (!has_feature("HASH"))
        {
            return std::nullopt;
        }
        if (!hash_selected_)
        {
            const auto reply = command("OPTS", "HASH SHA-256");
            if (!reply.completed())
            {
                logger_.debug("session", "server cannot select SHA-256: ", reply.text());
                return std::nullopt;
            }
            hash_selected_ = true;
        }
        const auto target = resolve(path);
        const auto reply = command("HASH", target);
        auto digest = parse_hash_reply(reply);
        if (!digest)
        {
            logger_.debug("session", "no usable HASH reply for ", target, ": ", reply.text());
        }
        return digest;
    }

    void FtpSession::interrupt() noexcept
    {
        interrupted_ = true;
        if (const int fd = data_fd_.load(); fd >= 0)
        {
            ::shutdown(fd, SHUT_RDWR);
        }
        if (const int fd = control_fd_.load(); fd >= 0)
        {
            ::shutdown(fd, SHUT_RDWR);
        }
    }

    void FtpSession::close() noexcept
    {
        if (!control_.is_open())
        {
            return;
        }
        std::error_code ec;
        if (!interrupted_)
        {
            const std::string quit = "QUIT\r\n";
            asio::write(control_, asio::buffer(quit), ec);
        }
        control_fd_ = -1;
        control_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        control_.close(ec);
        logger_.log("session", "disconnected from ", config_.host);
    }

    std::string FtpSession::resolve(const std::string &path) const
    {
        if (path.empty())
        {
            return home_;
        }
        return remote_path::join(home_, path);
    }

    void FtpSession::track_data_socket(asio::ip::tcp::socket &socket) noexcept
    {
        data_fd_ = static_cast<int>(socket.native_handle());
    }

    void FtpSession::release_data_socket() noexcept
    {
        data_fd_ = -1;
    }

} // namespace ftpcmd
