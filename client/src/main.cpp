#include <asio/io_context.hpp>
#include <asio/post.hpp>
#include <asio/signal_set.hpp>

#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <mutex>
#include <thread>
#include <utility>

#include "ftpcmd/cancellation.hpp"
#include "ftpcmd/client/command_runner.hpp"
#include "ftpcmd/client/config.hpp"
#include "ftpcmd/crypto.hpp"
#include "ftpcmd/error_codes.hpp"
#include "ftpcmd/ftp_session.hpp"
#include "ftpcmd/logger.hpp"
#include "ftpcmd/version.hpp"

namespace
{

    using namespace ftpcmd;

    // The session the worker is driving, so a signal can unblock its sockets.
    class ActiveSession
    {
    public:
        void publish(Session *session)
        {
            std::lock_guard lock(mutex_);
            session_ = session;
        }

        void interrupt()
        {
            std::lock_guard lock(mutex_);
            if (session_)
            {
                session_->interrupt();
            }
        }

    private:
        std::mutex mutex_;
        Session *session_{nullptr};
    };

    class PublishGuard
    {
    public:
        PublishGuard(ActiveSession &active, Session &session) : active_(active) { active_.publish(&session); }
        ~PublishGuard() { active_.publish(nullptr); }

        PublishGuard(const PublishGuard &) = delete;
        PublishGuard &operator=(const PublishGuard &) = delete;

    private:
        ActiveSession &active_;
    };

    int run_session(client::ClientConfig config, Logger logger, const CancellationToken &cancel,
                    ActiveSession &active)
    {
        try
        {
            auto connection = config.connection;
            crypto::wipe(config.connection.password);
            auto session = FtpSession::create(std::move(connection), logger);
            // Published before the handshake so a signal can abort a stalled login.
            PublishGuard guard(active, *session);
            if (cancel.cancelled())
            {
                return client::kExitCancelled;
            }
            session->open();
            client::CommandRunner runner(std::move(config), *session, logger, cancel, std::cout, std::cerr);
            return runner.run();
        }
        catch (const FtpError &ex)
        {
            if (cancel.cancelled())
            {
                return client::kExitCancelled;
            }
            client::print_error(std::cerr, ex);
            logger.warn("client", "fatal: ", ex.what());
            return client::kExitFailure;
        }
        catch (const std::exception &ex)
        {
            std::cerr << "ERROR: " << ex.what() << std::endl;
            logger.warn("client", "fatal: ", ex.what());
            return client::kExitFailure;
        }
    }

    // Runs the command on a worker thread while this thread waits for SIGINT/SIGTERM.
    int run_with_signals(client::ClientConfig config, Logger logger)
    {
        CancellationToken cancel;
        ActiveSession active;
        asio::io_context signal_context;
        asio::signal_set signals(signal_context, SIGINT, SIGTERM);
        signals.async_wait([&](const std::error_code &ec, int signal_number)
                           {
        if (ec) {
            return;
        }
        logger.warn("client", "signal ", signal_number, " received, cancelling");
        cancel.cancel();
        active.interrupt(); });

        int exit_code = client::kExitFailure;
        std::thread worker([&]
                           {
        exit_code = run_session(std::move(config), logger, cancel, active);
        asio::post(signal_context, [&signals] {
            std::error_code ignored;
            signals.cancel(ignored);
        }); });

        signal_context.run();
        worker.join();
        if (cancel.cancelled())
        {
            std::cerr << "Interrupted" << std::endl;
            return client::kExitCancelled;
        }
        return exit_code;
    }

} // namespace

int main(int argc, char *argv[])
{
    using namespace ftpcmd;

    client::CommandLine cli;
    try
    {
        cli = client::parse_arguments(argc, argv);
    }
    catch (const FtpError &ex)
    {
        client::print_error(std::cerr, ex);
        std::cerr << '\n' << client::usage(argv[0]);
        return client::kExitFailure;
    }
    if (cli.show_help)
    {
        std::cout << client::usage(argv[0]);
        return client::kExitOk;
    }
    if (cli.show_version)
    {
        std::cout << "ftpcmd " << version() << std::endl;
        return client::kExitOk;
    }

    try
    {
        client::FileConfig file;
        if (cli.config_file)
        {
            file = client::load_config_file(*cli.config_file);
        }
        else if (const auto path = client::default_config_path())
        {
            file = client::load_config_file(*path);
        }
        crypto::ensure_sodium_init();
        auto config = client::resolve_config(cli, file);
        Logger logger(LoggerOptions{.file = config.log_path, .verbose = config.verbose});
        logger.log("client", "ftpcmd ", version(), " ", client::to_string(config.mode), " on ",
                   config.connection.host, ':', config.connection.port, " as ", config.connection.username);
        return run_with_signals(std::move(config), std::move(logger));
    }
    catch (const FtpError &ex)
    {
        client::print_error(std::cerr, ex);
        return client::kExitFailure;
    }
    catch (const std::exception &ex)
    {
        std::cerr << "ERROR: " << ex.what() << std::endl;
        return client::kExitFailure;
    }
}
