#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>

#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <span>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "ftpcmd/error_codes.hpp"
#include "ftpcmd/ftp_session.hpp"
#include "ftpcmd/transfer_engine.hpp"
#include "loopback_ftp_server.hpp"

using namespace ftpcmd;
using ftpcmd::testing::LoopbackFtpServer;
using ftpcmd::testing::LoopbackOptions;

namespace
{

    std::filesystem::path fresh_dir(const std::string &name)
    {
        const auto path = std::filesystem::temp_directory_path() / name;
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
        std::filesystem::create_directories(path);
        return path;
    }

    void write_file(const std::filesystem::path &path, const std::string &content)
    {
        std::filesystem::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out << content;
    }

    std::string read_file(const std::filesystem::path &path)
    {
        std::ifstream in(path, std::ios::binary);
        std::ostringstream text;
        text << in.rdbuf();
        return text.str();
    }

    std::string make_content(std::size_t size)
    {
        std::string content;
        content.reserve(size);
        for (std::size_t i = 0; i < size; ++i)
        {
            content.push_back(static_cast<char>(i * 7 % 251));
        }
        return content;
    }

    ConnectionConfig config_for(const LoopbackFtpServer &server)
    {
        ConnectionConfig config;
        config.host = "127.0.0.1";
        config.port = server.port();
        config.username = "tester";
        config.password = "secret";
        config.connect_timeout = std::chrono::seconds(5);
        return config;
    }

    const RemoteEntry *find_entry(const std::vector<RemoteEntry> &entries, const std::string &name)
    {
        for (const auto &entry : entries)
        {
            if (entry.name == name)
            {
                return &entry;
            }
        }
        return nullptr;
    }

    void test_handshake_and_queries()
    {
        const auto root = fresh_dir("ftpcmd_session_basic");
        write_file(root / "pub" / "a.txt", "hello");
        std::filesystem::create_directories(root / "pub" / "sub");
        LoopbackFtpServer server(root);

        auto session = FtpSession::connect(config_for(server), Logger{});
        assert(session->home_directory() == "/");
        assert(session->has_feature("MLST"));
        assert(session->has_feature("epsv"));
        assert(session->remote_size("/pub/a.txt") == 5);
        assert(session->remote_size("pub/a.txt") == 5);

        bool missing = false;
        try
        {
            session->remote_size("/pub/none.txt");
        }
        catch (const NotFoundError &ex)
        {
            missing = ex.reply_code() == 550;
        }
        assert(missing);

        bool no_dir = false;
        try
        {
            session->change_dir("/nope");
        }
        catch (const NotFoundError &)
        {
            no_dir = true;
        }
        assert(no_dir);

        session->change_dir("/pub");
        const auto entries = session->list_current_dir();
        assert(entries.size() == 2);
        const auto *file = find_entry(entries, "a.txt");
        assert(file && file->kind == EntryKind::File && file->size == std::optional<std::uint64_t>(5));
        const auto *dir = find_entry(entries, "sub");
        assert(dir && dir->kind == EntryKind::Directory);

        session->close();
        session.reset();
        std::filesystem::remove_all(root);
    }

    void test_connection_failures()
    {
        const auto root = fresh_dir("ftpcmd_session_failures");
        {
            LoopbackFtpServer server(root);
            auto config = config_for(server);
            config.password = "wrong";
            bool rejected = false;
            try
            {
                FtpSession::connect(config, Logger{});
            }
            catch (const ConnectionError &ex)
            {
                rejected = ex.reply_code() == 530;
            }
            assert(rejected);

            config = config_for(server);
            config.encoding = "no-such-encoding";
            bool bad_encoding = false;
            try
            {
                FtpSession::connect(config, Logger{});
            }
            catch (const ConnectionError &)
            {
                bad_encoding = true;
            }
            assert(bad_encoding);

            config.encoding = "utf-8";
            config.host.clear();
            bool no_host = false;
            try
            {
                FtpSession::connect(config, Logger{});
            }
            catch (const ConnectionError &)
            {
                no_host = true;
            }
            assert(no_host);
        }

        std::uint16_t closed_port = 0;
        {
            asio::io_context context;
            asio::ip::tcp::acceptor probe(context, asio::ip::tcp::endpoint(asio::ip::address_v4::loopback(), 0));
            closed_port = probe.local_endpoint().port();
        }
        ConnectionConfig refused;
        refused.host = "127.0.0.1";
        refused.port = closed_port;
        bool unreachable = false;
        try
        {
            FtpSession::connect(refused, Logger{});
        }
        catch (const ConnectionError &)
        {
            unreachable = true;
        }
        assert(unreachable);

        std::filesystem::remove_all(root);
    }

    void test_round_trip_with_verification()
    {
        const auto root = fresh_dir("ftpcmd_session_roundtrip");
        const auto local = fresh_dir("ftpcmd_session_roundtrip_local");
        const auto content = make_content(300000);
        write_file(local / "big.bin", content);
        LoopbackFtpServer server(root);

        auto session = FtpSession::connect(config_for(server), Logger{});
        session->ensure_remote_dir("/up/deep");
        assert(std::filesystem::is_directory(root / "up" / "deep"));
        session->ensure_remote_dir("/up/deep");

        TransferEngine engine(*session, Logger{}, TransferOptions{.verify = true});
        const auto upload = engine.upload(local / "big.bin", "/up/deep/big.bin");
        assert(upload.outcome == TransferOutcome::Transferred);
        assert(upload.bytes_transferred == content.size());
        assert(upload.verified == std::optional<bool>(true));
        assert(read_file(root / "up" / "deep" / "big.bin") == content);

        const auto download = engine.download("/up/deep/big.bin", local / "copy" / "big.bin");
        assert(download.bytes_transferred == content.size());
        assert(download.verified == std::optional<bool>(true));
        assert(read_file(local / "copy" / "big.bin") == content);

        assert(engine.upload(local / "big.bin", "/up/deep/big.bin").outcome == TransferOutcome::Skipped);
        assert(engine.download("/up/deep/big.bin", local / "copy" / "big.bin").outcome == TransferOutcome::Skipped);

        session.reset();
        std::filesystem::remove_all(root);
        std::filesystem::remove_all(local);
    }

    void test_resume_over_the_wire()
    {
        const auto root = fresh_dir("ftpcmd_session_resume");
        const auto local = fresh_dir("ftpcmd_session_resume_local");
        const auto content = make_content(50000);
        write_file(local / "r.bin", content);
        write_file(root / "r.bin", content.substr(0, 12345));
        write_file(root / "s.bin", content);
        write_file(local / "s.bin", content.substr(0, 777));
        LoopbackFtpServer server(root);

        auto session = FtpSession::connect(config_for(server), Logger{});
        TransferEngine engine(*session, Logger{});

        const auto upload = engine.upload(local / "r.bin", "/r.bin");
        assert(upload.resume_offset == 12345);
        assert(upload.bytes_transferred == content.size() - 12345);
        assert(read_file(root / "r.bin") == content);

        const auto download = engine.download("/s.bin", local / "s.bin");
        assert(download.resume_offset == 777);
        assert(download.bytes_transferred == content.size() - 777);
        assert(read_file(local / "s.bin") == content);

        session.reset();
        std::filesystem::remove_all(root);
        std::filesystem::remove_all(local);
    }

    void test_abandoned_upload_keeps_partial_data()
    {
        const auto root = fresh_dir("ftpcmd_session_abandon");
        LoopbackFtpServer server(root);
        auto session = FtpSession::connect(config_for(server), Logger{});

        const auto content = make_content(5000);
        {
            auto sink = session->open_upload_stream("/part.bin", 0);
            sink->write(std::as_bytes(std::span(content.data(), content.size())));
        }
        // The next command first collects the reply of the aborted transfer.
        assert(session->remote_size("/part.bin") == 5000);
        assert(read_file(root / "part.bin") == content);

        session.reset();
        std::filesystem::remove_all(root);
    }

    void test_refused_operations()
    {
        const auto root = fresh_dir("ftpcmd_session_refused");
        write_file(root / "blocker", "file in the way");
        LoopbackFtpServer server(root);
        auto session = FtpSession::connect(config_for(server), Logger{});

        bool mkdir_refused = false;
        try
        {
            session->ensure_remote_dir("/blocker/sub");
        }
        catch (const PermissionError &)
        {
            mkdir_refused = true;
        }
        assert(mkdir_refused);

        bool store_refused = false;
        try
        {
            session->open_upload_stream("/nodir/x.bin", 0);
        }
        catch (const PermissionError &ex)
        {
            store_refused = ex.reply_code() == 553;
        }
        assert(store_refused);

        bool retrieve_missing = false;
        try
        {
            session->open_download_stream("/none.bin", 0);
        }
        catch (const NotFoundError &)
        {
            retrieve_missing = true;
        }
        assert(retrieve_missing);

        // The control connection is still usable afterwards.
        assert(session->remote_size("/blocker") == 15);

        session.reset();
        std::filesystem::remove_all(root);
    }

    void test_legacy_server_fallbacks()
    {
        const auto root = fresh_dir("ftpcmd_session_legacy");
        write_file(root / "dir" / "f.txt", "12345");
        std::filesystem::create_directories(root / "dir" / "nested");
        LoopbackFtpServer server(root, LoopbackOptions{.mlsd = false, .epsv = false, .hash = false});

        auto session = FtpSession::connect(config_for(server), Logger{});
        session->change_dir("/dir");
        const auto entries = session->list_current_dir();
        assert(entries.size() == 2);
        const auto *file = find_entry(entries, "f.txt");
        assert(file && file->kind == EntryKind::File && file->size == std::optional<std::uint64_t>(5));
        const auto *dir = find_entry(entries, "nested");
        assert(dir && dir->kind == EntryKind::Directory);

        // LIST is used from now on without asking for MLSD again.
        assert(session->list_current_dir().size() == 2);

        assert(!session->remote_hash("/dir/f.txt"));

        const auto local = fresh_dir("ftpcmd_session_legacy_local");
        TransferEngine engine(*session, Logger{}, TransferOptions{.verify = true});
        const auto result = engine.download("/dir/f.txt", local / "f.txt");
        assert(result.bytes_transferred == 5);
        assert(!result.verified);
        assert(read_file(local / "f.txt") == "12345");

        session.reset();
        std::filesystem::remove_all(root);
        std::filesystem::remove_all(local);
    }

    void test_server_path_encoding()
    {
        const auto root = fresh_dir("ftpcmd_session_latin1");
        const auto local = fresh_dir("ftpcmd_session_latin1_local");
        write_file(local / "payload.txt", "bonjour");
        LoopbackFtpServer server(root);

        auto config = config_for(server);
        config.encoding = "ISO-8859-1";
        auto session = FtpSession::connect(config, Logger{});
        TransferEngine engine(*session, Logger{});

        const std::string utf8_name = "caf\xC3\xA9.txt";
        engine.upload(local / "payload.txt", "/" + utf8_name);
        assert(std::filesystem::exists(root / "caf\xE9.txt"));

        session->change_dir("/");
        const auto entries = session->list_current_dir();
        assert(find_entry(entries, utf8_name));

        session.reset();
        std::filesystem::remove_all(root);
        std::filesystem::remove_all(local);
    }

    void test_silent_server_times_out()
    {
        const auto root = fresh_dir("ftpcmd_session_silent");
        LoopbackFtpServer server(root, LoopbackOptions{.greet = false});
        auto config = config_for(server);
        config.connect_timeout = std::chrono::seconds(1);

        const auto started = std::chrono::steady_clock::now();
        bool timed_out = false;
        try
        {
            FtpSession::connect(config, Logger{});
        }
        catch (const ConnectionError &ex)
        {
            timed_out = std::string(ex.what()).find("timed out") != std::string::npos;
        }
        assert(timed_out);
        assert(std::chrono::steady_clock::now() - started < std::chrono::seconds(4));

        std::filesystem::remove_all(root);
    }

    void test_interrupt_during_handshake()
    {
        const auto root = fresh_dir("ftpcmd_session_handshake_interrupt");
        LoopbackFtpServer server(root, LoopbackOptions{.greet = false});
        auto config = config_for(server);
        config.connect_timeout = std::chrono::seconds(30);

        auto session = FtpSession::create(config, Logger{});
        std::atomic<bool> cancelled{false};
        const auto started = std::chrono::steady_clock::now();
        std::thread worker([&]
                           {
            try
            {
                session->open();
            }
            catch (const CancelledError &)
            {
                cancelled = true;
            } });
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        session->interrupt();
        worker.join();
        assert(cancelled);
        assert(std::chrono::steady_clock::now() - started < std::chrono::seconds(5));

        session.reset();
        std::filesystem::remove_all(root);
    }

    void test_interrupt_during_download_keeps_partial_file()
    {
        const auto root = fresh_dir("ftpcmd_session_download_interrupt");
        const auto local = fresh_dir("ftpcmd_session_download_interrupt_local");
        const auto content = make_content(16 * 1024 * 1024);
        write_file(root / "large.bin", content);
        LoopbackFtpServer server(root);
        const auto target = local / "large.bin";

        {
            auto session = FtpSession::connect(config_for(server), Logger{});
            std::atomic<bool> streaming{false};
            std::atomic<bool> released{false};
            std::atomic<bool> cancelled{false};
            TransferEngine engine(*session, Logger{}, TransferOptions{},
                                  [&](const ProgressSample &)
                                  {
                                      streaming = true;
                                      while (!released)
                                      {
                                          std::this_thread::sleep_for(std::chrono::milliseconds(5));
                                      }
                                  });
            std::thread worker([&]
                               {
                try
                {
                    engine.download("/large.bin", target);
                }
                catch (const CancelledError &)
                {
                    cancelled = true;
                } });

            const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
            while (!streaming && std::chrono::steady_clock::now() < deadline)
            {
                std::this_thread::sleep_for(std::chrono::milliseconds(5));
            }
            assert(streaming);
            const auto interrupted_at = std::chrono::steady_clock::now();
            session->interrupt();
            released = true;
            worker.join();
            assert(cancelled);
            assert(std::chrono::steady_clock::now() - interrupted_at < std::chrono::seconds(5));
        }

        const auto partial = std::filesystem::file_size(target);
        assert(partial > 0 && partial < content.size());
        assert(read_file(target) == content.substr(0, partial));

        auto session = FtpSession::connect(config_for(server), Logger{});
        TransferEngine engine(*session, Logger{});
        const auto resumed = engine.download("/large.bin", target);
        assert(resumed.resume_offset == partial);
        assert(resumed.bytes_transferred == content.size() - partial);
        assert(read_file(target) == content);

        session.reset();
        std::filesystem::remove_all(root);
        std::filesystem::remove_all(local);
    }

    void test_password_is_masked_in_logs()
    {
        const auto root = fresh_dir("ftpcmd_session_logging");
        const auto log_path = root / "session.log";
        std::filesystem::create_directories(root / "served");
        {
            LoopbackFtpServer server(root / "served");
            Logger logger(LoggerOptions{.file = log_path, .verbose = true});
            auto session = FtpSession::connect(config_for(server), logger);
            session.reset();
        }
        const auto log = read_file(log_path);
        assert(log.find("> USER tester") != std::string::npos);
        assert(log.find("> PASS ****") != std::string::npos);
        assert(log.find("secret") == std::string::npos);

        std::filesystem::remove_all(root);
    }

} // namespace

void run_ftp_session_tests()
{
    test_handshake_and_queries();
    test_connection_failures();
    test_round_trip_with_verification();
    test_resume_over_the_wire();
    test_abandoned_upload_keeps_partial_data();
    test_refused_operations();
    test_legacy_server_fallbacks();
    test_server_path_encoding();
    test_password_is_masked_in_logs();
    test_silent_server_times_out();
    test_interrupt_during_handshake();
    test_interrupt_during_download_keeps_partial_file();
}
