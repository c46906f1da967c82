#include "ftpcmd/client/config.hpp"

#include <charconv>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <limits>

#include <nlohmann/json.hpp>

#include "ftpcmd/error_codes.hpp"
#include "ftpcmd/remote_path.hpp"

namespace ftpcmd::client
{

    namespace
    {

        [[noreturn]] void usage_error(const std::string &message)
        {
            throw FtpError(ErrorCode::InvalidArgument, message);
        }

        std::size_t parse_count(const std::string &option, const std::string &value)
        {
            std::size_t result = 0;
            const auto *first = value.data();
            const auto *last = value.data() + value.size();
            const auto [ptr, ec] = std::from_chars(first, last, result);
            if (ec != std::errc() || ptr != last || value.empty())
            {
                usage_error(option + " expects a non-negative number, got '" + value + "'");
            }
            return result;
        }

        std::uint16_t parse_port(const std::string &option, const std::string &value)
        {
            const auto port = parse_count(option, value);
            if (port == 0 || port > std::numeric_limits<std::uint16_t>::max())
            {
                usage_error(option + " must be between 1 and 65535, got '" + value + "'");
            }
            return static_cast<std::uint16_t>(port);
        }

        bool starts_with_dash(const std::string &value)
        {
            return value.size() > 1 && value.front() == '-';
        }

        template <typename T>
        T pick(const std::optional<T> &cli, const std::optional<T> &file, T fallback)
        {
            if (cli)
            {
                return *cli;
            }
            if (file)
            {
                return *file;
            }
            return fallback;
        }

    } // namespace

    std::string_view to_string(Mode mode) noexcept
    {
        switch (mode)
        {
        case Mode::Put:
            return "put";
        case Mode::Get:
            return "get";
        case Mode::Ls:
            return "ls";
        case Mode::Tree:
            return "tree";
        case Mode::Find:
            return "find";
        }
        return "unknown";
    }

    CommandLine parse_arguments(const std::vector<std::string> &args)
    {
        CommandLine cli;
        std::size_t index = 0;

        auto require_value = [&](const std::string &option) -> std::string
        {
            if (index >= args.size())
            {
                usage_error(option + " requires a value");
            }
            return args[index++];
        };

        auto select_mode = [&](Mode mode)
        {
            if (cli.mode)
            {
                usage_error("--put, --get, --ls, --tree and --find cannot be combined");
            }
            cli.mode = mode;
            if (index < args.size() && !starts_with_dash(args[index]))
            {
                cli.mode_argument = args[index++];
            }
        };

        while (index < args.size())
        {
            const std::string arg = args[index++];
            if (arg == "-p" || arg == "--put")
            {
                select_mode(Mode::Put);
            }
            else if (arg == "-g" || arg == "--get")
            {
                select_mode(Mode::Get);
            }
            else if (arg == "--ls")
            {
                select_mode(Mode::Ls);
            }
            else if (arg == "--tree")
            {
                select_mode(Mode::Tree);
            }
            else if (arg == "--find")
            {
                select_mode(Mode::Find);
            }
            else if (arg == "-l" || arg == "--local")
            {
                cli.local_path = require_value(arg);
            }
            else if (arg == "-r" || arg == "--remote")
            {
                cli.remote_path = require_value(arg);
            }
            else if (arg == "--host")
            {
                cli.host = require_value(arg);
            }
            else if (arg == "--port")
            {
                cli.port = parse_port(arg, require_value(arg));
            }
            else if (arg == "--user")
            {
                cli.username = require_value(arg);
            }
            else if (arg == "--pass")
            {
                cli.password = require_value(arg);
            }
            else if (arg == "--encoding")
            {
                cli.encoding = require_value(arg);
            }
            else if (arg == "--config")
            {
                cli.config_file = std::filesystem::path(require_value(arg));
            }
            else if (arg == "--log")
            {
                cli.log_path = std::filesystem::path(require_value(arg));
            }
            else if (arg == "--max-depth")
            {
                cli.max_depth = parse_count(arg, require_value(arg));
            }
            else if (arg == "--tree-depth")
            {
                cli.tree_depth = parse_count(arg, require_value(arg));
            }
            else if (arg == "--find-depth")
            {
                cli.find_depth = parse_count(arg, require_value(arg));
            }
            else if (arg == "--verbose")
            {
                cli.verbose = true;
            }
            else if (arg == "--verify")
            {
                cli.verify = true;
            }
            else if (arg == "--allow-partial")
            {
                cli.allow_partial = true;
            }
            else if (arg == "-v" || arg == "--version")
            {
                cli.show_version = true;
            }
            else if (arg == "-h" || arg == "--help")
            {
                cli.show_help = true;
            }
            else
            {
                usage_error("unknown argument: " + arg);
            }
        }

        if (cli.show_help || cli.show_version)
        {
            return cli;
        }
        if (!cli.mode)
        {
            usage_error("one of --put, --get, --ls, --tree or --find is required");
        }
        if (*cli.mode == Mode::Put && cli.local_path)
        {
            usage_error("--put takes the local path directly, --local is not allowed");
        }
        if (*cli.mode == Mode::Get && cli.remote_path)
        {
            usage_error("--get takes the remote path directly, --remote is not allowed");
        }
        return cli;
    }

    CommandLine parse_arguments(int argc, char *argv[])
    {
        std::vector<std::string> args;
        for (int i = 1; i < argc; ++i)
        {
            args.emplace_back(argv[i]);
        }
        return parse_arguments(args);
    }

    FileConfig parse_config_text(const std::string &text, const std::string &origin)
    {
        FileConfig config;
        try
        {
            const auto json = nlohmann::json::parse(text);
            if (!json.is_object())
            {
                usage_error("config file " + origin + " must hold a JSON object");
            }
            if (json.contains("FTP_HOST"))
            {
                config.host = json.at("FTP_HOST").get<std::string>();
            }
            if (json.contains("FTP_PORT"))
            {
                const auto &port = json.at("FTP_PORT");
                config.port = port.is_string() ? parse_port("FTP_PORT", port.get<std::string>())
                                               : parse_port("FTP_PORT", std::to_string(port.get<std::uint32_t>()));
            }
            if (json.contains("FTP_USER"))
            {
                config.username = json.at("FTP_USER").get<std::string>();
            }
            if (json.contains("FTP_PASS"))
            {
                config.password = json.at("FTP_PASS").get<std::string>();
            }
            if (json.contains("FTP_PATH"))
            {
                config.base_path = json.at("FTP_PATH").get<std::string>();
            }
            if (json.contains("FTP_ENCODING"))
            {
                config.encoding = json.at("FTP_ENCODING").get<std::string>();
            }
            if (json.contains("FTP_MAX_DEPTH"))
            {
                config.max_depth = json.at("FTP_MAX_DEPTH").get<std::size_t>();
            }
            if (json.contains("FTP_ALLOW_PARTIAL"))
            {
                config.allow_partial = json.at("FTP_ALLOW_PARTIAL").get<bool>();
            }
        }
        catch (const nlohmann::json::exception &ex)
        {
            usage_error("malformed config file " + origin + ": " + ex.what());
        }
        return config;
    }

    FileConfig load_config_file(const std::filesystem::path &path)
    {
        std::ifstream in(path);
        if (!in.is_open())
        {
            usage_error("cannot read config file " + path.string());
        }
        std::ostringstream text;
        text << in.rdbuf();
        return parse_config_text(text.str(), path.string());
    }

    std::optional<std::filesystem::path> default_config_path()
    {
        const char *home = std::getenv("HOME");
        if (!home)
        {
            return std::nullopt;
        }
        auto path = std::filesystem::path(home) / ".ftpcmd" / "config.json";
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec))
        {
            return std::nullopt;
        }
        return path;
    }

    ClientConfig resolve_config(const CommandLine &cli, const FileConfig &file)
    {
        if (!cli.mode)
        {
            usage_error("one of --put, --get, --ls, --tree or --find is required");
        }
        const ConnectionConfig defaults;
        ClientConfig config;
        config.mode = *cli.mode;
        config.connection.host = pick(cli.host, file.host, defaults.host);
        if (config.connection.host.empty())
        {
            usage_error("no FTP host given; use --host or FTP_HOST in the config file");
        }
        config.connection.port = pick(cli.port, file.port, defaults.port);
        config.connection.username = pick(cli.username, file.username, defaults.username);
        config.connection.password = pick(cli.password, file.password, defaults.password);
        config.connection.encoding = pick(cli.encoding, file.encoding, defaults.encoding);

        config.base_path = file.base_path.value_or("/");
        if (config.base_path.empty())
        {
            config.base_path = "/";
        }
        config.max_depth = pick(cli.max_depth, file.max_depth, config.max_depth);
        config.tree_depth = cli.tree_depth.value_or(config.tree_depth);
        config.find_depth = cli.find_depth.value_or(config.find_depth);
        config.allow_partial = cli.allow_partial || file.allow_partial.value_or(false);
        config.verify = cli.verify;
        config.verbose = cli.verbose;
        config.log_path = cli.log_path;

        config.local_path = cli.local_path;
        config.remote_path = cli.remote_path;
        if (cli.mode_argument)
        {
            if (config.mode == Mode::Put)
            {
                config.local_path = cli.mode_argument;
            }
            else
            {
                config.remote_path = cli.mode_argument;
            }
        }
        return config;
    }

    std::string resolve_remote(const ClientConfig &config, const std::optional<std::string> &input)
    {
        if (!input || input->empty())
        {
            return remote_path::normalize(config.base_path);
        }
        if (remote_path::is_absolute(*input))
        {
            return remote_path::normalize(*input);
        }
        return remote_path::join(config.base_path, *input);
    }

    std::string usage(std::string_view program_name)
    {
        std::ostringstream oss;
        oss << "Usage: " << program_name << " (--put [local] | --get [remote] | --ls [remote] | --tree [remote] |"
            << " --find [remote]) [options]\n"
            << "\nModes:\n"
            << "  -p, --put [local]         Upload a file or directory\n"
            << "  -g, --get [remote]        Download a file or directory\n"
            << "  --ls [remote]             List a remote directory\n"
            << "  --tree [remote]           Show a remote directory tree\n"
            << "  --find [remote]           List a remote directory recursively\n"
            << "\nOptions:\n"
            << "  -l, --local <path>        Local path (downloads)\n"
            << "  -r, --remote <path>       Remote path (uploads and listings)\n"
            << "  --host <host>             FTP server\n"
            << "  --port <port>             FTP port (default 21)\n"
            << "  --user <name>             User name (default anonymous)\n"
            << "  --pass <password>         Password\n"
            << "  --encoding <name>         Server path encoding (default utf-8)\n"
            << "  --config <file>           Config file (default ~/.ftpcmd/config.json)\n"
            << "  --log <file>              Append logs to file\n"
            << "  --verbose                 Debug logging to stderr\n"
            << "  --max-depth <n>           Directory transfer depth limit (default 50)\n"
            << "  --tree-depth <n>          Tree depth limit (default 10)\n"
            << "  --find-depth <n>          Find depth limit (default 20)\n"
            << "  --verify                  Compare SHA-256 after each transfer when the server supports HASH\n"
            << "  --allow-partial           Exit 0 even if some files of a directory transfer failed\n"
            << "  -v, --version             Print the version\n"
            << "  -h, --help                Print this help\n";
        return oss.str();
    }

} // namespace ftpcmd::client
