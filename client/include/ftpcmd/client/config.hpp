#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "ftpcmd/types.hpp"

namespace ftpcmd::client
{

    enum class Mode : std::uint8_t
    {
        Put,
        Get,
        Ls,
        Tree,
        Find
    };

    std::string_view to_string(Mode mode) noexcept;

    // Options exactly as given on the command line; nothing merged yet.
    struct CommandLine
    {
        std::optional<Mode> mode;
        std::optional<std::string> mode_argument;
        std::optional<std::string> local_path;
        std::optional<std::string> remote_path;
        std::optional<std::string> host;
        std::optional<std::uint16_t> port;
        std::optional<std::string> username;
        std::optional<std::string> password;
        std::optional<std::string> encoding;
        std::optional<std::filesystem::path> config_file;
        std::optional<std::filesystem::path> log_path;
        std::optional<std::size_t> max_depth;
        std::optional<std::size_t> tree_depth;
        std::optional<std::size_t> find_depth;
        bool verbose{false};
        bool verify{false};
        bool allow_partial{false};
        bool show_help{false};
        bool show_version{false};
    };

    // Values of the JSON config file (FTP_HOST, FTP_PORT, ...).
    struct FileConfig
    {
        std::optional<std::string> host;
        std::optional<std::uint16_t> port;
        std::optional<std::string> username;
        std::optional<std::string> password;
        std::optional<std::string> base_path;
        std::optional<std::string> encoding;
        std::optional<std::size_t> max_depth;
        std::optional<bool> allow_partial;
    };

    struct ClientConfig
    {
        Mode mode{Mode::Ls};
        ConnectionConfig connection;
        std::string base_path{"/"};
        // Raw user input; a trailing '/' is meaningful for put and get.
        std::optional<std::string> local_path;
        std::optional<std::string> remote_path;
        std::size_t max_depth{50};
        std::size_t tree_depth{10};
        std::size_t find_depth{20};
        bool verify{false};
        bool allow_partial{false};
        bool verbose{false};
        std::optional<std::filesystem::path> log_path;
    };

    // Throws FtpError(InvalidArgument) on unknown options, missing values, conflicting
    // modes and the --put/--local, --get/--remote combinations.
    CommandLine parse_arguments(const std::vector<std::string> &args);
    CommandLine parse_arguments(int argc, char *argv[]);

    FileConfig parse_config_text(const std::string &text, const std::string &origin);

    // Throws FtpError(InvalidArgument) naming the file when it cannot be read or parsed.
    FileConfig load_config_file(const std::filesystem::path &path);

    // $HOME/.ftpcmd/config.json when it exists.
    std::optional<std::filesystem::path> default_config_path();

    // CLI > file > defaults. Throws FtpError(InvalidArgument) when no host is left.
    ClientConfig resolve_config(const CommandLine &cli, const FileConfig &file);

    // Joins a relative remote path to the base path; absolute paths pass through.
    std::string resolve_remote(const ClientConfig &config, const std::optional<std::string> &input);

    std::string usage(std::string_view program_name);

} // namespace ftpcmd::client
