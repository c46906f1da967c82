/**
 * ftpcmd - Value types shared by the session, the engines and the client layer.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace ftpcmd
{

    struct ConnectionConfig
    {
        std::string host;
        std::uint16_t port{21};
        std::string username{"anonymous"};
        std::string password{"anonymous@"};
        std::string encoding{"utf-8"};
        std::chrono::seconds connect_timeout{15};
    };

    enum class EntryKind : std::uint8_t
    {
        File,
        Directory,
        Unknown
    };

    std::string_view to_string(EntryKind kind) noexcept;

    struct RemoteEntry
    {
        std::string name;
        EntryKind kind{EntryKind::Unknown};
        std::optional<std::uint64_t> size{};
    };

    enum class Direction : std::uint8_t
    {
        Upload,
        Download
    };

    std::string_view to_string(Direction direction) noexcept;

    struct TransferTask
    {
        std::filesystem::path local_path;
        std::string remote_path;
        Direction direction{Direction::Upload};
        std::uint64_t resume_offset{};
    };

    struct ProgressSample
    {
        std::uint64_t bytes_transferred{};
        std::optional<std::uint64_t> total_bytes{};
        std::string file_name;
        // Offset the transfer resumed from and time spent since the stream opened;
        // together they give the throughput of this attempt.
        std::uint64_t start_offset{};
        std::chrono::steady_clock::duration elapsed{};
    };

    struct TraversalFrame
    {
        std::string remote_path;
        std::filesystem::path local_path;
        std::size_t depth{};
    };

} // namespace ftpcmd
