/**
 * ftpcmd - SHA-256 digests and secret wiping built on libsodium.
 */
#pragma once

#include <cstddef>
#include <filesystem>
#include <istream>
#include <span>
#include <string>

namespace ftpcmd::crypto
{

    void ensure_sodium_init();

    // Lower-case hex, the form the FTP HASH extension replies with.
    std::string sha256_bytes(std::span<const std::byte> data);

    std::string sha256_stream(std::istream &input);

    std::string sha256_file(const std::filesystem::path &path);

    // Overwrites the buffer with zeros before releasing it.
    void wipe(std::string &secret) noexcept;

} // namespace ftpcmd::crypto
