#include "ftpcmd/crypto.hpp"

#include <array>
#include <fstream>
#include <mutex>
#include <stdexcept>
#include <vector>

#include <sodium.h>

#include "ftpcmd/error_codes.hpp"

namespace ftpcmd::crypto
{

    namespace
    {

        std::string to_hex(std::span<const unsigned char> data)
        {
            static constexpr char kHexDigits[] = "0123456789abcdef";
            std::string result;
            result.resize(data.size() * 2);
            for (std::size_t i = 0; i < data.size(); ++i)
            {
                const auto byte = data[i];
                result[2 * i] = kHexDigits[(byte >> 4) & 0x0F];
                result[2 * i + 1] = kHexDigits[byte & 0x0F];
            }
            return result;
        }

        std::once_flag &sodium_once_flag()
        {
            static std::once_flag flag;
            return flag;
        }

    } // namespace

    void ensure_sodium_init()
    {
        std::call_once(sodium_once_flag(), []()
                       {
            if (sodium_init() < 0)
            {
                throw std::runtime_error("libsodium initialization failed");
            } });
    }

    std::string sha256_bytes(std::span<const std::byte> data)
    {
        ensure_sodium_init();
        std::array<unsigned char, crypto_hash_sha256_BYTES> digest{};
        crypto_hash_sha256(digest.data(), reinterpret_cast<const unsigned char *>(data.data()), data.size());
        return to_hex(digest);
    }

    std::string sha256_stream(std::istream &input)
    {
        ensure_sodium_init();
        crypto_hash_sha256_state state;
        crypto_hash_sha256_init(&state);

        std::vector<unsigned char> buffer(64 * 1024);
        while (input)
        {
            input.read(reinterpret_cast<char *>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
            const auto read_count = static_cast<std::size_t>(input.gcount());
            if (read_count > 0)
            {
                crypto_hash_sha256_update(&state, buffer.data(), read_count);
            }
        }
        if (input.bad())
        {
            throw FtpError(ErrorCode::LocalIo, "read failed while hashing");
        }

        std::array<unsigned char, crypto_hash_sha256_BYTES> digest{};
        crypto_hash_sha256_final(&state, digest.data());
        return to_hex(digest);
    }

    std::string sha256_file(const std::filesystem::path &path)
    {
        std::ifstream file(path, std::ios::binary);
        if (!file.is_open())
        {
            throw FtpError(ErrorCode::LocalIo, "failed to open file for hashing: " + path.string());
        }
        return sha256_stream(file);
    }

    void wipe(std::string &secret) noexcept
    {
        if (!secret.empty())
        {
            sodium_memzero(secret.data(), secret.size());
        }
        secret.clear();
    }

} // namespace ftpcmd::crypto
