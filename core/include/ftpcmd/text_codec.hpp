/**
 * ftpcmd - Conversion of path names between UTF-8 and the server's encoding.
 */
#pragma once

#include <memory>
#include <string>
#include <string_view>

namespace ftpcmd
{

    class TextCodec
    {
    public:
        // Throws ConnectionError when iconv does not know the encoding.
        explicit TextCodec(std::string encoding);
        ~TextCodec();

        TextCodec(TextCodec &&) noexcept;
        TextCodec &operator=(TextCodec &&) noexcept;
        TextCodec(const TextCodec &) = delete;
        TextCodec &operator=(const TextCodec &) = delete;

        const std::string &encoding() const noexcept { return encoding_; }
        bool is_utf8() const;

        // Throws ProtocolError on input the target encoding cannot represent.
        std::string to_server(std::string_view utf8) const;
        std::string from_server(std::string_view raw) const;

    private:
        struct Handles;

        std::string encoding_;
        std::unique_ptr<Handles> handles_;
    };

} // namespace ftpcmd
