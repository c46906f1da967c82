/**
 * ftpcmd - Control channel reply assembly and parsing of the replies the session
 * interprets (PASV, EPSV, FEAT, SIZE, PWD, HASH).
 */
#pragma once

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace ftpcmd
{

    struct FtpReply
    {
        int code{};
        std::vector<std::string> lines;

        int category() const noexcept { return code / 100; }
        bool preliminary() const noexcept { return category() == 1; }
        bool completed() const noexcept { return category() == 2; }
        bool intermediate() const noexcept { return category() == 3; }

        // Last line without the code prefix; what servers put their message in.
        std::string message() const;
        std::string text() const;
    };

    /**
     * Collects control channel lines (CRLF already stripped) into replies. Single line
     * replies complete immediately; "NNN-" opens a multi-line reply that completes on
     * the first line starting with "NNN ".
     */
    class ReplyAssembler
    {
    public:
        // Throws ProtocolError when a reply does not start with a three digit code.
        std::optional<FtpReply> feed(std::string_view line);

        bool pending() const noexcept { return in_multiline_; }

    private:
        FtpReply current_;
        bool in_multiline_{false};
    };

    std::optional<std::uint16_t> parse_epsv_reply(std::string_view text);

    std::optional<std::uint16_t> parse_pasv_reply(std::string_view text);

    std::optional<std::uint64_t> parse_size_reply(const FtpReply &reply);

    std::optional<std::string> parse_pwd_reply(const FtpReply &reply);

    std::optional<std::string> parse_hash_reply(const FtpReply &reply);

    // Upper-cased feature names. Both the first token ("REST") and the whole
    // feature line ("REST STREAM") are recorded.
    std::set<std::string> parse_features(const FtpReply &reply);

} // namespace ftpcmd
