#include "ftpcmd/reply.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <utility>

#include "ftpcmd/error_codes.hpp"

namespace ftpcmd
{

    namespace
    {

        bool is_digit(char ch)
        {
            return std::isdigit(static_cast<unsigned char>(ch)) != 0;
        }

        std::string trim(std::string_view input)
        {
            const auto begin = input.find_first_not_of(" \t\r\n");
            if (begin == std::string_view::npos)
            {
                return "";
            }
            const auto end = input.find_last_not_of(" \t\r\n");
            return std::string(input.substr(begin, end - begin + 1));
        }

        std::string to_upper(std::string value)
        {
            for (auto &ch : value)
            {
                ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
            }
            return value;
        }

        template <typename T>
        std::optional<T> parse_number(std::string_view text)
        {
            if (text.empty() || !std::all_of(text.begin(), text.end(), is_digit))
            {
                return std::nullopt;
            }
            T value{};
            const auto result = std::from_chars(text.data(), text.data() + text.size(), value);
            if (result.ec != std::errc{} || result.ptr != text.data() + text.size())
            {
                return std::nullopt;
            }
            return value;
        }

        int reply_code_of(std::string_view line)
        {
            if (line.size() < 3 || !is_digit(line[0]) || !is_digit(line[1]) || !is_digit(line[2]))
            {
                return -1;
            }
            return (line[0] - '0') * 100 + (line[1] - '0') * 10 + (line[2] - '0');
        }

    } // namespace

    std::string FtpReply::message() const
    {
        if (lines.empty())
        {
            return "";
        }
        const auto &last = lines.back();
        if (last.size() > 4 && reply_code_of(last) == code)
        {
            return last.substr(4);
        }
        return last;
    }

    std::string FtpReply::text() const
    {
        std::string result;
        for (const auto &line : lines)
        {
            if (!result.empty())
            {
                result += '\n';
            }
            result += line;
        }
        return result;
    }

    std::optional<FtpReply> ReplyAssembler::feed(std::string_view line)
    {
        if (in_multiline_)
        {
            current_.lines.emplace_back(line);
            if (line.size() >= 4 && reply_code_of(line) == current_.code && line[3] == ' ')
            {
                in_multiline_ = false;
                return std::exchange(current_, FtpReply{});
            }
            return std::nullopt;
        }

        const int code = reply_code_of(line);
        if (code < 100 || code > 599)
        {
            throw ProtocolError("malformed reply: " + std::string(line));
        }
        current_ = FtpReply{};
        current_.code = code;
        current_.lines.emplace_back(line);
        if (line.size() > 3 && line[3] == '-')
        {
            in_multiline_ = true;
            return std::nullopt;
        }
        return std::exchange(current_, FtpReply{});
    }

    std::optional<std::uint16_t> parse_epsv_reply(std::string_view text)
    {
        // 229 Entering Extended Passive Mode (|||6446|)
        const auto open = text.find('(');
        const auto close = text.find(')', open == std::string_view::npos ? 0 : open);
        if (open == std::string_view::npos || close == std::string_view::npos || close - open < 6)
        {
            return std::nullopt;
        }
        const auto body = text.substr(open + 1, close - open - 1);
        const char delimiter = body.front();
        if (body.size() < 5 || body[1] != delimiter || body[2] != delimiter || body.back() != delimiter)
        {
            return std::nullopt;
        }
        const auto port = parse_number<unsigned>(body.substr(3, body.size() - 4));
        if (!port || *port == 0 || *port > 65535)
        {
            return std::nullopt;
        }
        return static_cast<std::uint16_t>(*port);
    }

    std::optional<std::uint16_t> parse_pasv_reply(std::string_view text)
    {
        // 227 Entering Passive Mode (h1,h2,h3,h4,p1,p2); some servers omit the parentheses.
        auto begin = text.find('(');
        if (begin == std::string_view::npos)
        {
            if (text.size() < 4)
            {
                return std::nullopt;
            }
            begin = 3;
            while (begin < text.size() && !is_digit(text[begin]))
            {
                ++begin;
            }
            if (begin >= text.size())
            {
                return std::nullopt;
            }
        }
        else
        {
            ++begin;
        }

        std::array<unsigned, 6> fields{};
        std::size_t index = 0;
        std::size_t pos = begin;
        while (index < fields.size())
        {
            auto end = pos;
            while (end < text.size() && is_digit(text[end]))
            {
                ++end;
            }
            const auto value = parse_number<unsigned>(text.substr(pos, end - pos));
            if (!value || *value > 255)
            {
                return std::nullopt;
            }
            fields[index++] = *value;
            if (index < fields.size())
            {
                if (end >= text.size() || text[end] != ',')
                {
                    return std::nullopt;
                }
                pos = end + 1;
            }
        }
        const unsigned port = fields[4] * 256 + fields[5];
        if (port == 0)
        {
            return std::nullopt;
        }
        return static_cast<std::uint16_t>(port);
    }

    std::optional<std::uint64_t> parse_size_reply(const FtpReply &reply)
    {
        if (reply.code != 213)
        {
            return std::nullopt;
        }
        return parse_number<std::uint64_t>(trim(reply.message()));
    }

    std::optional<std::string> parse_pwd_reply(const FtpReply &reply)
    {
        // 257 "/home/user" is the current directory; embedded quotes are doubled.
        if (reply.code != 257)
        {
            return std::nullopt;
        }
        const auto message = reply.message();
        const auto open = message.find('"');
        if (open == std::string::npos)
        {
            return std::nullopt;
        }
        std::string path;
        for (std::size_t i = open + 1; i < message.size(); ++i)
        {
            if (message[i] == '"')
            {
                if (i + 1 < message.size() && message[i + 1] == '"')
                {
                    path += '"';
                    ++i;
                    continue;
                }
                return path;
            }
            path += message[i];
        }
        return std::nullopt;
    }

    std::optional<std::string> parse_hash_reply(const FtpReply &reply)
    {
        // 213 SHA-256 0-49 <hex digest> <filename>
        if (reply.code != 213)
        {
            return std::nullopt;
        }
        const auto message = trim(reply.message());
        std::size_t pos = 0;
        std::vector<std::string> tokens;
        while (pos < message.size() && tokens.size() < 3)
        {
            const auto end = message.find(' ', pos);
            const auto token = message.substr(pos, end == std::string::npos ? std::string::npos : end - pos);
            if (!token.empty())
            {
                tokens.push_back(token);
            }
            if (end == std::string::npos)
            {
                break;
            }
            pos = end + 1;
        }
        if (tokens.size() < 3 || to_upper(tokens[0]) != "SHA-256")
        {
            return std::nullopt;
        }
        std::string digest = tokens[2];
        for (auto &ch : digest)
        {
            ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
        }
        if (digest.size() != 64 || !std::all_of(digest.begin(), digest.end(), [](char ch)
                                                { return std::isxdigit(static_cast<unsigned char>(ch)) != 0; }))
        {
            return std::nullopt;
        }
        return digest;
    }

    std::set<std::string> parse_features(const FtpReply &reply)
    {
        std::set<std::string> features;
        if (reply.code != 211)
        {
            return features;
        }
        for (std::size_t i = 1; i + 1 < reply.lines.size(); ++i)
        {
            const auto line = to_upper(trim(reply.lines[i]));
            if (line.empty())
            {
                continue;
            }
            features.insert(line);
            const auto space = line.find(' ');
            if (space != std::string::npos)
            {
                features.insert(line.substr(0, space));
            }
        }
        return features;
    }

} // namespace ftpcmd
