#include "ftpcmd/listing.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace ftpcmd
{

    namespace
    {

        bool is_digit(char ch)
        {
            return std::isdigit(static_cast<unsigned char>(ch)) != 0;
        }

        bool equals_no_case(std::string_view lhs, std::string_view rhs)
        {
            return lhs.size() == rhs.size() &&
                   std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b)
                              { return std::tolower(static_cast<unsigned char>(a)) ==
                                       std::tolower(static_cast<unsigned char>(b)); });
        }

        bool starts_with_no_case(std::string_view value, std::string_view prefix)
        {
            return value.size() >= prefix.size() && equals_no_case(value.substr(0, prefix.size()), prefix);
        }

        std::optional<std::uint64_t> parse_size(std::string_view text)
        {
            if (text.empty() || !std::all_of(text.begin(), text.end(), is_digit))
            {
                return std::nullopt;
            }
            std::uint64_t value{};
            const auto result = std::from_chars(text.data(), text.data() + text.size(), value);
            if (result.ec != std::errc{})
            {
                return std::nullopt;
            }
            return value;
        }

        struct Token
        {
            std::string_view text;
            std::size_t offset{};
        };

        std::vector<Token> tokenize(std::string_view line)
        {
            std::vector<Token> tokens;
            std::size_t pos = 0;
            while (pos < line.size())
            {
                while (pos < line.size() && std::isspace(static_cast<unsigned char>(line[pos])))
                {
                    ++pos;
                }
                if (pos >= line.size())
                {
                    break;
                }
                const auto begin = pos;
                while (pos < line.size() && !std::isspace(static_cast<unsigned char>(line[pos])))
                {
                    ++pos;
                }
                tokens.push_back(Token{.text = line.substr(begin, pos - begin), .offset = begin});
            }
            return tokens;
        }

        std::string_view strip_line_end(std::string_view line)
        {
            while (!line.empty() && (line.back() == '\r' || line.back() == '\n'))
            {
                line.remove_suffix(1);
            }
            return line;
        }

        bool is_dot_entry(std::string_view name)
        {
            return name == "." || name == "..";
        }

        // MM-DD-YY or MM-DD-YYYY as printed by IIS.
        bool looks_like_dos_date(std::string_view token)
        {
            if (token.size() != 8 && token.size() != 10)
            {
                return false;
            }
            for (std::size_t i = 0; i < token.size(); ++i)
            {
                const bool separator = i == 2 || i == 5;
                if (separator ? (token[i] != '-' && token[i] != '/') : !is_digit(token[i]))
                {
                    return false;
                }
            }
            return true;
        }

        std::optional<RemoteEntry> parse_dos_line(std::string_view line, const std::vector<Token> &tokens)
        {
            if (tokens.size() < 4)
            {
                return std::nullopt;
            }
            RemoteEntry entry;
            entry.name = std::string(line.substr(tokens[3].offset));
            if (equals_no_case(tokens[2].text, "<DIR>"))
            {
                entry.kind = EntryKind::Directory;
            }
            else if (auto size = parse_size(tokens[2].text))
            {
                entry.kind = EntryKind::File;
                entry.size = size;
            }
            return entry;
        }

        std::optional<RemoteEntry> parse_unix_line(std::string_view line, const std::vector<Token> &tokens)
        {
            RemoteEntry entry;
            if (tokens.size() >= 9)
            {
                entry.name = std::string(line.substr(tokens[8].offset));
            }
            else
            {
                entry.name = std::string(tokens.back().text);
            }
            if (tokens.size() >= 5)
            {
                entry.size = parse_size(tokens[4].text);
            }

            switch (tokens[0].text.front())
            {
            case 'd':
                entry.kind = EntryKind::Directory;
                entry.size.reset();
                break;
            case '-':
                entry.kind = EntryKind::File;
                break;
            case 'l':
            {
                const auto arrow = entry.name.find(" -> ");
                if (arrow != std::string::npos)
                {
                    entry.name.erase(arrow);
                }
                entry.kind = EntryKind::Unknown;
                break;
            }
            default:
                entry.kind = EntryKind::Unknown;
                break;
            }
            return entry;
        }

    } // namespace

    std::optional<RemoteEntry> parse_mlsd_line(std::string_view raw_line)
    {
        auto line = strip_line_end(raw_line);
        if (!line.empty() && line.front() == ' ')
        {
            line.remove_prefix(1);
        }
        const auto blank = line.find(' ');
        if (line.empty() || blank == std::string_view::npos || blank + 1 >= line.size())
        {
            return std::nullopt;
        }

        const auto facts = line.substr(0, blank);
        RemoteEntry entry;
        entry.name = std::string(line.substr(blank + 1));

        std::string_view type;
        std::string_view size;
        std::size_t pos = 0;
        while (pos < facts.size())
        {
            const auto end = facts.find(';', pos);
            const auto fact = facts.substr(pos, end == std::string_view::npos ? std::string_view::npos : end - pos);
            if (starts_with_no_case(fact, "type="))
            {
                type = fact.substr(5);
            }
            else if (starts_with_no_case(fact, "size="))
            {
                size = fact.substr(5);
            }
            if (end == std::string_view::npos)
            {
                break;
            }
            pos = end + 1;
        }

        if (equals_no_case(type, "cdir") || equals_no_case(type, "pdir") || is_dot_entry(entry.name))
        {
            return std::nullopt;
        }
        if (equals_no_case(type, "dir"))
        {
            entry.kind = EntryKind::Directory;
        }
        else if (equals_no_case(type, "file"))
        {
            entry.kind = EntryKind::File;
            entry.size = parse_size(size);
        }
        else
        {
            entry.kind = EntryKind::Unknown;
            entry.size = parse_size(size);
        }
        return entry;
    }

    std::optional<RemoteEntry> parse_list_line(std::string_view raw_line)
    {
        const auto line = strip_line_end(raw_line);
        const auto tokens = tokenize(line);
        if (tokens.size() < 3)
        {
            return std::nullopt;
        }

        auto entry = looks_like_dos_date(tokens[0].text) ? parse_dos_line(line, tokens) : parse_unix_line(line, tokens);
        if (!entry || entry->name.empty())
        {
            return std::nullopt;
        }
        if (entry->name.size() > 1 && entry->name.back() == '/')
        {
            entry->name.pop_back();
            entry->kind = EntryKind::Directory;
        }
        if (is_dot_entry(entry->name))
        {
            return std::nullopt;
        }
        return entry;
    }

    std::vector<RemoteEntry> parse_listing(std::string_view body, ListingFormat format)
    {
        std::vector<RemoteEntry> entries;
        std::size_t pos = 0;
        while (pos < body.size())
        {
            auto end = body.find('\n', pos);
            if (end == std::string_view::npos)
            {
                end = body.size();
            }
            const auto line = body.substr(pos, end - pos);
            auto entry = format == ListingFormat::Mlsd ? parse_mlsd_line(line) : parse_list_line(line);
            if (entry)
            {
                entries.push_back(std::move(*entry));
            }
            pos = end + 1;
        }
        return entries;
    }

} // namespace ftpcmd
