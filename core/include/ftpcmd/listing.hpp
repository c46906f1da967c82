/**
 * ftpcmd - Directory listing parsers (RFC 3659 MLSD facts and legacy LIST output).
 */
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "ftpcmd/types.hpp"

namespace ftpcmd
{

    enum class ListingFormat : std::uint8_t
    {
        Mlsd,
        List
    };

    // Returns nullopt for lines that carry no entry (".", "..", cdir/pdir, blanks).
    std::optional<RemoteEntry> parse_mlsd_line(std::string_view line);

    // Unix "ls -l" and DOS style lines. Returns nullopt for "total N" headers,
    // "." / ".." and lines too short to hold a name.
    std::optional<RemoteEntry> parse_list_line(std::string_view line);

    std::vector<RemoteEntry> parse_listing(std::string_view body, ListingFormat format);

} // namespace ftpcmd
