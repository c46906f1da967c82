#include "ftpcmd/types.hpp"

namespace ftpcmd
{

    std::string_view to_string(EntryKind kind) noexcept
    {
        switch (kind)
        {
        case EntryKind::File:
            return "file";
        case EntryKind::Directory:
            return "directory";
        case EntryKind::Unknown:
            return "unknown";
        }
        return "unknown";
    }

    std::string_view to_string(Direction direction) noexcept
    {
        switch (direction)
        {
        case Direction::Upload:
            return "upload";
        case Direction::Download:
            return "download";
        }
        return "unknown";
    }

} // namespace ftpcmd
