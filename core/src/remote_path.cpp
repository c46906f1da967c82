#include "ftpcmd/remote_path.hpp"

#include <filesystem>

namespace ftpcmd::remote_path
{

    std::string normalize(const std::string &path)
    {
        std::filesystem::path p(path);
        p = p.lexically_normal();
        auto result = p.generic_string();
        while (result.size() > 1 && result.back() == '/')
        {
            result.pop_back();
        }
        if (result.empty())
        {
            return ".";
        }
        return result;
    }

    std::string join(const std::string &base, const std::string &relative)
    {
        if (relative.empty() || relative == ".")
        {
            return normalize(base.empty() ? "." : base);
        }
        if (is_absolute(relative) || base.empty())
        {
            return normalize(relative);
        }
        return normalize((std::filesystem::path(base) / relative).generic_string());
    }

    std::string parent(const std::string &path)
    {
        const auto normalized = normalize(path);
        if (normalized == "/" || normalized == ".")
        {
            return normalized == "/" ? "/" : "";
        }
        const auto slash = normalized.find_last_of('/');
        if (slash == std::string::npos)
        {
            return "";
        }
        if (slash == 0)
        {
            return "/";
        }
        return normalized.substr(0, slash);
    }

    std::string filename(const std::string &path)
    {
        const auto normalized = normalize(path);
        if (normalized == "/" || normalized == ".")
        {
            return "";
        }
        const auto slash = normalized.find_last_of('/');
        return slash == std::string::npos ? normalized : normalized.substr(slash + 1);
    }

    std::vector<std::string> split_segments(const std::string &path)
    {
        std::vector<std::string> segments;
        std::size_t pos = 0;
        while (pos <= path.size())
        {
            auto end = path.find('/', pos);
            if (end == std::string::npos)
            {
                end = path.size();
            }
            const auto segment = path.substr(pos, end - pos);
            if (!segment.empty() && segment != ".")
            {
                segments.push_back(segment);
            }
            pos = end + 1;
        }
        return segments;
    }

    bool is_absolute(const std::string &path)
    {
        return !path.empty() && path.front() == '/';
    }

} // namespace ftpcmd::remote_path
