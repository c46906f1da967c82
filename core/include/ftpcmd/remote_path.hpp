/**
 * ftpcmd - POSIX style remote path helpers.
 */
#pragma once

#include <string>
#include <vector>

namespace ftpcmd::remote_path
{

    // Lexically normalized, '/' separated; "." for an empty relative path.
    std::string normalize(const std::string &path);

    std::string join(const std::string &base, const std::string &relative);

    // "/a/b" -> "/a", "/a" -> "/", "a" -> "".
    std::string parent(const std::string &path);

    std::string filename(const std::string &path);

    std::vector<std::string> split_segments(const std::string &path);

    bool is_absolute(const std::string &path);

} // namespace ftpcmd::remote_path
