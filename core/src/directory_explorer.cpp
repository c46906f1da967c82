#include "ftpcmd/directory_explorer.hpp"

#include <algorithm>
#include <utility>

#include "ftpcmd/error_codes.hpp"
#include "ftpcmd/remote_path.hpp"

namespace ftpcmd
{

    namespace
    {

        struct PendingEntry
        {
            std::string path;
            std::string name;
            EntryKind kind{EntryKind::Unknown};
            std::string prefix;
            bool last{false};
            std::size_t depth{};
        };

        bool is_fatal(const FtpError &error) noexcept
        {
            return error.code() == ErrorCode::ConnectionFailed || error.code() == ErrorCode::Cancelled;
        }

        // Children are pushed in reverse so the stack pops them in display order.
        void push_children(std::vector<PendingEntry> &stack, std::vector<RemoteEntry> children,
                           const std::string &parent, const std::string &prefix, std::size_t depth)
        {
            sort_for_display(children);
            for (auto it = children.rbegin(); it != children.rend(); ++it)
            {
                stack.push_back(PendingEntry{
                    .path = remote_path::join(parent, it->name),
                    .name = it->name,
                    .kind = it->kind,
                    .prefix = prefix,
                    .last = it == children.rbegin(),
                    .depth = depth,
                });
            }
        }

        std::string root_label(const std::string &path)
        {
            if (path.empty() || path.back() == '/')
            {
                return path.empty() ? "/" : path;
            }
            return path + "/";
        }

    } // namespace

    void sort_for_display(std::vector<RemoteEntry> &entries)
    {
        std::stable_sort(entries.begin(), entries.end(), [](const RemoteEntry &a, const RemoteEntry &b)
                         {
                             const bool a_dir = a.kind == EntryKind::Directory;
                             const bool b_dir = b.kind == EntryKind::Directory;
                             if (a_dir != b_dir)
                             {
                                 return !a_dir;
                             }
                             return a.name < b.name; });
    }

    DirectoryExplorer::DirectoryExplorer(Session &session, Logger logger, const CancellationToken *cancel)
        : session_(session), logger_(std::move(logger)), cancel_(cancel) {}

    void DirectoryExplorer::check_cancelled() const
    {
        if (cancel_)
        {
            cancel_->throw_if_cancelled();
        }
    }

    std::vector<RemoteEntry> DirectoryExplorer::list(const std::string &path)
    {
        check_cancelled();
        session_.change_dir(path);
        auto entries = session_.list_current_dir();
        logger_.debug("explore", "listed ", path, ": ", entries.size(), " entries");
        return entries;
    }

    ExploreSummary DirectoryExplorer::tree(const std::string &path, std::ostream &out, std::size_t max_depth)
    {
        ExploreSummary summary;
        auto entries = list(path);
        out << root_label(path) << '\n';
        if (entries.empty())
        {
            out << "(empty)\n";
            return summary;
        }
        if (max_depth == 0)
        {
            out << "└── [depth limit 0 reached]\n";
            ++summary.truncated;
            return summary;
        }

        std::vector<PendingEntry> stack;
        push_children(stack, std::move(entries), path, "", 1);
        while (!stack.empty())
        {
            check_cancelled();
            const auto item = std::move(stack.back());
            stack.pop_back();

            out << item.prefix << (item.last ? "└── " : "├── ") << item.name
                << (item.kind == EntryKind::Directory ? "/" : "") << '\n';
            if (item.kind == EntryKind::Unknown)
            {
                ++summary.ambiguous;
                logger_.warn("explore", "ambiguous entry ", item.path, " shown as a file");
                continue;
            }
            if (item.kind == EntryKind::File)
            {
                ++summary.files;
                continue;
            }

            ++summary.directories;
            const auto child_prefix = item.prefix + (item.last ? "    " : "│   ");
            if (item.depth >= max_depth)
            {
                out << child_prefix << "└── [depth limit " << max_depth << " reached]\n";
                ++summary.truncated;
                logger_.warn("explore", "tree depth limit ", max_depth, " reached at ", item.path);
                continue;
            }

            std::vector<RemoteEntry> children;
            try
            {
                children = list(item.path);
            }
            catch (const FtpError &ex)
            {
                if (is_fatal(ex))
                {
                    throw;
                }
                out << child_prefix << "└── [unreadable: " << to_string(ex.code()) << "]\n";
                ++summary.failed;
                logger_.warn("explore", "cannot list ", item.path, ": ", ex.what());
                continue;
            }
            push_children(stack, std::move(children), item.path, child_prefix, item.depth + 1);
        }
        return summary;
    }

    ExploreSummary DirectoryExplorer::find(const std::string &path, std::ostream &out, std::size_t max_depth)
    {
        ExploreSummary summary;
        auto entries = list(path);
        out << path << '\n';
        if (max_depth == 0)
        {
            if (!entries.empty())
            {
                out << "- [depth limit 0 reached]\n";
                ++summary.truncated;
            }
            return summary;
        }

        std::vector<PendingEntry> stack;
        push_children(stack, std::move(entries), path, "", 1);
        while (!stack.empty())
        {
            check_cancelled();
            const auto item = std::move(stack.back());
            stack.pop_back();

            const std::string marker(item.depth, '-');
            if (item.kind != EntryKind::Directory)
            {
                out << marker << " * " << item.path << '\n';
                if (item.kind == EntryKind::Unknown)
                {
                    ++summary.ambiguous;
                    logger_.warn("explore", "ambiguous entry ", item.path, " shown as a file");
                }
                else
                {
                    ++summary.files;
                }
                continue;
            }

            out << marker << ' ' << item.path << '\n';
            ++summary.directories;
            if (item.depth >= max_depth)
            {
                out << marker << "- [depth limit " << max_depth << " reached]\n";
                ++summary.truncated;
                logger_.warn("explore", "find depth limit ", max_depth, " reached at ", item.path);
                continue;
            }

            std::vector<RemoteEntry> children;
            try
            {
                children = list(item.path);
            }
            catch (const FtpError &ex)
            {
                if (is_fatal(ex))
                {
                    throw;
                }
                out << marker << "- [unreadable: " << to_string(ex.code()) << "]\n";
                ++summary.failed;
                logger_.warn("explore", "cannot list ", item.path, ": ", ex.what());
                continue;
            }
            push_children(stack, std::move(children), item.path, "", item.depth + 1);
        }
        return summary;
    }

} // namespace ftpcmd
