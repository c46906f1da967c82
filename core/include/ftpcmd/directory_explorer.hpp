/**
 * ftpcmd - Read-only remote introspection: flat listing, indented tree and recursive
 * find. Walks are iterative and bounded by a depth ceiling; a branch past the
 * ceiling is replaced by a visible marker line.
 */
#pragma once

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

#include "ftpcmd/cancellation.hpp"
#include "ftpcmd/logger.hpp"
#include "ftpcmd/session.hpp"
#include "ftpcmd/types.hpp"

namespace ftpcmd
{

    struct ExploreSummary
    {
        std::size_t directories{};
        std::size_t files{};
        std::size_t ambiguous{};
        std::size_t truncated{};
        std::size_t failed{};
    };

    // Files before directories, each group ordered by name.
    void sort_for_display(std::vector<RemoteEntry> &entries);

    class DirectoryExplorer
    {
    public:
        static constexpr std::size_t kDefaultTreeDepth = 10;
        static constexpr std::size_t kDefaultFindDepth = 20;

        DirectoryExplorer(Session &session, Logger logger, const CancellationToken *cancel = nullptr);

        // Throws NotFoundError when path is not a directory.
        std::vector<RemoteEntry> list(const std::string &path);

        ExploreSummary tree(const std::string &path, std::ostream &out, std::size_t max_depth = kDefaultTreeDepth);

        ExploreSummary find(const std::string &path, std::ostream &out, std::size_t max_depth = kDefaultFindDepth);

    private:
        void check_cancelled() const;

        Session &session_;
        Logger logger_;
        const CancellationToken *cancel_;
    };

} // namespace ftpcmd
