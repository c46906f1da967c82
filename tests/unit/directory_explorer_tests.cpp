#include <cassert>
#include <sstream>
#include <string>
#include <vector>

#include "deep_chain_session.hpp"
#include "ftpcmd/cancellation.hpp"
#include "ftpcmd/directory_explorer.hpp"
#include "ftpcmd/error_codes.hpp"
#include "memory_session.hpp"

using namespace ftpcmd;
using ftpcmd::testing::DeepChainSession;
using ftpcmd::testing::MemorySession;

namespace
{

    void populate(MemorySession &session)
    {
        session.add_file("/root/b.txt", "bb");
        session.add_file("/root/a.txt", "a");
        session.add_file("/root/docs/guide.md", "guide");
        session.add_file("/root/docs/api/ref.md", "ref");
        session.add_directory("/root/zeta");
        session.add_link("/root/link");
    }

    std::vector<std::string> lines_of(const std::string &text)
    {
        std::vector<std::string> lines;
        std::istringstream in(text);
        std::string line;
        while (std::getline(in, line))
        {
            lines.push_back(line);
        }
        return lines;
    }

    const std::string kExpectedTree = "/root/\n"
                                      "├── a.txt\n"
                                      "├── b.txt\n"
                                      "├── link\n"
                                      "├── docs/\n"
                                      "│   ├── guide.md\n"
                                      "│   └── api/\n"
                                      "│       └── ref.md\n"
                                      "└── zeta/\n";

    void test_list_and_display_order()
    {
        MemorySession session;
        populate(session);
        DirectoryExplorer explorer(session, Logger{});

        auto entries = explorer.list("/root");
        assert(entries.size() == 5);
        sort_for_display(entries);
        assert(entries[0].name == "a.txt");
        assert(entries[1].name == "b.txt");
        assert(entries[2].name == "link");
        assert(entries[2].kind == EntryKind::Unknown);
        assert(entries[3].name == "docs");
        assert(entries[4].name == "zeta");
        assert(entries[1].size == std::optional<std::uint64_t>(2));

        bool missing = false;
        try
        {
            explorer.list("/root/nope");
        }
        catch (const NotFoundError &)
        {
            missing = true;
        }
        assert(missing);
    }

    void test_tree_output()
    {
        MemorySession session;
        populate(session);
        DirectoryExplorer explorer(session, Logger{});

        std::ostringstream out;
        const auto summary = explorer.tree("/root", out);
        assert(out.str() == kExpectedTree);
        assert(summary.directories == 3);
        assert(summary.files == 4);
        assert(summary.ambiguous == 1);
        assert(summary.truncated == 0);
        assert(summary.failed == 0);

        std::ostringstream second;
        explorer.tree("/root", second);
        assert(second.str() == out.str());

        MemorySession legacy;
        legacy.use_list_format();
        populate(legacy);
        DirectoryExplorer legacy_explorer(legacy, Logger{});
        std::ostringstream legacy_out;
        legacy_explorer.tree("/root", legacy_out);
        assert(legacy_out.str() == kExpectedTree);
    }

    void test_tree_markers()
    {
        MemorySession session;
        populate(session);
        DirectoryExplorer explorer(session, Logger{});

        std::ostringstream shallow;
        const auto limited = explorer.tree("/root", shallow, 1);
        assert(shallow.str() == "/root/\n"
                                "├── a.txt\n"
                                "├── b.txt\n"
                                "├── link\n"
                                "├── docs/\n"
                                "│   └── [depth limit 1 reached]\n"
                                "└── zeta/\n"
                                "    └── [depth limit 1 reached]\n");
        assert(limited.truncated == 2);

        std::ostringstream none;
        explorer.tree("/root", none, 0);
        assert(none.str() == "/root/\n└── [depth limit 0 reached]\n");

        std::ostringstream empty;
        explorer.tree("/root/zeta", empty);
        assert(empty.str() == "/root/zeta/\n(empty)\n");

        session.fail_list("/root/docs");
        std::ostringstream unreadable;
        const auto failed = explorer.tree("/root", unreadable);
        assert(failed.failed == 1);
        assert(unreadable.str().find("├── docs/\n│   └── [unreadable: permission_denied]\n└── zeta/\n") !=
               std::string::npos);
    }

    void test_find_output()
    {
        MemorySession session;
        populate(session);
        DirectoryExplorer explorer(session, Logger{});

        std::ostringstream out;
        const auto summary = explorer.find("/root", out);
        assert(out.str() == "/root\n"
                            "- * /root/a.txt\n"
                            "- * /root/b.txt\n"
                            "- * /root/link\n"
                            "- /root/docs\n"
                            "-- * /root/docs/guide.md\n"
                            "-- /root/docs/api\n"
                            "--- * /root/docs/api/ref.md\n"
                            "- /root/zeta\n");
        assert(summary.files == 4);
        assert(summary.ambiguous == 1);
        assert(summary.directories == 3);

        std::ostringstream shallow;
        explorer.find("/root", shallow, 1);
        assert(shallow.str().find("- /root/docs\n-- [depth limit 1 reached]\n") != std::string::npos);
        assert(shallow.str().find("guide.md") == std::string::npos);
    }

    void test_tree_depth_ceiling_on_deep_chain()
    {
        DeepChainSession session(10000);
        DirectoryExplorer explorer(session, Logger{});

        std::ostringstream out;
        const auto summary = explorer.tree("/", out);
        const auto lines = lines_of(out.str());
        assert(lines.size() == 12);
        assert(lines[0] == "/");
        std::string prefix;
        for (std::size_t depth = 1; depth <= DirectoryExplorer::kDefaultTreeDepth; ++depth)
        {
            assert(lines[depth] == prefix + "└── d/");
            prefix += "    ";
        }
        assert(lines[11] == prefix + "└── [depth limit 10 reached]");
        assert(summary.truncated == 1);
        assert(summary.directories == 10);
        assert(session.deepest_listed() == 9);
        assert(session.lists() == 10);
    }

    void test_find_depth_ceiling_on_deep_chain()
    {
        DeepChainSession session(10000);
        DirectoryExplorer explorer(session, Logger{});

        std::ostringstream out;
        const auto summary = explorer.find("/", out);
        const auto lines = lines_of(out.str());
        assert(lines.size() == 22);
        assert(lines[0] == "/");
        std::string path;
        for (std::size_t depth = 1; depth <= DirectoryExplorer::kDefaultFindDepth; ++depth)
        {
            path += "/d";
            assert(lines[depth] == std::string(depth, '-') + " " + path);
        }
        assert(lines[21] == std::string(21, '-') + " [depth limit 20 reached]");
        assert(summary.truncated == 1);
        assert(session.deepest_listed() == 19);
    }

    void test_cancelled_walk()
    {
        MemorySession session;
        populate(session);
        CancellationToken cancel;
        cancel.cancel();
        DirectoryExplorer explorer(session, Logger{}, &cancel);
        std::ostringstream out;
        bool cancelled = false;
        try
        {
            explorer.tree("/root", out);
        }
        catch (const CancelledError &)
        {
            cancelled = true;
        }
        assert(cancelled);
        assert(out.str().empty());
    }

} // namespace

void run_directory_explorer_tests()
{
    test_list_and_display_order();
    test_tree_output();
    test_tree_markers();
    test_find_output();
    test_tree_depth_ceiling_on_deep_chain();
    test_find_depth_ceiling_on_deep_chain();
    test_cancelled_walk();
}
