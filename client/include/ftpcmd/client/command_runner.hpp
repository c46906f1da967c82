#pragma once

#include <filesystem>
#include <ostream>
#include <string>

#include "ftpcmd/cancellation.hpp"
#include "ftpcmd/client/config.hpp"
#include "ftpcmd/error_codes.hpp"
#include "ftpcmd/logger.hpp"
#include "ftpcmd/progress.hpp"
#include "ftpcmd/session.hpp"
#include "ftpcmd/transfer_engine.hpp"
#include "ftpcmd/traversal_engine.hpp"

namespace ftpcmd::client
{

    constexpr int kExitOk = 0;
    constexpr int kExitFailure = 1;
    constexpr int kExitPartial = 2;
    constexpr int kExitCancelled = 130;

    void print_error(std::ostream &err, const FtpError &error);

    // Prints the Transferred/Skipped/Failed/Truncated block and one line per issue.
    void print_summary(std::ostream &out, const TraversalSummary &summary);

    /**
     * Executes one resolved put/get/ls/tree/find invocation against an open session
     * and maps the outcome to a process exit code.
     */
    class CommandRunner
    {
    public:
        CommandRunner(ClientConfig config, Session &session, Logger logger, const CancellationToken &cancel,
                      std::ostream &out, std::ostream &err);

        int run();

    private:
        int handle_put();
        int handle_get();
        int handle_ls();
        int handle_tree();
        int handle_find();

        int finish_traversal(const TraversalSummary &summary);
        void print_transfer(const TransferResult &result, const std::string &from, const std::string &to);

        ClientConfig config_;
        Session &session_;
        Logger logger_;
        const CancellationToken &cancel_;
        std::ostream &out_;
        std::ostream &err_;
        ProgressReporter progress_;
        TransferEngine transfers_;
        TraversalEngine traversal_;
        DirectoryExplorer explorer_;
    };

} // namespace ftpcmd::client
