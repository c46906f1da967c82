/**
 * ftpcmd - Rendering of transfer progress lines.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <ostream>
#include <string>

#include "ftpcmd/types.hpp"

namespace ftpcmd
{

    // "512 B", "1.5 KiB", "3.2 MiB", ...
    std::string format_bytes(std::uint64_t bytes);

    // One line without a trailing newline: a percentage when the total is known,
    // otherwise the raw byte count, followed by the throughput of this attempt.
    std::string format_progress(const ProgressSample &sample);

    /**
     * Writes carriage-return terminated progress lines, at most one per interval unless
     * at least min_delta bytes moved since the previous line. The final sample of a file
     * (bytes == total) is always written.
     */
    class ProgressReporter
    {
    public:
        explicit ProgressReporter(std::ostream &out,
                                  std::chrono::milliseconds min_interval = std::chrono::milliseconds(100),
                                  std::uint64_t min_delta = 4 * 1024 * 1024);

        void report(const ProgressSample &sample);

        // Ends the current line if one was written.
        void finish();

        bool should_emit(const ProgressSample &sample, std::chrono::steady_clock::time_point now) const;

    private:
        std::ostream &out_;
        std::chrono::milliseconds min_interval_;
        std::uint64_t min_delta_;
        std::string current_file_;
        std::uint64_t last_bytes_{};
        std::chrono::steady_clock::time_point last_emit_{};
        bool line_open_{false};
    };

} // namespace ftpcmd
