#include "ftpcmd/progress.hpp"

#include <array>
#include <iomanip>
#include <sstream>

namespace ftpcmd
{

    std::string format_bytes(std::uint64_t bytes)
    {
        static constexpr std::array<const char *, 5> kUnits = {"B", "KiB", "MiB", "GiB", "TiB"};
        if (bytes < 1024)
        {
            return std::to_string(bytes) + " B";
        }
        double value = static_cast<double>(bytes);
        std::size_t unit = 0;
        while (value >= 1024.0 && unit + 1 < kUnits.size())
        {
            value /= 1024.0;
            ++unit;
        }
        std::ostringstream oss;
        oss << std::fixed << std::setprecision(1) << value << ' ' << kUnits[unit];
        return oss.str();
    }

    std::string format_progress(const ProgressSample &sample)
    {
        std::ostringstream oss;
        oss << sample.file_name << ": ";
        if (sample.total_bytes && *sample.total_bytes > 0)
        {
            const double percent =
                100.0 * static_cast<double>(sample.bytes_transferred) / static_cast<double>(*sample.total_bytes);
            oss << std::fixed << std::setprecision(1) << percent << "% (" << sample.bytes_transferred << '/'
                << *sample.total_bytes << " bytes)";
        }
        else
        {
            oss << sample.bytes_transferred << " bytes";
        }

        const auto seconds = std::chrono::duration<double>(sample.elapsed).count();
        if (seconds > 0.0 && sample.bytes_transferred >= sample.start_offset)
        {
            const auto moved = sample.bytes_transferred - sample.start_offset;
            const auto rate = static_cast<std::uint64_t>(static_cast<double>(moved) / seconds);
            oss << ' ' << format_bytes(rate) << "/s";
        }
        return oss.str();
    }

    ProgressReporter::ProgressReporter(std::ostream &out, std::chrono::milliseconds min_interval,
                                       std::uint64_t min_delta)
        : out_(out), min_interval_(min_interval), min_delta_(min_delta) {}

    bool ProgressReporter::should_emit(const ProgressSample &sample, std::chrono::steady_clock::time_point now) const
    {
        if (!line_open_ || sample.file_name != current_file_)
        {
            return true;
        }
        if (sample.total_bytes && sample.bytes_transferred >= *sample.total_bytes)
        {
            return true;
        }
        if (sample.bytes_transferred >= last_bytes_ + min_delta_)
        {
            return true;
        }
        return now - last_emit_ >= min_interval_;
    }

    void ProgressReporter::report(const ProgressSample &sample)
    {
        const auto now = std::chrono::steady_clock::now();
        if (!should_emit(sample, now))
        {
            return;
        }
        if (line_open_ && sample.file_name != current_file_)
        {
            out_ << '\n';
        }
        out_ << '\r' << format_progress(sample) << std::flush;
        current_file_ = sample.file_name;
        last_bytes_ = sample.bytes_transferred;
        last_emit_ = now;
        line_open_ = true;
    }

    void ProgressReporter::finish()
    {
        if (line_open_)
        {
            out_ << std::endl;
            line_open_ = false;
        }
    }

} // namespace ftpcmd
