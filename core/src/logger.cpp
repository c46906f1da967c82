#include "ftpcmd/logger.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <iostream>
#include <vector>

namespace ftpcmd
{

    Logger::Logger(const LoggerOptions &options)
    {
        try
        {
            std::vector<spdlog::sink_ptr> sinks;
            if (options.file)
            {
                sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(options.file->string(), false));
            }
            if (options.verbose)
            {
                auto console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
                console->set_level(spdlog::level::debug);
                sinks.push_back(std::move(console));
            }
            if (sinks.empty())
            {
                sinks.push_back(std::make_shared<spdlog::sinks::null_sink_mt>());
            }
            logger_ = std::make_shared<spdlog::logger>("ftpcmd", sinks.begin(), sinks.end());
            logger_->set_pattern("%Y-%m-%d %H:%M:%S [%l] %v");
            logger_->set_level(options.verbose ? spdlog::level::debug : spdlog::level::info);
        }
        catch (const spdlog::spdlog_ex &ex)
        {
            std::cerr << "[warning] logging disabled: " << ex.what() << std::endl;
            logger_.reset();
        }
    }

} // namespace ftpcmd
