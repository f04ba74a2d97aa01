#include "mediaup/client/logger.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <iostream>
#include <vector>

namespace mediaup::client
{

    Logger::Logger(const std::optional<std::filesystem::path> &path, bool echo_stderr)
    {
        try
        {
            std::vector<spdlog::sink_ptr> sinks;
            if (path)
            {
                sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(path->string(), true));
            }
            if (echo_stderr)
            {
                sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
            }
            if (sinks.empty())
            {
                sinks.push_back(std::make_shared<spdlog::sinks::null_sink_mt>());
            }
            logger_ = std::make_shared<spdlog::logger>("client", sinks.begin(), sinks.end());
            logger_->set_pattern("%Y-%m-%d %H:%M:%S.%e [%l] [t%t] %v");
            logger_->set_level(echo_stderr ? spdlog::level::debug : spdlog::level::info);
            logger_->flush_on(spdlog::level::warn);
        }
        catch (const spdlog::spdlog_ex &ex)
        {
            std::cerr << "Logging disabled: " << ex.what() << std::endl;
            logger_.reset();
        }
    }

} // namespace mediaup::client
