#pragma once

#include <filesystem>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include <spdlog/logger.h>
#include <spdlog/spdlog.h>

namespace mediaup::client
{

    // Cheap to copy; all copies share one spdlog logger with thread-safe sinks.
    class Logger
    {
    public:
        explicit Logger(const std::optional<std::filesystem::path> &path = std::nullopt, bool echo_stderr = false);

        template <typename... Args>
        void debug(const std::string &tag, Args &&...args) const
        {
            write(spdlog::level::debug, tag, std::forward<Args>(args)...);
        }

        template <typename... Args>
        void info(const std::string &tag, Args &&...args) const
        {
            write(spdlog::level::info, tag, std::forward<Args>(args)...);
        }

        template <typename... Args>
        void warn(const std::string &tag, Args &&...args) const
        {
            write(spdlog::level::warn, tag, std::forward<Args>(args)...);
        }

        template <typename... Args>
        void error(const std::string &tag, Args &&...args) const
        {
            write(spdlog::level::err, tag, std::forward<Args>(args)...);
        }

    private:
        template <typename... Args>
        void write(spdlog::level::level_enum level, const std::string &tag, Args &&...args) const
        {
            if (!logger_ || !logger_->should_log(level))
            {
                return;
            }
            spdlog::fmt_lib::memory_buffer buf;
            (spdlog::fmt_lib::format_to(std::back_inserter(buf), "{}", std::forward<Args>(args)), ...);
            logger_->log(level, "[{}] {}", tag, std::string(buf.data(), buf.size()));
        }

        std::shared_ptr<spdlog::logger> logger_;
    };

} // namespace mediaup::client
