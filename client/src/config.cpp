#include "mediaup/client/config.hpp"

#include <stdexcept>
#include <string>

namespace mediaup::client
{

    namespace
    {

        std::uint32_t read_count(const std::string &option, const char *value, std::uint32_t minimum,
                                 std::uint32_t maximum = 1024)
        {
            std::size_t consumed = 0;
            unsigned long parsed = 0;
            try
            {
                parsed = std::stoul(value, &consumed);
            }
            catch (const std::logic_error &)
            {
                throw std::runtime_error(option + " expects a number, got '" + value + "'");
            }
            if (consumed != std::string(value).size() || parsed < minimum || parsed > maximum)
            {
                throw std::runtime_error(option + " out of range: " + value);
            }
            return static_cast<std::uint32_t>(parsed);
        }

        WatchTarget parse_target(const std::string &arg)
        {
            WatchTarget target;
            const auto eq_pos = arg.find('=');
            target.session_id = arg.substr(0, eq_pos);
            if (target.session_id.empty())
            {
                throw std::runtime_error("Empty session id in '" + arg + "'");
            }
            if (eq_pos != std::string::npos)
            {
                try
                {
                    target.baseline = std::stod(arg.substr(eq_pos + 1));
                }
                catch (const std::logic_error &)
                {
                    throw std::runtime_error("Invalid baseline progress in '" + arg + "'");
                }
            }
            return target;
        }

    } // namespace

    std::string usage()
    {
        return "Usage:\n"
               "  mediaup-client <host>:<port> upload <file>... [--speakers N] [--parallel N] [--retries N]\n"
               "                 [--watch] [--log FILE] [--verbose]\n"
               "  mediaup-client <host>:<port> watch <session[=baseline]>... [--interval SEC] [--log FILE]\n"
               "                 [--verbose]";
    }

    ClientConfig parse_arguments(int argc, char *argv[])
    {
        if (argc < 3)
        {
            throw std::runtime_error(usage());
        }

        ClientConfig config;
        int index = 1;
        const std::string endpoint = argv[index++];
        const auto colon_pos = endpoint.rfind(':');
        if (colon_pos == std::string::npos || colon_pos == 0)
        {
            throw std::runtime_error("Expected endpoint format host:port");
        }
        config.host = endpoint.substr(0, colon_pos);
        config.port = static_cast<std::uint16_t>(read_count("port", endpoint.c_str() + colon_pos + 1, 1, 65535));

        const std::string mode = argv[index++];
        if (mode == "upload")
        {
            config.mode = ClientMode::Upload;
        }
        else if (mode == "watch")
        {
            config.mode = ClientMode::Watch;
        }
        else
        {
            throw std::runtime_error("Unknown command: " + mode);
        }

        while (index < argc)
        {
            const std::string arg = argv[index++];
            auto require_value = [&](const char *what) -> const char *
            {
                if (index >= argc)
                {
                    throw std::runtime_error(arg + " requires " + what);
                }
                return argv[index++];
            };

            if (arg == "--log")
            {
                config.log_path = std::filesystem::path(require_value("a file path"));
            }
            else if (arg == "--verbose")
            {
                config.verbose = true;
            }
            else if (arg == "--speakers")
            {
                config.speaker_count = read_count(arg, require_value("a speaker count"), 1);
            }
            else if (arg == "--parallel")
            {
                config.parallel_parts = read_count(arg, require_value("a part count"), 1);
            }
            else if (arg == "--retries")
            {
                config.max_attempts = read_count(arg, require_value("an attempt count"), 1);
            }
            else if (arg == "--watch")
            {
                config.watch_uploads = true;
            }
            else if (arg == "--interval")
            {
                config.poll_interval = std::chrono::seconds(read_count(arg, require_value("a number of seconds"), 1));
            }
            else if (arg.starts_with("--"))
            {
                throw std::runtime_error("Unknown argument: " + arg);
            }
            else if (config.mode == ClientMode::Upload)
            {
                config.files.emplace_back(arg);
            }
            else
            {
                config.targets.push_back(parse_target(arg));
            }
        }

        if (config.mode == ClientMode::Upload && config.files.empty())
        {
            throw std::runtime_error("upload requires at least one file");
        }
        if (config.mode == ClientMode::Watch && config.targets.empty())
        {
            throw std::runtime_error("watch requires at least one session id");
        }
        return config;
    }

} // namespace mediaup::client
