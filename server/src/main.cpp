#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "mediaup/server/gateway.hpp"
#include "mediaup/version.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace
{

    using mediaup::server::GatewayConfig;

    void print_usage(const char *program_name)
    {
        std::cout << "MediaUp gateway " << mediaup::version() << "\n"
                  << "Usage: " << program_name << " --port <PORT> --root <DIR> [options]\n"
                  << "  --address <ADDR>            listen address (default 0.0.0.0)\n"
                  << "  --threads <N>               I/O threads (default: one per core)\n"
                  << "  --idle-timeout <SECONDS>    reap upload sessions idle this long (default 3600)\n"
                  << "  --progress-ttl <SECONDS>    keep progress records this long (default 3600)\n"
                  << "  --sweep-interval <SECONDS>  time between maintenance sweeps (default 60)\n"
                  << "  --max-file-size <BYTES>     refuse larger uploads (default 5 GiB)\n"
                  << "  --log <FILE>                also log to FILE\n";
    }

    std::chrono::seconds parse_seconds(const std::string &value)
    {
        const auto seconds = std::stoll(value);
        if (seconds < 0)
        {
            throw std::out_of_range("negative duration " + value);
        }
        return std::chrono::seconds{seconds};
    }

    using OptionSetter = std::function<void(GatewayConfig &, const std::string &)>;

    const std::map<std::string, OptionSetter> &option_table()
    {
        static const std::map<std::string, OptionSetter> options{
            {"--port", [](GatewayConfig &config, const std::string &value)
             {
                 const auto port = std::stoi(value);
                 if (port < 1 || port > 65535)
                 {
                     throw std::out_of_range("port " + value);
                 }
                 config.listen_port = static_cast<std::uint16_t>(port);
             }},
            {"--root", [](GatewayConfig &config, const std::string &value)
             { config.storage_root = value; }},
            {"--address", [](GatewayConfig &config, const std::string &value)
             { config.listen_address = value; }},
            {"--threads", [](GatewayConfig &config, const std::string &value)
             { config.io_threads = static_cast<std::size_t>(std::stoul(value)); }},
            {"--idle-timeout", [](GatewayConfig &config, const std::string &value)
             { config.idle_timeout = parse_seconds(value); }},
            {"--progress-ttl", [](GatewayConfig &config, const std::string &value)
             { config.progress_ttl = parse_seconds(value); }},
            {"--sweep-interval", [](GatewayConfig &config, const std::string &value)
             {
                 config.maintenance_interval = parse_seconds(value);
                 if (config.maintenance_interval.count() == 0)
                 {
                     throw std::out_of_range("sweep interval must be positive");
                 }
             }},
            {"--max-file-size", [](GatewayConfig &config, const std::string &value)
             {
                 const auto bytes = std::stoull(value);
                 if (bytes == 0 || value.front() == '-')
                 {
                     throw std::out_of_range("max file size must be positive");
                 }
                 config.max_file_size = bytes;
             }},
            {"--log", [](GatewayConfig &config, const std::string &value)
             { config.log_file = std::filesystem::path(value); }},
        };
        return options;
    }

    void install_logger(const GatewayConfig &config)
    {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        if (config.log_file)
        {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.log_file->string(), true));
        }
        auto logger = std::make_shared<spdlog::logger>("gateway", sinks.begin(), sinks.end());
        logger->set_level(spdlog::level::info);
        logger->set_pattern("%Y-%m-%d %H:%M:%S [%^%l%$] %v");
        spdlog::set_default_logger(logger);
    }

} // namespace

int main(int argc, char *argv[])
{
    GatewayConfig config;

    for (int i = 1; i < argc; ++i)
    {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h")
        {
            print_usage(argv[0]);
            return EXIT_SUCCESS;
        }
        const auto &options = option_table();
        const auto option = options.find(arg);
        if (option == options.end())
        {
            std::cerr << "Unknown argument: " << arg << std::endl;
            print_usage(argv[0]);
            return EXIT_FAILURE;
        }
        if (i + 1 >= argc)
        {
            std::cerr << "Missing value for " << arg << std::endl;
            print_usage(argv[0]);
            return EXIT_FAILURE;
        }
        const std::string value = argv[++i];
        try
        {
            option->second(config, value);
        }
        catch (const std::logic_error &)
        {
            std::cerr << "Invalid value for " << arg << ": " << value << std::endl;
            print_usage(argv[0]);
            return EXIT_FAILURE;
        }
    }

    if (config.listen_port == 0 || config.storage_root.empty())
    {
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    try
    {
        install_logger(config);
        spdlog::info("Starting MediaUp gateway {}", mediaup::version());

        mediaup::server::Gateway gateway(std::move(config));
        gateway.run();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Gateway failed: " << ex.what() << std::endl;
        spdlog::error("Fatal error: {}", ex.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
