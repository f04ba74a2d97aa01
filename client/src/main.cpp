#include <asio.hpp>

#include <csignal>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "mediaup/client/config.hpp"
#include "mediaup/client/logger.hpp"
#include "mediaup/client/progress_observer.hpp"
#include "mediaup/client/rpc_channel.hpp"
#include "mediaup/client/rpc_services.hpp"
#include "mediaup/client/upload_launcher.hpp"
#include "mediaup/version.hpp"

namespace
{

    using namespace mediaup::client;

    std::mutex output_mutex;

    void print_update(const ObservedSession &update)
    {
        std::lock_guard lock(output_mutex);
        std::cout << update.session_id << "  " << std::setw(12) << std::left << mediaup::protocol::to_string(update.status)
                  << std::right << std::setw(6) << std::fixed << std::setprecision(1) << update.progress << "%  "
                  << update.message << std::endl;
    }

    // Runs `on_signal` on SIGINT/SIGTERM until the guard goes out of scope.
    class SignalGuard
    {
    public:
        template <typename Handler>
        explicit SignalGuard(Handler on_signal) : signals_(io_context_, SIGINT, SIGTERM)
        {
            signals_.async_wait([on_signal](const asio::error_code &ec, int)
                                {
                if (!ec)
                {
                    on_signal();
                } });
            thread_ = std::thread([this]
                                  { io_context_.run(); });
        }

        ~SignalGuard()
        {
            io_context_.stop();
            thread_.join();
        }

    private:
        asio::io_context io_context_;
        asio::signal_set signals_;
        std::thread thread_;
    };

    int run_upload(const ClientConfig &config, const Logger &logger, StorageService &storage, ProgressStore &progress)
    {
        CoordinatorOptions options;
        options.retry.max_attempts = config.max_attempts;
        options.max_parts_in_flight = config.parallel_parts;

        std::vector<UploadRequest> files;
        for (const auto &path : config.files)
        {
            files.push_back(UploadRequest{
                .source = path,
                .filename = path.filename().string(),
                .content_type = {},
                .speaker_count = config.speaker_count,
            });
        }

        // One worker per file so every upload in the batch makes progress at once.
        UploadLauncher launcher(storage, progress, logger, files.size());
        SignalGuard signals([&launcher]
                            { launcher.cancel_all(); });

        launcher.on_outcome([](const SessionOutcome &outcome)
                            {
            std::lock_guard lock(output_mutex);
            if (outcome.succeeded())
            {
                std::cout << "OK    " << outcome.session_id << "  " << outcome.filename << "  handed off for processing"
                          << std::endl;
            }
            else
            {
                std::cout << "FAIL  " << outcome.session_id << "  " << outcome.filename << "  "
                          << to_string(*outcome.error) << " at " << outcome.progress << "%: " << outcome.message
                          << std::endl;
            } });

        const auto launched = launcher.start_batch(files, options, [](const std::vector<LaunchedSession> &sessions)
                                                   {
            std::lock_guard lock(output_mutex);
            for (const auto &session : sessions)
            {
                std::cout << "START " << session.session_id << "  " << session.filename << "  "
                          << session.file_size << " bytes, " << mediaup::protocol::to_string(session.strategy) << ", "
                          << session.total_parts << " part(s)" << std::endl;
            } });

        if (config.watch_uploads)
        {
            ProgressObserver observer(progress, logger, config.poll_interval);
            for (const auto &session : launched)
            {
                observer.watch(session.session_id);
            }
            observer.on_update(print_update);
            std::thread watcher([&observer]
                                { observer.run(); });
            launcher.wait();
            observer.stop();
            watcher.join();
            observer.poll_once();
        }
        launcher.wait();

        for (const auto &outcome : launcher.outcomes())
        {
            if (!outcome.succeeded())
            {
                return 1;
            }
        }
        return 0;
    }

    int run_watch(const ClientConfig &config, const Logger &logger, ProgressStore &progress)
    {
        ProgressObserver observer(progress, logger, config.poll_interval);
        for (const auto &target : config.targets)
        {
            observer.watch(target.session_id, target.baseline);
        }
        observer.on_update(print_update);
        SignalGuard signals([&observer]
                            { observer.stop(); });
        observer.run();

        for (const auto &state : observer.snapshot())
        {
            if (state.status == mediaup::protocol::SessionStatus::Failed)
            {
                return 1;
            }
        }
        return 0;
    }

} // namespace

int main(int argc, char *argv[])
{
    try
    {
        const auto config = parse_arguments(argc, argv);
        Logger logger(config.log_path, config.verbose);
        logger.info("main", "mediaup-client ", mediaup::version(), " -> ", config.host, ':', config.port);

        RpcChannel channel(config.host, config.port, logger);
        channel.ping();
        RpcStorageService storage(channel);
        RpcProgressStore progress(channel);

        if (config.mode == ClientMode::Watch)
        {
            return run_watch(config, logger, progress);
        }
        return run_upload(config, logger, storage, progress);
    }
    catch (const std::exception &ex)
    {
        std::cerr << "ERROR: " << ex.what() << std::endl;
        return 1;
    }
}
