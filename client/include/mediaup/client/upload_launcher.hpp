#pragma once

#include <asio/thread_pool.hpp>

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "mediaup/client/cancellation.hpp"
#include "mediaup/client/logger.hpp"
#include "mediaup/client/services.hpp"
#include "mediaup/client/session_coordinator.hpp"

namespace mediaup::client
{

    struct LaunchedSession
    {
        std::string session_id;
        std::string filename;
        std::uint64_t file_size{};
        std::uint32_t total_parts{};
        mediaup::protocol::UploadStrategy strategy{mediaup::protocol::UploadStrategy::Direct};
    };

    /**
     * Starts one background upload per file and hands control back once every file has a session.
     *
     * Initialization runs on the calling thread so its errors reach the caller; everything after
     * that runs on the launcher's pool and is reported through the progress store and the outcome
     * channel. The launcher must outlive its uploads; the destructor waits for them.
     *
     * At most `threads` uploads transfer at a time. Files beyond that wait for a free worker
     * with their session already open, so size the launcher to the batch when every file
     * should move at once.
     */
    class UploadLauncher
    {
    public:
        using InitializedHook = std::function<void(const std::vector<LaunchedSession> &)>;
        using OutcomeListener = std::function<void(const SessionOutcome &)>;

        UploadLauncher(StorageService &storage, ProgressStore &progress, Logger logger, std::size_t threads = 4);
        ~UploadLauncher();

        UploadLauncher(const UploadLauncher &) = delete;
        UploadLauncher &operator=(const UploadLauncher &) = delete;

        // Throws UploadError(Initialization) for the first file that cannot be initialized;
        // files launched before it keep running.
        std::vector<LaunchedSession> start_batch(const std::vector<UploadRequest> &files,
                                                 const CoordinatorOptions &options = {},
                                                 const InitializedHook &on_initialized = {});

        // Called from a pool thread for every finished upload.
        void on_outcome(OutcomeListener listener);

        std::vector<SessionOutcome> outcomes() const;

        // False when the session is not running on this launcher.
        bool cancel(const std::string &session_id);
        void cancel_all();

        std::size_t active() const;

        // Blocks until every launched upload has finished.
        void wait();

    private:
        void launch(std::shared_ptr<SessionCoordinator> coordinator, UploadSession session);
        void finish(SessionOutcome outcome);

        StorageService &storage_;
        ProgressStore &progress_;
        Logger logger_;
        asio::thread_pool pool_;

        mutable std::mutex mutex_;
        std::condition_variable idle_cv_;
        std::map<std::string, CancellationToken> running_;
        std::vector<SessionOutcome> outcomes_;
        OutcomeListener listener_;
    };

} // namespace mediaup::client
