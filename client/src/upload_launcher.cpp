#include "mediaup/client/upload_launcher.hpp"

#include <asio/post.hpp>

#include <algorithm>
#include <exception>
#include <utility>

namespace mediaup::client
{

    UploadLauncher::UploadLauncher(StorageService &storage, ProgressStore &progress, Logger logger,
                                   std::size_t threads)
        : storage_(storage),
          progress_(progress),
          logger_(std::move(logger)),
          pool_(std::max<std::size_t>(threads, 1)) {}

    UploadLauncher::~UploadLauncher()
    {
        wait();
        pool_.join();
    }

    std::vector<LaunchedSession> UploadLauncher::start_batch(const std::vector<UploadRequest> &files,
                                                             const CoordinatorOptions &options,
                                                             const InitializedHook &on_initialized)
    {
        auto coordinator = std::make_shared<SessionCoordinator>(storage_, progress_, logger_, options);
        std::vector<LaunchedSession> launched;
        launched.reserve(files.size());

        for (const auto &file : files)
        {
            auto session = coordinator->initialize(file);
            launched.push_back(LaunchedSession{
                .session_id = session.session_id,
                .filename = session.filename,
                .file_size = session.file_size(),
                .total_parts = session.total_parts(),
                .strategy = session.strategy(),
            });
            launch(coordinator, std::move(session));
        }

        logger_.info("launcher", "batch of ", launched.size(), " file(s) initialized");
        if (on_initialized)
        {
            on_initialized(launched);
        }
        return launched;
    }

    void UploadLauncher::launch(std::shared_ptr<SessionCoordinator> coordinator, UploadSession session)
    {
        CancellationToken token;
        {
            std::lock_guard lock(mutex_);
            running_.insert_or_assign(session.session_id, token);
        }

        asio::post(pool_, [this, coordinator = std::move(coordinator), session = std::move(session), token]()
                   {
            SessionOutcome outcome;
            try
            {
                outcome = coordinator->run(session, token);
            }
            catch (const std::exception &ex)
            {
                logger_.error("launcher", session.session_id, " task terminated: ", ex.what());
                outcome.session_id = session.session_id;
                outcome.filename = session.filename;
                outcome.status = mediaup::protocol::SessionStatus::Failed;
                outcome.error = UploadErrorKind::PartUpload;
                outcome.message = ex.what();
            }
            finish(std::move(outcome)); });
    }

    void UploadLauncher::finish(SessionOutcome outcome)
    {
        OutcomeListener listener;
        {
            std::lock_guard lock(mutex_);
            outcomes_.push_back(outcome);
            listener = listener_;
        }

        if (listener)
        {
            try
            {
                listener(outcome);
            }
            catch (const std::exception &ex)
            {
                logger_.warn("launcher", "outcome listener failed: ", ex.what());
            }
        }

        {
            std::lock_guard lock(mutex_);
            running_.erase(outcome.session_id);
        }
        idle_cv_.notify_all();
    }

    void UploadLauncher::on_outcome(OutcomeListener listener)
    {
        std::lock_guard lock(mutex_);
        listener_ = std::move(listener);
    }

    std::vector<SessionOutcome> UploadLauncher::outcomes() const
    {
        std::lock_guard lock(mutex_);
        return outcomes_;
    }

    bool UploadLauncher::cancel(const std::string &session_id)
    {
        std::lock_guard lock(mutex_);
        const auto it = running_.find(session_id);
        if (it == running_.end())
        {
            return false;
        }
        it->second.cancel();
        logger_.info("launcher", session_id, " cancellation requested");
        return true;
    }

    void UploadLauncher::cancel_all()
    {
        std::lock_guard lock(mutex_);
        for (auto &[session_id, token] : running_)
        {
            token.cancel();
        }
        if (!running_.empty())
        {
            logger_.info("launcher", "cancellation requested for ", running_.size(), " upload(s)");
        }
    }

    std::size_t UploadLauncher::active() const
    {
        std::lock_guard lock(mutex_);
        return running_.size();
    }

    void UploadLauncher::wait()
    {
        std::unique_lock lock(mutex_);
        idle_cv_.wait(lock, [this]
                      { return running_.empty(); });
    }

} // namespace mediaup::client
