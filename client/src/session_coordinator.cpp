#include "mediaup/client/session_coordinator.hpp"

#include <algorithm>
#include <array>
#include <atomic>
#include <cctype>
#include <exception>
#include <mutex>
#include <stdexcept>
#include <string_view>
#include <thread>

namespace mediaup::client
{

    using mediaup::protocol::PartETag;
    using mediaup::protocol::SessionStatus;
    using mediaup::protocol::UploadStrategy;

    namespace
    {

        struct ContentTypeMapping
        {
            std::string_view extension;
            std::string_view content_type;
        };

        constexpr std::array<ContentTypeMapping, 11> kContentTypes{{
            {".mp4", "video/mp4"},
            {".mov", "video/quicktime"},
            {".webm", "video/webm"},
            {".mkv", "video/x-matroska"},
            {".avi", "video/x-msvideo"},
            {".mp3", "audio/mpeg"},
            {".wav", "audio/wav"},
            {".m4a", "audio/mp4"},
            {".ogg", "audio/ogg"},
            {".flac", "audio/flac"},
            {".aac", "audio/aac"},
        }};

        std::string guess_content_type(const std::filesystem::path &path)
        {
            auto extension = path.extension().string();
            std::transform(extension.begin(), extension.end(), extension.begin(), [](unsigned char ch)
                           { return static_cast<char>(std::tolower(ch)); });
            for (const auto &mapping : kContentTypes)
            {
                if (mapping.extension == extension)
                {
                    return std::string(mapping.content_type);
                }
            }
            return "application/octet-stream";
        }

        std::string failure_stage(UploadErrorKind kind)
        {
            return kind == UploadErrorKind::Cancelled ? "cancelled" : std::string(to_string(kind));
        }

    } // namespace

    double transfer_progress(std::uint32_t completed_parts, std::uint32_t total_parts) noexcept
    {
        if (total_parts == 0)
        {
            return kTransferStartProgress;
        }
        const auto fraction = static_cast<double>(completed_parts) / static_cast<double>(total_parts);
        return std::min(kTransferStartProgress + fraction * kTransferSpan, kHandoffProgress);
    }

    // Serializes publishes for one session and keeps them non-decreasing.
    // Publish failures are logged and dropped.
    class SessionCoordinator::Publisher
    {
    public:
        Publisher(ProgressStore &store, Logger logger, std::string session_id)
            : store_(store), logger_(std::move(logger)), session_id_(std::move(session_id)) {}

        void publish(SessionStatus status, double progress, std::string stage, std::string message)
        {
            std::lock_guard lock(mutex_);
            last_ = std::clamp(std::max(last_, progress), 0.0, 100.0);
            mediaup::protocol::ProgressRecord record{
                .session_id = session_id_,
                .status = status,
                .progress = last_,
                .message = std::move(message),
                .stage = std::move(stage),
                .timestamp = {},
            };
            try
            {
                store_.publish(record);
            }
            catch (const std::exception &ex)
            {
                logger_.warn("progress", session_id_, " publish of ", last_, "% failed: ", ex.what());
            }
        }

        void fail(const std::string &stage, const std::string &message)
        {
            double at;
            {
                std::lock_guard lock(mutex_);
                at = last_;
            }
            publish(SessionStatus::Failed, at, stage, message);
        }

        double last() const
        {
            std::lock_guard lock(mutex_);
            return last_;
        }

    private:
        ProgressStore &store_;
        Logger logger_;
        std::string session_id_;
        mutable std::mutex mutex_;
        double last_{kInitializedProgress};
    };

    SessionCoordinator::SessionCoordinator(StorageService &storage, ProgressStore &progress, Logger logger,
                                           CoordinatorOptions options)
        : storage_(storage),
          progress_(progress),
          logger_(logger),
          options_(options),
          uploader_(storage, logger, options.retry)
    {
        options_.max_parts_in_flight = std::max<std::uint32_t>(options_.max_parts_in_flight, 1);
    }

    UploadSession SessionCoordinator::initialize(const UploadRequest &request)
    {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(request.source, ec))
        {
            throw UploadError(UploadErrorKind::Initialization, "Not a regular file: " + request.source.string(),
                              mediaup::ErrorCode::NotFound);
        }
        const auto size = std::filesystem::file_size(request.source, ec);
        if (ec)
        {
            throw UploadError(UploadErrorKind::Initialization,
                              "Cannot read size of " + request.source.string() + ": " + ec.message(),
                              mediaup::ErrorCode::NotFound);
        }

        UploadSession session{};
        session.source = request.source;
        session.filename = request.filename.empty() ? request.source.filename().string() : request.filename;
        session.speaker_count = request.speaker_count;
        try
        {
            session.plan = plan_chunks(size, options_.planner);
        }
        catch (const std::logic_error &ex)
        {
            throw UploadError(UploadErrorKind::Initialization, session.filename + ": " + ex.what(),
                              mediaup::ErrorCode::InvalidPayload);
        }

        mediaup::protocol::InitializeUploadRequest init{
            .filename = session.filename,
            .file_size = size,
            .content_type = request.content_type.empty() ? guess_content_type(request.source) : request.content_type,
            .speaker_count = request.speaker_count,
            .strategy = session.plan.strategy,
            .chunk_size = session.plan.chunk_size,
            .total_parts = session.plan.total_parts,
        };

        InitResult result;
        try
        {
            result = storage_.initialize(init);
        }
        catch (const ServiceError &ex)
        {
            logger_.error("init", session.filename, ": ", ex.what());
            throw UploadError(UploadErrorKind::Initialization,
                              "Upload initialization failed for " + session.filename + ": " + ex.what(), ex.code());
        }
        if (result.session_id.empty())
        {
            throw UploadError(UploadErrorKind::Initialization, "Storage returned no session id",
                              mediaup::ErrorCode::InvalidPayload);
        }
        if (session.strategy() == UploadStrategy::Multipart && !result.upload_id)
        {
            throw UploadError(UploadErrorKind::Initialization, "Storage returned no multipart upload id",
                              mediaup::ErrorCode::InvalidPayload);
        }
        session.session_id = std::move(result.session_id);
        session.upload_id = std::move(result.upload_id);

        logger_.info("init", session.session_id, " ", session.filename, " size=", size,
                     " strategy=", mediaup::protocol::to_string(session.strategy()),
                     " chunk=", session.plan.chunk_size, " parts=", session.total_parts());

        Publisher publisher(progress_, logger_, session.session_id);
        publisher.publish(SessionStatus::Uploading, kInitializedProgress, "initialized",
                          "Upload initialized for " + session.filename);
        return session;
    }

    SessionOutcome SessionCoordinator::run(const UploadSession &session, const CancellationToken &cancel)
    {
        Publisher publisher(progress_, logger_, session.session_id);
        SessionOutcome outcome{};
        outcome.session_id = session.session_id;
        outcome.filename = session.filename;

        try
        {
            cancel.throw_if_cancelled();
            if (session.strategy() == UploadStrategy::Direct)
            {
                uploader_.upload_direct(session, cancel);
                outcome.parts_uploaded = 1;
            }
            else
            {
                auto parts = upload_parts(session, cancel, publisher, outcome.parts_uploaded);
                complete(session, std::move(parts), cancel);
            }

            publisher.publish(SessionStatus::Processing, kHandoffProgress, "processing",
                              "Upload complete, queued for transcription");
            outcome.status = SessionStatus::Processing;
            outcome.progress = publisher.last();
            outcome.message = "uploaded";
            logger_.info("session", session.session_id, " handed off for processing");
            return outcome;
        }
        catch (const UploadError &ex)
        {
            outcome.error = ex.kind();
            outcome.message = ex.what();
        }
        catch (const std::exception &ex)
        {
            outcome.error = UploadErrorKind::PartUpload;
            outcome.message = std::string("Unexpected failure: ") + ex.what();
        }

        if (session.strategy() == UploadStrategy::Multipart)
        {
            abort_quietly(session);
        }
        publisher.fail(failure_stage(*outcome.error), outcome.message);
        outcome.status = SessionStatus::Failed;
        outcome.progress = publisher.last();
        logger_.error("session", session.session_id, " failed at ", outcome.progress, "% (",
                      to_string(*outcome.error), "): ", outcome.message);
        return outcome;
    }

    void SessionCoordinator::validate_parts(const std::vector<PartETag> &parts, std::uint32_t total_parts)
    {
        if (parts.size() != total_parts)
        {
            throw UploadError(UploadErrorKind::Completion,
                              "Expected " + std::to_string(total_parts) + " parts, have " + std::to_string(parts.size()),
                              mediaup::ErrorCode::PartsInvalid);
        }
        for (std::size_t i = 0; i < parts.size(); ++i)
        {
            if (parts[i].part_number != i + 1)
            {
                throw UploadError(UploadErrorKind::Completion,
                                  "Part list out of sequence at position " + std::to_string(i + 1) + ": part " +
                                      std::to_string(parts[i].part_number),
                                  mediaup::ErrorCode::PartsInvalid);
            }
            if (parts[i].etag.empty())
            {
                throw UploadError(UploadErrorKind::Completion,
                                  "Part " + std::to_string(i + 1) + " has no ETag", mediaup::ErrorCode::PartsInvalid);
            }
        }
    }

    std::vector<PartETag> SessionCoordinator::upload_parts(const UploadSession &session,
                                                           const CancellationToken &cancel, Publisher &publisher,
                                                           std::uint32_t &parts_uploaded)
    {
        const auto total = session.total_parts();
        std::vector<PartETag> parts;
        parts.reserve(total);

        std::mutex mutex;
        std::atomic<std::uint32_t> next_part{1};
        std::atomic<bool> stop{false};
        std::exception_ptr first_error;

        auto worker = [&]
        {
            while (!stop.load())
            {
                const auto part_number = next_part.fetch_add(1);
                if (part_number > total)
                {
                    return;
                }
                try
                {
                    auto record = uploader_.upload_part(session, part_number, cancel);
                    std::lock_guard lock(mutex);
                    parts.push_back(PartETag{.part_number = record.part_number, .etag = std::move(record.etag)});
                    ++parts_uploaded;
                    publisher.publish(SessionStatus::Uploading, transfer_progress(parts_uploaded, total), "uploading",
                                      "Uploaded " + std::to_string(parts_uploaded) + " of " + std::to_string(total) +
                                          " parts");
                }
                catch (const std::exception &)
                {
                    std::lock_guard lock(mutex);
                    if (!first_error)
                    {
                        first_error = std::current_exception();
                    }
                    stop = true;
                    return;
                }
            }
        };

        const auto in_flight = std::min(options_.max_parts_in_flight, total);
        if (in_flight <= 1)
        {
            worker();
        }
        else
        {
            std::vector<std::thread> workers;
            workers.reserve(in_flight);
            for (std::uint32_t i = 0; i < in_flight; ++i)
            {
                workers.emplace_back(worker);
            }
            for (auto &thread : workers)
            {
                thread.join();
            }
        }

        if (first_error)
        {
            std::rethrow_exception(first_error);
        }

        std::sort(parts.begin(), parts.end(), [](const PartETag &lhs, const PartETag &rhs)
                  { return lhs.part_number < rhs.part_number; });
        return parts;
    }

    void SessionCoordinator::complete(const UploadSession &session, std::vector<PartETag> parts,
                                      const CancellationToken &cancel)
    {
        validate_parts(parts, session.total_parts());
        cancel.throw_if_cancelled();

        CompletionResult ack;
        try
        {
            ack = storage_.complete_upload(session.session_id, parts);
        }
        catch (const ServiceError &ex)
        {
            throw UploadError(UploadErrorKind::Completion, std::string("Completing upload failed: ") + ex.what(),
                              ex.code());
        }
        if (ack.size != session.file_size())
        {
            throw UploadError(UploadErrorKind::Completion,
                              "Assembled object has " + std::to_string(ack.size) + " bytes, expected " +
                                  std::to_string(session.file_size()),
                              mediaup::ErrorCode::IntegrityMismatch);
        }
        logger_.info("complete", session.session_id, " assembled ", parts.size(), " parts, ", ack.size, " bytes");
    }

    void SessionCoordinator::abort_quietly(const UploadSession &session)
    {
        try
        {
            storage_.abort_upload(session.session_id);
            logger_.info("abort", session.session_id, " multipart upload aborted");
        }
        catch (const ServiceError &ex)
        {
            logger_.warn("abort", session.session_id, " abort failed: ", ex.what());
        }
    }

} // namespace mediaup::client
