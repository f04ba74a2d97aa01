#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "mediaup/client/cancellation.hpp"
#include "mediaup/client/chunk_planner.hpp"
#include "mediaup/client/errors.hpp"
#include "mediaup/client/logger.hpp"
#include "mediaup/client/part_uploader.hpp"
#include "mediaup/client/services.hpp"
#include "mediaup/client/upload_session.hpp"
#include "mediaup/protocol.hpp"

namespace mediaup::client
{

    // Progress bands: 0-5 initialization, 5-50 transfer, 50-100 downstream processing.
    inline constexpr double kInitializedProgress = 0.0;
    inline constexpr double kTransferStartProgress = 5.0;
    inline constexpr double kTransferSpan = 40.0;
    inline constexpr double kHandoffProgress = 50.0;

    // Progress after `completed_parts` of `total_parts` have been acknowledged, capped at kHandoffProgress.
    double transfer_progress(std::uint32_t completed_parts, std::uint32_t total_parts) noexcept;

    struct UploadRequest
    {
        std::filesystem::path source;
        // Defaults to the source file name.
        std::string filename;
        // Guessed from the extension when empty.
        std::string content_type;
        std::uint32_t speaker_count{2};
    };

    struct CoordinatorOptions
    {
        PlannerPolicy planner{};
        RetryPolicy retry{};
        // 1 uploads parts strictly in order.
        std::uint32_t max_parts_in_flight{1};
    };

    struct SessionOutcome
    {
        std::string session_id;
        std::string filename;
        mediaup::protocol::SessionStatus status{mediaup::protocol::SessionStatus::Unknown};
        double progress{};
        std::uint32_t parts_uploaded{};
        std::optional<UploadErrorKind> error;
        std::string message;

        bool succeeded() const noexcept { return !error.has_value(); }
    };

    /**
     * Drives one file through Uninitialized -> Uploading -> Processing, or to Failed.
     *
     * The coordinator is the only writer of its session's progress record until it hands the
     * session off at 50%; after that the record belongs to the downstream pipeline. Published
     * progress never decreases, and a failure keeps the last value reached.
     */
    class SessionCoordinator
    {
    public:
        SessionCoordinator(StorageService &storage, ProgressStore &progress, Logger logger,
                           CoordinatorOptions options = {});

        // Plans the file and opens a session. Throws UploadError(Initialization).
        UploadSession initialize(const UploadRequest &request);

        // Never throws; failures are published and returned in the outcome.
        SessionOutcome run(const UploadSession &session, const CancellationToken &cancel);

        // Requires exactly part numbers 1..total_parts, in order, each with an ETag. Throws UploadError(Completion).
        static void validate_parts(const std::vector<mediaup::protocol::PartETag> &parts, std::uint32_t total_parts);

    private:
        class Publisher;

        std::vector<mediaup::protocol::PartETag> upload_parts(const UploadSession &session,
                                                              const CancellationToken &cancel, Publisher &publisher,
                                                              std::uint32_t &parts_uploaded);
        void complete(const UploadSession &session, std::vector<mediaup::protocol::PartETag> parts,
                      const CancellationToken &cancel);
        void abort_quietly(const UploadSession &session);

        StorageService &storage_;
        ProgressStore &progress_;
        Logger logger_;
        CoordinatorOptions options_;
        PartUploader uploader_;
    };

} // namespace mediaup::client
