#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

#include "mediaup/client/cancellation.hpp"
#include "mediaup/client/logger.hpp"
#include "mediaup/client/services.hpp"
#include "mediaup/client/upload_session.hpp"

namespace mediaup::client
{

    struct RetryPolicy
    {
        std::uint32_t max_attempts{3};
        std::chrono::milliseconds base_delay{500};
        std::chrono::milliseconds max_delay{8000};

        // Delay before attempt `attempt + 1`, doubling from base_delay.
        std::chrono::milliseconds backoff(std::uint32_t attempt) const;
    };

    /**
     * Transfers the bytes of one session to the storage service.
     *
     * Every transfer reads its byte range from the source file, sends it, and checks the
     * acknowledgement. Retryable service failures are retried with exponential backoff;
     * re-sending a part number overwrites the earlier attempt, so retries are safe.
     * Failures surface as UploadError(PartUpload) or UploadError(Cancelled).
     */
    class PartUploader
    {
    public:
        PartUploader(StorageService &storage, Logger logger, RetryPolicy policy = {});

        PartRecord upload_part(const UploadSession &session, std::uint32_t part_number,
                               const CancellationToken &cancel) const;

        // Single-request transfer of the whole file for the Direct strategy.
        CompletionResult upload_direct(const UploadSession &session, const CancellationToken &cancel) const;

        static std::vector<std::byte> read_range(const std::filesystem::path &path, const ByteRange &range);

    private:
        template <typename Result>
        Result with_retry(const std::string &what, const CancellationToken &cancel,
                          const std::function<Result()> &attempt) const;

        StorageService &storage_;
        Logger logger_;
        RetryPolicy policy_;
    };

} // namespace mediaup::client
